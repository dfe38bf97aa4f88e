#ifndef FRAGXFER_MANIFEST_HPP
#define FRAGXFER_MANIFEST_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <array>
#include <iostream>

// Use a fixed-size array for hashes for simplicity and performance.
// SHA-256 produces a 32-byte hash.
constexpr size_t HASH_SIZE = 32;
using hash_t = std::array<uint8_t, HASH_SIZE>;

// Content fingerprint of a fragment (Merkle root). Only a FingerprintOracle creates one.
using Fingerprint = hash_t;

struct FragmentSpec {
    uint32_t index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;

    bool operator==(const FragmentSpec& other) const {
        return index == other.index && offset == other.offset && length == other.length;
    }
};

struct Fragment {
    FragmentSpec spec;
    std::vector<uint8_t> bytes; // spec.length bytes
};

// What the storage network hands back for an accepted upload.
struct TransactionHandle {
    std::string id;
    bool confirmed = false;
};

struct TransferReceipt {
    uint32_t fragment_index = 0;
    Fingerprint fingerprint{};
    std::string transaction_id;
    bool confirmed = false;
    uint64_t length = 0;
};

struct VerificationResult {
    uint32_t fragment_index = 0;
    bool match = false;
    Fingerprint expected{};
    Fingerprint actual{};

    bool operator==(const VerificationResult& other) const {
        return fragment_index == other.fragment_index && match == other.match &&
               expected == other.expected && actual == other.actual;
    }
};

/**
 * @brief Ordered, append-only record of per-fragment receipts.
 *
 * Receipt i always belongs to fragment i. This is the only handle needed to
 * retrieve and reassemble a file later.
 */
struct TransferManifest {
    std::string source_name;
    uint64_t source_length = 0;
    uint64_t fragment_size = 0;

    // Throws ShapeMismatch unless receipt.fragment_index == size().
    void append(TransferReceipt receipt);

    const std::vector<TransferReceipt>& receipts() const { return receipts_; }
    const TransferReceipt& operator[](size_t i) const { return receipts_[i]; }
    size_t size() const { return receipts_.size(); }
    bool empty() const { return receipts_.empty(); }

    // Sum of the recorded fragment lengths.
    uint64_t covered_bytes() const;

    void print(std::ostream& os = std::cout) const;

private:
    std::vector<TransferReceipt> receipts_;
};

#endif // FRAGXFER_MANIFEST_HPP
