#ifndef FRAGXFER_FINGERPRINT_ORACLE_HPP
#define FRAGXFER_FINGERPRINT_ORACLE_HPP

#include <filesystem>
#include <vector>

#include "../files/manifest.hpp"

// Computes deterministic content fingerprints. Implementations must be safe to
// call from several threads at once.
class FingerprintOracle {
public:
    virtual ~FingerprintOracle() = default;

    // Throws ComputeFailure.
    virtual Fingerprint fingerprint(const std::vector<uint8_t>& bytes) const = 0;

    // Throws IOFailure if the file cannot be read, ComputeFailure otherwise.
    virtual Fingerprint fingerprint_file(const std::filesystem::path& path) const = 0;
};

// SHA-256 Merkle root over Hasher::SEGMENT_SIZE byte leaves.
class MerkleFingerprintOracle : public FingerprintOracle {
public:
    Fingerprint fingerprint(const std::vector<uint8_t>& bytes) const override;
    Fingerprint fingerprint_file(const std::filesystem::path& path) const override;
};

#endif // FRAGXFER_FINGERPRINT_ORACLE_HPP
