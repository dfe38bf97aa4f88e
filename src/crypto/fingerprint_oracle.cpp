#include "crypto/fingerprint_oracle.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"

#include <array>
#include <fstream>

namespace fs = std::filesystem;

Fingerprint MerkleFingerprintOracle::fingerprint(const std::vector<uint8_t>& bytes) const {
    return Hasher::merkle_root(bytes);
}

Fingerprint MerkleFingerprintOracle::fingerprint_file(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOFailure("Failed to open file for fingerprinting: " + path.string());
    }

    // Leaves are hashed as the file streams by, so only the leaf list is held.
    std::vector<hash_t> leaves;
    std::array<uint8_t, Hasher::SEGMENT_SIZE> segment;
    while (file) {
        file.read(reinterpret_cast<char*>(segment.data()), segment.size());
        std::streamsize got = file.gcount();
        if (got > 0) {
            leaves.push_back(Hasher::sha256(segment.data(), static_cast<size_t>(got)));
        }
    }
    if (file.bad()) {
        throw IOFailure("Failed to read file for fingerprinting: " + path.string());
    }
    return Hasher::merkle_root(std::move(leaves));
}
