#ifndef FRAGXFER_HASHER_HPP
#define FRAGXFER_HASHER_HPP

#include <vector>
#include <string>
#include "../files/manifest.hpp" // For hash_t

namespace Hasher {

// Leaf width of the Merkle tree used for fragment fingerprints.
constexpr size_t SEGMENT_SIZE = 256;

/**
 * @brief Calculates the SHA-256 hash of a data buffer.
 * @param data The data to hash.
 * @return A 32-byte SHA-256 hash.
 * @throws ComputeFailure if OpenSSL reports an error.
 */
hash_t sha256(const uint8_t* data, size_t size);
hash_t sha256(const std::vector<uint8_t>& data);

    // Calculate SHA-256 hash of a string
    hash_t sha256(const std::string& data);

    // SHA-256 of left || right, the interior node of the Merkle tree.
    hash_t hash_pair(const hash_t& left, const hash_t& right);

/**
 * @brief Folds leaf hashes into a Merkle root.
 *
 * Pairs are hashed left to right; an unpaired last node is carried up to the
 * next level unchanged. An empty leaf list yields sha256 of the empty string.
 */
hash_t merkle_root(std::vector<hash_t> leaves);

/**
 * @brief Merkle root of a buffer split into SEGMENT_SIZE leaves.
 *
 * Data of at most one segment therefore fingerprints to its plain SHA-256.
 */
hash_t merkle_root(const uint8_t* data, size_t size);
hash_t merkle_root(const std::vector<uint8_t>& data);

    // Helpers
    hash_t hex_to_hash(const std::string& hex);
    std::string hash_to_hex(const hash_t& hash);

} // namespace Hasher
#endif //FRAGXFER_HASHER_HPP
