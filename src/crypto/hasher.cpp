#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <memory>
#include <cctype>
#include <algorithm>

namespace Hasher {

// Helper deleter
struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };

hash_t sha256(const uint8_t* data, size_t size) {
    hash_t hash;
    std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter> ctx(EVP_MD_CTX_new());

    if (!ctx) {
        throw ComputeFailure("EVP_MD_CTX_new failed");
    }

    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), NULL)) {
        throw ComputeFailure("EVP_DigestInit_ex failed");
    }

    if (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size)) {
        throw ComputeFailure("EVP_DigestUpdate failed");
    }

    unsigned int len = 0;
    if (!EVP_DigestFinal_ex(ctx.get(), hash.data(), &len)) {
        throw ComputeFailure("EVP_DigestFinal_ex failed");
    }

    return hash;
}

hash_t sha256(const std::vector<uint8_t>& data) {
    return sha256(data.data(), data.size());
}

hash_t sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

hash_t hash_pair(const hash_t& left, const hash_t& right) {
    std::array<uint8_t, HASH_SIZE * 2> joined;
    std::copy(left.begin(), left.end(), joined.begin());
    std::copy(right.begin(), right.end(), joined.begin() + HASH_SIZE);
    return sha256(joined.data(), joined.size());
}

hash_t merkle_root(std::vector<hash_t> leaves) {
    if (leaves.empty()) {
        return sha256(nullptr, 0);
    }
    while (leaves.size() > 1) {
        std::vector<hash_t> parents;
        parents.reserve((leaves.size() + 1) / 2);
        for (size_t i = 0; i + 1 < leaves.size(); i += 2) {
            parents.push_back(hash_pair(leaves[i], leaves[i + 1]));
        }
        if (leaves.size() % 2 == 1) {
            parents.push_back(leaves.back());
        }
        leaves.swap(parents);
    }
    return leaves.front();
}

hash_t merkle_root(const uint8_t* data, size_t size) {
    std::vector<hash_t> leaves;
    leaves.reserve((size + SEGMENT_SIZE - 1) / SEGMENT_SIZE);
    for (size_t offset = 0; offset < size; offset += SEGMENT_SIZE) {
        size_t len = std::min(SEGMENT_SIZE, size - offset);
        leaves.push_back(sha256(data + offset, len));
    }
    return merkle_root(std::move(leaves));
}

hash_t merkle_root(const std::vector<uint8_t>& data) {
    return merkle_root(data.data(), data.size());
}

hash_t hex_to_hash(const std::string& hex_str) {
    if (hex_str.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("expected " + std::to_string(HASH_SIZE * 2) +
                                    " hex characters, got " + std::to_string(hex_str.size()));
    }
    for (char c : hex_str) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("not a hex string: " + hex_str);
        }
    }
    hash_t hash;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        hash[i] = static_cast<uint8_t>(std::stoul(hex_str.substr(i * 2, 2), nullptr, 16));
    }
    return hash;
}

std::string hash_to_hex(const hash_t& hash) {
    std::stringstream ss;
    for (uint8_t byte : hash) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
    }
    return ss.str();
}

} // namespace Hasher