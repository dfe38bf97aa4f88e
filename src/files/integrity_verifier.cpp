#include "files/integrity_verifier.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"

IntegrityVerifier::IntegrityVerifier(const FingerprintOracle& oracle) : oracle_(oracle) {}

VerificationResult IntegrityVerifier::compare(const Fragment& original, const Fragment& retrieved) const {
    if (original.spec.index != retrieved.spec.index) {
        throw ShapeMismatch("original fragment " + std::to_string(original.spec.index) +
                            " paired with retrieved fragment " + std::to_string(retrieved.spec.index));
    }

    VerificationResult result;
    result.fragment_index = original.spec.index;
    result.expected = oracle_.fingerprint(original.bytes);
    result.actual = oracle_.fingerprint(retrieved.bytes);
    result.match = result.expected == result.actual;

    if (result.match) {
        LOG_INFO("Part ", result.fragment_index + 1, " verification passed: ", Hasher::hash_to_hex(result.expected));
    } else {
        LOG_ERR("Hash mismatch for part ", result.fragment_index + 1, ": expected ",
                Hasher::hash_to_hex(result.expected), ", got ", Hasher::hash_to_hex(result.actual));
    }
    return result;
}

std::vector<VerificationResult> IntegrityVerifier::verify(const std::vector<Fragment>& original,
                                                          const std::vector<Fragment>& retrieved) const {
    if (original.size() != retrieved.size()) {
        throw ShapeMismatch("cannot verify " + std::to_string(retrieved.size()) + " retrieved fragments against " +
                            std::to_string(original.size()) + " originals");
    }

    std::vector<VerificationResult> results;
    results.reserve(original.size());
    for (size_t i = 0; i < original.size(); ++i) {
        results.push_back(compare(original[i], retrieved[i]));
    }
    return results;
}

std::vector<VerificationResult> IntegrityVerifier::verify(FragmentSource& original, FragmentSource& retrieved) const {
    LOG_INFO("Verifying integrity of downloaded parts");
    std::vector<VerificationResult> results;
    for (;;) {
        auto left = original.next();
        auto right = retrieved.next();
        if (!left && !right) break;
        if (!left || !right) {
            throw ShapeMismatch(std::string("fragment sequences differ in length: ") +
                                (left ? "retrieved" : "original") + " side ended after " +
                                std::to_string(results.size()) + " fragments");
        }
        results.push_back(compare(*left, *right));
        original.recycle(std::move(*left));
        retrieved.recycle(std::move(*right));
    }
    return results;
}

std::vector<VerificationResult> IntegrityVerifier::verify_against_manifest(const TransferManifest& manifest,
                                                                           FragmentSource& retrieved) const {
    std::vector<VerificationResult> results;
    results.reserve(manifest.size());
    for (const auto& receipt : manifest.receipts()) {
        auto fragment = retrieved.next();
        if (!fragment) {
            throw ShapeMismatch("manifest names " + std::to_string(manifest.size()) +
                                " fragments, only " + std::to_string(results.size()) + " retrieved");
        }
        if (fragment->spec.index != receipt.fragment_index) {
            throw ShapeMismatch("manifest entry " + std::to_string(receipt.fragment_index) +
                                " paired with retrieved fragment " + std::to_string(fragment->spec.index));
        }
        VerificationResult result;
        result.fragment_index = receipt.fragment_index;
        result.expected = receipt.fingerprint;
        result.actual = oracle_.fingerprint(fragment->bytes);
        result.match = result.expected == result.actual;
        if (!result.match) {
            LOG_ERR("Hash mismatch for part ", result.fragment_index + 1, ": manifest records ",
                    Hasher::hash_to_hex(result.expected), ", got ", Hasher::hash_to_hex(result.actual));
        }
        results.push_back(result);
        retrieved.recycle(std::move(*fragment));
    }
    if (retrieved.next()) {
        throw ShapeMismatch("more fragments retrieved than the manifest names");
    }
    return results;
}

void IntegrityVerifier::require_all_match(const std::vector<VerificationResult>& results) {
    for (const auto& result : results) {
        if (!result.match) {
            throw IntegrityMismatch(result.fragment_index,
                                    "hash mismatch for fragment " + std::to_string(result.fragment_index) +
                                    ": expected " + Hasher::hash_to_hex(result.expected) +
                                    ", got " + Hasher::hash_to_hex(result.actual));
        }
    }
}

void IntegrityVerifier::cross_check_manifest(const TransferManifest& manifest,
                                             const std::vector<VerificationResult>& results) {
    if (manifest.size() != results.size()) {
        throw ShapeMismatch("manifest has " + std::to_string(manifest.size()) + " receipts but " +
                            std::to_string(results.size()) + " fragments were verified");
    }
    for (size_t i = 0; i < results.size(); ++i) {
        if (manifest[i].fingerprint != results[i].expected) {
            throw IntegrityMismatch(static_cast<uint32_t>(i),
                                    "manifest fingerprint of fragment " + std::to_string(i) +
                                    " does not match the source: recorded " +
                                    Hasher::hash_to_hex(manifest[i].fingerprint) + ", source " +
                                    Hasher::hash_to_hex(results[i].expected));
        }
    }
}
