#ifndef FRAGXFER_INTEGRITY_VERIFIER_HPP
#define FRAGXFER_INTEGRITY_VERIFIER_HPP

#include <vector>

#include "fragment_source.hpp"
#include "../crypto/fingerprint_oracle.hpp"

/**
 * @brief Compares what came back from the network with what went in.
 *
 * Both sides are fingerprinted again by the oracle. Fingerprints recorded in
 * a manifest or reported by the network are never taken on trust.
 */
class IntegrityVerifier {
public:
    explicit IntegrityVerifier(const FingerprintOracle& oracle);

    /**
     * @brief One result per index, in order.
     * @throws ShapeMismatch if the sequences differ in length or in the index at some position.
     */
    std::vector<VerificationResult> verify(const std::vector<Fragment>& original,
                                           const std::vector<Fragment>& retrieved) const;

    // Streaming form; both sources are consumed pairwise, one fragment each at a time.
    std::vector<VerificationResult> verify(FragmentSource& original, FragmentSource& retrieved) const;

    /**
     * @brief Checks retrieved fragments against the manifest alone.
     *
     * Used when the original is no longer at hand (a download run in its own
     * process). expected is the manifest fingerprint, actual is recomputed.
     */
    std::vector<VerificationResult> verify_against_manifest(const TransferManifest& manifest,
                                                            FragmentSource& retrieved) const;

    // Throws IntegrityMismatch for the first result that does not match.
    static void require_all_match(const std::vector<VerificationResult>& results);

    // The fingerprint recorded at upload must equal the recomputed original one.
    // Throws ShapeMismatch on a length difference, IntegrityMismatch on a disagreement.
    static void cross_check_manifest(const TransferManifest& manifest,
                                     const std::vector<VerificationResult>& results);

private:
    VerificationResult compare(const Fragment& original, const Fragment& retrieved) const;

    const FingerprintOracle& oracle_;
};

#endif // FRAGXFER_INTEGRITY_VERIFIER_HPP
