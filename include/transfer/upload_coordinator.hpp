#ifndef FRAGXFER_UPLOAD_COORDINATOR_HPP
#define FRAGXFER_UPLOAD_COORDINATOR_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "storage_client.hpp"
#include "../common/errors.hpp"
#include "../common/pacer.hpp"
#include "../crypto/fingerprint_oracle.hpp"
#include "../files/fragment_source.hpp"

struct UploadPolicy {
    size_t batch_size = 1;
    int max_retries = 3;
    std::chrono::milliseconds attempt_timeout = std::chrono::minutes(30);
    std::chrono::milliseconds overall_timeout = std::chrono::minutes(30);
    std::chrono::milliseconds batch_cooldown = std::chrono::seconds(5);
    std::chrono::milliseconds max_backoff = std::chrono::seconds(30);
    bool parallel = false; // upload the fragments of a batch concurrently
    UploadOptions options;
};

// The result of one upload attempt of one fragment.
struct AttemptOutcome {
    int attempt = 0;
    std::chrono::milliseconds waited{0};
    std::optional<TransactionHandle> transaction;
    ErrorKind error_kind = ErrorKind::NetworkFailure;
    std::string error;

    bool succeeded() const { return transaction.has_value(); }

    // Transport errors and per-attempt timeouts are worth another attempt.
    bool retryable() const {
        return !succeeded() && (error_kind == ErrorKind::NetworkFailure || error_kind == ErrorKind::Timeout);
    }
};

/**
 * @brief Pushes fragments into the storage network batch by batch.
 *
 * Batches run strictly in order. Each fragment is fingerprinted before it is
 * sent, then tried up to max(1, max_retries) times with exponential backoff.
 * Every attempt runs under the earlier of its own timeout and the deadline
 * of the whole upload.
 */
class UploadCoordinator {
public:
    UploadCoordinator(StorageClient& client, const FingerprintOracle& oracle, Pacer& pacer);

    /**
     * @brief Uploads every fragment of the source.
     *
     * Fragments whose index is already covered by resume_from are skipped and
     * the new receipts are appended after it. A skipped fragment must still
     * match the length and fingerprint its receipt records, otherwise the
     * upload fails with cause IntegrityMismatch at that index.
     * @return A manifest with one receipt per fragment, in index order.
     * @throws UploadFailure carrying the receipts gathered before the failing fragment.
     */
    TransferManifest upload(FragmentSource& fragments, const UploadPolicy& policy,
                            TransferManifest resume_from = TransferManifest());

    TransferManifest upload(const std::vector<Fragment>& fragments, const UploadPolicy& policy);

    // Wait before attempt k (1-based): 0 for the first, then min(2^(k-2) s, cap).
    static std::chrono::milliseconds backoff_for_attempt(int attempt,
                                                         std::chrono::milliseconds cap = std::chrono::seconds(30));

    static int attempts_allowed(int max_retries) { return max_retries < 1 ? 1 : max_retries; }

private:
    struct SlotResult {
        uint32_t index = 0;
        std::optional<TransferReceipt> receipt;
        ErrorKind cause_kind = ErrorKind::NetworkFailure;
        std::string cause;
        int attempts = 0;
    };

    void verify_resumed(const Fragment& fragment, const TransferManifest& manifest) const;
    SlotResult upload_fragment(const Fragment& fragment, const UploadPolicy& policy, const Deadline& overall);
    AttemptOutcome attempt_once(const Fragment& fragment, int attempt, std::chrono::milliseconds waited,
                                const UploadPolicy& policy, const Deadline& overall);

    StorageClient& client_;
    const FingerprintOracle& oracle_;
    Pacer& pacer_;
};

#endif // FRAGXFER_UPLOAD_COORDINATOR_HPP
