#include "transfer/upload_coordinator.hpp"
#include "common/logger.hpp"
#include "common/worker_pool.hpp"
#include "crypto/hasher.hpp"

#include <algorithm>
#include <memory>

namespace {

TransferManifest first_receipts(const TransferManifest& manifest, size_t count) {
    TransferManifest prefix;
    prefix.source_name = manifest.source_name;
    prefix.source_length = manifest.source_length;
    prefix.fragment_size = manifest.fragment_size;
    for (size_t i = 0; i < count && i < manifest.size(); ++i) {
        prefix.append(manifest[i]);
    }
    return prefix;
}

} // namespace

UploadCoordinator::UploadCoordinator(StorageClient& client, const FingerprintOracle& oracle, Pacer& pacer)
    : client_(client), oracle_(oracle), pacer_(pacer) {}

std::chrono::milliseconds UploadCoordinator::backoff_for_attempt(int attempt, std::chrono::milliseconds cap) {
    if (attempt <= 1) return std::chrono::milliseconds(0);
    // 2^(k-2) seconds; once the shift would pass the cap there is no need to compute it.
    int exponent = attempt - 2;
    if (exponent >= 30) return cap;
    std::chrono::milliseconds delay(static_cast<int64_t>(1000) << exponent);
    return std::min(delay, cap);
}

TransferManifest UploadCoordinator::upload(const std::vector<Fragment>& fragments, const UploadPolicy& policy) {
    FragmentList list(fragments);
    return upload(list, policy);
}

TransferManifest UploadCoordinator::upload(FragmentSource& fragments, const UploadPolicy& policy,
                                           TransferManifest resume_from) {
    const size_t batch_size = std::max<size_t>(policy.batch_size, 1);
    const Deadline overall = Deadline::after(policy.overall_timeout);

    TransferManifest manifest = std::move(resume_from);
    const size_t already_uploaded = manifest.size();
    if (already_uploaded > 0) {
        LOG_INFO("Resuming upload after ", already_uploaded, " fragments already in the manifest");
    }

    std::unique_ptr<WorkerPool> workers;
    if (policy.parallel && batch_size > 1) {
        workers = std::make_unique<WorkerPool>(batch_size);
    }

    LOG_INFO("Starting upload with batch size ", batch_size, ", ",
             attempts_allowed(policy.max_retries), " attempts per fragment",
             (workers ? ", parallel within batches" : ""));

    std::vector<Fragment> batch;
    auto fill_batch = [&]() {
        batch.clear();
        try {
            while (batch.size() < batch_size) {
                auto fragment = fragments.next();
                if (!fragment) break;
                if (fragment->spec.index < already_uploaded) {
                    verify_resumed(*fragment, manifest);
                    fragments.recycle(std::move(*fragment));
                    continue;
                }
                batch.push_back(std::move(*fragment));
            }
        } catch (const UploadFailure&) {
            throw;
        } catch (const TransferError& e) {
            throw UploadFailure(static_cast<uint32_t>(manifest.size() + batch.size()), e.kind(), e.what(), manifest);
        }
    };

    fill_batch();
    size_t batch_number = 0;
    while (!batch.empty()) {
        ++batch_number;
        LOG_INFO("Processing batch ", batch_number, ": fragments ", batch.front().spec.index, "-",
                 batch.back().spec.index);

        // Each fragment owns one slot; the manifest is built from the slots in index order
        // no matter which worker finishes first.
        std::vector<SlotResult> slots(batch.size());
        if (workers) {
            workers->run_batch(batch.size(), [&](size_t slot) {
                slots[slot] = upload_fragment(batch[slot], policy, overall);
            });
        } else {
            for (size_t slot = 0; slot < batch.size(); ++slot) {
                slots[slot] = upload_fragment(batch[slot], policy, overall);
                if (!slots[slot].receipt) break;
            }
        }

        for (auto& slot : slots) {
            if (!slot.receipt) {
                LOG_ERR("Upload of fragment ", slot.index, " failed after ", slot.attempts, " attempt(s): ", slot.cause);
                throw UploadFailure(slot.index, slot.cause_kind, slot.cause, manifest);
            }
            manifest.append(std::move(*slot.receipt));
        }

        for (auto& fragment : batch) {
            fragments.recycle(std::move(fragment));
        }

        fill_batch();
        if (!batch.empty() && policy.batch_cooldown.count() > 0) {
            LOG_INFO("Waiting ", policy.batch_cooldown.count(), " ms before next batch...");
            try {
                pacer_.pause(policy.batch_cooldown, overall);
            } catch (const TimeoutError& e) {
                throw UploadFailure(batch.front().spec.index, ErrorKind::Timeout, e.what(), manifest);
            } catch (const std::exception& e) {
                throw UploadFailure(batch.front().spec.index, ErrorKind::NetworkFailure,
                                    std::string("batch cooldown failed: ") + e.what(), manifest);
            }
        }
    }

    LOG_INFO("Upload complete: ", manifest.size(), " fragments in ", batch_number, " batch(es)");
    return manifest;
}

UploadCoordinator::SlotResult UploadCoordinator::upload_fragment(const Fragment& fragment, const UploadPolicy& policy,
                                                                 const Deadline& overall) {
    SlotResult result;
    result.index = fragment.spec.index;

    // The fingerprint is taken locally before transfer so that it can later be
    // compared against what comes back, independent of what the network reports.
    Fingerprint fingerprint;
    try {
        fingerprint = oracle_.fingerprint(fragment.bytes);
    } catch (const TransferError& e) {
        result.cause_kind = e.kind();
        result.cause = std::string("fingerprint failed: ") + e.what();
        return result;
    } catch (const std::exception& e) {
        result.cause_kind = ErrorKind::ComputeFailure;
        result.cause = std::string("fingerprint failed: ") + e.what();
        return result;
    }

    const int allowed = attempts_allowed(policy.max_retries);
    for (int attempt = 1;; ++attempt) {
        if (overall.expired()) {
            result.cause_kind = ErrorKind::Timeout;
            result.cause = "upload deadline expired before attempt " + std::to_string(attempt) +
                           (result.cause.empty() ? "" : " (last error: " + result.cause + ")");
            return result;
        }

        const auto delay = backoff_for_attempt(attempt, policy.max_backoff);
        if (attempt > 1) {
            LOG_INFO("Retrying upload of fragment ", result.index, " (attempt ", attempt, "/", allowed,
                     ") in ", delay.count(), " ms");
        }
        try {
            pacer_.pause(delay, overall);
        } catch (const TimeoutError& e) {
            result.cause_kind = ErrorKind::Timeout;
            result.cause = std::string("upload deadline reached during backoff: ") + e.what();
            return result;
        } catch (const std::exception& e) {
            result.cause_kind = ErrorKind::NetworkFailure;
            result.cause = std::string("backoff wait failed: ") + e.what();
            return result;
        }

        const AttemptOutcome outcome = attempt_once(fragment, attempt, delay, policy, overall);
        result.attempts = attempt;

        if (outcome.succeeded()) {
            TransferReceipt receipt;
            receipt.fragment_index = fragment.spec.index;
            receipt.fingerprint = fingerprint;
            receipt.transaction_id = outcome.transaction->id;
            receipt.confirmed = outcome.transaction->confirmed;
            receipt.length = fragment.bytes.size();
            LOG_INFO("Fragment ", result.index, " uploaded - TxHash: ", receipt.transaction_id,
                     ", RootHash: ", Hasher::hash_to_hex(fingerprint));
            result.receipt = std::move(receipt);
            return result;
        }

        LOG_WARN("Upload attempt ", attempt, " failed for fragment ", result.index, ": ", outcome.error);
        result.cause_kind = outcome.error_kind;
        result.cause = outcome.error;

        if (!outcome.retryable()) {
            return result;
        }
        if (attempt >= allowed) {
            result.cause = "gave up after " + std::to_string(attempt) + " attempt(s): " + outcome.error;
            return result;
        }
    }
}

void UploadCoordinator::verify_resumed(const Fragment& fragment, const TransferManifest& manifest) const {
    const uint32_t index = fragment.spec.index;
    const TransferReceipt& recorded = manifest[index];
    if (recorded.length != fragment.bytes.size()) {
        throw UploadFailure(index, ErrorKind::IntegrityMismatch,
                            "source changed since the saved manifest: fragment " + std::to_string(index) +
                                " is " + std::to_string(fragment.bytes.size()) + " bytes, manifest records " +
                                std::to_string(recorded.length),
                            first_receipts(manifest, index));
    }
    if (oracle_.fingerprint(fragment.bytes) != recorded.fingerprint) {
        throw UploadFailure(index, ErrorKind::IntegrityMismatch,
                            "source changed since the saved manifest: fingerprint of fragment " +
                                std::to_string(index) + " no longer matches",
                            first_receipts(manifest, index));
    }
}

AttemptOutcome UploadCoordinator::attempt_once(const Fragment& fragment, int attempt, std::chrono::milliseconds waited,
                                               const UploadPolicy& policy, const Deadline& overall) {
    const Deadline attempt_deadline = Deadline::after(policy.attempt_timeout).earliest(overall);

    AttemptOutcome outcome;
    outcome.attempt = attempt;
    outcome.waited = waited;
    try {
        outcome.transaction = client_.upload(fragment.bytes, policy.options, attempt_deadline);
    } catch (const TransferError& e) {
        outcome.error_kind = e.kind();
        outcome.error = e.what();
    } catch (const std::exception& e) {
        // Unclassified client errors are treated as transport trouble.
        outcome.error_kind = ErrorKind::NetworkFailure;
        outcome.error = e.what();
    }
    return outcome;
}
