#include "transfer/download_coordinator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/worker_pool.hpp"
#include "crypto/hasher.hpp"

#include <algorithm>
#include <memory>
#include <optional>

DownloadCoordinator::DownloadCoordinator(StorageClient& client) : client_(client) {}

std::vector<uint8_t> DownloadCoordinator::fetch(const TransferReceipt& receipt, const DownloadPolicy& policy,
                                                const Deadline& deadline) {
    if (deadline.expired()) {
        throw DownloadFailure(receipt.fragment_index, ErrorKind::Timeout, "download deadline expired");
    }

    std::vector<uint8_t> bytes;
    try {
        bytes = client_.download(receipt.fingerprint, policy.verify_proof, deadline);
    } catch (const TransferError& e) {
        throw DownloadFailure(receipt.fragment_index, e.kind(), e.what());
    } catch (const std::exception& e) {
        throw DownloadFailure(receipt.fragment_index, ErrorKind::NetworkFailure, e.what());
    }

    if (bytes.empty()) {
        throw DownloadFailure(receipt.fragment_index, ErrorKind::ShapeMismatch, "storage returned an empty fragment");
    }
    if (receipt.length != 0 && bytes.size() != receipt.length) {
        throw DownloadFailure(receipt.fragment_index, ErrorKind::ShapeMismatch,
                              "expected " + std::to_string(receipt.length) + " bytes, got " +
                              std::to_string(bytes.size()));
    }
    return bytes;
}

void DownloadCoordinator::download(const TransferManifest& manifest, const DownloadPolicy& policy,
                                   const FragmentSink& sink) {
    const Deadline deadline = Deadline::after(policy.timeout);
    const size_t window = std::max<size_t>(policy.parallelism, 1);
    const size_t total = manifest.size();

    LOG_INFO("Starting download of ", total, " parts (verify proof: ", (policy.verify_proof ? "yes" : "no"),
             ", window ", window, ")");

    std::unique_ptr<WorkerPool> workers;
    if (window > 1) {
        workers = std::make_unique<WorkerPool>(window);
    }

    uint64_t offset = 0;
    auto emit = [&](const TransferReceipt& receipt, std::vector<uint8_t>&& bytes) {
        Fragment fragment;
        fragment.spec.index = receipt.fragment_index;
        fragment.spec.offset = offset;
        fragment.spec.length = bytes.size();
        fragment.bytes = std::move(bytes);
        offset += fragment.spec.length;
        LOG_INFO("Part ", receipt.fragment_index + 1, "/", total, " downloaded (",
                 fragment.spec.length, " bytes)");
        sink(std::move(fragment));
    };

    for (size_t start = 0; start < total; start += window) {
        const size_t count = std::min(window, total - start);

        if (!workers) {
            const TransferReceipt& receipt = manifest[start];
            LOG_DEBUG("Downloading part ", start + 1, "/", total, ": ", Hasher::hash_to_hex(receipt.fingerprint));
            emit(receipt, fetch(receipt, policy, deadline));
            continue;
        }

        // Results land in index-addressed slots and are emitted in order afterwards.
        std::vector<std::vector<uint8_t>> payloads(count);
        std::vector<std::optional<DownloadFailure>> failures(count);
        workers->run_batch(count, [&](size_t slot) {
            try {
                payloads[slot] = fetch(manifest[start + slot], policy, deadline);
            } catch (const DownloadFailure& e) {
                failures[slot] = e;
            }
        });

        for (size_t slot = 0; slot < count; ++slot) {
            if (failures[slot]) {
                LOG_ERR(failures[slot]->what());
                throw *failures[slot];
            }
        }
        for (size_t slot = 0; slot < count; ++slot) {
            emit(manifest[start + slot], std::move(payloads[slot]));
        }
    }

    LOG_INFO("All ", total, " parts downloaded");
}

std::vector<Fragment> DownloadCoordinator::download_all(const TransferManifest& manifest,
                                                        const DownloadPolicy& policy) {
    std::vector<Fragment> fragments;
    fragments.reserve(manifest.size());
    download(manifest, policy, [&fragments](Fragment&& fragment) { fragments.push_back(std::move(fragment)); });
    return fragments;
}
