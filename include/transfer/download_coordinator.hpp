#ifndef FRAGXFER_DOWNLOAD_COORDINATOR_HPP
#define FRAGXFER_DOWNLOAD_COORDINATOR_HPP

#include <chrono>
#include <functional>
#include <vector>

#include "storage_client.hpp"
#include "../files/manifest.hpp"

struct DownloadPolicy {
    bool verify_proof = true; // ask the network to check inclusion proofs
    std::chrono::milliseconds timeout = std::chrono::minutes(30);
    size_t parallelism = 1;   // fragments fetched at once
};

class DownloadCoordinator {
public:
    using FragmentSink = std::function<void(Fragment&&)>;

    explicit DownloadCoordinator(StorageClient& client);

    /**
     * @brief Retrieves every fragment named by the manifest.
     *
     * Fragments reach the sink one at a time in manifest order, even when
     * several are fetched concurrently; at most `parallelism` are held at once.
     * The first failing fragment aborts the whole download.
     * @throws DownloadFailure naming the fragment index and the cause.
     */
    void download(const TransferManifest& manifest, const DownloadPolicy& policy, const FragmentSink& sink);

    // Collects the whole download in memory.
    std::vector<Fragment> download_all(const TransferManifest& manifest, const DownloadPolicy& policy);

private:
    std::vector<uint8_t> fetch(const TransferReceipt& receipt, const DownloadPolicy& policy, const Deadline& deadline);

    StorageClient& client_;
};

#endif // FRAGXFER_DOWNLOAD_COORDINATOR_HPP
