#ifndef FRAGXFER_STORAGE_CLIENT_HPP
#define FRAGXFER_STORAGE_CLIENT_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "../common/deadline.hpp"
#include "../files/manifest.hpp"

// How far a submitted transfer must progress before upload() returns.
enum class FinalityMode {
    TransactionPacked,
    FileFinalized
};

const char* to_string(FinalityMode mode);
FinalityMode parse_finality(const std::string& name); // "packed" or "finalized"

// Passed through to the storage network untouched.
struct UploadOptions {
    uint32_t replica_count = 1;
    std::string method = "min";
    bool trusted_nodes_only = true;
    FinalityMode finality = FinalityMode::TransactionPacked;
    int retries = 0; // client-side retries inside one attempt
};

/**
 * @brief Client of a content-addressed storage network.
 *
 * Calls may come from several worker threads at once. Implementations should
 * give up once the deadline passes and report it as TimeoutError.
 */
class StorageClient {
public:
    virtual ~StorageClient() = default;

    // Throws NetworkFailure, InsufficientFunds or TimeoutError.
    virtual TransactionHandle upload(const std::vector<uint8_t>& fragment_bytes,
                                     const UploadOptions& options,
                                     const Deadline& deadline) = 0;

    // Throws NetworkFailure, ProofInvalid, NotFound or TimeoutError.
    virtual std::vector<uint8_t> download(const Fingerprint& fingerprint,
                                          bool verify_proof,
                                          const Deadline& deadline) = 0;
};

#endif // FRAGXFER_STORAGE_CLIENT_HPP
