#ifndef FRAGXFER_LOCAL_FRAGMENT_STORE_HPP
#define FRAGXFER_LOCAL_FRAGMENT_STORE_HPP

#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

#include "../transfer/storage_client.hpp"
#include "../crypto/fingerprint_oracle.hpp"

/**
 * @brief Content-addressed fragment store backed by a SQLite database.
 *
 * Stands in for the remote storage network: fragments are keyed by their
 * fingerprint and every accepted upload is recorded as a transaction.
 * Uploads are confirmed as soon as the row is committed, so both finality
 * modes are satisfied on return.
 */
class LocalFragmentStore : public StorageClient {
public:
    /**
     * @param capacity_bytes Total payload the store accepts; 0 means unlimited.
     * @throws NetworkFailure if the database cannot be opened or initialised.
     */
    LocalFragmentStore(const std::string& db_path, const FingerprintOracle& oracle, uint64_t capacity_bytes = 0);
    ~LocalFragmentStore() override;

    LocalFragmentStore(const LocalFragmentStore&) = delete;
    LocalFragmentStore& operator=(const LocalFragmentStore&) = delete;

    // Throws InsufficientFunds once the capacity would be exceeded.
    TransactionHandle upload(const std::vector<uint8_t>& fragment_bytes,
                             const UploadOptions& options,
                             const Deadline& deadline) override;

    std::vector<uint8_t> download(const Fingerprint& fingerprint,
                                  bool verify_proof,
                                  const Deadline& deadline) override;

    bool contains(const Fingerprint& fingerprint);
    size_t fragment_count();
    uint64_t stored_bytes();
    size_t transaction_count();

private:
    void open();
    void close();
    void create_tables();
    void execute_sql(const std::string& sql);

    // Caller holds mutex_.
    int64_t query_int64(const std::string& sql);

    std::string db_path_;
    const FingerprintOracle& oracle_;
    uint64_t capacity_bytes_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

#endif // FRAGXFER_LOCAL_FRAGMENT_STORE_HPP
