#include "storage/local_fragment_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"

#include <ctime>

namespace {
    // Finalizes the statement on every exit path.
    class Statement {
    public:
        Statement(sqlite3* db, const std::string& sql) : db_(db) {
            if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
                throw NetworkFailure(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
            }
        }
        ~Statement() { sqlite3_finalize(stmt_); }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        sqlite3_stmt* get() const { return stmt_; }

        // SQLITE_ROW or SQLITE_DONE; anything else throws.
        int step() {
            int rc = sqlite3_step(stmt_);
            if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
                throw NetworkFailure(std::string("Failed to execute statement: ") + sqlite3_errmsg(db_));
            }
            return rc;
        }

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_ = nullptr;
    };

    void check_deadline(const Deadline& deadline, const char* operation) {
        if (deadline.expired()) {
            throw TimeoutError(std::string(operation) + " deadline expired");
        }
    }
}

LocalFragmentStore::LocalFragmentStore(const std::string& db_path, const FingerprintOracle& oracle,
                                       uint64_t capacity_bytes)
    : db_path_(db_path), oracle_(oracle), capacity_bytes_(capacity_bytes) {
    open();
    try {
        create_tables();
    } catch (...) {
        close();
        throw;
    }
}

LocalFragmentStore::~LocalFragmentStore() {
    close();
}

void LocalFragmentStore::open() {
    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        close();
        throw NetworkFailure("Can't open fragment store " + db_path_ + ": " + message);
    }
    // Concurrent uploads from other processes wait instead of failing outright.
    sqlite3_busy_timeout(db_, 5000);
    LOG_DEBUG("Opened fragment store: ", db_path_);
}

void LocalFragmentStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void LocalFragmentStore::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        throw NetworkFailure("SQL error: " + message);
    }
}

void LocalFragmentStore::create_tables() {
    std::string create_fragments_sql = R"(
        CREATE TABLE IF NOT EXISTS fragments (
            root_hash TEXT PRIMARY KEY NOT NULL,
            data BLOB NOT NULL,
            size INTEGER NOT NULL,
            replicas INTEGER NOT NULL,
            finality TEXT NOT NULL
        );
    )";

    std::string create_transactions_sql = R"(
        CREATE TABLE IF NOT EXISTS transactions (
            tx_hash TEXT PRIMARY KEY NOT NULL,
            root_hash TEXT NOT NULL,
            submitted_at INTEGER NOT NULL
        );
    )";

    execute_sql(create_fragments_sql);
    execute_sql(create_transactions_sql);
}

int64_t LocalFragmentStore::query_int64(const std::string& sql) {
    Statement stmt(db_, sql);
    if (stmt.step() != SQLITE_ROW) return 0;
    return sqlite3_column_int64(stmt.get(), 0);
}

TransactionHandle LocalFragmentStore::upload(const std::vector<uint8_t>& fragment_bytes,
                                             const UploadOptions& options,
                                             const Deadline& deadline) {
    check_deadline(deadline, "upload");
    if (fragment_bytes.empty()) {
        throw NetworkFailure("refusing to store an empty fragment");
    }

    const Fingerprint root = oracle_.fingerprint(fragment_bytes);
    const std::string root_hex = Hasher::hash_to_hex(root);

    std::lock_guard<std::mutex> lock(mutex_);
    check_deadline(deadline, "upload");

    bool already_stored = false;
    {
        Statement existing(db_, "SELECT 1 FROM fragments WHERE root_hash = ?;");
        sqlite3_bind_text(existing.get(), 1, root_hex.c_str(), -1, SQLITE_TRANSIENT);
        already_stored = existing.step() == SQLITE_ROW;
    }

    if (!already_stored && capacity_bytes_ != 0) {
        uint64_t used = static_cast<uint64_t>(query_int64("SELECT COALESCE(SUM(size), 0) FROM fragments;"));
        if (used + fragment_bytes.size() > capacity_bytes_) {
            throw InsufficientFunds("storing " + std::to_string(fragment_bytes.size()) + " bytes exceeds capacity (" +
                                    std::to_string(used) + " of " + std::to_string(capacity_bytes_) + " used)");
        }
    }

    execute_sql("BEGIN IMMEDIATE;");
    try {
        if (!already_stored) {
            Statement insert(db_, "INSERT INTO fragments (root_hash, data, size, replicas, finality) "
                                  "VALUES (?, ?, ?, ?, ?);");
            sqlite3_bind_text(insert.get(), 1, root_hex.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_blob(insert.get(), 2, fragment_bytes.data(), static_cast<int>(fragment_bytes.size()),
                              SQLITE_STATIC);
            sqlite3_bind_int64(insert.get(), 3, static_cast<sqlite3_int64>(fragment_bytes.size()));
            sqlite3_bind_int(insert.get(), 4, static_cast<int>(options.replica_count));
            sqlite3_bind_text(insert.get(), 5, to_string(options.finality), -1, SQLITE_STATIC);
            insert.step();
        }

        // The transaction hash depends on the submission order so that
        // re-uploading identical content yields a fresh transaction.
        int64_t sequence = query_int64("SELECT COUNT(*) FROM transactions;");
        std::string tx_hex = Hasher::hash_to_hex(Hasher::sha256(root_hex + ":" + std::to_string(sequence)));

        Statement record(db_, "INSERT INTO transactions (tx_hash, root_hash, submitted_at) VALUES (?, ?, ?);");
        sqlite3_bind_text(record.get(), 1, tx_hex.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(record.get(), 2, root_hex.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(record.get(), 3, static_cast<sqlite3_int64>(std::time(nullptr)));
        record.step();

        execute_sql("COMMIT;");

        LOG_DEBUG("Stored fragment ", root_hex, " (", fragment_bytes.size(), " bytes, ",
                  options.replica_count, " replica(s), ", to_string(options.finality), ")");
        return TransactionHandle{"0x" + tx_hex, true};
    } catch (...) {
        char* err_msg = nullptr;
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err_msg);
        sqlite3_free(err_msg);
        throw;
    }
}

std::vector<uint8_t> LocalFragmentStore::download(const Fingerprint& fingerprint,
                                                  bool verify_proof,
                                                  const Deadline& deadline) {
    check_deadline(deadline, "download");
    const std::string root_hex = Hasher::hash_to_hex(fingerprint);

    std::vector<uint8_t> bytes;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt(db_, "SELECT data FROM fragments WHERE root_hash = ?;");
        sqlite3_bind_text(stmt.get(), 1, root_hex.c_str(), -1, SQLITE_TRANSIENT);
        if (stmt.step() != SQLITE_ROW) {
            throw NotFound("no fragment stored under " + root_hex);
        }
        const auto* blob_data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt.get(), 0));
        int blob_size = sqlite3_column_bytes(stmt.get(), 0);
        if (blob_data && blob_size > 0) {
            bytes.assign(blob_data, blob_data + blob_size);
        }
    }

    if (verify_proof) {
        Fingerprint actual = oracle_.fingerprint(bytes);
        if (actual != fingerprint) {
            throw ProofInvalid("stored content of " + root_hex + " hashes to " + Hasher::hash_to_hex(actual));
        }
    }
    return bytes;
}

bool LocalFragmentStore::contains(const Fingerprint& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string root_hex = Hasher::hash_to_hex(fingerprint);
    Statement stmt(db_, "SELECT 1 FROM fragments WHERE root_hash = ?;");
    sqlite3_bind_text(stmt.get(), 1, root_hex.c_str(), -1, SQLITE_TRANSIENT);
    return stmt.step() == SQLITE_ROW;
}

size_t LocalFragmentStore::fragment_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(query_int64("SELECT COUNT(*) FROM fragments;"));
}

uint64_t LocalFragmentStore::stored_bytes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint64_t>(query_int64("SELECT COALESCE(SUM(size), 0) FROM fragments;"));
}

size_t LocalFragmentStore::transaction_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(query_int64("SELECT COUNT(*) FROM transactions;"));
}
