#ifndef FRAGXFER_CONFIG_HPP
#define FRAGXFER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "logger.hpp"
#include "../transfer/storage_client.hpp"

struct StorageConfig {
    std::string database = "fragxfer_store.db";
    uint64_t capacity_bytes = 0; // 0 = unlimited
};

struct FileConfig {
    std::string input_file = "test_file.bin";
    std::string output_directory = "output";
    uint64_t fragment_size = 4 * 1024 * 1024;
    uint32_t number_of_parts = 10;
    bool generate_test_file = false;
    uint64_t test_file_size = 40ULL * 1024 * 1024;
    bool allow_truncation = false;
};

struct UploadConfig {
    UploadOptions options;
    int max_retries = 3;
    int timeout_minutes = 30;
    int attempt_timeout_minutes = 30;
    uint32_t batch_size = 2;
    int batch_cooldown_seconds = 5;
    bool parallel = false;
};

struct DownloadConfig {
    bool verify_proof = true;
    int timeout_minutes = 30;
    uint32_t parallelism = 1;
};

struct LogConfig {
    std::string file = "fragxfer.log";
    LogLevel level = LogLevel::INFO;
};

// Read once at start-up; treated as immutable for the rest of the run.
struct Config {
    StorageConfig storage;
    FileConfig file;
    UploadConfig upload;
    DownloadConfig download;
    LogConfig log;

    /**
     * @brief Loads and validates a JSON configuration file.
     *
     * Keys that are absent keep their defaults.
     * @throws IOFailure if the file cannot be read.
     * @throws ConfigInvalid if the JSON is malformed or a value is out of range.
     */
    static Config load(const std::filesystem::path& path);

    static Config parse(const std::string& json_text);

    // Throws ConfigInvalid on the first bad value.
    void validate() const;
};

#endif // FRAGXFER_CONFIG_HPP
