#include "common/config.hpp"
#include "common/errors.hpp"
#include "nlohmann/json.hpp"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {
    template <typename T>
    void read_value(const json& section, const char* key, T& target) {
        if (section.contains(key)) {
            section.at(key).get_to(target);
        }
    }

    // Unsigned fields are read through int64_t so that negative input is caught
    // instead of wrapping around.
    template <typename T>
    void read_count(const json& section, const char* key, T& target, const std::string& path) {
        if (!section.contains(key)) return;
        int64_t value = section.at(key).get<int64_t>();
        if (value <= 0) {
            throw ConfigInvalid(path + "." + key + " must be positive, got " + std::to_string(value));
        }
        target = static_cast<T>(value);
    }

    const json& section_of(const json& root, const char* name) {
        static const json empty = json::object();
        if (!root.contains(name)) return empty;
        const json& section = root.at(name);
        if (!section.is_object()) {
            throw ConfigInvalid(std::string("section '") + name + "' must be an object");
        }
        return section;
    }
}

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IOFailure("Failed to open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

Config Config::parse(const std::string& json_text) {
    Config config;
    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            throw ConfigInvalid("configuration must be a JSON object");
        }

        const json& storage = section_of(root, "storage");
        read_value(storage, "database", config.storage.database);
        if (storage.contains("capacity_bytes")) {
            int64_t capacity = storage.at("capacity_bytes").get<int64_t>();
            if (capacity < 0) throw ConfigInvalid("storage.capacity_bytes must not be negative");
            config.storage.capacity_bytes = static_cast<uint64_t>(capacity);
        }

        const json& file = section_of(root, "file");
        read_value(file, "input_file", config.file.input_file);
        read_value(file, "output_directory", config.file.output_directory);
        read_count(file, "fragment_size", config.file.fragment_size, "file");
        read_count(file, "number_of_parts", config.file.number_of_parts, "file");
        read_value(file, "generate_test_file", config.file.generate_test_file);
        read_count(file, "test_file_size", config.file.test_file_size, "file");
        read_value(file, "allow_truncation", config.file.allow_truncation);

        const json& upload = section_of(root, "upload");
        read_count(upload, "expected_replica", config.upload.options.replica_count, "upload");
        read_value(upload, "method", config.upload.options.method);
        read_value(upload, "full_trusted", config.upload.options.trusted_nodes_only);
        if (upload.contains("finality")) {
            config.upload.options.finality = parse_finality(upload.at("finality").get<std::string>());
        }
        read_value(upload, "client_retries", config.upload.options.retries);
        read_value(upload, "max_retries", config.upload.max_retries);
        read_value(upload, "timeout_minutes", config.upload.timeout_minutes);
        // The per-attempt budget follows the overall one unless given separately.
        config.upload.attempt_timeout_minutes = config.upload.timeout_minutes;
        read_value(upload, "attempt_timeout_minutes", config.upload.attempt_timeout_minutes);
        read_count(upload, "batch_size", config.upload.batch_size, "upload");
        read_value(upload, "batch_cooldown_seconds", config.upload.batch_cooldown_seconds);
        read_value(upload, "parallel", config.upload.parallel);

        const json& download = section_of(root, "download");
        read_value(download, "verify_proof", config.download.verify_proof);
        read_value(download, "timeout_minutes", config.download.timeout_minutes);
        read_count(download, "parallelism", config.download.parallelism, "download");

        const json& log = section_of(root, "log");
        read_value(log, "file", config.log.file);
        if (log.contains("level")) {
            try {
                config.log.level = Logger::parse_level(log.at("level").get<std::string>());
            } catch (const std::invalid_argument& e) {
                throw ConfigInvalid(e.what());
            }
        }
    } catch (const json::exception& e) {
        throw ConfigInvalid(std::string("Failed to parse config: ") + e.what());
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (file.fragment_size == 0) throw ConfigInvalid("file.fragment_size must be positive");
    if (file.number_of_parts == 0) throw ConfigInvalid("file.number_of_parts must be positive");
    if (file.input_file.empty()) throw ConfigInvalid("file.input_file must be set");
    if (file.output_directory.empty()) throw ConfigInvalid("file.output_directory must be set");
    if (upload.batch_size == 0) throw ConfigInvalid("upload.batch_size must be at least 1");
    if (upload.max_retries < 0) throw ConfigInvalid("upload.max_retries must not be negative");
    if (upload.options.retries < 0) throw ConfigInvalid("upload.client_retries must not be negative");
    if (upload.timeout_minutes <= 0) throw ConfigInvalid("upload.timeout_minutes must be positive");
    if (upload.attempt_timeout_minutes <= 0) throw ConfigInvalid("upload.attempt_timeout_minutes must be positive");
    if (upload.batch_cooldown_seconds < 0) throw ConfigInvalid("upload.batch_cooldown_seconds must not be negative");
    if (download.timeout_minutes <= 0) throw ConfigInvalid("download.timeout_minutes must be positive");
    if (download.parallelism == 0) throw ConfigInvalid("download.parallelism must be at least 1");
    if (storage.database.empty()) throw ConfigInvalid("storage.database must be set");
}
