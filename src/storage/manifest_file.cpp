#include "storage/manifest_file.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include "nlohmann/json.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

// JSON serialization for TransferReceipt
void to_json(json& j, const TransferReceipt& r) {
    j = json{
        {"index", r.fragment_index},
        {"fingerprint", Hasher::hash_to_hex(r.fingerprint)},
        {"transaction_id", r.transaction_id},
        {"confirmed", r.confirmed},
        {"length", r.length}
    };
}

void from_json(const json& j, TransferReceipt& r) {
    j.at("index").get_to(r.fragment_index);
    r.fingerprint = Hasher::hex_to_hash(j.at("fingerprint").get<std::string>());
    j.at("transaction_id").get_to(r.transaction_id);
    if (j.contains("confirmed")) j.at("confirmed").get_to(r.confirmed);
    if (j.contains("length")) j.at("length").get_to(r.length);
}

ManifestFile::ManifestFile(std::filesystem::path path) : path_(std::move(path)) {}

bool ManifestFile::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}

std::string ManifestFile::to_json_text(const TransferManifest& manifest) {
    json j = {
        {"version", FORMAT_VERSION},
        {"source_name", manifest.source_name},
        {"source_length", manifest.source_length},
        {"fragment_size", manifest.fragment_size},
        {"fragments", json::array()}
    };
    for (const auto& receipt : manifest.receipts()) {
        j["fragments"].push_back(receipt);
    }
    return j.dump(4);
}

TransferManifest ManifestFile::from_json_text(const std::string& text) {
    std::vector<TransferReceipt> receipts;
    TransferManifest manifest;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw IOFailure("manifest must be a JSON object");
        }
        int version = j.value("version", FORMAT_VERSION);
        if (version != FORMAT_VERSION) {
            throw IOFailure("unsupported manifest version " + std::to_string(version));
        }
        j.at("source_name").get_to(manifest.source_name);
        j.at("source_length").get_to(manifest.source_length);
        j.at("fragment_size").get_to(manifest.fragment_size);
        receipts = j.at("fragments").get<std::vector<TransferReceipt>>();
    } catch (const json::exception& e) {
        throw IOFailure(std::string("malformed manifest: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw IOFailure(std::string("malformed manifest fingerprint: ") + e.what());
    }

    // append() rejects entries that are missing or out of order.
    for (auto& receipt : receipts) {
        manifest.append(std::move(receipt));
    }
    return manifest;
}

void ManifestFile::save(const TransferManifest& manifest) const {
    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw IOFailure("cannot create directory " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    // The previous manifest stays intact until the new one is fully on disk.
    std::filesystem::path temp_path = path_;
    temp_path += ".tmp";
    std::ofstream write_file(temp_path, std::ios::trunc);
    if (!write_file.is_open()) {
        throw IOFailure("cannot open manifest file for writing: " + temp_path.string());
    }
    write_file << to_json_text(manifest);
    write_file.close();
    std::error_code ec;
    if (!write_file) {
        std::filesystem::remove(temp_path, ec);
        throw IOFailure("failed to write manifest file: " + temp_path.string());
    }
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(temp_path, ec);
        throw IOFailure("cannot replace manifest file " + path_.string() + ": " + reason);
    }
    LOG_INFO("Manifest with ", manifest.size(), " fragments saved to ", path_.string());
}

TransferManifest ManifestFile::load() const {
    std::ifstream read_file(path_);
    if (!read_file.is_open()) {
        throw IOFailure("cannot open manifest file: " + path_.string());
    }
    std::stringstream buffer;
    buffer << read_file.rdbuf();
    TransferManifest manifest = from_json_text(buffer.str());
    LOG_INFO("Loaded manifest for ", manifest.source_name, " with ", manifest.size(), " fragments");
    return manifest;
}
