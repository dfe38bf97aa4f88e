#ifndef FRAGXFER_MANIFEST_FILE_HPP
#define FRAGXFER_MANIFEST_FILE_HPP

#include <filesystem>
#include <string>

#include "../files/manifest.hpp"

// JSON persistence of a TransferManifest, so a download can run in a later process.
class ManifestFile {
public:
    static constexpr int FORMAT_VERSION = 1;
    static constexpr const char* DEFAULT_FILE_NAME = "manifest.json";

    explicit ManifestFile(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

    // Throws IOFailure if the file cannot be written.
    void save(const TransferManifest& manifest) const;

    /**
     * @brief Reads the manifest back.
     * @throws IOFailure if the file is missing or not valid manifest JSON.
     * @throws ShapeMismatch if the fragment entries are not numbered 0..N-1 in order.
     */
    TransferManifest load() const;

    bool exists() const;

    static std::string to_json_text(const TransferManifest& manifest);
    static TransferManifest from_json_text(const std::string& text);

private:
    std::filesystem::path path_;
};

#endif // FRAGXFER_MANIFEST_FILE_HPP
