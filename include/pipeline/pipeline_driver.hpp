#ifndef FRAGXFER_PIPELINE_DRIVER_HPP
#define FRAGXFER_PIPELINE_DRIVER_HPP

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../common/pacer.hpp"
#include "../crypto/fingerprint_oracle.hpp"
#include "../common/buffer_pool.hpp"
#include "../files/fragmenter.hpp"
#include "../files/manifest.hpp"
#include "../transfer/download_coordinator.hpp"
#include "../transfer/storage_client.hpp"
#include "../transfer/upload_coordinator.hpp"

namespace fs = std::filesystem;

enum class PipelineState {
    Idle,
    Fragmented,
    Uploaded,
    Downloaded,
    Verified,
    Combined,
    Done,
    Failed
};

enum class Stage {
    Fragment,
    Upload,
    Download,
    Verify,
    Combine
};

const char* to_string(PipelineState state);
const char* to_string(Stage stage);

struct PipelineFailure {
    Stage stage = Stage::Fragment;
    ErrorKind cause_kind = ErrorKind::IOFailure;
    std::optional<uint32_t> fragment_index;
    std::string message;
};

struct PipelineReport {
    PipelineState state = PipelineState::Idle;
    std::optional<PipelineFailure> failure;
    TransferManifest manifest; // partial when the upload failed
    std::vector<VerificationResult> verification;
    fs::path output;
    uint64_t bytes_written = 0;

    bool succeeded() const { return state == PipelineState::Done; }

    // Per-part transaction and fingerprint table, as printed after a run.
    void print_summary(std::ostream& os = std::cout) const;
};

struct PipelineSettings {
    uint64_t fragment_size = 4 * 1024 * 1024;
    uint32_t max_parts = 10;
    bool allow_truncation = false;
    UploadPolicy upload;
    DownloadPolicy download;

    static PipelineSettings from_config(const Config& config);
};

UploadPolicy make_upload_policy(const UploadConfig& config);
DownloadPolicy make_download_policy(const DownloadConfig& config);

/**
 * @brief Drives one file through split, upload, download, verify and combine.
 *
 * The state only moves forward. The first stage that fails stops the run in
 * Failed with the stage, the cause and the fragment index when one is known;
 * errors never escape run(). The manifest is written to the output directory
 * after the upload stage, also when the upload failed part way.
 */
class PipelineDriver {
public:
    static constexpr const char* STAGING_DIR_NAME = "downloaded_parts";
    static constexpr const char* FINAL_FILE_NAME = "final_file.bin";

    PipelineDriver(StorageClient& client, const FingerprintOracle& oracle, Pacer& pacer, PipelineSettings settings);

    PipelineReport run(const fs::path& source, const fs::path& output_dir);

    PipelineReport run(std::unique_ptr<std::istream> source, const std::string& source_name,
                       const fs::path& output_dir);

    /**
     * @brief Only the fragment and upload stages; ends in Done with the manifest saved.
     * @param resume Continue from the manifest already in output_dir.
     */
    PipelineReport upload_file(const fs::path& source, const fs::path& output_dir, bool resume = false);

    // Download, verify against the saved manifest and combine, in a later process.
    PipelineReport download_file(const fs::path& output_dir);

    PipelineState state() const { return state_; }

    static fs::path manifest_path(const fs::path& output_dir);
    static fs::path staging_path(const fs::path& output_dir);
    static fs::path final_path(const fs::path& output_dir);

private:
    // Runs one stage body; a thrown error moves the run to Failed. Returns false then.
    template <typename Body>
    bool stage(Stage stage, PipelineReport& report, Body&& body);

    template <typename Open>
    PipelineReport execute(Open&& open, const fs::path& output_dir);

    template <typename Open>
    bool fragment_and_upload(Open&& open, const fs::path& output_dir, bool resume,
                             std::optional<FragmentCursor>& cursor, PipelineReport& report);

    void advance(PipelineReport& report, PipelineState next);
    void fail(PipelineReport& report, Stage stage, ErrorKind kind, std::optional<uint32_t> fragment_index,
              const std::string& message);

    StorageClient& client_;
    const FingerprintOracle& oracle_;
    Pacer& pacer_;
    PipelineSettings settings_;
    PipelineState state_ = PipelineState::Idle;
    BufferPool pool_; // fragment buffers of the upload and verify stages
};

#endif // FRAGXFER_PIPELINE_DRIVER_HPP
