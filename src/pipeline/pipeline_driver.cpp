#include "pipeline/pipeline_driver.hpp"
#include "common/logger.hpp"
#include "crypto/hasher.hpp"
#include "files/integrity_verifier.hpp"
#include "files/part_directory.hpp"
#include "files/reassembler.hpp"
#include "storage/manifest_file.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Idle: return "Idle";
        case PipelineState::Fragmented: return "Fragmented";
        case PipelineState::Uploaded: return "Uploaded";
        case PipelineState::Downloaded: return "Downloaded";
        case PipelineState::Verified: return "Verified";
        case PipelineState::Combined: return "Combined";
        case PipelineState::Done: return "Done";
        case PipelineState::Failed: return "Failed";
        default: return "Unknown";
    }
}

const char* to_string(Stage stage) {
    switch (stage) {
        case Stage::Fragment: return "fragment";
        case Stage::Upload: return "upload";
        case Stage::Download: return "download";
        case Stage::Verify: return "verify";
        case Stage::Combine: return "combine";
        default: return "unknown";
    }
}

namespace {
    std::string shorten(const std::string& text) {
        return text.size() > 10 ? text.substr(0, 10) + "..." : text;
    }
}

void PipelineReport::print_summary(std::ostream& os) const {
    const std::string rule(50, '=');
    os << rule << "\n"
       << (state == PipelineState::Done ? "TRANSFER COMPLETED SUCCESSFULLY!" : "TRANSFER FAILED") << "\n"
       << rule << "\n";

    if (failure) {
        os << "Failed stage: " << to_string(failure->stage) << "\n"
           << "Cause:        " << to_string(failure->cause_kind) << "\n";
        if (failure->fragment_index) {
            os << "Fragment:     " << *failure->fragment_index << "\n";
        }
        os << "Message:      " << failure->message << "\n";
    }
    if (!output.empty()) {
        os << "Final file: " << output.string() << " (" << bytes_written << " bytes)\n";
    }
    os << "Total parts: " << manifest.size() << "\n"
       << "Total transactions: " << manifest.size() << "\n";

    if (!verification.empty()) {
        size_t matched = std::count_if(verification.begin(), verification.end(),
                                       [](const VerificationResult& r) { return r.match; });
        os << "Verified parts: " << matched << "/" << verification.size() << "\n";
    }

    os << "\nUpload summary:\n";
    for (const auto& receipt : manifest.receipts()) {
        os << "  Part " << receipt.fragment_index + 1
           << ": Tx=" << shorten(receipt.transaction_id)
           << ", Root=" << shorten("0x" + Hasher::hash_to_hex(receipt.fingerprint)) << "\n";
    }
}

UploadPolicy make_upload_policy(const UploadConfig& config) {
    UploadPolicy policy;
    policy.batch_size = config.batch_size;
    policy.max_retries = config.max_retries;
    policy.attempt_timeout = std::chrono::minutes(config.attempt_timeout_minutes);
    policy.overall_timeout = std::chrono::minutes(config.timeout_minutes);
    policy.batch_cooldown = std::chrono::seconds(config.batch_cooldown_seconds);
    policy.parallel = config.parallel;
    policy.options = config.options;
    return policy;
}

DownloadPolicy make_download_policy(const DownloadConfig& config) {
    DownloadPolicy policy;
    policy.verify_proof = config.verify_proof;
    policy.timeout = std::chrono::minutes(config.timeout_minutes);
    policy.parallelism = config.parallelism;
    return policy;
}

PipelineSettings PipelineSettings::from_config(const Config& config) {
    PipelineSettings settings;
    settings.fragment_size = config.file.fragment_size;
    settings.max_parts = config.file.number_of_parts;
    settings.allow_truncation = config.file.allow_truncation;
    settings.upload = make_upload_policy(config.upload);
    settings.download = make_download_policy(config.download);
    return settings;
}

PipelineDriver::PipelineDriver(StorageClient& client, const FingerprintOracle& oracle, Pacer& pacer,
                               PipelineSettings settings)
    : client_(client),
      oracle_(oracle),
      pacer_(pacer),
      settings_(std::move(settings)),
      pool_(std::max<size_t>(settings_.upload.batch_size, 1)) {}

fs::path PipelineDriver::manifest_path(const fs::path& output_dir) {
    return output_dir / ManifestFile::DEFAULT_FILE_NAME;
}

fs::path PipelineDriver::staging_path(const fs::path& output_dir) {
    return output_dir / STAGING_DIR_NAME;
}

fs::path PipelineDriver::final_path(const fs::path& output_dir) {
    return output_dir / FINAL_FILE_NAME;
}

void PipelineDriver::advance(PipelineReport& report, PipelineState next) {
    if (state_ == PipelineState::Failed || next <= state_) {
        throw std::logic_error(std::string("illegal pipeline transition ") + to_string(state_) + " -> " +
                               to_string(next));
    }
    state_ = next;
    report.state = next;
    LOG_DEBUG("Pipeline state: ", to_string(next));
}

void PipelineDriver::fail(PipelineReport& report, Stage stage, ErrorKind kind,
                          std::optional<uint32_t> fragment_index, const std::string& message) {
    state_ = PipelineState::Failed;
    report.state = PipelineState::Failed;
    report.failure = PipelineFailure{stage, kind, fragment_index, message};
    LOG_ERR("Pipeline failed in ", to_string(stage), " stage (", to_string(kind), "): ", message);
}

template <typename Body>
bool PipelineDriver::stage(Stage stage, PipelineReport& report, Body&& body) {
    try {
        body();
        return true;
    } catch (const UploadFailure& e) {
        fail(report, stage, e.cause_kind(), e.fragment_index(), e.what());
    } catch (const DownloadFailure& e) {
        fail(report, stage, e.cause_kind(), e.fragment_index(), e.what());
    } catch (const GapDetected& e) {
        fail(report, stage, e.kind(), e.expected_index(), e.what());
    } catch (const IntegrityMismatch& e) {
        fail(report, stage, e.kind(), e.fragment_index(), e.what());
    } catch (const TransferError& e) {
        fail(report, stage, e.kind(), std::nullopt, e.what());
    } catch (const std::exception& e) {
        fail(report, stage, ErrorKind::IOFailure, std::nullopt, e.what());
    }
    return false;
}

template <typename Open>
bool PipelineDriver::fragment_and_upload(Open&& open, const fs::path& output_dir, bool resume,
                                         std::optional<FragmentCursor>& cursor, PipelineReport& report) {
    ManifestFile manifest_file(manifest_path(output_dir));

    bool ok = stage(Stage::Fragment, report, [&] {
        cursor.emplace(open(&pool_));

        const uint64_t length = cursor->source_length();
        const uint64_t covered = Fragmenter::covered_bytes(length, settings_.fragment_size, settings_.max_parts);
        const auto plan = Fragmenter::plan(length, settings_.fragment_size, settings_.max_parts);
        if (covered < length) {
            std::string message = cursor->source_name() + " is " + std::to_string(length) + " bytes but " +
                                  std::to_string(settings_.max_parts) + " parts of " +
                                  std::to_string(settings_.fragment_size) + " bytes cover only " +
                                  std::to_string(covered);
            if (!settings_.allow_truncation) {
                throw ConfigInvalid(message + " (set file.allow_truncation to accept)");
            }
            LOG_WARN(message, "; the remaining ", length - covered, " bytes are not transferred");
        }
        LOG_INFO("Source ", cursor->source_name(), ": ", length, " bytes in ", plan.size(), " parts");
        advance(report, PipelineState::Fragmented);
    });
    if (!ok) return false;

    return stage(Stage::Upload, report, [&] {
        TransferManifest seed;
        if (resume && manifest_file.exists()) {
            seed = manifest_file.load();
            if (seed.fragment_size != settings_.fragment_size || seed.source_length != cursor->source_length()) {
                throw ConfigInvalid("saved manifest was made for a different source or fragment size");
            }
        } else if (resume) {
            LOG_WARN("No manifest to resume from at ", manifest_file.path().string(), "; starting a new upload");
        }
        seed.source_name = cursor->source_name();
        seed.source_length = cursor->source_length();
        seed.fragment_size = settings_.fragment_size;

        const size_t seeded = seed.size();
        UploadCoordinator uploader(client_, oracle_, pacer_);
        try {
            report.manifest = uploader.upload(*cursor, settings_.upload, std::move(seed));
        } catch (const UploadFailure& e) {
            report.manifest = e.partial_manifest();
            // A saved manifest is never replaced by a shorter one.
            if (report.manifest.size() < seeded) {
                LOG_WARN("Keeping saved manifest at ", manifest_file.path().string(), " with ", seeded, " receipts");
                throw;
            }
            try {
                manifest_file.save(report.manifest);
            } catch (const TransferError& save_error) {
                LOG_ERR("Could not save partial manifest: ", save_error.what());
            }
            throw;
        }
        manifest_file.save(report.manifest);
        advance(report, PipelineState::Uploaded);
    });
}

template <typename Open>
PipelineReport PipelineDriver::execute(Open&& open, const fs::path& output_dir) {
    state_ = PipelineState::Idle;
    PipelineReport report;
    std::optional<FragmentCursor> cursor;

    if (!fragment_and_upload(open, output_dir, false, cursor, report)) return report;

    PartDirectory parts(staging_path(output_dir));

    bool ok = stage(Stage::Download, report, [&] {
        parts.clear();
        DownloadCoordinator downloader(client_);
        downloader.download(report.manifest, settings_.download,
                            [&parts](Fragment&& fragment) { parts.write(fragment); });
        advance(report, PipelineState::Downloaded);
    });
    if (!ok) return report;

    ok = stage(Stage::Verify, report, [&] {
        IntegrityVerifier verifier(oracle_);
        cursor->rewind();
        PartDirectory::Reader retrieved = parts.reader();
        report.verification = verifier.verify(*cursor, retrieved);
        IntegrityVerifier::require_all_match(report.verification);
        IntegrityVerifier::cross_check_manifest(report.manifest, report.verification);
        LOG_INFO("All ", report.verification.size(), " parts verified");
        advance(report, PipelineState::Verified);
    });
    if (!ok) return report;

    ok = stage(Stage::Combine, report, [&] {
        Reassembler reassembler;
        PartDirectory::Reader retrieved = parts.reader();
        report.output = final_path(output_dir);
        report.bytes_written = reassembler.combine_to_file(retrieved, report.output);
        if (report.bytes_written != report.manifest.covered_bytes()) {
            throw ShapeMismatch("combined " + std::to_string(report.bytes_written) + " bytes, manifest covers " +
                                std::to_string(report.manifest.covered_bytes()));
        }
        advance(report, PipelineState::Combined);
    });
    if (!ok) return report;

    advance(report, PipelineState::Done);
    LOG_INFO("Pipeline finished: ", report.bytes_written, " bytes written to ", report.output.string());
    return report;
}

PipelineReport PipelineDriver::run(const fs::path& source, const fs::path& output_dir) {
    LOG_INFO("Starting transfer of ", source.string());
    return execute([&](BufferPool* pool) {
        return Fragmenter::split(source, settings_.fragment_size, settings_.max_parts, pool);
    }, output_dir);
}

PipelineReport PipelineDriver::run(std::unique_ptr<std::istream> source, const std::string& source_name,
                                   const fs::path& output_dir) {
    LOG_INFO("Starting transfer of ", source_name);
    return execute([&](BufferPool* pool) {
        return FragmentCursor(std::move(source), source_name, settings_.fragment_size, settings_.max_parts, pool);
    }, output_dir);
}

PipelineReport PipelineDriver::upload_file(const fs::path& source, const fs::path& output_dir, bool resume) {
    state_ = PipelineState::Idle;
    PipelineReport report;
    std::optional<FragmentCursor> cursor;

    LOG_INFO("Uploading ", source.string(), (resume ? " (resuming)" : ""));
    auto open = [&](BufferPool* pool) {
        return Fragmenter::split(source, settings_.fragment_size, settings_.max_parts, pool);
    };
    if (!fragment_and_upload(open, output_dir, resume, cursor, report)) return report;

    advance(report, PipelineState::Done);
    return report;
}

PipelineReport PipelineDriver::download_file(const fs::path& output_dir) {
    state_ = PipelineState::Idle;
    PipelineReport report;
    PartDirectory parts(staging_path(output_dir));

    bool ok = stage(Stage::Download, report, [&] {
        report.manifest = ManifestFile(manifest_path(output_dir)).load();
        parts.clear();
        DownloadCoordinator downloader(client_);
        downloader.download(report.manifest, settings_.download,
                            [&parts](Fragment&& fragment) { parts.write(fragment); });
        advance(report, PipelineState::Downloaded);
    });
    if (!ok) return report;

    ok = stage(Stage::Verify, report, [&] {
        IntegrityVerifier verifier(oracle_);
        PartDirectory::Reader retrieved = parts.reader();
        report.verification = verifier.verify_against_manifest(report.manifest, retrieved);
        IntegrityVerifier::require_all_match(report.verification);
        LOG_INFO("All ", report.verification.size(), " parts match the manifest");
        advance(report, PipelineState::Verified);
    });
    if (!ok) return report;

    ok = stage(Stage::Combine, report, [&] {
        Reassembler reassembler;
        PartDirectory::Reader retrieved = parts.reader();
        report.output = final_path(output_dir);
        report.bytes_written = reassembler.combine_to_file(retrieved, report.output);
        advance(report, PipelineState::Combined);
    });
    if (!ok) return report;

    advance(report, PipelineState::Done);
    return report;
}
