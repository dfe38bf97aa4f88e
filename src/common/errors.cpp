#include "common/errors.hpp"

#include <utility>

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IOFailure: return "IOFailure";
        case ErrorKind::ComputeFailure: return "ComputeFailure";
        case ErrorKind::NetworkFailure: return "NetworkFailure";
        case ErrorKind::InsufficientFunds: return "InsufficientFunds";
        case ErrorKind::ProofInvalid: return "ProofInvalid";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::UploadFailure: return "UploadFailure";
        case ErrorKind::DownloadFailure: return "DownloadFailure";
        case ErrorKind::ShapeMismatch: return "ShapeMismatch";
        case ErrorKind::GapDetected: return "GapDetected";
        case ErrorKind::IntegrityMismatch: return "IntegrityMismatch";
        case ErrorKind::ConfigInvalid: return "ConfigInvalid";
        default: return "Unknown";
    }
}

TransferError::TransferError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

GapDetected::GapDetected(uint32_t expected_index, const std::string& what)
    : TransferError(ErrorKind::GapDetected, what), expected_index_(expected_index) {}

IntegrityMismatch::IntegrityMismatch(uint32_t fragment_index, const std::string& what)
    : TransferError(ErrorKind::IntegrityMismatch, what), fragment_index_(fragment_index) {}

UploadFailure::UploadFailure(uint32_t fragment_index, ErrorKind cause_kind, const std::string& cause,
                             TransferManifest partial_manifest)
    : TransferError(ErrorKind::UploadFailure,
                    "upload failed for fragment " + std::to_string(fragment_index) + ": " + cause),
      fragment_index_(fragment_index),
      cause_kind_(cause_kind),
      cause_(cause),
      partial_manifest_(std::move(partial_manifest)) {}

DownloadFailure::DownloadFailure(uint32_t fragment_index, ErrorKind cause_kind, const std::string& cause)
    : TransferError(ErrorKind::DownloadFailure,
                    "download failed for fragment " + std::to_string(fragment_index) + ": " + cause),
      fragment_index_(fragment_index),
      cause_kind_(cause_kind),
      cause_(cause) {}
