#ifndef FRAGXFER_ERRORS_HPP
#define FRAGXFER_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

#include "../files/manifest.hpp"

enum class ErrorKind {
    IOFailure,
    ComputeFailure,
    NetworkFailure,
    InsufficientFunds,
    ProofInvalid,
    NotFound,
    Timeout,
    UploadFailure,
    DownloadFailure,
    ShapeMismatch,
    GapDetected,
    IntegrityMismatch,
    ConfigInvalid
};

const char* to_string(ErrorKind kind);

// Base of every error raised by the transfer pipeline.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& what);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class IOFailure : public TransferError {
public:
    explicit IOFailure(const std::string& what) : TransferError(ErrorKind::IOFailure, what) {}
};

class ComputeFailure : public TransferError {
public:
    explicit ComputeFailure(const std::string& what) : TransferError(ErrorKind::ComputeFailure, what) {}
};

class NetworkFailure : public TransferError {
public:
    explicit NetworkFailure(const std::string& what) : TransferError(ErrorKind::NetworkFailure, what) {}
};

class InsufficientFunds : public TransferError {
public:
    explicit InsufficientFunds(const std::string& what) : TransferError(ErrorKind::InsufficientFunds, what) {}
};

class ProofInvalid : public TransferError {
public:
    explicit ProofInvalid(const std::string& what) : TransferError(ErrorKind::ProofInvalid, what) {}
};

class NotFound : public TransferError {
public:
    explicit NotFound(const std::string& what) : TransferError(ErrorKind::NotFound, what) {}
};

class TimeoutError : public TransferError {
public:
    explicit TimeoutError(const std::string& what) : TransferError(ErrorKind::Timeout, what) {}
};

class ShapeMismatch : public TransferError {
public:
    explicit ShapeMismatch(const std::string& what) : TransferError(ErrorKind::ShapeMismatch, what) {}
};

class ConfigInvalid : public TransferError {
public:
    explicit ConfigInvalid(const std::string& what) : TransferError(ErrorKind::ConfigInvalid, what) {}
};

class GapDetected : public TransferError {
public:
    GapDetected(uint32_t expected_index, const std::string& what);

    uint32_t expected_index() const { return expected_index_; }

private:
    uint32_t expected_index_;
};

class IntegrityMismatch : public TransferError {
public:
    IntegrityMismatch(uint32_t fragment_index, const std::string& what);

    uint32_t fragment_index() const { return fragment_index_; }

private:
    uint32_t fragment_index_;
};

/**
 * @brief Terminal upload error.
 *
 * Raised once a fragment has used up its attempts, hit a non-retryable
 * cause, or the overall upload deadline expired. Carries the receipts
 * uploaded before the failing fragment so a caller can resume.
 */
class UploadFailure : public TransferError {
public:
    UploadFailure(uint32_t fragment_index, ErrorKind cause_kind, const std::string& cause,
                  TransferManifest partial_manifest);

    uint32_t fragment_index() const { return fragment_index_; }
    ErrorKind cause_kind() const { return cause_kind_; }
    const std::string& cause() const { return cause_; }
    const TransferManifest& partial_manifest() const { return partial_manifest_; }

private:
    uint32_t fragment_index_;
    ErrorKind cause_kind_;
    std::string cause_;
    TransferManifest partial_manifest_;
};

class DownloadFailure : public TransferError {
public:
    DownloadFailure(uint32_t fragment_index, ErrorKind cause_kind, const std::string& cause);

    uint32_t fragment_index() const { return fragment_index_; }
    ErrorKind cause_kind() const { return cause_kind_; }
    const std::string& cause() const { return cause_; }

private:
    uint32_t fragment_index_;
    ErrorKind cause_kind_;
    std::string cause_;
};

#endif // FRAGXFER_ERRORS_HPP
