#pragma once

#include <stdexcept>
#include <string>

// Failure taxonomy shared by the adapters, the ledger and the job driver
enum class ErrorKind {
    None,
    DeviceError,
    TransientExtractionFailure,
    StalledExtraction,
    EncodingError,
    ChecksumMismatch,
    Unrecoverable,
    UserCancelled,
    StorageIOError,
    DuplicateEntry,
    NoEntry,
    InvalidConfiguration
};

std::string errorKindToString(ErrorKind kind);
ErrorKind parseErrorKind(const std::string& text);

// Retryable kinds are handled by BackupJob; everything else ends the job
bool isRetryable(ErrorKind kind);

class BackupError : public std::runtime_error {
public:
    BackupError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
