#include "common/backup_status.hpp"

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                       return "None";
        case ErrorKind::DeviceError:                return "DeviceError";
        case ErrorKind::TransientExtractionFailure: return "TransientExtractionFailure";
        case ErrorKind::StalledExtraction:          return "StalledExtraction";
        case ErrorKind::EncodingError:              return "EncodingError";
        case ErrorKind::ChecksumMismatch:           return "ChecksumMismatch";
        case ErrorKind::Unrecoverable:              return "Unrecoverable";
        case ErrorKind::UserCancelled:              return "UserCancelled";
        case ErrorKind::StorageIOError:             return "StorageIOError";
        case ErrorKind::DuplicateEntry:             return "DuplicateEntry";
        case ErrorKind::NoEntry:                    return "NoEntry";
        case ErrorKind::InvalidConfiguration:       return "InvalidConfiguration";
        default:                                    return "Unknown";
    }
}

ErrorKind parseErrorKind(const std::string& text) {
    static const ErrorKind kinds[] = {
        ErrorKind::None,
        ErrorKind::DeviceError,
        ErrorKind::TransientExtractionFailure,
        ErrorKind::StalledExtraction,
        ErrorKind::EncodingError,
        ErrorKind::ChecksumMismatch,
        ErrorKind::Unrecoverable,
        ErrorKind::UserCancelled,
        ErrorKind::StorageIOError,
        ErrorKind::DuplicateEntry,
        ErrorKind::NoEntry,
        ErrorKind::InvalidConfiguration
    };
    for (ErrorKind kind : kinds) {
        if (errorKindToString(kind) == text) {
            return kind;
        }
    }
    throw BackupError(ErrorKind::StorageIOError, "Unknown error kind in job record: " + text);
}

bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::TransientExtractionFailure;
}
