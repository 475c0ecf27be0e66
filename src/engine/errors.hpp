#pragma once

#include <string>

enum class ErrorKind {
    None,
    InvalidInput,
    ExtractionFailure,
    NotFound,
    StorageFailure,
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::InvalidInput:
        return "invalid_input";
    case ErrorKind::ExtractionFailure:
        return "extraction_failure";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::StorageFailure:
    default:
        return "storage_failure";
    }
}

struct OperationResult {
    ErrorKind error = ErrorKind::None;
    std::string message;

    bool ok() const { return error == ErrorKind::None; }

    static OperationResult success(const std::string& message = "") {
        return OperationResult{ErrorKind::None, message};
    }
    static OperationResult failure(ErrorKind error, const std::string& message) {
        return OperationResult{error, message};
    }
};
