#pragma once
#include <string>
#include <utility>

namespace ledgerflow {

enum class ErrorKind {
    NONE,
    // Terminal: the whole statement is rejected
    UNSUPPORTED_FORMAT,
    ENCODING_ERROR,
    MISSING_COLUMNS,
    NO_TRANSACTIONS_FOUND,
    ROW_LIMIT_EXCEEDED,
    FILE_TOO_LARGE,
    CANCELLED,
    PROCESSING_ERROR,
    IO_ERROR,
    // Non-fatal: reported as warnings, processing degrades
    RATE_UNAVAILABLE,
    MODEL_UNAVAILABLE
};

inline const char* error_kind_str(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:                  return "none";
        case ErrorKind::UNSUPPORTED_FORMAT:    return "unsupported_format";
        case ErrorKind::ENCODING_ERROR:        return "encoding_error";
        case ErrorKind::MISSING_COLUMNS:       return "missing_columns";
        case ErrorKind::NO_TRANSACTIONS_FOUND: return "no_transactions_found";
        case ErrorKind::ROW_LIMIT_EXCEEDED:    return "row_limit_exceeded";
        case ErrorKind::FILE_TOO_LARGE:        return "file_too_large";
        case ErrorKind::CANCELLED:             return "cancelled";
        case ErrorKind::PROCESSING_ERROR:      return "processing_error";
        case ErrorKind::IO_ERROR:              return "io_error";
        case ErrorKind::RATE_UNAVAILABLE:      return "rate_unavailable";
        case ErrorKind::MODEL_UNAVAILABLE:     return "model_unavailable";
    }
    return "??";
}

struct Status {
    ErrorKind kind = ErrorKind::NONE;
    std::string message;  // Empty on success

    [[nodiscard]] bool ok() const { return kind == ErrorKind::NONE; }

    static Status success() { return {}; }
    static Status failure(ErrorKind k, std::string msg) { return {k, std::move(msg)}; }
};

} // namespace ledgerflow
