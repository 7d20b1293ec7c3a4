// capture_error.hpp

#pragma once

#include <string>

enum class CaptureErrorKind {
    Timeout,
    ConnectionRefused,
    Unreachable,
    AuthFailed,
    HttpError,
    InvalidContent,
    StorageFailed
};

inline const char* capture_error_code(CaptureErrorKind kind) {
    switch (kind) {
    case CaptureErrorKind::Timeout:           return "timeout";
    case CaptureErrorKind::ConnectionRefused: return "connection_refused";
    case CaptureErrorKind::Unreachable:       return "unreachable";
    case CaptureErrorKind::AuthFailed:        return "auth_failed";
    case CaptureErrorKind::HttpError:         return "http_error";
    case CaptureErrorKind::InvalidContent:    return "invalid_content";
    case CaptureErrorKind::StorageFailed:     return "storage_failed";
    }
    return "unknown";
}

// A failed capture attempt. http_status is set for AuthFailed and HttpError.
struct CaptureError {
    CaptureErrorKind kind;
    std::string message;
    int http_status = 0;

    std::string code() const { return capture_error_code(kind); }
};
