#pragma once

#include "core/Result.hpp"
#include "http/HttpResponse.hpp"
#include "http/HttpStatus.hpp"
#include <string>

namespace reading_service {
namespace handlers {

enum class ErrorKind {
    BadRequest,                 // 400
    NotFound,                   // 404
    MethodNotSupported,         // 405
    StoreConfigurationError,    // 500
    InternalError               // 500
};

inline http::HttpStatus ErrorKindToStatus(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest: return http::HttpStatus::BadRequest;
        case ErrorKind::NotFound: return http::HttpStatus::NotFound;
        case ErrorKind::MethodNotSupported: return http::HttpStatus::MethodNotAllowed;
        case ErrorKind::StoreConfigurationError: return http::HttpStatus::InternalServerError;
        case ErrorKind::InternalError: return http::HttpStatus::InternalServerError;
        default: return http::HttpStatus::InternalServerError;
    }
}

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BadRequest: return "BadRequest";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::MethodNotSupported: return "MethodNotSupported";
        case ErrorKind::StoreConfigurationError: return "StoreConfigurationError";
        case ErrorKind::InternalError: return "InternalError";
        default: return "Unknown";
    }
}

// `message` is what the client sees; `detail` is only logged.
struct HandlerError {
    ErrorKind kind;
    std::string message;
    std::string detail;

    http::HttpStatus GetStatus() const { return ErrorKindToStatus(kind); }
};

using HandlerResult = core::Result<http::HttpResponse, HandlerError>;

} // namespace handlers
} // namespace reading_service
