#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace reading_service {
namespace http {

enum class HttpStatus {
    OK = 200,

    BadRequest = 400,
    NotFound = 404,
    MethodNotAllowed = 405,
    RequestTimeout = 408,

    InternalServerError = 500,
    ServiceUnavailable = 503
};

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_,
    PATCH,
    HEAD,
    OPTIONS,
    UNKNOWN
};

inline std::string StatusToString(HttpStatus status) {
    switch (status) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::BadRequest: return "Bad Request";
        case HttpStatus::NotFound: return "Not Found";
        case HttpStatus::MethodNotAllowed: return "Method Not Allowed";
        case HttpStatus::RequestTimeout: return "Request Timeout";
        case HttpStatus::InternalServerError: return "Internal Server Error";
        case HttpStatus::ServiceUnavailable: return "Service Unavailable";
        default: return "Unknown";
    }
}

inline std::string MethodToString(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE_: return "DELETE";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

// Method names are matched case-insensitively ("post" and "POST" are the same verb).
inline HttpMethod StringToMethod(const std::string& method) {
    std::string upper = method;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "GET") return HttpMethod::GET;
    if (upper == "POST") return HttpMethod::POST;
    if (upper == "PUT") return HttpMethod::PUT;
    if (upper == "DELETE") return HttpMethod::DELETE_;
    if (upper == "PATCH") return HttpMethod::PATCH;
    if (upper == "HEAD") return HttpMethod::HEAD;
    if (upper == "OPTIONS") return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

// RFC 7230 token characters, used to validate the request-line method.
inline bool IsMethodToken(const std::string& method) {
    if (method.empty()) {
        return false;
    }

    return std::all_of(method.begin(), method.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '!' || c == '#' || c == '$' || c == '%' ||
               c == '&' || c == '\'' || c == '*' || c == '+' || c == '-' || c == '.' ||
               c == '^' || c == '_' || c == '`' || c == '|' || c == '~';
    });
}

} // namespace http
} // namespace reading_service
