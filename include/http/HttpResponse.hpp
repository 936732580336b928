#pragma once

#include "http/HttpStatus.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace reading_service {
namespace http {

class HttpResponse {
public:
    HttpResponse();
    explicit HttpResponse(HttpStatus status);

    void SetStatus(HttpStatus status);
    HttpStatus GetStatus() const { return m_status; }
    int GetStatusCode() const { return static_cast<int>(m_status); }

    void SetHeader(const std::string& name, const std::string& value);
    void RemoveHeader(const std::string& name);
    std::string GetHeader(const std::string& name) const;
    const std::unordered_map<std::string, std::string>& GetHeaders() const { return m_headers; }

    void SetBody(const std::string& body);
    void SetBody(std::string&& body);
    void SetJsonBody(const nlohmann::json& json);
    void SetTextBody(const std::string& text);
    const std::string& GetBody() const { return m_body; }

    void SetContentType(const std::string& contentType);
    std::string GetContentType() const { return GetHeader("Content-Type"); }

    void SetKeepAlive(bool keepAlive);
    bool IsKeepAlive() const { return m_keepAlive; }

    std::string Serialize() const;

    // Every factory except Json() produces a plain-text body.
    static HttpResponse Ok(const std::string& message = "");
    static HttpResponse Text(HttpStatus status, const std::string& message);
    static HttpResponse BadRequest(const std::string& message = "");
    static HttpResponse NotFound(const std::string& message = "");
    static HttpResponse MethodNotAllowed(const std::string& message = "", const std::string& allow = "");
    static HttpResponse InternalServerError(const std::string& message = "");
    static HttpResponse Json(const nlohmann::json& json, HttpStatus status = HttpStatus::OK);

    static constexpr const char* SERVER_NAME = "ReadingService/1.0";
    static constexpr const char* TEXT_CONTENT_TYPE = "text/plain; charset=utf-8";
    static constexpr const char* JSON_CONTENT_TYPE = "application/json";

private:
    HttpStatus m_status;
    std::unordered_map<std::string, std::string> m_headers;
    std::string m_body;
    bool m_keepAlive;
};

} // namespace http
} // namespace reading_service
