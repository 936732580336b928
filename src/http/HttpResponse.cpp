#include "http/HttpResponse.hpp"
#include <sstream>

namespace reading_service {
namespace http {

HttpResponse::HttpResponse()
    : HttpResponse(HttpStatus::OK) {
}

HttpResponse::HttpResponse(HttpStatus status)
    : m_status(status)
    , m_keepAlive(true) {
    SetHeader("Server", SERVER_NAME);
}

void HttpResponse::SetStatus(HttpStatus status) {
    m_status = status;
}

void HttpResponse::SetHeader(const std::string& name, const std::string& value) {
    m_headers[name] = value;
}

void HttpResponse::RemoveHeader(const std::string& name) {
    m_headers.erase(name);
}

std::string HttpResponse::GetHeader(const std::string& name) const {
    auto it = m_headers.find(name);
    if (it != m_headers.end()) {
        return it->second;
    }
    return "";
}

void HttpResponse::SetBody(const std::string& body) {
    m_body = body;
    SetHeader("Content-Length", std::to_string(m_body.size()));
}

void HttpResponse::SetBody(std::string&& body) {
    m_body = std::move(body);
    SetHeader("Content-Length", std::to_string(m_body.size()));
}

void HttpResponse::SetJsonBody(const nlohmann::json& json) {
    SetContentType(JSON_CONTENT_TYPE);
    SetBody(json.dump());
}

void HttpResponse::SetTextBody(const std::string& text) {
    SetContentType(TEXT_CONTENT_TYPE);
    SetBody(text);
}

void HttpResponse::SetContentType(const std::string& contentType) {
    SetHeader("Content-Type", contentType);
}

void HttpResponse::SetKeepAlive(bool keepAlive) {
    m_keepAlive = keepAlive;
    SetHeader("Connection", keepAlive ? "keep-alive" : "close");
}

std::string HttpResponse::Serialize() const {
    std::ostringstream oss;

    oss << "HTTP/1.1 " << static_cast<int>(m_status) << " " << StatusToString(m_status) << "\r\n";

    for (const auto& [name, value] : m_headers) {
        oss << name << ": " << value << "\r\n";
    }

    if (m_headers.find("Content-Length") == m_headers.end()) {
        oss << "Content-Length: " << m_body.size() << "\r\n";
    }

    oss << "\r\n";
    oss << m_body;

    return oss.str();
}

HttpResponse HttpResponse::Ok(const std::string& message) {
    return Text(HttpStatus::OK, message);
}

HttpResponse HttpResponse::Text(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.SetTextBody(message);
    return response;
}

HttpResponse HttpResponse::BadRequest(const std::string& message) {
    return Text(HttpStatus::BadRequest, message.empty() ? "Bad request" : message);
}

HttpResponse HttpResponse::NotFound(const std::string& message) {
    return Text(HttpStatus::NotFound, message.empty() ? "Resource not found" : message);
}

HttpResponse HttpResponse::MethodNotAllowed(const std::string& message, const std::string& allow) {
    HttpResponse response = Text(HttpStatus::MethodNotAllowed,
                                 message.empty() ? "Method not allowed" : message);
    if (!allow.empty()) {
        response.SetHeader("Allow", allow);
    }
    return response;
}

HttpResponse HttpResponse::InternalServerError(const std::string& message) {
    return Text(HttpStatus::InternalServerError, message.empty() ? "Internal server error" : message);
}

HttpResponse HttpResponse::Json(const nlohmann::json& json, HttpStatus status) {
    HttpResponse response(status);
    response.SetJsonBody(json);
    return response;
}

} // namespace http
} // namespace reading_service
