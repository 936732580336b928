#include "http/HttpRequest.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace reading_service {
namespace http {

namespace {
    std::string ToLowerCase(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }
}

std::optional<std::string> HttpRequest::GetHeader(const std::string& name) const {
    auto it = m_headers.find(ToLowerCase(name));
    if (it != m_headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool HttpRequest::HasHeader(const std::string& name) const {
    return m_headers.find(ToLowerCase(name)) != m_headers.end();
}

size_t HttpRequest::GetContentLength() const {
    auto header = GetHeader("content-length");
    if (!header || header->empty() || !std::isdigit(static_cast<unsigned char>((*header)[0]))) {
        return 0;
    }

    try {
        return std::stoull(*header);
    } catch (const std::logic_error&) {
        return 0;
    }
}

std::string HttpRequest::GetContentType() const {
    auto header = GetHeader("content-type");
    return header.value_or("");
}

bool HttpRequest::IsKeepAlive() const {
    auto connection = GetHeader("connection");
    if (connection) {
        std::string value = ToLowerCase(*connection);
        if (value == "close") {
            return false;
        }
        if (value == "keep-alive") {
            return true;
        }
    }

    return m_httpVersion == "HTTP/1.1";
}

void HttpRequest::SetMethod(HttpMethod method) {
    m_method = method;
    m_methodName = MethodToString(method);
}

void HttpRequest::SetMethod(const std::string& methodName) {
    m_method = StringToMethod(methodName);
    m_methodName = methodName;
}

void HttpRequest::SetPath(const std::string& target) {
    auto queryPos = target.find('?');
    if (queryPos != std::string::npos) {
        m_path = target.substr(0, queryPos);
        m_queryString = target.substr(queryPos + 1);
    } else {
        m_path = target;
        m_queryString.clear();
    }
}

void HttpRequest::AddHeader(const std::string& name, const std::string& value) {
    m_headers[ToLowerCase(name)] = value;
}

void HttpRequest::Clear() {
    m_method = HttpMethod::UNKNOWN;
    m_methodName.clear();
    m_path.clear();
    m_queryString.clear();
    m_httpVersion.clear();
    m_body.clear();
    m_headers.clear();
}

} // namespace http
} // namespace reading_service
