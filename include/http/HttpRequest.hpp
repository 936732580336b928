#pragma once

#include "http/HttpStatus.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace reading_service {
namespace http {

class HttpRequest {
public:
    HttpRequest() = default;

    HttpMethod GetMethod() const { return m_method; }
    // The method token as the client sent it, e.g. "post" or "PROPFIND".
    const std::string& GetMethodName() const { return m_methodName; }
    const std::string& GetPath() const { return m_path; }
    const std::string& GetQueryString() const { return m_queryString; }
    const std::string& GetHttpVersion() const { return m_httpVersion; }
    const std::string& GetBody() const { return m_body; }

    std::optional<std::string> GetHeader(const std::string& name) const;
    const std::unordered_map<std::string, std::string>& GetHeaders() const { return m_headers; }
    bool HasHeader(const std::string& name) const;

    size_t GetContentLength() const;
    std::string GetContentType() const;
    bool IsKeepAlive() const;

    void SetMethod(HttpMethod method);
    void SetMethod(const std::string& methodName);
    void SetPath(const std::string& target);
    void SetHttpVersion(const std::string& version) { m_httpVersion = version; }
    void SetBody(const std::string& body) { m_body = body; }
    void SetBody(std::string&& body) { m_body = std::move(body); }
    void AddHeader(const std::string& name, const std::string& value);

    void Clear();

private:
    HttpMethod m_method = HttpMethod::UNKNOWN;
    std::string m_methodName;
    std::string m_path;
    std::string m_queryString;
    std::string m_httpVersion;
    std::string m_body;
    std::unordered_map<std::string, std::string> m_headers;
};

} // namespace http
} // namespace reading_service
