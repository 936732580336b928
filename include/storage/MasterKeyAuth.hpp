#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace reading_service {
namespace storage {

/**
 * Signs document database REST requests with the account master key.
 *
 * The token is an HMAC-SHA256 over the verb, resource type, resource link and
 * request date, sent URL-encoded in the Authorization header together with the
 * same date in x-ms-date.
 */
class MasterKeyAuth {
public:
    // Throws std::invalid_argument if the key is not valid base64.
    explicit MasterKeyAuth(const std::string& base64Key);

    std::string BuildToken(const std::string& verb,
                           const std::string& resourceType,
                           const std::string& resourceLink,
                           const std::string& date) const;

    // RFC 1123, e.g. "Sat, 01 Jun 2024 12:00:00 GMT".
    static std::string FormatHttpDate(std::chrono::system_clock::time_point time);

    static std::string Base64Encode(const std::string& data);
    static std::optional<std::string> Base64Decode(const std::string& text);
    static std::string UrlEncode(const std::string& text);

private:
    std::string m_key;
};

} // namespace storage
} // namespace reading_service
