#include "storage/MasterKeyAuth.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <vector>

namespace reading_service {
namespace storage {

namespace {
    std::string ToLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

MasterKeyAuth::MasterKeyAuth(const std::string& base64Key) {
    auto key = Base64Decode(base64Key);
    if (!key || key->empty()) {
        throw std::invalid_argument("master key is not valid base64");
    }
    m_key = std::move(*key);
}

std::string MasterKeyAuth::BuildToken(const std::string& verb,
                                      const std::string& resourceType,
                                      const std::string& resourceLink,
                                      const std::string& date) const {
    const std::string payload = ToLower(verb) + "\n" +
                                ToLower(resourceType) + "\n" +
                                resourceLink + "\n" +
                                ToLower(date) + "\n" +
                                "\n";

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (HMAC(EVP_sha256(), m_key.data(), static_cast<int>(m_key.size()),
             reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
             digest, &digestLength) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    std::string signature = Base64Encode(std::string(reinterpret_cast<const char*>(digest), digestLength));
    return UrlEncode("type=master&ver=1.0&sig=" + signature);
}

std::string MasterKeyAuth::FormatHttpDate(std::chrono::system_clock::time_point time) {
    static const char* const DAYS[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const MONTHS[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  DAYS[utc.tm_wday], utc.tm_mday, MONTHS[utc.tm_mon], utc.tm_year + 1900,
                  utc.tm_hour, utc.tm_min, utc.tm_sec);
    return buffer;
}

std::string MasterKeyAuth::Base64Encode(const std::string& data) {
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                 static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(length));
}

std::optional<std::string> MasterKeyAuth::Base64Decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    int length = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                 static_cast<int>(text.size()));
    if (length < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as zero bytes.
    size_t padding = 0;
    for (auto it = text.rbegin(); it != text.rend() && *it == '=' && padding < 2; ++it) {
        ++padding;
    }

    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(length) - padding);
}

std::string MasterKeyAuth::UrlEncode(const std::string& text) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(text.size() * 3);

    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += HEX[c >> 4];
            encoded += HEX[c & 0x0F];
        }
    }

    return encoded;
}

} // namespace storage
} // namespace reading_service
