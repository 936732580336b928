#include "storage/RestTransport.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace reading_service {
namespace storage {

std::string RestResponse::GetHeader(const std::string& name) const {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = headers.find(key);
    return it == headers.end() ? std::string() : it->second;
}

ServiceEndpoint ServiceEndpoint::Parse(const std::string& url) {
    ServiceEndpoint endpoint;
    std::string rest;

    if (url.compare(0, 8, "https://") == 0) {
        endpoint.secure = true;
        endpoint.port = 443;
        rest = url.substr(8);
    } else if (url.compare(0, 7, "http://") == 0) {
        endpoint.secure = false;
        endpoint.port = 80;
        rest = url.substr(7);
    } else {
        throw std::invalid_argument("endpoint must start with https:// or http://: " + url);
    }

    rest = rest.substr(0, rest.find('/'));

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        std::string port = rest.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("invalid port in endpoint: " + url);
        }
        unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535) {
            throw std::invalid_argument("invalid port in endpoint: " + url);
        }
        endpoint.port = static_cast<uint16_t>(value);
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) {
        throw std::invalid_argument("endpoint has no host: " + url);
    }

    endpoint.host = rest;
    return endpoint;
}

} // namespace storage
} // namespace reading_service
