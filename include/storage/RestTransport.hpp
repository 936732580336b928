#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace reading_service {
namespace storage {

struct RestRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct RestResponse {
    int status = 0;
    std::map<std::string, std::string> headers;  // names lowercased
    std::string body;

    std::string GetHeader(const std::string& name) const;
};

// Scheme, host and port of the database account, e.g. "https://acct.documents.azure.com:443/".
struct ServiceEndpoint {
    bool secure = true;
    std::string host;
    uint16_t port = 443;

    // Throws std::invalid_argument for anything but an absolute http(s) URL.
    static ServiceEndpoint Parse(const std::string& url);
};

// Sends one request to the database account. Network failures are thrown as exceptions;
// any HTTP status, including errors, comes back as a response.
class IRestTransport {
public:
    virtual ~IRestTransport() = default;
    virtual RestResponse Send(const RestRequest& request) = 0;
};

} // namespace storage
} // namespace reading_service
