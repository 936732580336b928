#pragma once

#include "storage/RestTransport.hpp"

#include <boost/asio/ssl/context.hpp>
#include <chrono>

namespace reading_service {
namespace storage {

// Synchronous HTTP/1.1 client over Boost.Beast. One connection per request;
// TLS (peer and host name verified against the system trust store) unless the
// endpoint is plain http, as the local emulator may be.
class BeastRestTransport : public IRestTransport {
public:
    explicit BeastRestTransport(ServiceEndpoint endpoint,
                                std::chrono::seconds timeout = std::chrono::seconds(30));

    RestResponse Send(const RestRequest& request) override;

    const ServiceEndpoint& GetEndpoint() const { return m_endpoint; }

private:
    template <typename Stream>
    RestResponse Exchange(Stream& stream, const RestRequest& request);

    ServiceEndpoint m_endpoint;
    std::chrono::seconds m_timeout;
    boost::asio::ssl::context m_tlsContext;
};

} // namespace storage
} // namespace reading_service
