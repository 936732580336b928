#include "storage/BeastRestTransport.hpp"
#include "utils/Logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace reading_service {
namespace storage {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {
    constexpr const char* USER_AGENT = "reading-service/1.0 " BOOST_BEAST_VERSION_STRING;

    std::string ToLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

BeastRestTransport::BeastRestTransport(ServiceEndpoint endpoint, std::chrono::seconds timeout)
    : m_endpoint(std::move(endpoint))
    , m_timeout(timeout)
    , m_tlsContext(ssl::context::tlsv12_client) {
    m_tlsContext.set_default_verify_paths();
    m_tlsContext.set_verify_mode(ssl::verify_peer);
}

RestResponse BeastRestTransport::Send(const RestRequest& request) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto results = resolver.resolve(m_endpoint.host, std::to_string(m_endpoint.port));

    if (!m_endpoint.secure) {
        beast::tcp_stream stream(ioc);
        stream.expires_after(m_timeout);
        stream.connect(results);

        RestResponse response = Exchange(stream, request);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc, m_tlsContext);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), m_endpoint.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw beast::system_error{ec};
    }
    stream.set_verify_callback(ssl::host_name_verification(m_endpoint.host));

    beast::get_lowest_layer(stream).expires_after(m_timeout);
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(ssl::stream_base::client);

    RestResponse response = Exchange(stream, request);

    beast::error_code ec;
    stream.shutdown(ec);
    if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof) {
        utils::Logger::Debug("TLS shutdown: " + ec.message());
    }
    return response;
}

template <typename Stream>
RestResponse BeastRestTransport::Exchange(Stream& stream, const RestRequest& request) {
    http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("unsupported HTTP method " + request.method);
    }

    http::request<http::string_body> req{verb, request.path, 11};
    req.set(http::field::host, m_endpoint.host);
    req.set(http::field::user_agent, USER_AGENT);
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    req.body() = request.body;
    req.prepare_payload();

    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    RestResponse response;
    response.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        auto name = field.name_string();
        auto value = field.value();
        response.headers[ToLower(std::string(name.data(), name.size()))] = std::string(value.data(), value.size());
    }
    response.body = std::move(res.body());
    return response;
}

} // namespace storage
} // namespace reading_service
