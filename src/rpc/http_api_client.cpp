#include "rpc/api_client.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace das_integrity {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr int kHttpVersion = 11;

using Response = http::response<http::string_body>;

template <typename Stream>
Response exchange(Stream& stream, const http::request<http::string_body>& request) {
    http::write(stream, request);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    // Tree accounts and asset pages can be larger than the default 8 MB limit
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read(stream, buffer, parser);
    return parser.release();
}

} // namespace

HttpEndpoint HttpEndpoint::parse(const std::string& url) {
    HttpEndpoint endpoint;

    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        endpoint.tls = true;
        endpoint.port = "443";
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        endpoint.port = "80";
        rest = url.substr(7);
    } else {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }

    // The authority ends at the path, the query or the fragment
    size_t end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, end);
    if (end == std::string::npos || rest[end] == '#') {
        endpoint.target = "/";
    } else {
        endpoint.target = (rest[end] == '/' ? "" : "/") + rest.substr(end);
        size_t fragment = endpoint.target.find('#');
        if (fragment != std::string::npos) {
            endpoint.target.erase(fragment);
        }
    }

    if (!authority.empty() && authority.front() == '[') {
        // [v6-address] or [v6-address]:port
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated IPv6 address: " + url);
        }
        endpoint.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw std::invalid_argument("Malformed authority: " + url);
            }
            endpoint.port = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            endpoint.host = authority.substr(0, colon);
            endpoint.port = authority.substr(colon + 1);
        } else {
            endpoint.host = authority;
        }
    }

    if (endpoint.port.empty()) {
        throw std::invalid_argument("URL has an empty port: " + url);
    }
    if (endpoint.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    return endpoint;
}

struct HttpApiClient::Impl {
    ssl::context tls_context{ssl::context::tls_client};
};

HttpApiClient::HttpApiClient() : impl_(std::make_unique<Impl>()) {
    impl_->tls_context.set_default_verify_paths();
    impl_->tls_context.set_verify_mode(ssl::verify_peer);
}

HttpApiClient::~HttpApiClient() = default;

nlohmann::json HttpApiClient::make_request(const std::string& url, const std::string& body) const {
    HttpEndpoint endpoint;
    try {
        endpoint = HttpEndpoint::parse(url);
    } catch (const std::invalid_argument& e) {
        throw ApiTransportError(e.what());
    }

    http::request<http::string_body> request{http::verb::post, endpoint.target, kHttpVersion};
    request.set(http::field::host,
                endpoint.host.find(':') == std::string::npos ? endpoint.host : "[" + endpoint.host + "]");
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();

    Response response;
    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(endpoint.host, endpoint.port);

        if (endpoint.tls) {
            beast::ssl_stream<beast::tcp_stream> stream(ioc, impl_->tls_context);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
                beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                throw beast::system_error{ec};
            }
            stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

            beast::get_lowest_layer(stream).connect(results);
            stream.handshake(ssl::stream_base::client);
            response = das_integrity::exchange(stream, request);

            beast::error_code ec;
            stream.shutdown(ec);
            // Many servers close without a TLS close_notify
            if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
                DAS_DEBUG_COUT("http", "TLS shutdown with " << endpoint.host << ": " << ec.message());
            }
        } else {
            beast::tcp_stream stream(ioc);
            stream.connect(results);
            response = das_integrity::exchange(stream, request);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                DAS_DEBUG_COUT("http", "Shutdown with " << endpoint.host << ": " << ec.message());
            }
        }
    } catch (const beast::system_error& e) {
        throw ApiTransportError(url + ": " + e.code().message());
    }

    if (response.result() != http::status::ok) {
        throw ApiStatusError(response.result_int());
    }

    try {
        return nlohmann::json::parse(response.body());
    } catch (const nlohmann::json::parse_error& e) {
        throw ApiDecodeError(e.what());
    }
}

} // namespace das_integrity
