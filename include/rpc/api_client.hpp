#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace das_integrity {

/**
 * Abstract JSON-over-HTTP client.
 *
 * Implementations must be safe to call from several threads at once: the
 * reference and testing calls of one attempt run in parallel, and every
 * category task shares the same client.
 */
class ApiClient {
public:
    virtual ~ApiClient() = default;

    /**
     * POST a JSON body and decode the JSON reply.
     *
     * @param url Full endpoint URL (http:// or https://)
     * @param body Serialized JSON request
     * @throws ApiTransportError if the endpoint cannot be reached
     * @throws ApiStatusError on any status other than 200, without reading the body
     * @throws ApiDecodeError if a 200 body is not JSON
     */
    virtual nlohmann::json make_request(const std::string& url, const std::string& body) const = 0;
};

/**
 * Parsed endpoint URL. IPv6 hosts are kept without brackets; the target keeps
 * the query and drops the fragment.
 */
struct HttpEndpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string target;

    /**
     * @throws std::invalid_argument on an unsupported scheme or an empty host
     */
    static HttpEndpoint parse(const std::string& url);
};

/**
 * HttpApiClient - synchronous Boost.Beast client, one connection per request
 */
class HttpApiClient : public ApiClient {
public:
    HttpApiClient();
    ~HttpApiClient() override;

    nlohmann::json make_request(const std::string& url, const std::string& body) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace das_integrity
