#pragma once

#include "bndl/arweave/gateway-url.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <string>
#include <string_view>

namespace bndl::arweave {

struct HttpResponse
{
    unsigned status = 0;
    std::string body;
};

/**
 * Minimal blocking HTTP/1.1 GET client over Boost.Beast.
 *
 * Each request uses its own connection (TLS with SNI and peer verification
 * for https). DNS resolution, connect, handshake, write and read are each
 * bounded by the configured timeout.
 */
class HttpClient
{
public:
    HttpClient(GatewayUrl url, std::chrono::seconds timeout);

    /**
     * @param path Path relative to the gateway's base path
     * @return status and body of the response, whatever the status
     * @throws TransportError if the exchange fails or times out
     */
    HttpResponse
    get(std::string_view path);

    const GatewayUrl&
    url() const
    {
        return url_;
    }

private:
    template <typename Stream>
    HttpResponse
    exchange(Stream& stream, const std::string& target);

    // Run the io_context until the operation started by `initiate`
    // completes, then throw TransportError if it failed
    template <typename Initiate>
    void
    run_step(const char* what, Initiate&& initiate);

    GatewayUrl url_;
    std::chrono::seconds timeout_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
};

}  // namespace bndl::arweave
