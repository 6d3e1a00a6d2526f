#include "bndl/arweave/http-client.h"
#include "bndl/arweave/deadline.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/core/logger.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/ssl.h>
#include <utility>

namespace bndl::arweave {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

namespace {
constexpr const char* USER_AGENT = "bundle-dumper";
}  // namespace

HttpClient::HttpClient(GatewayUrl url, std::chrono::seconds timeout)
    : url_(std::move(url))
    , timeout_(timeout)
    , ssl_ctx_(asio::ssl::context::tls_client)
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
}

template <typename Initiate>
void
HttpClient::run_step(const char* what, Initiate&& initiate)
{
    beast::error_code ec;
    bool done = false;
    initiate([&ec, &done](beast::error_code e, auto&&...) {
        ec = e;
        done = true;
    });

    ioc_.restart();
    ioc_.run();

    if (!done)
    {
        throw bundle::TransportError(
            std::string(what) + " did not complete for " + url_.host);
    }
    if (ec)
    {
        throw bundle::TransportError(
            std::string(what) + " failed for " + url_.host + ": " +
            ec.message());
    }
}

template <typename Stream>
HttpResponse
HttpClient::exchange(Stream& stream, const std::string& target)
{
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, url_.host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::accept, "application/json");

    beast::get_lowest_layer(stream).expires_after(timeout_);
    run_step("HTTP write", [&](auto handler) {
        http::async_write(stream, req, std::move(handler));
    });

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    // Chunk responses are base64 encoded 256 KiB chunks plus JSON framing
    parser.body_limit(64 * 1024 * 1024);
    beast::get_lowest_layer(stream).expires_after(timeout_);
    run_step("HTTP read", [&](auto handler) {
        http::async_read(stream, buffer, parser, std::move(handler));
    });

    HttpResponse response;
    response.status = parser.get().result_int();
    response.body = std::move(parser.get().body());
    return response;
}

HttpResponse
HttpClient::get(std::string_view path)
{
    const std::string target = url_.target(path);
    LOGD("GET ", url_.scheme, "://", url_.host, ":", url_.port, target);

    tcp::resolver resolver(ioc_);
    tcp::resolver::results_type endpoints;
    beast::error_code resolve_ec = run_with_deadline(
        ioc_,
        timeout_,
        [&](auto handler) {
            resolver.async_resolve(
                url_.host,
                url_.port,
                [&endpoints, handler](
                    beast::error_code ec,
                    tcp::resolver::results_type results) {
                    endpoints = std::move(results);
                    handler(ec);
                });
        },
        [&resolver] { resolver.cancel(); });
    if (resolve_ec)
    {
        throw bundle::TransportError(
            "DNS resolve failed for " + url_.host + ": " +
            resolve_ec.message());
    }

    if (!url_.tls())
    {
        beast::tcp_stream stream(ioc_);
        stream.expires_after(timeout_);
        run_step("connect", [&](auto handler) {
            stream.async_connect(endpoints, std::move(handler));
        });

        HttpResponse response = exchange(stream, target);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    beast::ssl_stream<beast::tcp_stream> stream(ioc_, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url_.host.c_str()))
    {
        throw bundle::TransportError(
            "failed to set TLS SNI host name " + url_.host);
    }
    stream.set_verify_callback(asio::ssl::host_name_verification(url_.host));

    beast::get_lowest_layer(stream).expires_after(timeout_);
    run_step("connect", [&](auto handler) {
        beast::get_lowest_layer(stream).async_connect(
            endpoints, std::move(handler));
    });
    beast::get_lowest_layer(stream).expires_after(timeout_);
    run_step("TLS handshake", [&](auto handler) {
        stream.async_handshake(
            asio::ssl::stream_base::client, std::move(handler));
    });

    HttpResponse response = exchange(stream, target);

    // Gateways commonly drop the connection without a close_notify; the
    // response is already complete at this point
    beast::error_code ec;
    beast::get_lowest_layer(stream).socket().shutdown(
        tcp::socket::shutdown_both, ec);
    return response;
}

}  // namespace bndl::arweave
