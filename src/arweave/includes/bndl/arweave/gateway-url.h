#pragma once

#include <string>
#include <string_view>

namespace bndl::arweave {

// Base URL of an HTTP(S) gateway, split into what a connection needs
struct GatewayUrl
{
    std::string scheme;  // "http" or "https"
    std::string host;
    std::string port;
    std::string base_path;  // Always ends with '/'

    bool
    tls() const
    {
        return scheme == "https";
    }

    // Request target for `path`, relative to the base path
    std::string
    target(std::string_view path) const;

    std::string
    to_string() const;

    /**
     * Parse "scheme://host[:port][/base/path]".
     *
     * @throws std::invalid_argument for a missing host, an unsupported
     * scheme or a bad port
     */
    static GatewayUrl
    parse(std::string_view url);
};

}  // namespace bndl::arweave
