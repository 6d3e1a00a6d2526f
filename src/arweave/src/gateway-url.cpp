#include "bndl/arweave/gateway-url.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace bndl::arweave {

std::string
GatewayUrl::target(std::string_view path) const
{
    while (!path.empty() && path.front() == '/')
    {
        path.remove_prefix(1);
    }
    return base_path + std::string(path);
}

std::string
GatewayUrl::to_string() const
{
    bool default_port = (tls() && port == "443") || (!tls() && port == "80");
    return scheme + "://" + host + (default_port ? "" : ":" + port) +
        base_path;
}

GatewayUrl
GatewayUrl::parse(std::string_view url)
{
    GatewayUrl result;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos)
    {
        throw std::invalid_argument(
            "URL has no scheme: " + std::string(url));
    }
    result.scheme = std::string(url.substr(0, scheme_end));
    std::ranges::transform(result.scheme, result.scheme.begin(), ::tolower);
    if (result.scheme != "http" && result.scheme != "https")
    {
        throw std::invalid_argument(
            "Unsupported URL scheme: " + result.scheme);
    }

    std::string_view rest = url.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    std::string_view authority = rest.substr(0, path_start);
    std::string_view path = path_start == std::string_view::npos
        ? std::string_view("/")
        : rest.substr(path_start);

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos)
    {
        result.host = std::string(authority.substr(0, colon));
        result.port = std::string(authority.substr(colon + 1));
        if (result.port.empty() ||
            !std::ranges::all_of(result.port, [](unsigned char c) {
                return std::isdigit(c);
            }))
        {
            throw std::invalid_argument(
                "Invalid port in URL: " + std::string(url));
        }
    }
    else
    {
        result.host = std::string(authority);
        result.port = result.tls() ? "443" : "80";
    }

    if (result.host.empty())
    {
        throw std::invalid_argument(
            "URL has no host: " + std::string(url));
    }

    result.base_path = std::string(path);
    if (result.base_path.back() != '/')
    {
        result.base_path.push_back('/');
    }
    return result;
}

}  // namespace bndl::arweave
