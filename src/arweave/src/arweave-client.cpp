#include "bndl/arweave/arweave-client.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/codec/base64url.h"
#include "bndl/core/logger.h"

#include <boost/json.hpp>
#include <charconv>
#include <utility>

namespace bndl::arweave {

namespace json = boost::json;
using bundle::TransportError;

namespace {

json::object
parse_object(std::string_view body, const char* what)
{
    json::error_code ec;
    json::value jv =
        json::parse(json::string_view(body.data(), body.size()), ec);
    if (ec)
    {
        throw TransportError(
            std::string("invalid JSON in ") + what + ": " + ec.message());
    }
    if (!jv.is_object())
    {
        throw TransportError(std::string(what) + " is not a JSON object");
    }
    return std::move(jv.as_object());
}

const json::string&
string_field(const json::object& obj, const char* key, const char* what)
{
    auto it = obj.if_contains(key);
    if (!it || !it->is_string())
    {
        throw TransportError(
            std::string(what) + " has no string field '" + key + "'");
    }
    return it->as_string();
}

std::string
decode_text(const json::string& encoded, const char* what)
{
    auto bytes = codec::decode_base64url(
        std::string_view(encoded.data(), encoded.size()));
    if (!bytes)
    {
        throw TransportError(
            std::string("invalid base64url in ") + what + ": " +
            std::string(encoded.c_str()));
    }
    return std::string(bytes->begin(), bytes->end());
}

uint64_t
parse_decimal(const json::string& text, const char* what)
{
    uint64_t value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || first == last)
    {
        throw TransportError(
            std::string("invalid number for ") + what + ": '" +
            std::string(text.c_str()) + "'");
    }
    return value;
}

}  // namespace

bundle::TxMetadata
parse_transaction_metadata(std::string_view body)
{
    const auto obj = parse_object(body, "transaction metadata");

    bundle::TxMetadata metadata;
    auto tags = obj.if_contains("tags");
    if (!tags)
    {
        return metadata;
    }
    if (!tags->is_array())
    {
        throw TransportError("transaction metadata 'tags' is not an array");
    }

    for (const auto& tag : tags->as_array())
    {
        if (!tag.is_object())
        {
            throw TransportError("transaction tag is not a JSON object");
        }
        const auto& tag_obj = tag.as_object();
        metadata.add_tag(
            decode_text(string_field(tag_obj, "name", "tag"), "tag name"),
            decode_text(string_field(tag_obj, "value", "tag"), "tag value"));
    }
    return metadata;
}

TxOffset
parse_transaction_offset(std::string_view body)
{
    const auto obj = parse_object(body, "transaction offset");

    TxOffset result;
    result.size = parse_decimal(
        string_field(obj, "size", "transaction offset"), "size");
    result.offset = parse_decimal(
        string_field(obj, "offset", "transaction offset"), "offset");
    if (result.size > 0 && result.offset + 1 < result.size)
    {
        throw TransportError(
            "transaction offset " + std::to_string(result.offset) +
            " is smaller than its size " + std::to_string(result.size));
    }
    return result;
}

std::vector<uint8_t>
parse_chunk(std::string_view body)
{
    const auto obj = parse_object(body, "chunk");
    const auto& encoded = string_field(obj, "chunk", "chunk");
    auto bytes = codec::decode_base64url(
        std::string_view(encoded.data(), encoded.size()));
    if (!bytes)
    {
        throw TransportError("invalid base64url in chunk payload");
    }
    return std::move(*bytes);
}

ArweaveClient::ArweaveClient(GatewayUrl url, std::chrono::seconds timeout)
    : http_(std::move(url), timeout)
{
}

std::string
ArweaveClient::get_ok(const std::string& path)
{
    HttpResponse response = http_.get(path);
    if (response.status == 200)
    {
        return std::move(response.body);
    }
    if (response.status == 404)
    {
        throw bundle::TransactionNotFoundError(
            "gateway " + http_.url().to_string() + " has no " + path);
    }
    if (response.status == 202)
    {
        throw TransportError(path + " is pending (HTTP 202)");
    }
    throw TransportError(
        "GET " + path + " returned HTTP " + std::to_string(response.status));
}

bundle::TxMetadata
ArweaveClient::fetch_transaction_metadata(const TransactionId& id)
{
    const std::string path = "tx/" + codec::to_base64url(id);
    auto metadata = parse_transaction_metadata(get_ok(path));
    LOGD("Fetched ", metadata.tags().size(), " tags for ", path);
    return metadata;
}

TxOffset
ArweaveClient::fetch_transaction_offset(const TransactionId& id)
{
    const std::string path = "tx/" + codec::to_base64url(id) + "/offset";
    auto result = parse_transaction_offset(get_ok(path));
    LOGD(
        "Transaction payload: size=",
        result.size,
        " end offset=",
        result.offset);
    return result;
}

std::vector<uint8_t>
ArweaveClient::fetch_chunk(uint64_t absolute_offset)
{
    return parse_chunk(get_ok("chunk/" + std::to_string(absolute_offset)));
}

}  // namespace bndl::arweave
