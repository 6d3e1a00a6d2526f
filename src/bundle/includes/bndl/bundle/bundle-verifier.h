#pragma once

#include "bndl/core/types.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace bndl::bundle {

inline constexpr std::string_view BUNDLE_FORMAT_TAG = "Bundle-Format";
inline constexpr std::string_view BUNDLE_FORMAT_BINARY = "binary";
inline constexpr std::string_view BUNDLE_VERSION_TAG = "Bundle-Version";
inline constexpr std::string_view BUNDLE_VERSION_2 = "2.0.0";

// Tags of a transaction, decoded to text. A repeated tag name keeps its
// first value.
class TxMetadata
{
public:
    TxMetadata() = default;
    explicit TxMetadata(std::map<std::string, std::string, std::less<>> tags)
        : tags_(std::move(tags))
    {
    }

    void
    add_tag(std::string name, std::string value)
    {
        tags_.emplace(std::move(name), std::move(value));
    }

    std::optional<std::string_view>
    get_tag(std::string_view name) const;

    // Declares binary bundle format version 2.0.0
    bool
    is_bundle() const;

    const std::map<std::string, std::string, std::less<>>&
    tags() const
    {
        return tags_;
    }

private:
    std::map<std::string, std::string, std::less<>> tags_;
};

// Source of transaction metadata, typically a network gateway
class MetadataLookup
{
public:
    virtual ~MetadataLookup() = default;

    /**
     * @throws TransactionNotFoundError if the transaction is unknown
     * @throws TransportError on any other failure
     */
    virtual TxMetadata
    fetch_transaction_metadata(const TransactionId& id) = 0;
};

/**
 * Check that a transaction declares itself a bundle before any of its
 * payload is requested.
 *
 * @return the fetched metadata
 * @throws NotABundleError if the bundle format tags are missing or carry
 * other values
 */
TxMetadata
verify_bundle(MetadataLookup& lookup, const TransactionId& id);

}  // namespace bndl::bundle
