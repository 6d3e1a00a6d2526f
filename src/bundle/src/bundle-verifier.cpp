#include "bndl/bundle/bundle-verifier.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/codec/base64url.h"
#include "bndl/core/logger.h"

#include <string>

namespace bndl::bundle {

std::optional<std::string_view>
TxMetadata::get_tag(std::string_view name) const
{
    auto it = tags_.find(name);
    if (it == tags_.end())
    {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

bool
TxMetadata::is_bundle() const
{
    return get_tag(BUNDLE_FORMAT_TAG) == BUNDLE_FORMAT_BINARY &&
        get_tag(BUNDLE_VERSION_TAG) == BUNDLE_VERSION_2;
}

TxMetadata
verify_bundle(MetadataLookup& lookup, const TransactionId& id)
{
    const std::string id_text = codec::to_base64url(id);
    TxMetadata metadata = lookup.fetch_transaction_metadata(id);

    if (!metadata.is_bundle())
    {
        auto format = metadata.get_tag(BUNDLE_FORMAT_TAG);
        auto version = metadata.get_tag(BUNDLE_VERSION_TAG);
        throw NotABundleError(
            "transaction " + id_text + " is not an ANS-104 bundle (" +
            std::string(BUNDLE_FORMAT_TAG) + "=" +
            std::string(format.value_or("<missing>")) + ", " +
            std::string(BUNDLE_VERSION_TAG) + "=" +
            std::string(version.value_or("<missing>")) + ")");
    }

    LOGI("Transaction ", id_text, " is a binary bundle, version 2.0.0");
    return metadata;
}

}  // namespace bndl::bundle
