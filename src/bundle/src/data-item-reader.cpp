#include "bndl/bundle/data-item-reader.h"
#include "bndl/bundle/bounded-reader.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/bundle/tag-decoder.h"
#include "bndl/core/logger.h"

#include <algorithm>
#include <string>

namespace bndl::bundle {

namespace {

LogPartition item_log("ITEMS");

constexpr uint64_t SIGNATURE_TYPE_BYTES = 2;
constexpr uint64_t PRESENCE_FLAG_BYTES = 1;
constexpr uint64_t TAG_HEADER_BYTES = 16;

// Presence byte then the fixed-size field when set
bool
read_presence(BoundedReader& item, const char* field)
{
    uint8_t flag = item.read_u8(field);
    if (flag > 1)
    {
        throw InvalidPresenceFlagError(
            std::string(field) + " presence byte is " +
            std::to_string(static_cast<int>(flag)) + ", expected 0 or 1");
    }
    return flag == 1;
}

}  // namespace

uint64_t
min_item_size(const SignatureConfig& config)
{
    return SIGNATURE_TYPE_BYTES + config.signature_length +
        config.owner_length + 2 * PRESENCE_FLAG_BYTES + TAG_HEADER_BYTES;
}

DataItem
read_data_item(ChunkedReader& reader, const BundleEntry& entry, uint64_t index)
{
    if (entry.size < SIGNATURE_TYPE_BYTES)
    {
        throw ItemSizeMismatchError(
            "declared size " + std::to_string(entry.size) +
            " cannot hold a signature type");
    }

    BoundedReader item(reader, entry.size, BudgetKind::item);

    DataItem result;
    result.index = index;
    result.id = entry.id;

    uint16_t code = item.read_uint16_le("signature type");
    auto config = signature_config(code);
    if (!config)
    {
        throw UnknownSignatureTypeError(
            "unsupported signature type " + std::to_string(code));
    }
    if (entry.size < min_item_size(*config))
    {
        throw ItemSizeMismatchError(
            "declared size " + std::to_string(entry.size) + " is below the " +
            std::to_string(min_item_size(*config)) + " bytes a " +
            config->name + " item needs");
    }
    result.signature_type = config->type;

    result.signature = item.read_bytes(config->signature_length, "signature");
    result.owner = item.read_bytes(config->owner_length, "owner");

    if (read_presence(item, "target"))
    {
        auto bytes = item.read_bytes(TARGET_LENGTH, "target");
        result.target = TransactionId(bytes.data());
    }
    if (read_presence(item, "anchor"))
    {
        auto bytes = item.read_bytes(ANCHOR_LENGTH, "anchor");
        Anchor anchor;
        std::copy(bytes.begin(), bytes.end(), anchor.begin());
        result.anchor = anchor;
    }

    uint64_t tag_count = item.read_uint64_le("tag count");
    uint64_t tag_bytes = item.read_uint64_le("tag bytes");
    item.reserve(tag_bytes, "tags");
    result.tags = read_tags(reader, tag_count, tag_bytes);

    uint64_t data_length = item.remaining();
    result.data = item.read_bytes(data_length, "data");

    if (item.consumed() != entry.size)
    {
        throw ItemSizeMismatchError(
            "item consumed " + std::to_string(item.consumed()) +
            " bytes, declared size is " + std::to_string(entry.size));
    }

    PLOGD(
        item_log,
        "Item #",
        index,
        ": ",
        config->name,
        ", ",
        result.tags.size(),
        " tags, ",
        data_length,
        " data bytes");
    return result;
}

}  // namespace bndl::bundle
