#include "bndl/bundle/bundle-header.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/core/logger.h"

#include <limits>
#include <string>

namespace bndl::bundle {

BundleHeader
read_bundle_header(ChunkedReader& reader)
{
    const uint64_t total = reader.total_size();
    if (total < ITEM_COUNT_BYTES)
    {
        throw MalformedHeaderError(
            "stream of " + std::to_string(total) +
            " bytes is too short for an item count");
    }

    BundleHeader header;
    {
        ByteCursor cursor{reader.request(ITEM_COUNT_BYTES)};
        header.item_count = cursor.read_uint64_le();
    }

    // Reject the count before multiplying so huge values cannot wrap
    const uint64_t max_items = (total - ITEM_COUNT_BYTES) / ENTRY_BYTES;
    if (header.item_count > max_items)
    {
        throw MalformedHeaderError(
            "item count " + std::to_string(header.item_count) +
            " needs an entry table larger than the " + std::to_string(total) +
            " byte stream");
    }

    header.body_offset = ITEM_COUNT_BYTES + header.item_count * ENTRY_BYTES;
    header.entries.reserve(static_cast<std::size_t>(header.item_count));

    uint64_t size_sum = 0;
    for (uint64_t i = 0; i < header.item_count; ++i)
    {
        ByteCursor cursor{reader.request(ENTRY_BYTES)};
        BundleEntry entry;
        entry.size = cursor.read_uint64_le();
        entry.id =
            TransactionId(cursor.read_slice(TransactionId::size()).data());

        if (entry.size > std::numeric_limits<uint64_t>::max() - size_sum)
        {
            throw MalformedHeaderError(
                "entry sizes overflow at entry " + std::to_string(i));
        }
        size_sum += entry.size;
        header.entries.push_back(entry);
    }

    const uint64_t body_length = total - header.body_offset;
    if (size_sum != body_length)
    {
        throw MalformedHeaderError(
            "entry sizes add up to " + std::to_string(size_sum) +
            " bytes but the item-body region is " +
            std::to_string(body_length) + " bytes");
    }
    header.body_size = size_sum;

    LOGI(
        "Bundle header: ",
        header.item_count,
        " items, bodies start at offset ",
        header.body_offset);
    return header;
}

}  // namespace bndl::bundle
