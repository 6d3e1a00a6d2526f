#pragma once

#include "bndl/bundle/chunked-reader.h"
#include "bndl/core/types.h"

#include <cstdint>
#include <vector>

namespace bndl::bundle {

// Encoded sizes of the header fields
inline constexpr uint64_t ITEM_COUNT_BYTES = 8;
inline constexpr uint64_t ENTRY_SIZE_BYTES = 8;
inline constexpr uint64_t ENTRY_BYTES =
    ENTRY_SIZE_BYTES + TransactionId::size();

// One row of the entry table: how many bytes the item occupies, and its id
struct BundleEntry
{
    uint64_t size = 0;
    TransactionId id;
};

struct BundleHeader
{
    uint64_t item_count = 0;
    std::vector<BundleEntry> entries;

    // Stream offset of the first item body
    uint64_t body_offset = 0;

    // Sum of all entry sizes; equals the length of the item-body region
    uint64_t body_size = 0;
};

/**
 * Parse the bundle header from the front of the stream.
 *
 * Layout: 8-byte little-endian item count, then for each item an 8-byte
 * little-endian size followed by the 32-byte item id, with no delimiters.
 *
 * @throws MalformedHeaderError if the entry table would not fit in the
 * declared stream, or the entry sizes do not add up to exactly the bytes
 * that follow the table
 */
BundleHeader
read_bundle_header(ChunkedReader& reader);

}  // namespace bndl::bundle
