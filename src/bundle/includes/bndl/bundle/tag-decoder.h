#pragma once

#include "bndl/bundle/chunked-reader.h"
#include "bndl/bundle/data-item.h"

#include <cstdint>
#include <vector>

namespace bndl::bundle {

/**
 * Decode an item's tag list from the next `tag_bytes` bytes of the stream.
 *
 * The list is an Avro array of {name: bytes, value: bytes} records: blocks
 * each prefixed by a zigzag varint item count (a negative count is followed
 * by the block's byte size), terminated by a block count of zero. A record
 * field is a zigzag varint length followed by that many bytes.
 *
 * A zero-length region is an empty list. Exactly `tag_bytes` bytes are
 * consumed on success.
 *
 * @throws TagCountMismatchError if the array holds other than `tag_count`
 * records
 * @throws TagLengthMismatchError if decoding needs more than `tag_bytes`
 * bytes (including a varint cut off by the end of the region), or finishes
 * before consuming all of them
 * @throws MalformedTagsError for negative field lengths or an inconsistent
 * block byte size
 * @throws TruncatedVarintError if a varint is cut off by the end of the
 * stream
 */
std::vector<Tag>
read_tags(ChunkedReader& reader, uint64_t tag_count, uint64_t tag_bytes);

}  // namespace bndl::bundle
