#pragma once

#include "bndl/bundle/bundle-header.h"
#include "bndl/bundle/chunked-reader.h"
#include "bndl/bundle/data-item.h"

#include <cstdint>

namespace bndl::bundle {

/**
 * Decode one DataItem occupying exactly `entry.size` bytes at the reader's
 * current offset.
 *
 * Field order: 2-byte signature type, signature, owner, target presence
 * byte (+ 32-byte target), anchor presence byte (+ 32-byte anchor), 8-byte
 * tag count, 8-byte tag byte length, tag array, then data up to the end of
 * the item. Data length is whatever the declared size leaves.
 *
 * On failure the reader is left somewhere inside the item; callers that
 * want to continue must realign to the item's end themselves.
 *
 * @throws ItemSizeMismatchError if the declared size cannot hold the fixed
 * fields of the item's signature type, or the item does not end exactly at
 * its declared size
 * @throws ItemOverrunError if a field would read past the declared size
 * @throws UnknownSignatureTypeError, InvalidPresenceFlagError, and the tag
 * decoding errors of read_tags()
 */
DataItem
read_data_item(ChunkedReader& reader, const BundleEntry& entry, uint64_t index);

// Smallest encoded size of an item with the given signature layout: no
// target, anchor, tags or data
uint64_t
min_item_size(const SignatureConfig& config);

}  // namespace bndl::bundle
