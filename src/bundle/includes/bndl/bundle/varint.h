#pragma once

#include "bndl/bundle/byte-cursor.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bndl::bundle {

// Zigzag-signed base-128 varints as used by the Avro encoding of the tag
// list: little-endian groups of 7 bits, high bit set on every byte except
// the last, then (n >> 1) ^ -(n & 1).

// Longest encoding of a 64-bit value
inline constexpr std::size_t max_varint_bytes = 10;

enum class VarintStatus {
    ok,
    // The cursor ran out before the terminating byte; nothing was consumed
    need_more
};

inline constexpr int64_t
zigzag_decode(uint64_t n)
{
    return static_cast<int64_t>(n >> 1) ^ -static_cast<int64_t>(n & 1);
}

inline constexpr uint64_t
zigzag_encode(int64_t v)
{
    return (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
}

/**
 * Try to decode one zigzag varint at the cursor.
 *
 * On VarintStatus::ok the value is stored in `out` and the cursor is moved
 * past the encoding. On VarintStatus::need_more the cursor is left where it
 * was so the caller can retry once more bytes are available.
 *
 * @throws MalformedVarintError if the encoding is longer than
 * max_varint_bytes, regardless of how many bytes are available
 */
VarintStatus
try_read_zigzag(ByteCursor& cursor, int64_t& out);

// Append the encoding of `v` to `out`, returns the number of bytes written
std::size_t
write_zigzag(std::vector<uint8_t>& out, int64_t v);

std::size_t
size_zigzag(int64_t v);

}  // namespace bndl::bundle
