#pragma once

#include "bndl/bundle/bundle-errors.h"
#include "bndl/bundle/chunked-reader.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bndl::bundle {

// Which error a BoundedReader raises when a field would cross its limit
enum class BudgetKind {
    item,  // ItemOverrunError
    tags   // TagLengthMismatchError
};

/**
 * Reads from a ChunkedReader without crossing a byte limit measured from
 * the offset at construction.
 *
 * Budgets nest: a reader over an item's tag region consumes from the same
 * ChunkedReader, so the enclosing item budget sees those bytes as consumed.
 */
class BoundedReader
{
public:
    BoundedReader(ChunkedReader& reader, uint64_t limit, BudgetKind kind);

    uint64_t
    limit() const
    {
        return limit_;
    }

    uint64_t
    consumed() const
    {
        return reader_.offset() - start_;
    }

    uint64_t
    remaining() const
    {
        return limit_ - consumed();
    }

    // Throw the budget's error if `n` more bytes do not fit
    void
    reserve(uint64_t n, const char* field) const;

    uint8_t
    read_u8(const char* field);

    uint16_t
    read_uint16_le(const char* field);

    uint64_t
    read_uint64_le(const char* field);

    std::vector<uint8_t>
    read_bytes(uint64_t n, const char* field);

    /**
     * Decode a zigzag varint, pulling further chunks while the decoder
     * reports that it needs more bytes.
     *
     * @throws TruncatedVarintError if the stream ends before the terminating
     * byte, with the source's UnexpectedEofError nested when the source
     * came up short; the budget's own error if the budget ends first
     * @throws MalformedVarintError if the encoding itself is invalid
     */
    int64_t
    read_zigzag(const char* field);

    // Consume whatever is left of the budget
    void
    skip_rest();

private:
    TruncatedVarintError
    truncated(const char* field, std::size_t have) const;

    ChunkedReader& reader_;
    uint64_t start_;
    uint64_t limit_;
    BudgetKind kind_;
};

}  // namespace bndl::bundle
