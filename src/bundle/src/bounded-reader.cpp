#include "bndl/bundle/bounded-reader.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/bundle/varint.h"

#include <exception>
#include <string>

namespace bndl::bundle {

BoundedReader::BoundedReader(
    ChunkedReader& reader,
    uint64_t limit,
    BudgetKind kind)
    : reader_(reader), start_(reader.offset()), limit_(limit), kind_(kind)
{
}

void
BoundedReader::reserve(uint64_t n, const char* field) const
{
    if (n <= remaining())
    {
        return;
    }

    std::string msg = std::string(field) + " needs " + std::to_string(n) +
        " bytes but only " + std::to_string(remaining()) + " of " +
        std::to_string(limit_) + " remain";
    if (kind_ == BudgetKind::tags)
    {
        throw TagLengthMismatchError("tag region too short: " + msg);
    }
    throw ItemOverrunError(msg);
}

uint8_t
BoundedReader::read_u8(const char* field)
{
    reserve(1, field);
    return reader_.request(1).data()[0];
}

uint16_t
BoundedReader::read_uint16_le(const char* field)
{
    reserve(2, field);
    ByteCursor cursor{reader_.request(2)};
    return cursor.read_uint16_le();
}

uint64_t
BoundedReader::read_uint64_le(const char* field)
{
    reserve(8, field);
    ByteCursor cursor{reader_.request(8)};
    return cursor.read_uint64_le();
}

std::vector<uint8_t>
BoundedReader::read_bytes(uint64_t n, const char* field)
{
    reserve(n, field);
    std::vector<uint8_t> out;
    reader_.read_into(out, n);
    return out;
}

int64_t
BoundedReader::read_zigzag(const char* field)
{
    for (;;)
    {
        ByteCursor cursor = reader_.window();
        bool capped = cursor.data.size() >= remaining();
        if (capped)
        {
            cursor.data = cursor.data.subslice(
                0, static_cast<std::size_t>(remaining()));
        }

        int64_t value = 0;
        if (try_read_zigzag(cursor, value) == VarintStatus::ok)
        {
            reader_.consume(cursor.pos);
            return value;
        }

        // Ran out of bytes: either the budget ends here, or the next chunk
        // holds the rest of the encoding
        if (capped)
        {
            reserve(remaining() + 1, field);
        }

        const bool partial = cursor.data.size() > 0;
        bool fetched = false;
        try
        {
            fetched = reader_.fetch_more();
        }
        catch (const UnexpectedEofError&)
        {
            if (!partial)
            {
                throw;
            }
            std::throw_with_nested(truncated(field, cursor.data.size()));
        }
        if (!fetched)
        {
            throw truncated(field, cursor.data.size());
        }
    }
}

TruncatedVarintError
BoundedReader::truncated(const char* field, std::size_t have) const
{
    return TruncatedVarintError(
        std::string(field) + ": stream ends after " + std::to_string(have) +
        " byte(s) of a varint at offset " + std::to_string(reader_.offset()));
}

void
BoundedReader::skip_rest()
{
    reader_.skip(remaining());
}

}  // namespace bndl::bundle
