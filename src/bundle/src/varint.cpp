#include "bndl/bundle/varint.h"

#include <string>

namespace bndl::bundle {

VarintStatus
try_read_zigzag(ByteCursor& cursor, int64_t& out)
{
    Slice window = cursor.remaining();
    uint64_t raw = 0;

    for (std::size_t n = 0; n < max_varint_bytes; ++n)
    {
        if (n >= window.size())
        {
            return VarintStatus::need_more;
        }

        uint8_t byte = window.data()[n];
        raw |= static_cast<uint64_t>(byte & 0x7F) << (7 * n);
        if ((byte & 0x80) == 0)
        {
            // The tenth byte only contributes one bit to a 64-bit value
            if (n == max_varint_bytes - 1 && byte > 1)
            {
                throw MalformedVarintError(
                    "varint overflows 64 bits (last byte " +
                    std::to_string(static_cast<int>(byte)) + ")");
            }
            cursor.pos += n + 1;
            out = zigzag_decode(raw);
            return VarintStatus::ok;
        }
    }

    throw MalformedVarintError(
        "varint has no terminating byte within " +
        std::to_string(max_varint_bytes) + " bytes");
}

std::size_t
write_zigzag(std::vector<uint8_t>& out, int64_t v)
{
    uint64_t n = zigzag_encode(v);
    std::size_t written = 0;
    do
    {
        uint8_t d = n & 0x7F;
        n >>= 7;
        if (n != 0)
            d |= 0x80;
        out.push_back(d);
        ++written;
    } while (n != 0);
    return written;
}

std::size_t
size_zigzag(int64_t v)
{
    uint64_t n = zigzag_encode(v);
    std::size_t size = 1;
    while (n >>= 7)
        ++size;
    return size;
}

}  // namespace bndl::bundle
