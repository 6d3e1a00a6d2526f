#pragma once

#include "bndl/bundle/bundle-errors.h"
#include "bndl/core/types.h"

#include <cstdint>
#include <string>

namespace bndl::bundle {

// Cursor for tracking position in a borrowed Slice. All multi-byte integers
// in the bundle format are little-endian.
struct ByteCursor
{
    Slice data;
    size_t pos = 0;

    bool
    empty() const
    {
        return pos >= data.size();
    }
    size_t
    remaining_size() const
    {
        return pos >= data.size() ? 0 : data.size() - pos;
    }
    Slice
    remaining() const
    {
        return data.subslice(pos);
    }

    uint8_t
    peek_u8() const
    {
        if (pos >= data.size())
        {
            throw UnexpectedEofError("ByteCursor: peek past end of data");
        }
        return data.data()[pos];
    }

    uint8_t
    read_u8()
    {
        if (pos >= data.size())
        {
            throw UnexpectedEofError("ByteCursor: read_u8 past end of data");
        }
        return data.data()[pos++];
    }

    uint16_t
    read_uint16_le()
    {
        require(2, "read_uint16_le");
        uint16_t result = static_cast<uint16_t>(data.data()[pos]) |
            (static_cast<uint16_t>(data.data()[pos + 1]) << 8);
        pos += 2;
        return result;
    }

    uint64_t
    read_uint64_le()
    {
        require(8, "read_uint64_le");
        uint64_t result = 0;
        for (int i = 7; i >= 0; --i)
        {
            result = (result << 8) | data.data()[pos + i];
        }
        pos += 8;
        return result;
    }

    Slice
    read_slice(size_t n)
    {
        require(n, "read_slice");
        Slice result(data.data() + pos, n);
        pos += n;
        return result;
    }

private:
    void
    require(size_t n, const char* what) const
    {
        if (n > remaining_size())
        {
            throw UnexpectedEofError(
                std::string("ByteCursor: ") + what + " wants " +
                std::to_string(n) + " bytes, only " +
                std::to_string(remaining_size()) + " available");
        }
    }
};

}  // namespace bndl::bundle
