#include "bndl/core/types.h"

#include <string>

void
slice_hex(Slice sl, std::string& result)
{
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    result.reserve(result.size() + sl.size() * 2);
    for (size_t i = 0; i < sl.size(); ++i)
    {
        uint8_t byte = sl.data()[i];
        result.push_back(hex_chars[(byte >> 4) & 0xF]);
        result.push_back(hex_chars[byte & 0xF]);
    }
}

std::string
TransactionId::hex() const
{
    std::string result;
    slice_hex(slice(), result);
    return result;
}
