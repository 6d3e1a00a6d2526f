#include "bndl/codec/base64url.h"

#include <algorithm>
#include <limits>
#include <openssl/evp.h>

namespace bndl::codec {

namespace {

bool
is_url_alphabet(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
        (c >= '0' && c <= '9') || c == '-' || c == '_';
}

// Largest multiple of 3 whose encoding length still fits in an int
constexpr size_t MAX_ENCODE_SLICE =
    static_cast<size_t>(std::numeric_limits<int>::max()) / 4 * 3;

}  // namespace

std::string
encode_base64url(const uint8_t* data, size_t len)
{
    return encode_base64url_sliced(data, len, MAX_ENCODE_SLICE);
}

std::string
encode_base64url_sliced(const uint8_t* data, size_t len, size_t max_slice)
{
    max_slice = std::min(max_slice, MAX_ENCODE_SLICE) / 3 * 3;
    if (max_slice == 0)
    {
        max_slice = 3;
    }

    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    size_t written = 0;
    for (size_t done = 0; done < len;)
    {
        size_t step = std::min(max_slice, len - done);
        int n = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(out.data()) + written,
            data + done,
            static_cast<int>(step));
        written += static_cast<size_t>(n);
        done += step;
    }
    out.resize(written);

    while (!out.empty() && out.back() == '=')
    {
        out.pop_back();
    }
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::optional<std::vector<uint8_t>>
decode_base64url(std::string_view encoded)
{
    while (!encoded.empty() && encoded.back() == '=')
    {
        encoded.remove_suffix(1);
    }
    if (encoded.empty())
    {
        return std::vector<uint8_t>{};
    }
    if (encoded.size() % 4 == 1)
    {
        return std::nullopt;
    }

    std::string standard;
    standard.reserve(encoded.size() + 3);
    for (char c : encoded)
    {
        if (!is_url_alphabet(c))
        {
            return std::nullopt;
        }
        standard.push_back(c == '-' ? '+' : (c == '_' ? '/' : c));
    }
    size_t padding = (4 - standard.size() % 4) % 4;
    standard.append(padding, '=');

    std::vector<uint8_t> out(standard.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(standard.data()),
        static_cast<int>(standard.size()));
    if (decoded < 0)
    {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the padding positions as zero bytes
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

std::optional<TransactionId>
transaction_id_from_base64url(std::string_view encoded)
{
    auto bytes = decode_base64url(encoded);
    if (!bytes || bytes->size() != TransactionId::size())
    {
        return std::nullopt;
    }
    return TransactionId(bytes->data());
}

}  // namespace bndl::codec
