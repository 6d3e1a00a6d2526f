#pragma once

#include "bndl/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bndl::codec {

// RFC 4648 section 5 alphabet, unpadded. Every byte string the network
// exposes (ids, owners, signatures, tags, chunk payloads) uses it.

std::string
encode_base64url(const uint8_t* data, size_t len);

// Encode through EVP_EncodeBlock in pieces of at most `max_slice` input
// bytes. `max_slice` is rounded down to a multiple of 3, so the pieces
// concatenate to the one-shot encoding. encode_base64url uses the largest
// slice an int length can describe.
std::string
encode_base64url_sliced(const uint8_t* data, size_t len, size_t max_slice);

inline std::string
encode_base64url(Slice bytes)
{
    return encode_base64url(bytes.data(), bytes.size());
}

inline std::string
encode_base64url(const std::vector<uint8_t>& bytes)
{
    return encode_base64url(bytes.data(), bytes.size());
}

// Returns nullopt for characters outside the alphabet or an impossible
// length. Trailing '=' padding is tolerated.
std::optional<std::vector<uint8_t>>
decode_base64url(std::string_view encoded);

inline std::string
to_base64url(const TransactionId& id)
{
    return encode_base64url(id.data(), TransactionId::size());
}

// Parse a 43 character transaction id
std::optional<TransactionId>
transaction_id_from_base64url(std::string_view encoded);

}  // namespace bndl::codec
