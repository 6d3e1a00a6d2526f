#pragma once

#include "bndl/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace bndl::bundle {

enum class SignatureType : uint16_t {
    arweave = 1,
    ed25519 = 2,
    ethereum = 3,
    solana = 4
};

// Fixed field lengths implied by a signature type
struct SignatureConfig
{
    SignatureType type;
    const char* name;
    std::size_t signature_length;
    std::size_t owner_length;
};

// Lookup by wire code, nullopt for codes this decoder does not know
std::optional<SignatureConfig>
signature_config(uint16_t code);

inline constexpr std::size_t TARGET_LENGTH = 32;
inline constexpr std::size_t ANCHOR_LENGTH = 32;

using Anchor = std::array<uint8_t, ANCHOR_LENGTH>;

// Name and value are opaque bytes; order within an item is significant
struct Tag
{
    std::vector<uint8_t> name;
    std::vector<uint8_t> value;

    bool
    operator==(const Tag& other) const = default;
};

struct DataItem
{
    // Position in the bundle and the id listed for it in the entry table
    uint64_t index = 0;
    TransactionId id;

    SignatureType signature_type = SignatureType::arweave;
    std::vector<uint8_t> signature;
    std::vector<uint8_t> owner;
    std::optional<TransactionId> target;
    std::optional<Anchor> anchor;
    std::vector<Tag> tags;
    std::vector<uint8_t> data;
};

}  // namespace bndl::bundle
