#include "bndl/bundle/data-item.h"

namespace bndl::bundle {

std::optional<SignatureConfig>
signature_config(uint16_t code)
{
    switch (code)
    {
        case 1:
            return SignatureConfig{SignatureType::arweave, "arweave", 512, 512};
        case 2:
            return SignatureConfig{SignatureType::ed25519, "ed25519", 64, 32};
        case 3:
            return SignatureConfig{SignatureType::ethereum, "ethereum", 65, 65};
        case 4:
            return SignatureConfig{SignatureType::solana, "solana", 64, 32};
        default:
            return std::nullopt;
    }
}

}  // namespace bndl::bundle
