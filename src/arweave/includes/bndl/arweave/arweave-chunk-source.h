#pragma once

#include "bndl/arweave/arweave-client.h"
#include "bndl/arweave/retry.h"
#include "bndl/bundle/chunk-source.h"
#include "bndl/core/types.h"

#include <optional>

namespace bndl::arweave {

/**
 * Streams a transaction's payload from a gateway, one `chunk/{offset}`
 * request per chunk. The payload location is resolved on first use so that
 * nothing is requested before the reader needs it.
 */
class ArweaveChunkSource : public bundle::ChunkSource
{
public:
    ArweaveChunkSource(
        ArweaveClient& client,
        const TransactionId& id,
        RetryPolicy policy);

    uint64_t
    total_size() override;

    std::optional<std::vector<uint8_t>>
    next_chunk() override;

private:
    const TxOffset&
    location();

    ArweaveClient& client_;
    TransactionId id_;
    RetryPolicy policy_;
    std::optional<TxOffset> location_;
    uint64_t delivered_ = 0;
};

}  // namespace bndl::arweave
