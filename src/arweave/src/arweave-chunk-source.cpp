#include "bndl/arweave/arweave-chunk-source.h"
#include "bndl/codec/base64url.h"
#include "bndl/core/logger.h"

namespace bndl::arweave {

ArweaveChunkSource::ArweaveChunkSource(
    ArweaveClient& client,
    const TransactionId& id,
    RetryPolicy policy)
    : client_(client), id_(id), policy_(policy)
{
}

const TxOffset&
ArweaveChunkSource::location()
{
    if (!location_)
    {
        location_ = with_retries(policy_, "transaction offset fetch", [&] {
            return client_.fetch_transaction_offset(id_);
        });
        LOGI(
            "Transaction ",
            codec::to_base64url(id_),
            " payload is ",
            location_->size,
            " bytes starting at weave offset ",
            location_->start());
    }
    return *location_;
}

uint64_t
ArweaveChunkSource::total_size()
{
    return location().size;
}

std::optional<std::vector<uint8_t>>
ArweaveChunkSource::next_chunk()
{
    const TxOffset& loc = location();
    if (delivered_ >= loc.size)
    {
        return std::nullopt;
    }

    const uint64_t absolute = loc.start() + delivered_;
    auto chunk = with_retries(policy_, "chunk fetch", [&] {
        return client_.fetch_chunk(absolute);
    });
    LOGD("Fetched chunk at ", absolute, " (", chunk.size(), " bytes)");
    delivered_ += chunk.size();
    return chunk;
}

}  // namespace bndl::arweave
