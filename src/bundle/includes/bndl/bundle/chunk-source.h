#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace bndl::bundle {

/**
 * Pull interface over a transaction's payload, delivered as consecutive
 * chunks whose sizes are chosen by the producer, not the consumer.
 *
 * Implementations own their transport (network session, file, buffer) and
 * are driven by exactly one ChunkedReader.
 */
class ChunkSource
{
public:
    virtual ~ChunkSource() = default;

    // Declared length of the whole payload in bytes
    virtual uint64_t
    total_size() = 0;

    // Next chunk in stream order, or nullopt once the source has nothing
    // left to give. May throw TransportError.
    virtual std::optional<std::vector<uint8_t>>
    next_chunk() = 0;
};

}  // namespace bndl::bundle
