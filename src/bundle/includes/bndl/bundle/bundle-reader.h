#pragma once

#include "bndl/bundle/bundle-header.h"
#include "bndl/bundle/chunked-reader.h"
#include "bndl/bundle/data-item.h"
#include "bndl/core/logger.h"

#include <cstdint>
#include <optional>

namespace bndl::bundle {

/**
 * Pull-based decoder for a whole bundle: the header once, then one DataItem
 * per call to next(), in stream order. Only the current item is ever held.
 *
 * Before each item the reader checks that the stream offset equals the
 * header's body offset plus the sizes of all previous entries, so a decoder
 * bug or corrupt item cannot silently shift every later item.
 *
 * Decode-layer failures are rethrown as DecodeError (item index, the
 * offset the item started at and the offset of the failure) with the
 * original error nested. After a failed item the stream is moved to the
 * item's declared end where possible, so offset() stays consistent and
 * next() may be called again.
 */
class BundleReader
{
public:
    explicit BundleReader(ChunkedReader& reader);

    // Parse the header; subsequent calls return the cached value
    const BundleHeader&
    read_header();

    const std::optional<BundleHeader>&
    header() const
    {
        return header_;
    }

    // Next item, or nullopt once all declared items have been read
    std::optional<DataItem>
    next();

    uint64_t
    offset() const
    {
        return reader_.offset();
    }

private:
    void
    realign(uint64_t target);

    ChunkedReader& reader_;
    std::optional<BundleHeader> header_;
    uint64_t next_index_ = 0;
    uint64_t expected_offset_ = 0;

    static LogPartition log_partition_;
};

}  // namespace bndl::bundle
