#pragma once

#include "bndl/bundle/bundle-verifier.h"
#include "bndl/bundle/chunk-source.h"
#include "bndl/core/types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>

namespace bndl::dumper {

// Creates the payload source for a transaction; called only once the
// transaction has been verified as a bundle
using ChunkSourceFactory =
    std::function<std::unique_ptr<bundle::ChunkSource>(const TransactionId&)>;

struct DumpStats
{
    uint64_t item_count = 0;
    std::size_t items_written = 0;
    uint64_t bytes_read = 0;
    std::size_t chunks_fetched = 0;
};

/**
 * End-to-end dump of one bundle: verify the transaction's tags, stream its
 * payload through the decoder, and write every DataItem to a JSON array.
 *
 * Decoding runs on the calling thread; serialization and output run on a
 * writer thread fed through a bounded queue.
 */
class BundleDumper
{
public:
    BundleDumper(
        bundle::MetadataLookup& lookup,
        ChunkSourceFactory make_source,
        std::size_t queue_depth = 4);

    /**
     * @throws NotABundleError before any payload is requested if the
     * transaction is not a bundle
     * @throws DecodeError wrapping the first decoding failure; the output is
     * left as an unterminated array holding the items decoded before it
     * @throws TransportError, TransactionNotFoundError, OutputIoError
     */
    DumpStats
    run(const TransactionId& id, std::ostream& out);

private:
    bundle::MetadataLookup& lookup_;
    ChunkSourceFactory make_source_;
    std::size_t queue_depth_;
};

}  // namespace bndl::dumper
