#include "bndl/dumper/bundle-dumper.h"
#include "bndl/bundle/bundle-reader.h"
#include "bndl/bundle/chunked-reader.h"
#include "bndl/codec/base64url.h"
#include "bndl/core/logger.h"
#include "bndl/output/async-item-writer.h"
#include "bndl/output/json-array-writer.h"

#include <utility>

namespace bndl::dumper {

BundleDumper::BundleDumper(
    bundle::MetadataLookup& lookup,
    ChunkSourceFactory make_source,
    std::size_t queue_depth)
    : lookup_(lookup)
    , make_source_(std::move(make_source))
    , queue_depth_(queue_depth)
{
}

DumpStats
BundleDumper::run(const TransactionId& id, std::ostream& out)
{
    bundle::verify_bundle(lookup_, id);

    bundle::ChunkedReader chunks(make_source_(id));
    bundle::BundleReader reader(chunks);
    const auto& header = reader.read_header();

    DumpStats stats;
    stats.item_count = header.item_count;

    output::JsonArrayWriter json_writer(out);
    output::AsyncItemWriter writer(json_writer, queue_depth_);
    writer.start();

    try
    {
        while (auto item = reader.next())
        {
            LOGD(
                "Decoded item ",
                item->index,
                " (",
                codec::to_base64url(item->id),
                ", ",
                item->data.size(),
                " data bytes)");
            writer.push(std::move(*item));
        }
        writer.finish();
    }
    catch (const std::exception& e)
    {
        LOGE("Dump of ", codec::to_base64url(id), " stopped: ", e.what());
        writer.abort();
        throw;
    }

    stats.items_written = writer.items_written();
    stats.bytes_read = chunks.offset();
    stats.chunks_fetched = chunks.chunks_fetched();
    LOGI(
        "Wrote ",
        stats.items_written,
        " items from ",
        stats.bytes_read,
        " bytes in ",
        stats.chunks_fetched,
        " chunks");
    return stats;
}

}  // namespace bndl::dumper
