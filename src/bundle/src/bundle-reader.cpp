#include "bndl/bundle/bundle-reader.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/bundle/data-item-reader.h"

#include <exception>
#include <string>

namespace bndl::bundle {

LogPartition BundleReader::log_partition_("BUNDLE");

BundleReader::BundleReader(ChunkedReader& reader) : reader_(reader)
{
}

const BundleHeader&
BundleReader::read_header()
{
    if (header_)
    {
        return *header_;
    }

    uint64_t start = reader_.offset();
    try
    {
        header_ = read_bundle_header(reader_);
    }
    catch (const BundleError& e)
    {
        if (!is_decode_errc(e.errc()))
        {
            throw;
        }
        std::throw_with_nested(
            DecodeError(e.errc(), std::nullopt, start, reader_.offset()));
    }

    expected_offset_ = header_->body_offset;
    return *header_;
}

std::optional<DataItem>
BundleReader::next()
{
    const BundleHeader& header = read_header();
    if (next_index_ >= header.item_count)
    {
        return std::nullopt;
    }

    const uint64_t index = next_index_;
    const BundleEntry& entry = header.entries[index];
    const uint64_t start = reader_.offset();

    if (start != expected_offset_)
    {
        throw DecodeError(
            BundleErrc::item_size_mismatch,
            index,
            expected_offset_,
            start,
            "stream is at offset " + std::to_string(start) +
                " but the entry table places this item at " +
                std::to_string(expected_offset_));
    }

    // Advance bookkeeping first so a failed item still counts as consumed
    ++next_index_;
    expected_offset_ += entry.size;

    try
    {
        DataItem item = read_data_item(reader_, entry, index);
        PLOGD(
            log_partition_,
            "Decoded item ",
            index + 1,
            "/",
            header.item_count,
            ", stream at ",
            reader_.offset());
        return item;
    }
    catch (const BundleError& e)
    {
        if (!is_decode_errc(e.errc()))
        {
            throw;
        }
        const uint64_t failed_at = reader_.offset();
        realign(expected_offset_);
        std::throw_with_nested(
            DecodeError(e.errc(), index, start, failed_at));
    }
}

void
BundleReader::realign(uint64_t target)
{
    if (reader_.offset() >= target)
    {
        return;
    }
    try
    {
        reader_.skip(target - reader_.offset());
    }
    catch (const BundleError& e)
    {
        // Stream stays short of the item's end; the item error still wins
        PLOGW(
            log_partition_,
            "Could not skip to the end of the failed item at offset ",
            target,
            ": ",
            e.what());
    }
}

}  // namespace bndl::bundle
