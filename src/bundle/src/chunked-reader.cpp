#include "bndl/bundle/chunked-reader.h"
#include "bndl/bundle/bundle-errors.h"

#include <algorithm>
#include <string>
#include <utility>

namespace bndl::bundle {

LogPartition ChunkedReader::log_partition_("CHUNKS");

ChunkedReader::ChunkedReader(std::unique_ptr<ChunkSource> source)
    : source_(std::move(source)), total_size_(source_->total_size())
{
    PLOGD(log_partition_, "Streaming ", total_size_, " bytes");
}

bool
ChunkedReader::fetch_more()
{
    if (fetched_ >= total_size_)
    {
        return false;
    }

    auto chunk = source_->next_chunk();
    if (!chunk)
    {
        throw UnexpectedEofError(
            "chunk source ended after " + std::to_string(fetched_) + " of " +
            std::to_string(total_size_) + " declared bytes");
    }
    if (chunk->empty())
    {
        throw TransportError(
            "chunk source delivered an empty chunk at offset " +
            std::to_string(fetched_));
    }

    uint64_t room = total_size_ - fetched_;
    if (chunk->size() > room)
    {
        PLOGW(
            log_partition_,
            "Chunk at offset ",
            fetched_,
            " overshoots the declared size by ",
            chunk->size() - room,
            " bytes, ignoring the excess");
        chunk->resize(static_cast<std::size_t>(room));
    }

    // Drop the consumed prefix before growing the buffer
    buffer_.erase(
        buffer_.begin(),
        buffer_.begin() + static_cast<std::ptrdiff_t>(pos_));
    pos_ = 0;
    buffer_.insert(buffer_.end(), chunk->begin(), chunk->end());

    fetched_ += chunk->size();
    ++chunks_fetched_;
    PLOGD(
        log_partition_,
        "Fetched chunk #",
        chunks_fetched_,
        " (",
        chunk->size(),
        " bytes, ",
        fetched_,
        "/",
        total_size_,
        ")");
    return true;
}

void
ChunkedReader::consume(std::size_t n)
{
    if (n > buffered())
    {
        throw UnexpectedEofError(
            "consume of " + std::to_string(n) + " bytes with only " +
            std::to_string(buffered()) + " buffered");
    }
    pos_ += n;
    offset_ += n;
}

Slice
ChunkedReader::request(std::size_t n)
{
    if (n > remaining())
    {
        throw UnexpectedEofError(
            "request for " + std::to_string(n) + " bytes at offset " +
            std::to_string(offset_) + " runs past the end of the " +
            std::to_string(total_size_) + " byte stream");
    }

    while (buffered() < n)
    {
        if (!fetch_more())
        {
            throw UnexpectedEofError(
                "stream exhausted at offset " + std::to_string(offset_));
        }
    }

    Slice result(buffer_.data() + pos_, n);
    pos_ += n;
    offset_ += n;
    return result;
}

void
ChunkedReader::read_into(std::vector<uint8_t>& out, uint64_t n)
{
    drain(n, &out);
}

void
ChunkedReader::skip(uint64_t n)
{
    drain(n, nullptr);
}

void
ChunkedReader::drain(uint64_t n, std::vector<uint8_t>* out)
{
    if (n > remaining())
    {
        throw UnexpectedEofError(
            "span of " + std::to_string(n) + " bytes at offset " +
            std::to_string(offset_) + " runs past the end of the " +
            std::to_string(total_size_) + " byte stream");
    }

    if (out)
    {
        out->reserve(out->size() + static_cast<std::size_t>(n));
    }

    while (n > 0)
    {
        if (buffered() == 0 && !fetch_more())
        {
            throw UnexpectedEofError(
                "stream exhausted at offset " + std::to_string(offset_));
        }
        auto step = static_cast<std::size_t>(
            std::min<uint64_t>(n, static_cast<uint64_t>(buffered())));
        if (out)
        {
            const uint8_t* begin = buffer_.data() + pos_;
            out->insert(out->end(), begin, begin + step);
        }
        consume(step);
        n -= step;
    }
}

}  // namespace bndl::bundle
