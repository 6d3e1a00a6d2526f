#pragma once

#include "bndl/bundle/byte-cursor.h"
#include "bndl/bundle/chunk-source.h"
#include "bndl/core/logger.h"
#include "bndl/core/types.h"

#include <cstdint>
#include <memory>
#include <vector>

namespace bndl::bundle {

/**
 * Rolling buffer over a ChunkSource.
 *
 * Decoders ask for spans of bytes and never see chunk boundaries: when the
 * buffered bytes cannot satisfy a request the reader pulls further chunks,
 * dropping the already consumed prefix first, so at most the unconsumed tail
 * of one chunk plus the chunks needed for the current request are held.
 *
 * Two access styles are offered:
 *  - request()/skip() fetch transparently and fail with UnexpectedEofError
 *    when the span lies beyond the declared total size;
 *  - window()/fetch_more()/consume() let a decoder that cannot know its
 *    length up front (varints) try against what is buffered, and ask for
 *    more only when it reports that it needs more.
 */
class ChunkedReader
{
public:
    explicit ChunkedReader(std::unique_ptr<ChunkSource> source);

    uint64_t
    total_size() const
    {
        return total_size_;
    }

    // Cumulative number of bytes consumed from the start of the stream
    uint64_t
    offset() const
    {
        return offset_;
    }

    uint64_t
    remaining() const
    {
        return total_size_ - offset_;
    }

    // Every declared byte has been consumed
    bool
    exhausted() const
    {
        return offset_ == total_size_;
    }

    std::size_t
    chunks_fetched() const
    {
        return chunks_fetched_;
    }

    /**
     * Consume the next `n` bytes and return a view of them.
     *
     * The view stays valid until the next call that fetches or consumes.
     *
     * @throws UnexpectedEofError if fewer than `n` bytes remain in the
     * declared stream, or the source stops delivering early
     * @throws TransportError if fetching a chunk fails
     */
    Slice
    request(std::size_t n);

    // Consume `n` bytes, appending them to `out` piece by piece so a large
    // span never has to be contiguous in the rolling buffer
    void
    read_into(std::vector<uint8_t>& out, uint64_t n);

    // Consume `n` bytes without keeping them
    void
    skip(uint64_t n);

    // Buffered, unconsumed bytes; may be empty
    ByteCursor
    window() const
    {
        return ByteCursor{Slice(buffer_.data() + pos_, buffer_.size() - pos_)};
    }

    /**
     * Pull one more chunk into the buffer.
     *
     * @return false if the declared stream has been fully fetched already
     * @throws UnexpectedEofError if the source ends before the declared size
     */
    bool
    fetch_more();

    // Mark `n` buffered bytes as consumed; `n` must not exceed window()
    void
    consume(std::size_t n);

private:
    void
    drain(uint64_t n, std::vector<uint8_t>* out);

    std::size_t
    buffered() const
    {
        return buffer_.size() - pos_;
    }

    std::unique_ptr<ChunkSource> source_;
    uint64_t total_size_;
    uint64_t offset_ = 0;
    uint64_t fetched_ = 0;
    std::size_t chunks_fetched_ = 0;

    std::vector<uint8_t> buffer_;
    std::size_t pos_ = 0;

    static LogPartition log_partition_;
};

}  // namespace bndl::bundle
