#pragma once

#include "bndl/bundle/bundle-verifier.h"
#include "bndl/bundle/chunk-source.h"
#include "bndl/bundle/data-item.h"
#include "bndl/core/types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

// Convert hex string to byte vector
std::vector<uint8_t>
hex_to_vector(const std::string& hex_string);

std::vector<uint8_t>
bytes_from_string(const std::string& str);

// Id whose 32 bytes are all `fill`
TransactionId
id_filled(uint8_t fill);

namespace test_bundles {

using bndl::bundle::Tag;

Tag
make_tag(const std::string& name, const std::string& value);

// Avro array of {name: bytes, value: bytes} records in a single block,
// terminated by a zero count. No tags encode to no bytes at all.
std::vector<uint8_t>
encode_tags(const std::vector<Tag>& tags);

// Everything needed to lay out one DataItem on the wire. Empty signature
// and owner are filled with patterned bytes of the lengths the signature
// type implies.
struct ItemLayout
{
    uint16_t signature_type = 2;
    std::vector<uint8_t> signature;
    std::vector<uint8_t> owner;
    std::optional<TransactionId> target;
    std::optional<bndl::bundle::Anchor> anchor;
    std::vector<Tag> tags;
    std::vector<uint8_t> data;

    // Corruption knobs
    std::optional<uint64_t> tag_count_override;
    std::optional<uint64_t> tag_bytes_override;
    std::optional<std::vector<uint8_t>> raw_tags;
};

std::vector<uint8_t>
encode_item(const ItemLayout& layout);

// Header plus bodies; ids default to id_filled(index + 1)
std::vector<uint8_t>
encode_bundle(
    const std::vector<std::vector<uint8_t>>& items,
    const std::vector<TransactionId>& ids = {});

// Header only, with explicit entry sizes (for malformed header cases)
std::vector<uint8_t>
encode_header(uint64_t item_count, const std::vector<uint64_t>& sizes);

}  // namespace test_bundles

// Counters shared between a test and a source owned by a ChunkedReader
struct SourceStats
{
    std::size_t chunks_served = 0;
    std::size_t total_size_calls = 0;
};

/**
 * In-memory ChunkSource that serves its bytes in a chosen partition.
 *
 * The partition lists chunk lengths; once exhausted, the last length repeats.
 * declared_total may differ from the payload length to model a source that
 * under-delivers.
 */
class MemoryChunkSource : public bndl::bundle::ChunkSource
{
public:
    MemoryChunkSource(
        std::vector<uint8_t> bytes,
        std::vector<std::size_t> partition,
        std::shared_ptr<SourceStats> stats = nullptr);

    MemoryChunkSource(
        std::vector<uint8_t> bytes,
        std::size_t chunk_size,
        std::shared_ptr<SourceStats> stats = nullptr);

    void
    set_declared_total(uint64_t total)
    {
        declared_total_ = total;
    }

    // Throw TransportError instead of serving chunk number `n` (0-based)
    void
    fail_at_chunk(std::size_t n)
    {
        fail_at_ = n;
    }

    uint64_t
    total_size() override;

    std::optional<std::vector<uint8_t>>
    next_chunk() override;

private:
    std::vector<uint8_t> bytes_;
    std::vector<std::size_t> partition_;
    std::shared_ptr<SourceStats> stats_;
    std::optional<uint64_t> declared_total_;
    std::optional<std::size_t> fail_at_;
    std::size_t pos_ = 0;
    std::size_t served_ = 0;
};

std::unique_ptr<MemoryChunkSource>
make_source(
    std::vector<uint8_t> bytes,
    std::vector<std::size_t> partition,
    std::shared_ptr<SourceStats> stats = nullptr);

// Random partition of `total` bytes into chunks of 1..max_chunk bytes
std::vector<std::size_t>
random_partition(std::size_t total, std::size_t max_chunk, unsigned seed);

class FakeMetadataLookup : public bndl::bundle::MetadataLookup
{
public:
    explicit FakeMetadataLookup(bndl::bundle::TxMetadata metadata)
        : metadata_(std::move(metadata))
    {
    }

    bndl::bundle::TxMetadata
    fetch_transaction_metadata(const TransactionId& id) override;

    std::size_t calls = 0;
    std::optional<TransactionId> last_id;

private:
    bndl::bundle::TxMetadata metadata_;
};

// Metadata carrying Bundle-Format=binary and Bundle-Version=2.0.0
bndl::bundle::TxMetadata
bundle_metadata();

// Stream buffer that accepts `limit` bytes and then reports failure
class FailingStreambuf : public std::streambuf
{
public:
    explicit FailingStreambuf(std::size_t limit) : limit_(limit)
    {
    }

    const std::string&
    written() const
    {
        return written_;
    }

protected:
    int_type
    overflow(int_type ch) override;

    std::streamsize
    xsputn(const char* s, std::streamsize n) override;

private:
    std::size_t limit_;
    std::string written_;
};
