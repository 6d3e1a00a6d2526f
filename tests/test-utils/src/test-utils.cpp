#include "bndl/test-utils/test-utils.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/bundle/varint.h"

#include <algorithm>
#include <random>
#include <stdexcept>

using namespace bndl;

std::vector<uint8_t>
hex_to_vector(const std::string& hex_string)
{
    if (hex_string.size() % 2 != 0)
    {
        throw std::invalid_argument("hex string must have an even length");
    }
    std::vector<uint8_t> result;
    result.reserve(hex_string.size() / 2);
    for (size_t i = 0; i < hex_string.size(); i += 2)
    {
        result.push_back(static_cast<uint8_t>(
            std::stoul(hex_string.substr(i, 2), nullptr, 16)));
    }
    return result;
}

std::vector<uint8_t>
bytes_from_string(const std::string& str)
{
    return std::vector<uint8_t>(str.begin(), str.end());
}

TransactionId
id_filled(uint8_t fill)
{
    std::array<uint8_t, 32> bytes;
    bytes.fill(fill);
    return TransactionId(bytes);
}

namespace test_bundles {

namespace {

void
put_u16(std::vector<uint8_t>& out, uint16_t v)
{
    out.push_back(static_cast<uint8_t>(v));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void
put_u64(std::vector<uint8_t>& out, uint64_t v)
{
    for (int i = 0; i < 8; ++i)
    {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

void
put_bytes(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes)
{
    out.insert(out.end(), bytes.begin(), bytes.end());
}

std::vector<uint8_t>
patterned(std::size_t n, uint8_t seed)
{
    std::vector<uint8_t> out(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        out[i] = static_cast<uint8_t>(seed + i);
    }
    return out;
}

}  // namespace

Tag
make_tag(const std::string& name, const std::string& value)
{
    return Tag{bytes_from_string(name), bytes_from_string(value)};
}

std::vector<uint8_t>
encode_tags(const std::vector<Tag>& tags)
{
    std::vector<uint8_t> out;
    if (tags.empty())
    {
        return out;
    }
    bundle::write_zigzag(out, static_cast<int64_t>(tags.size()));
    for (const auto& tag : tags)
    {
        bundle::write_zigzag(out, static_cast<int64_t>(tag.name.size()));
        put_bytes(out, tag.name);
        bundle::write_zigzag(out, static_cast<int64_t>(tag.value.size()));
        put_bytes(out, tag.value);
    }
    bundle::write_zigzag(out, 0);
    return out;
}

std::vector<uint8_t>
encode_item(const ItemLayout& layout)
{
    std::size_t sig_len = 64;
    std::size_t owner_len = 32;
    if (auto config = bundle::signature_config(layout.signature_type))
    {
        sig_len = config->signature_length;
        owner_len = config->owner_length;
    }

    std::vector<uint8_t> out;
    put_u16(out, layout.signature_type);
    put_bytes(
        out,
        layout.signature.empty() ? patterned(sig_len, 0x10) : layout.signature);
    put_bytes(
        out, layout.owner.empty() ? patterned(owner_len, 0x80) : layout.owner);

    if (layout.target)
    {
        out.push_back(1);
        out.insert(
            out.end(),
            layout.target->data(),
            layout.target->data() + TransactionId::size());
    }
    else
    {
        out.push_back(0);
    }
    if (layout.anchor)
    {
        out.push_back(1);
        out.insert(out.end(), layout.anchor->begin(), layout.anchor->end());
    }
    else
    {
        out.push_back(0);
    }

    std::vector<uint8_t> tag_bytes =
        layout.raw_tags ? *layout.raw_tags : encode_tags(layout.tags);
    put_u64(out, layout.tag_count_override.value_or(layout.tags.size()));
    put_u64(out, layout.tag_bytes_override.value_or(tag_bytes.size()));
    put_bytes(out, tag_bytes);
    put_bytes(out, layout.data);
    return out;
}

std::vector<uint8_t>
encode_bundle(
    const std::vector<std::vector<uint8_t>>& items,
    const std::vector<TransactionId>& ids)
{
    std::vector<uint8_t> out;
    put_u64(out, items.size());
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        put_u64(out, items[i].size());
        TransactionId id =
            i < ids.size() ? ids[i] : id_filled(static_cast<uint8_t>(i + 1));
        out.insert(out.end(), id.data(), id.data() + TransactionId::size());
    }
    for (const auto& item : items)
    {
        put_bytes(out, item);
    }
    return out;
}

std::vector<uint8_t>
encode_header(uint64_t item_count, const std::vector<uint64_t>& sizes)
{
    std::vector<uint8_t> out;
    put_u64(out, item_count);
    for (std::size_t i = 0; i < sizes.size(); ++i)
    {
        put_u64(out, sizes[i]);
        TransactionId id = id_filled(static_cast<uint8_t>(i + 1));
        out.insert(out.end(), id.data(), id.data() + TransactionId::size());
    }
    return out;
}

}  // namespace test_bundles

MemoryChunkSource::MemoryChunkSource(
    std::vector<uint8_t> bytes,
    std::vector<std::size_t> partition,
    std::shared_ptr<SourceStats> stats)
    : bytes_(std::move(bytes))
    , partition_(std::move(partition))
    , stats_(std::move(stats))
{
    if (partition_.empty())
    {
        partition_.push_back(bytes_.empty() ? 1 : bytes_.size());
    }
}

MemoryChunkSource::MemoryChunkSource(
    std::vector<uint8_t> bytes,
    std::size_t chunk_size,
    std::shared_ptr<SourceStats> stats)
    : MemoryChunkSource(
          std::move(bytes),
          std::vector<std::size_t>{chunk_size},
          std::move(stats))
{
}

uint64_t
MemoryChunkSource::total_size()
{
    if (stats_)
    {
        ++stats_->total_size_calls;
    }
    return declared_total_.value_or(bytes_.size());
}

std::optional<std::vector<uint8_t>>
MemoryChunkSource::next_chunk()
{
    if (fail_at_ && served_ == *fail_at_)
    {
        throw bundle::TransportError("injected chunk failure");
    }
    if (pos_ >= bytes_.size())
    {
        return std::nullopt;
    }

    std::size_t len = partition_[std::min(served_, partition_.size() - 1)];
    len = std::min(std::max<std::size_t>(len, 1), bytes_.size() - pos_);
    std::vector<uint8_t> chunk(
        bytes_.begin() + static_cast<std::ptrdiff_t>(pos_),
        bytes_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
    pos_ += len;
    ++served_;
    if (stats_)
    {
        ++stats_->chunks_served;
    }
    return chunk;
}

std::unique_ptr<MemoryChunkSource>
make_source(
    std::vector<uint8_t> bytes,
    std::vector<std::size_t> partition,
    std::shared_ptr<SourceStats> stats)
{
    return std::make_unique<MemoryChunkSource>(
        std::move(bytes), std::move(partition), std::move(stats));
}

std::vector<std::size_t>
random_partition(std::size_t total, std::size_t max_chunk, unsigned seed)
{
    std::mt19937 rng(seed);
    std::uniform_int_distribution<std::size_t> dist(1, max_chunk);
    std::vector<std::size_t> partition;
    std::size_t covered = 0;
    while (covered < total)
    {
        std::size_t len = std::min(dist(rng), total - covered);
        partition.push_back(len);
        covered += len;
    }
    return partition;
}

bundle::TxMetadata
FakeMetadataLookup::fetch_transaction_metadata(const TransactionId& id)
{
    ++calls;
    last_id = id;
    return metadata_;
}

bundle::TxMetadata
bundle_metadata()
{
    bundle::TxMetadata metadata;
    metadata.add_tag("Bundle-Format", "binary");
    metadata.add_tag("Bundle-Version", "2.0.0");
    return metadata;
}

FailingStreambuf::int_type
FailingStreambuf::overflow(int_type ch)
{
    if (ch == traits_type::eof())
    {
        return traits_type::not_eof(ch);
    }
    if (written_.size() >= limit_)
    {
        return traits_type::eof();
    }
    written_.push_back(traits_type::to_char_type(ch));
    return ch;
}

std::streamsize
FailingStreambuf::xsputn(const char* s, std::streamsize n)
{
    std::size_t room = limit_ - std::min(limit_, written_.size());
    std::size_t take = std::min(room, static_cast<std::size_t>(n));
    written_.append(s, take);
    return static_cast<std::streamsize>(take);
}
