#include "bndl/bundle/bundle-errors.h"
#include "bndl/bundle/bundle-reader.h"
#include "bndl/test-utils/test-utils.h"
#include <gtest/gtest.h>

using namespace bndl::bundle;
using test_bundles::encode_bundle;
using test_bundles::encode_item;
using test_bundles::ItemLayout;
using test_bundles::make_tag;

namespace {

std::vector<ItemLayout>
sample_layouts()
{
    std::vector<ItemLayout> layouts(4);

    layouts[0].signature_type = 1;
    layouts[0].tags = {make_tag("Content-Type", "text/plain")};
    layouts[0].data = bytes_from_string("hello");

    layouts[1].signature_type = 2;
    layouts[1].target = id_filled(0x77);
    layouts[1].tags = {
        make_tag(std::string(150, 'a'), std::string(700, 'b')),
        make_tag("x", "")};

    layouts[2].signature_type = 3;
    Anchor anchor;
    anchor.fill(0x42);
    layouts[2].anchor = anchor;
    layouts[2].data.assign(3000, 0x5c);

    layouts[3].signature_type = 4;
    return layouts;
}

std::vector<uint8_t>
encode_layouts(const std::vector<ItemLayout>& layouts)
{
    std::vector<std::vector<uint8_t>> items;
    for (const auto& layout : layouts)
    {
        items.push_back(encode_item(layout));
    }
    return encode_bundle(items);
}

std::vector<DataItem>
read_all(const std::vector<uint8_t>& bytes, std::vector<std::size_t> partition)
{
    ChunkedReader chunks(make_source(bytes, std::move(partition)));
    BundleReader reader(chunks);
    std::vector<DataItem> items;
    while (auto item = reader.next())
    {
        items.push_back(std::move(*item));
    }
    EXPECT_TRUE(chunks.exhausted());
    return items;
}

void
expect_same(const DataItem& a, const DataItem& b)
{
    EXPECT_EQ(a.index, b.index);
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(a.signature_type, b.signature_type);
    EXPECT_EQ(a.signature, b.signature);
    EXPECT_EQ(a.owner, b.owner);
    EXPECT_EQ(a.target, b.target);
    EXPECT_EQ(a.anchor, b.anchor);
    EXPECT_EQ(a.tags, b.tags);
    EXPECT_EQ(a.data, b.data);
}

}  // namespace

TEST(BundleReader, ReadsItemsInOrder)
{
    auto layouts = sample_layouts();
    auto items = read_all(encode_layouts(layouts), {});

    ASSERT_EQ(items.size(), layouts.size());
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        EXPECT_EQ(items[i].index, i);
        EXPECT_EQ(items[i].id, id_filled(static_cast<uint8_t>(i + 1)));
        EXPECT_EQ(items[i].tags, layouts[i].tags);
        EXPECT_EQ(items[i].data, layouts[i].data);
        EXPECT_EQ(items[i].target, layouts[i].target);
        EXPECT_EQ(items[i].anchor, layouts[i].anchor);
    }
}

TEST(BundleReader, ResultIndependentOfChunking)
{
    auto bytes = encode_layouts(sample_layouts());
    auto reference = read_all(bytes, {});

    std::vector<std::vector<std::size_t>> partitions = {
        {1}, {2}, {7}, {39, 41}, {256 * 1024}};
    for (unsigned seed = 0; seed < 10; ++seed)
    {
        partitions.push_back(random_partition(bytes.size(), 600, seed));
    }

    for (const auto& partition : partitions)
    {
        auto items = read_all(bytes, partition);
        ASSERT_EQ(items.size(), reference.size());
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            expect_same(items[i], reference[i]);
        }
    }
}

TEST(BundleReader, SplitInsideTagLengthVarint)
{
    ItemLayout layout;
    layout.tags = {make_tag(std::string(300, 'n'), "v")};
    auto item = encode_item(layout);
    auto bytes = encode_bundle({item});

    // Tag region starts after header, type, signature, owner, presence
    // bytes, and tag count and length; its second byte begins the name
    // length varint, which is two bytes long
    std::size_t tags_at = 8 + 40 + 2 + 64 + 32 + 2 + 16;
    std::size_t split = tags_at + 2;
    auto items = read_all(bytes, {split, bytes.size() - split});
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].tags, layout.tags);
}

TEST(BundleReader, EmptyBundle)
{
    ChunkedReader chunks(make_source(encode_bundle({}), {}));
    BundleReader reader(chunks);
    EXPECT_EQ(reader.read_header().item_count, 0u);
    EXPECT_FALSE(reader.next());
    EXPECT_FALSE(reader.next());
}

TEST(BundleReader, HeaderErrorCarriesContext)
{
    auto bytes = test_bundles::encode_header(1, {5});
    bytes.push_back(0);

    ChunkedReader chunks(make_source(bytes, {}));
    BundleReader reader(chunks);
    try
    {
        reader.read_header();
        FAIL() << "expected DecodeError";
    }
    catch (const DecodeError& e)
    {
        EXPECT_EQ(e.errc(), BundleErrc::malformed_header);
        EXPECT_FALSE(e.item_index());
        EXPECT_EQ(e.item_offset(), 0u);
        // Detected once the single entry has been read
        EXPECT_EQ(e.offset(), 48u);
        EXPECT_THROW(std::rethrow_if_nested(e), MalformedHeaderError);
    }
}

TEST(BundleReader, ItemErrorCarriesIndexAndOffset)
{
    auto layouts = sample_layouts();
    layouts[1].tag_count_override = 5;
    auto bytes = encode_layouts(layouts);

    ChunkedReader chunks(make_source(bytes, {64}));
    BundleReader reader(chunks);
    ASSERT_TRUE(reader.next());

    const auto& header = reader.read_header();
    uint64_t item1_offset = header.body_offset + header.entries[0].size;
    try
    {
        reader.next();
        FAIL() << "expected DecodeError";
    }
    catch (const DecodeError& e)
    {
        EXPECT_EQ(e.errc(), BundleErrc::tag_count_mismatch);
        ASSERT_TRUE(e.item_index());
        EXPECT_EQ(*e.item_index(), 1u);
        EXPECT_EQ(e.item_offset(), item1_offset);
        EXPECT_GT(e.offset(), item1_offset);
        EXPECT_LE(e.offset(), item1_offset + header.entries[1].size);

        std::string cause;
        try
        {
            std::rethrow_if_nested(e);
        }
        catch (const TagCountMismatchError& nested)
        {
            cause = nested.what();
        }
        ASSERT_FALSE(cause.empty());

        // The cause is printed once, below the context line
        auto chain = describe_error_chain(e);
        EXPECT_NE(chain.find("DataItem #1"), std::string::npos);
        EXPECT_NE(chain.find("caused by:"), std::string::npos);
        auto first = chain.find(cause);
        ASSERT_NE(first, std::string::npos);
        EXPECT_GT(first, chain.find("caused by:"));
        EXPECT_EQ(chain.find(cause, first + 1), std::string::npos);
    }

    // Realigned to the end of the failed item, the next one decodes
    EXPECT_EQ(reader.offset(), item1_offset + header.entries[1].size);
    auto next = reader.next();
    ASSERT_TRUE(next);
    EXPECT_EQ(next->index, 2u);
    EXPECT_EQ(next->data, layouts[2].data);
}

TEST(BundleReader, TruncatedStream)
{
    auto bytes = encode_layouts(sample_layouts());
    auto source = make_source(
        std::vector<uint8_t>(bytes.begin(), bytes.end() - 100), {512});
    // The last item is 116 bytes long, so only it is cut short
    source->set_declared_total(bytes.size());

    ChunkedReader chunks(std::move(source));
    BundleReader reader(chunks);
    std::size_t decoded = 0;
    try
    {
        while (reader.next())
        {
            ++decoded;
        }
        FAIL() << "expected DecodeError";
    }
    catch (const DecodeError& e)
    {
        EXPECT_EQ(e.errc(), BundleErrc::unexpected_eof);
    }
    EXPECT_EQ(decoded, 3u);
}

TEST(BundleReader, SourceEndingInsideTagLengthVarint)
{
    // A 200 byte tag name encodes its length as the two byte varint
    // 0x90 0x03, at stream offsets 165 and 166
    ItemLayout layout;
    layout.tags = {make_tag(std::string(200, 'n'), "v")};
    auto bytes = encode_bundle({encode_item(layout)});
    const std::size_t varint_at = 8 + 40 + 2 + 64 + 32 + 2 + 16 + 1;
    ASSERT_EQ(bytes[varint_at], 0x90);
    ASSERT_EQ(bytes[varint_at + 1], 0x03);

    auto source = make_source(
        std::vector<uint8_t>(bytes.begin(), bytes.begin() + varint_at + 1),
        {});
    source->set_declared_total(bytes.size());

    ChunkedReader chunks(std::move(source));
    BundleReader reader(chunks);
    try
    {
        reader.next();
        FAIL() << "expected DecodeError";
    }
    catch (const DecodeError& e)
    {
        EXPECT_EQ(e.errc(), BundleErrc::truncated_varint);
        ASSERT_TRUE(e.item_index());
        EXPECT_EQ(*e.item_index(), 0u);
        EXPECT_EQ(e.item_offset(), 48u);
        EXPECT_EQ(e.offset(), varint_at);

        // The varint error keeps the source's shortfall as its cause
        try
        {
            std::rethrow_if_nested(e);
            FAIL() << "expected a nested TruncatedVarintError";
        }
        catch (const TruncatedVarintError& varint)
        {
            EXPECT_THROW(
                std::rethrow_if_nested(varint), UnexpectedEofError);
        }
    }
}

TEST(BundleReader, TransportErrorIsNotWrapped)
{
    auto bytes = encode_layouts(sample_layouts());
    auto source = make_source(bytes, {100});
    source->fail_at_chunk(3);

    ChunkedReader chunks(std::move(source));
    BundleReader reader(chunks);
    EXPECT_THROW(
        {
            while (reader.next())
            {
            }
        },
        TransportError);
}
