#include "bndl/bundle/bounded-reader.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/bundle/tag-decoder.h"
#include "bndl/bundle/varint.h"
#include "bndl/test-utils/test-utils.h"
#include <gtest/gtest.h>

using namespace bndl::bundle;
using test_bundles::encode_tags;
using test_bundles::make_tag;

namespace {

std::vector<Tag>
decode(
    const std::vector<uint8_t>& bytes,
    uint64_t tag_count,
    uint64_t tag_bytes,
    std::vector<std::size_t> partition = {})
{
    ChunkedReader reader(make_source(bytes, std::move(partition)));
    return read_tags(reader, tag_count, tag_bytes);
}

void
put_field(std::vector<uint8_t>& out, const std::string& text)
{
    write_zigzag(out, static_cast<int64_t>(text.size()));
    out.insert(out.end(), text.begin(), text.end());
}

}  // namespace

TEST(TagDecoder, DecodesTagsInOrder)
{
    std::vector<Tag> tags = {
        make_tag("Content-Type", "text/plain"),
        make_tag("App-Name", "bundle-test"),
        make_tag("", "")};
    auto bytes = encode_tags(tags);

    EXPECT_EQ(decode(bytes, 3, bytes.size()), tags);
}

TEST(TagDecoder, ChunkBoundariesAnywhere)
{
    std::vector<Tag> tags = {
        make_tag(std::string(200, 'n'), std::string(300, 'v')),
        make_tag("k", "v")};
    auto bytes = encode_tags(tags);

    EXPECT_EQ(decode(bytes, 2, bytes.size(), {1}), tags);
    for (unsigned seed = 0; seed < 20; ++seed)
    {
        auto partition = random_partition(bytes.size(), 7, seed);
        EXPECT_EQ(decode(bytes, 2, bytes.size(), partition), tags)
            << "seed " << seed;
    }
}

TEST(TagDecoder, EmptyRegion)
{
    EXPECT_TRUE(decode({}, 0, 0).empty());
    EXPECT_THROW(decode({}, 1, 0), TagCountMismatchError);
}

TEST(TagDecoder, ZeroCountArray)
{
    std::vector<uint8_t> bytes = {0x00};
    EXPECT_TRUE(decode(bytes, 0, 1).empty());
}

TEST(TagDecoder, CountMismatch)
{
    auto bytes = encode_tags({make_tag("a", "1"), make_tag("b", "2")});
    EXPECT_THROW(decode(bytes, 3, bytes.size()), TagCountMismatchError);
    EXPECT_THROW(decode(bytes, 1, bytes.size()), TagCountMismatchError);
}

TEST(TagDecoder, DeclaredLengthTooShort)
{
    auto bytes = encode_tags({make_tag("a", "1")});
    bytes.push_back(0xee);
    EXPECT_THROW(decode(bytes, 1, bytes.size() - 2), TagLengthMismatchError);
}

TEST(TagDecoder, DeclaredLengthTooLong)
{
    auto bytes = encode_tags({make_tag("a", "1")});
    std::size_t encoded = bytes.size();
    bytes.insert(bytes.end(), {0, 0, 0});
    EXPECT_THROW(decode(bytes, 1, encoded + 3), TagLengthMismatchError);
}

TEST(TagDecoder, RegionEndingInsideVarintIsLengthMismatch)
{
    // A 300-byte name needs a two-byte length varint
    auto bytes = encode_tags({make_tag(std::string(300, 'x'), "y")});
    EXPECT_THROW(decode(bytes, 1, 2, {1}), TagLengthMismatchError);
}

TEST(TagDecoder, NegativeBlockCountWithByteSize)
{
    std::vector<uint8_t> record;
    put_field(record, "name");
    put_field(record, "value");

    std::vector<uint8_t> bytes;
    write_zigzag(bytes, -1);
    write_zigzag(bytes, static_cast<int64_t>(record.size()));
    bytes.insert(bytes.end(), record.begin(), record.end());
    write_zigzag(bytes, 0);

    auto tags = decode(bytes, 1, bytes.size());
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0], make_tag("name", "value"));
}

TEST(TagDecoder, BlockByteSizeMismatchIsMalformed)
{
    std::vector<uint8_t> bytes;
    write_zigzag(bytes, -1);
    write_zigzag(bytes, 99);
    put_field(bytes, "a");
    put_field(bytes, "b");
    write_zigzag(bytes, 0);

    EXPECT_THROW(decode(bytes, 1, bytes.size()), MalformedTagsError);
}

TEST(TagDecoder, MultipleBlocks)
{
    std::vector<uint8_t> bytes;
    write_zigzag(bytes, 1);
    put_field(bytes, "a");
    put_field(bytes, "1");
    write_zigzag(bytes, 2);
    put_field(bytes, "b");
    put_field(bytes, "2");
    put_field(bytes, "c");
    put_field(bytes, "3");
    write_zigzag(bytes, 0);

    auto tags = decode(bytes, 3, bytes.size());
    ASSERT_EQ(tags.size(), 3u);
    EXPECT_EQ(tags[2], make_tag("c", "3"));
}

TEST(TagDecoder, NegativeFieldLengthIsMalformed)
{
    std::vector<uint8_t> bytes;
    write_zigzag(bytes, 1);
    write_zigzag(bytes, -3);
    bytes.insert(bytes.end(), {0, 0, 0, 0});

    EXPECT_THROW(decode(bytes, 1, bytes.size()), MalformedTagsError);
}

TEST(TagDecoder, StreamEndingInsideVarintIsTruncated)
{
    std::vector<uint8_t> bytes = {0x80};
    EXPECT_THROW(decode(bytes, 1, 5), TruncatedVarintError);
}

TEST(BoundedReader, ItemBudgetOverrun)
{
    std::vector<uint8_t> bytes(16, 0xaa);
    ChunkedReader reader(make_source(bytes, {3}));
    BoundedReader item(reader, 10, BudgetKind::item);

    item.read_bytes(8, "first");
    EXPECT_EQ(item.consumed(), 8u);
    EXPECT_EQ(item.remaining(), 2u);
    EXPECT_THROW(item.read_uint64_le("second"), ItemOverrunError);
    // Nothing is consumed by a rejected read
    EXPECT_EQ(reader.offset(), 8u);
}

TEST(BoundedReader, LittleEndianIntegers)
{
    auto bytes = hex_to_vector("3412" "0807060504030201");
    ChunkedReader reader(make_source(bytes, {1}));
    BoundedReader item(reader, bytes.size(), BudgetKind::item);

    EXPECT_EQ(item.read_uint16_le("u16"), 0x1234);
    EXPECT_EQ(item.read_uint64_le("u64"), 0x0102030405060708ULL);
    EXPECT_EQ(item.remaining(), 0u);
}
