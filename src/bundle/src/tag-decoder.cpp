#include "bndl/bundle/tag-decoder.h"
#include "bndl/bundle/bounded-reader.h"
#include "bndl/bundle/bundle-errors.h"

#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace bndl::bundle {

namespace {

std::vector<uint8_t>
read_field(BoundedReader& region, const char* field)
{
    int64_t length = region.read_zigzag(field);
    if (length < 0)
    {
        throw MalformedTagsError(
            std::string(field) + " has negative length " +
            std::to_string(length));
    }
    return region.read_bytes(static_cast<uint64_t>(length), field);
}

}  // namespace

std::vector<Tag>
read_tags(ChunkedReader& reader, uint64_t tag_count, uint64_t tag_bytes)
{
    std::vector<Tag> tags;
    if (tag_bytes == 0)
    {
        if (tag_count != 0)
        {
            throw TagCountMismatchError(
                "header declares " + std::to_string(tag_count) +
                " tags in an empty tag region");
        }
        return tags;
    }

    BoundedReader region(reader, tag_bytes, BudgetKind::tags);

    for (;;)
    {
        int64_t block_count = region.read_zigzag("tag block count");
        if (block_count == 0)
        {
            break;
        }

        std::optional<uint64_t> block_size;
        if (block_count < 0)
        {
            if (block_count == std::numeric_limits<int64_t>::min())
            {
                throw MalformedTagsError("tag block count out of range");
            }
            block_count = -block_count;
            int64_t size = region.read_zigzag("tag block size");
            if (size < 0)
            {
                throw MalformedTagsError(
                    "tag block has negative byte size " +
                    std::to_string(size));
            }
            block_size = static_cast<uint64_t>(size);
        }

        if (static_cast<uint64_t>(block_count) > tag_count - tags.size())
        {
            throw TagCountMismatchError(
                "tag array holds more than the declared " +
                std::to_string(tag_count) + " tags");
        }

        uint64_t block_start = region.consumed();
        for (int64_t i = 0; i < block_count; ++i)
        {
            Tag tag;
            tag.name = read_field(region, "tag name");
            tag.value = read_field(region, "tag value");
            tags.push_back(std::move(tag));
        }

        if (block_size && region.consumed() - block_start != *block_size)
        {
            throw MalformedTagsError(
                "tag block declared " + std::to_string(*block_size) +
                " bytes but used " +
                std::to_string(region.consumed() - block_start));
        }
    }

    if (tags.size() != tag_count)
    {
        throw TagCountMismatchError(
            "header declares " + std::to_string(tag_count) +
            " tags, array holds " + std::to_string(tags.size()));
    }
    if (region.remaining() != 0)
    {
        throw TagLengthMismatchError(
            "header declares " + std::to_string(tag_bytes) +
            " tag bytes, array ends after " +
            std::to_string(region.consumed()));
    }
    return tags;
}

}  // namespace bndl::bundle
