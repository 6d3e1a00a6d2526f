#include "bndl/bundle/bundle-errors.h"

#include <sstream>

namespace bndl::bundle {

namespace {

std::string
format_context(
    std::optional<uint64_t> item_index,
    uint64_t item_offset,
    uint64_t offset)
{
    std::ostringstream oss;
    if (item_index)
    {
        oss << "DataItem #" << *item_index;
    }
    else
    {
        oss << "bundle header";
    }
    oss << " (starts at " << item_offset << ") at stream offset " << offset;
    return oss.str();
}

void
append_chain(std::ostringstream& oss, const std::exception& e, int depth)
{
    if (depth > 0)
    {
        oss << "\n" << std::string(depth * 2, ' ') << "caused by: ";
    }
    oss << e.what();

    try
    {
        std::rethrow_if_nested(e);
    }
    catch (const std::exception& nested)
    {
        append_chain(oss, nested, depth + 1);
    }
}

}  // namespace

const char*
errc_name(BundleErrc errc)
{
    switch (errc)
    {
        case BundleErrc::transport:
            return "TransportError";
        case BundleErrc::not_found:
            return "NotFound";
        case BundleErrc::not_a_bundle:
            return "NotABundle";
        case BundleErrc::unexpected_eof:
            return "UnexpectedEof";
        case BundleErrc::malformed_header:
            return "MalformedHeader";
        case BundleErrc::item_size_mismatch:
            return "ItemSizeMismatch";
        case BundleErrc::item_overrun:
            return "ItemOverrun";
        case BundleErrc::unknown_signature_type:
            return "UnknownSignatureType";
        case BundleErrc::invalid_presence_flag:
            return "InvalidPresenceFlag";
        case BundleErrc::tag_count_mismatch:
            return "TagCountMismatch";
        case BundleErrc::tag_length_mismatch:
            return "TagLengthMismatch";
        case BundleErrc::malformed_tags:
            return "MalformedTags";
        case BundleErrc::truncated_varint:
            return "TruncatedVarint";
        case BundleErrc::malformed_varint:
            return "MalformedVarint";
        case BundleErrc::output_io:
            return "OutputIoError";
    }
    return "Unknown";
}

bool
is_decode_errc(BundleErrc errc)
{
    switch (errc)
    {
        case BundleErrc::transport:
        case BundleErrc::not_found:
        case BundleErrc::not_a_bundle:
        case BundleErrc::output_io:
            return false;
        default:
            return true;
    }
}

DecodeError::DecodeError(
    BundleErrc errc,
    std::optional<uint64_t> item_index,
    uint64_t item_offset,
    uint64_t offset,
    const std::string& detail)
    : BundleError(
          errc,
          std::string(errc_name(errc)) + " while decoding " +
              format_context(item_index, item_offset, offset) +
              (detail.empty() ? "" : ": " + detail))
    , item_index_(item_index)
    , item_offset_(item_offset)
    , offset_(offset)
{
}

std::string
describe_error_chain(const std::exception& e)
{
    std::ostringstream oss;
    append_chain(oss, e, 0);
    return oss.str();
}

}  // namespace bndl::bundle
