#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace bndl::bundle {

// Every failure a run can end with
enum class BundleErrc {
    transport,
    not_found,
    not_a_bundle,
    unexpected_eof,
    malformed_header,
    item_size_mismatch,
    item_overrun,
    unknown_signature_type,
    invalid_presence_flag,
    tag_count_mismatch,
    tag_length_mismatch,
    malformed_tags,
    truncated_varint,
    malformed_varint,
    output_io
};

const char*
errc_name(BundleErrc errc);

// True for errors raised while parsing bytes, as opposed to I/O failures
bool
is_decode_errc(BundleErrc errc);

// Base exception for everything this library throws
class BundleError : public std::runtime_error
{
public:
    BundleError(BundleErrc errc, const std::string& msg)
        : std::runtime_error(msg), errc_(errc)
    {
    }

    BundleErrc
    errc() const
    {
        return errc_;
    }

private:
    BundleErrc errc_;
};

// Network or chunk fetch failure after retries
class TransportError : public BundleError
{
public:
    explicit TransportError(const std::string& msg)
        : BundleError(BundleErrc::transport, msg)
    {
    }
};

// Gateway does not know the transaction
class TransactionNotFoundError : public BundleError
{
public:
    explicit TransactionNotFoundError(const std::string& msg)
        : BundleError(BundleErrc::not_found, msg)
    {
    }
};

// Transaction metadata lacks the bundle format tags
class NotABundleError : public BundleError
{
public:
    explicit NotABundleError(const std::string& msg)
        : BundleError(BundleErrc::not_a_bundle, msg)
    {
    }
};

// A read needs bytes past the declared end of the stream
class UnexpectedEofError : public BundleError
{
public:
    explicit UnexpectedEofError(const std::string& msg)
        : BundleError(BundleErrc::unexpected_eof, msg)
    {
    }
};

// Entry table inconsistent with the transaction size
class MalformedHeaderError : public BundleError
{
public:
    explicit MalformedHeaderError(const std::string& msg)
        : BundleError(BundleErrc::malformed_header, msg)
    {
    }
};

// Item did not end where its declared size says
class ItemSizeMismatchError : public BundleError
{
public:
    explicit ItemSizeMismatchError(const std::string& msg)
        : BundleError(BundleErrc::item_size_mismatch, msg)
    {
    }
};

// A field would read past the item's declared size
class ItemOverrunError : public BundleError
{
public:
    explicit ItemOverrunError(const std::string& msg)
        : BundleError(BundleErrc::item_overrun, msg)
    {
    }
};

class UnknownSignatureTypeError : public BundleError
{
public:
    explicit UnknownSignatureTypeError(const std::string& msg)
        : BundleError(BundleErrc::unknown_signature_type, msg)
    {
    }
};

// Target/anchor presence byte other than 0 or 1
class InvalidPresenceFlagError : public BundleError
{
public:
    explicit InvalidPresenceFlagError(const std::string& msg)
        : BundleError(BundleErrc::invalid_presence_flag, msg)
    {
    }
};

class TagCountMismatchError : public BundleError
{
public:
    explicit TagCountMismatchError(const std::string& msg)
        : BundleError(BundleErrc::tag_count_mismatch, msg)
    {
    }
};

class TagLengthMismatchError : public BundleError
{
public:
    explicit TagLengthMismatchError(const std::string& msg)
        : BundleError(BundleErrc::tag_length_mismatch, msg)
    {
    }
};

// Negative lengths or counts inside the tag array
class MalformedTagsError : public BundleError
{
public:
    explicit MalformedTagsError(const std::string& msg)
        : BundleError(BundleErrc::malformed_tags, msg)
    {
    }
};

// Stream or tag region ended inside a varint
class TruncatedVarintError : public BundleError
{
public:
    explicit TruncatedVarintError(const std::string& msg)
        : BundleError(BundleErrc::truncated_varint, msg)
    {
    }
};

// Varint longer than any 64-bit value can encode
class MalformedVarintError : public BundleError
{
public:
    explicit MalformedVarintError(const std::string& msg)
        : BundleError(BundleErrc::malformed_varint, msg)
    {
    }
};

class OutputIoError : public BundleError
{
public:
    explicit OutputIoError(const std::string& msg)
        : BundleError(BundleErrc::output_io, msg)
    {
    }
};

/**
 * Context wrapper for decode-layer failures.
 *
 * Carries the kind of the underlying error, the item index (empty while
 * the header is being parsed), the stream offset at which that item or the
 * header started and the offset the stream had reached when decoding
 * failed. Thrown via std::throw_with_nested, so the message only names the
 * context and the original error stays reachable as the nested cause.
 */
class DecodeError : public BundleError
{
public:
    DecodeError(
        BundleErrc errc,
        std::optional<uint64_t> item_index,
        uint64_t item_offset,
        uint64_t offset,
        const std::string& detail = {});

    const std::optional<uint64_t>&
    item_index() const
    {
        return item_index_;
    }

    // Where the failing item (or the header) begins
    uint64_t
    item_offset() const
    {
        return item_offset_;
    }

    // Where the stream was when the failure was detected
    uint64_t
    offset() const
    {
        return offset_;
    }

private:
    std::optional<uint64_t> item_index_;
    uint64_t item_offset_;
    uint64_t offset_;
};

// Render an exception and everything nested inside it, one cause per line
std::string
describe_error_chain(const std::exception& e);

}  // namespace bndl::bundle
