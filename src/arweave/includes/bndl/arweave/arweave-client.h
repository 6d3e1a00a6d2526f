#pragma once

#include "bndl/arweave/gateway-url.h"
#include "bndl/arweave/http-client.h"
#include "bndl/arweave/retry.h"
#include "bndl/bundle/bundle-verifier.h"
#include "bndl/core/types.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bndl::arweave {

// Where a transaction's payload sits in the weave
struct TxOffset
{
    uint64_t size = 0;
    // Absolute offset of the payload's last byte
    uint64_t offset = 0;

    // Absolute offset of the payload's first byte
    uint64_t
    start() const
    {
        return offset - size + 1;
    }
};

// Response body parsers, independent of any transport. All of them throw
// TransportError for bodies that are not what the gateway should send.

// `tx/{id}` body; tag names and values are base64url encoded text
bundle::TxMetadata
parse_transaction_metadata(std::string_view body);

// `tx/{id}/offset` body; both numbers are decimal strings
TxOffset
parse_transaction_offset(std::string_view body);

// `chunk/{offset}` body; returns the decoded `chunk` field
std::vector<uint8_t>
parse_chunk(std::string_view body);

/**
 * Arweave gateway HTTP API.
 *
 * A 404 is reported as TransactionNotFoundError, any other non-200 status
 * (including 202 for pending transactions) as TransportError.
 */
class ArweaveClient : public bundle::MetadataLookup
{
public:
    ArweaveClient(GatewayUrl url, std::chrono::seconds timeout);

    bundle::TxMetadata
    fetch_transaction_metadata(const TransactionId& id) override;

    virtual TxOffset
    fetch_transaction_offset(const TransactionId& id);

    // Chunk containing the weave byte at `absolute_offset`
    virtual std::vector<uint8_t>
    fetch_chunk(uint64_t absolute_offset);

    const GatewayUrl&
    url() const
    {
        return http_.url();
    }

private:
    std::string
    get_ok(const std::string& path);

    HttpClient http_;
};

/**
 * Metadata lookup that retries an underlying lookup on transport failures.
 */
class RetryingMetadataLookup : public bundle::MetadataLookup
{
public:
    RetryingMetadataLookup(bundle::MetadataLookup& inner, RetryPolicy policy)
        : inner_(inner), policy_(policy)
    {
    }

    bundle::TxMetadata
    fetch_transaction_metadata(const TransactionId& id) override
    {
        return with_retries(policy_, "transaction metadata fetch", [&] {
            return inner_.fetch_transaction_metadata(id);
        });
    }

private:
    bundle::MetadataLookup& inner_;
    RetryPolicy policy_;
};

}  // namespace bndl::arweave
