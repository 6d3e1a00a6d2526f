#include "bndl/arweave/arweave-chunk-source.h"
#include "bndl/arweave/arweave-client.h"
#include "bndl/arweave/gateway-url.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/codec/base64url.h"
#include "bndl/core/logger.h"
#include "bndl/dumper/arg-options.h"
#include "bndl/dumper/bundle-dumper.h"

#include <boost/filesystem.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace fs = boost::filesystem;
using namespace bndl;
using namespace bndl::dumper;

int
main(int argc, char* argv[])
{
    CommandLineOptions options = parse_argv(argc, argv);

    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    try
    {
        if (!Logger::set_level(options.log_level))
        {
            Logger::set_level(LogLevel::ERROR);
            std::cerr << "Unrecognized log level: " << options.log_level
                      << ", falling back to 'error'" << std::endl;
        }

        auto id = codec::transaction_id_from_base64url(*options.transaction_id);
        if (!id)
        {
            std::cerr << "Error: invalid transaction id "
                      << *options.transaction_id << std::endl;
            return 1;
        }

        arweave::RetryPolicy retry;
        retry.max_retries = options.max_retries;
        retry.initial_delay = std::chrono::milliseconds(options.retry_delay_ms);

        arweave::ArweaveClient client(
            arweave::GatewayUrl::parse(options.api_url),
            std::chrono::seconds(options.timeout_s));
        arweave::RetryingMetadataLookup lookup(client, retry);

        BundleDumper dumper(
            lookup,
            [&client, &retry](const TransactionId& tx) {
                return std::make_unique<arweave::ArweaveChunkSource>(
                    client, tx, retry);
            },
            options.queue_depth);

        const std::string output_file = options.resolved_output_file();
        std::ofstream out(output_file, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            throw bundle::OutputIoError(
                "cannot open output file " + output_file);
        }

        LOGI(
            "Dumping bundle ",
            *options.transaction_id,
            " from ",
            client.url().to_string());
        dumper.run(*id, out);
        out.close();
        if (!out)
        {
            throw bundle::OutputIoError(
                "failed to close output file " + output_file);
        }

        std::cout << "Bundle data stored in: "
                  << fs::absolute(output_file).string() << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << bundle::describe_error_chain(e) << std::endl;
        return 1;
    }
}
