#include "bndl/dumper/arg-options.h"
#include "bndl/codec/base64url.h"

#include <boost/program_options.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
namespace bndl::dumper {

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "transaction-id,t",
        po::value<std::string>(),
        "Base64url id of the bundle transaction to dump")(
        "api-url,u",
        po::value<std::string>()->default_value(DEFAULT_API_URL),
        "Base URL of the Arweave gateway")(
        "output-file,o",
        po::value<std::string>(),
        "Path of the JSON file to write (default: <transaction-id>.json)")(
        "log-level,l",
        po::value<std::string>()->default_value("error"),
        "Log level (none, error, warn, info, debug)")(
        "max-retries",
        po::value<unsigned>()->default_value(3),
        "Retries for each gateway request after a network failure")(
        "retry-delay-ms",
        po::value<unsigned>()->default_value(500),
        "Delay before the first retry, doubled for each further retry")(
        "queue-depth",
        po::value<std::size_t>()->default_value(4),
        "Number of decoded items that may wait for the JSON writer")(
        "timeout-s",
        po::value<unsigned>()->default_value(30),
        "Timeout in seconds for each network step of a request");

    // Generate the help text
    std::ostringstream help_stream;
    help_stream << "Bundle Dumper" << std::endl
                << "-------------" << std::endl
                << "Stream an ANS-104 bundle from an Arweave gateway and "
                   "write its data items as JSON"
                << std::endl
                << std::endl
                << "Usage: " << (argc > 0 ? argv[0] : "bundle-dumper")
                << " --transaction-id <id> [options]" << std::endl
                << desc << std::endl
                << "The bundle is decoded while it downloads; only the "
                   "item being decoded and the"
                << std::endl
                << "items queued for output are held in memory." << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("transaction-id"))
        {
            options.transaction_id = vm["transaction-id"].as<std::string>();
            if (!codec::transaction_id_from_base64url(*options.transaction_id))
            {
                options.valid = false;
                options.error_message = "Invalid transaction id '" +
                    *options.transaction_id +
                    "' (expected 43 base64url characters)";
                return options;
            }
        }
        else
        {
            options.valid = false;
            options.error_message =
                "No transaction id specified (--transaction-id)";
            return options;
        }

        options.api_url = vm["api-url"].as<std::string>();

        if (vm.count("output-file"))
        {
            options.output_file = vm["output-file"].as<std::string>();
        }

        std::string level = vm["log-level"].as<std::string>();
        if (level != "none" && level != "error" && level != "warn" &&
            level != "info" && level != "debug")
        {
            options.valid = false;
            options.error_message =
                "Log level must be one of: none, error, warn, info, debug";
            return options;
        }
        options.log_level = level;

        options.max_retries = vm["max-retries"].as<unsigned>();
        options.retry_delay_ms = vm["retry-delay-ms"].as<unsigned>();

        options.queue_depth = vm["queue-depth"].as<std::size_t>();
        if (options.queue_depth == 0)
        {
            options.valid = false;
            options.error_message = "Queue depth must be at least 1";
            return options;
        }

        options.timeout_s = vm["timeout-s"].as<unsigned>();
        if (options.timeout_s == 0)
        {
            options.valid = false;
            options.error_message = "Timeout must be at least 1 second";
            return options;
        }
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }
    catch (const std::exception& e)
    {
        options.valid = false;
        options.error_message = std::string("Unexpected error: ") + e.what();
    }

    return options;
}

}  // namespace bndl::dumper
