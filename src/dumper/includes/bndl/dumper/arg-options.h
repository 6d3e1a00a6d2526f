#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace bndl::dumper {

inline constexpr const char* DEFAULT_API_URL = "https://arweave.net/";

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Base64url id of the bundle transaction */
    std::optional<std::string> transaction_id;

    /** Gateway base URL */
    std::string api_url = DEFAULT_API_URL;

    /** Output JSON file; "<transaction id>.json" when not given */
    std::optional<std::string> output_file;

    /** Log level (none, error, warn, info, debug) */
    std::string log_level = "error";

    /** Retries per gateway request after a transport failure */
    unsigned max_retries = 3;

    /** Delay before the first retry, doubled for each further one */
    unsigned retry_delay_ms = 500;

    /** Decoded items that may wait for the writer */
    std::size_t queue_depth = 4;

    /** Timeout for each network step of a request */
    unsigned timeout_s = 30;

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;

    // Output file name to use, applying the default
    std::string
    resolved_output_file() const
    {
        if (output_file)
            return *output_file;
        return transaction_id.value_or("bundle") + ".json";
    }
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

}  // namespace bndl::dumper
