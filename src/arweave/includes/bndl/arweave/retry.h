#pragma once

#include "bndl/bundle/bundle-errors.h"
#include "bndl/core/logger.h"

#include <chrono>
#include <thread>

namespace bndl::arweave {

struct RetryPolicy
{
    // Attempts after the first one
    unsigned max_retries = 3;
    // Delay before the first retry, doubled for each further one
    std::chrono::milliseconds initial_delay{500};
};

/**
 * Call `fn` until it returns without throwing TransportError, at most
 * 1 + policy.max_retries times. Any other exception propagates at once.
 *
 * @param what Description of the operation for the log
 */
template <typename Fn>
auto
with_retries(const RetryPolicy& policy, const char* what, Fn&& fn)
    -> decltype(fn())
{
    auto delay = policy.initial_delay;
    for (unsigned attempt = 0;; ++attempt)
    {
        try
        {
            return fn();
        }
        catch (const bundle::TransportError& e)
        {
            if (attempt >= policy.max_retries)
            {
                LOGE(what, " failed after ", attempt + 1, " attempts");
                throw;
            }
            LOGW(
                what,
                " failed (attempt ",
                attempt + 1,
                "): ",
                e.what(),
                "; retrying in ",
                delay.count(),
                "ms");
        }
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

}  // namespace bndl::arweave
