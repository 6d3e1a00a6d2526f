#pragma once

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>

namespace bndl::arweave {

/**
 * Run `ioc` until the operation started by `initiate` completes, calling
 * `cancel` if it is still pending once `timeout` has elapsed.
 *
 * For operations that have no expiry of their own (DNS resolution), where
 * beast::tcp_stream::expires_after cannot be used.
 *
 * @param initiate Called with a completion handler taking an error_code
 * @param cancel Must make the pending operation complete promptly
 * @return the operation's error, beast::error::timeout if the deadline
 * cancelled it, or operation_aborted if it never completed
 */
template <typename Initiate, typename Cancel>
boost::system::error_code
run_with_deadline(
    boost::asio::io_context& ioc,
    std::chrono::steady_clock::duration timeout,
    Initiate&& initiate,
    Cancel&& cancel)
{
    boost::system::error_code result = boost::asio::error::operation_aborted;
    bool timed_out = false;

    boost::asio::steady_timer deadline(ioc, timeout);
    deadline.async_wait([&](boost::system::error_code ec) {
        if (!ec)
        {
            timed_out = true;
            cancel();
        }
    });

    initiate([&](boost::system::error_code ec) {
        deadline.cancel();
        result = (ec && timed_out)
            ? boost::beast::make_error_code(boost::beast::error::timeout)
            : ec;
    });

    ioc.restart();
    ioc.run();
    return result;
}

}  // namespace bndl::arweave
