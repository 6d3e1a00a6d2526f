#pragma once

#include "bndl/bundle/data-item.h"
#include "bndl/output/json-array-writer.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

namespace bndl::output {

/**
 * Moves JSON serialization and output I/O off the decoding thread.
 *
 * The decoder push()es items into a bounded queue; a single consumer thread
 * serializes them in push order through a JsonArrayWriter. push() blocks
 * while the queue is full, so a slow sink throttles decoding and a slow
 * network never holds up items that are already decoded.
 *
 * A failure on the consumer thread is stored and rethrown to the producer
 * from the next push() or from finish().
 */
class AsyncItemWriter
{
public:
    AsyncItemWriter(JsonArrayWriter& writer, std::size_t max_queued = 4);

    // Aborts the consumer if finish() was not called
    ~AsyncItemWriter();

    AsyncItemWriter(const AsyncItemWriter&) = delete;
    AsyncItemWriter&
    operator=(const AsyncItemWriter&) = delete;

    // Start the consumer thread, which opens the array
    void
    start();

    void
    push(bundle::DataItem item);

    // Write everything queued, close the array and join the consumer
    void
    finish();

    // Stop the consumer without closing the array; queued items are dropped
    void
    abort();

    std::size_t
    items_written() const;

private:
    void
    run();

    void
    rethrow_if_failed();

    JsonArrayWriter& writer_;
    std::size_t max_queued_;

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_producer_;  // Decoder waits here
    std::condition_variable cv_consumer_;  // Writer thread waits here
    std::deque<bundle::DataItem> queue_;
    bool finishing_ = false;
    bool stopping_ = false;
    std::exception_ptr error_;
    std::size_t items_written_ = 0;
};

}  // namespace bndl::output
