#include "bndl/output/async-item-writer.h"
#include "bndl/core/logger.h"
#include "bndl/output/data-item-json.h"

#include <stdexcept>
#include <utility>

namespace bndl::output {

AsyncItemWriter::AsyncItemWriter(
    JsonArrayWriter& writer,
    std::size_t max_queued)
    : writer_(writer), max_queued_(max_queued == 0 ? 1 : max_queued)
{
}

AsyncItemWriter::~AsyncItemWriter()
{
    abort();
}

void
AsyncItemWriter::start()
{
    if (thread_.joinable())
    {
        throw std::logic_error("AsyncItemWriter: already started");
    }
    thread_ = std::thread([this]() { run(); });
}

void
AsyncItemWriter::rethrow_if_failed()
{
    if (error_)
    {
        std::rethrow_exception(error_);
    }
}

void
AsyncItemWriter::push(bundle::DataItem item)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_producer_.wait(lock, [this] {
        return queue_.size() < max_queued_ || error_ || stopping_;
    });
    rethrow_if_failed();
    if (stopping_ || finishing_)
    {
        throw std::logic_error("AsyncItemWriter: push after finish/abort");
    }

    queue_.push_back(std::move(item));
    cv_consumer_.notify_one();
}

void
AsyncItemWriter::finish()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finishing_ = true;
        cv_consumer_.notify_one();
    }
    if (thread_.joinable())
    {
        thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rethrow_if_failed();
}

void
AsyncItemWriter::abort()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queue_.clear();
        cv_consumer_.notify_one();
        cv_producer_.notify_all();
    }
    if (thread_.joinable())
    {
        thread_.join();
    }
}

std::size_t
AsyncItemWriter::items_written() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_written_;
}

void
AsyncItemWriter::run()
{
    try
    {
        writer_.open();

        for (;;)
        {
            bundle::DataItem item;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_consumer_.wait(lock, [this] {
                    return !queue_.empty() || finishing_ || stopping_;
                });

                if (stopping_)
                {
                    return;
                }
                if (queue_.empty())
                {
                    // finishing_ and fully drained
                    break;
                }

                item = std::move(queue_.front());
                queue_.pop_front();
                cv_producer_.notify_one();
            }

            // Serialize outside the lock so the decoder keeps running
            writer_.write_item(data_item_to_json(item));

            std::lock_guard<std::mutex> lock(mutex_);
            ++items_written_;
        }

        writer_.close();
        LOGI("JSON array closed after ", writer_.items_written(), " items");
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = std::current_exception();
        cv_producer_.notify_all();
    }
}

}  // namespace bndl::output
