#pragma once

#include <boost/json/value.hpp>
#include <cstddef>
#include <ostream>
#include <string>

namespace bndl::output {

/**
 * Writes a JSON array to a stream one element at a time.
 *
 * open() writes the opening bracket, each write_item() the separator and
 * one pretty-printed element, close() the closing bracket. An array with no
 * elements comes out as "[]". Every element is rendered in memory first and
 * written with a single call, so a failing sink never receives part of an
 * element.
 *
 * The writer does not own the stream.
 */
class JsonArrayWriter
{
public:
    explicit JsonArrayWriter(std::ostream& out);

    // @throws OutputIoError if the sink rejects the write
    void
    open();

    // @throws OutputIoError if the sink rejects the write
    void
    write_item(const boost::json::value& item);

    // Closing bracket and flush. @throws OutputIoError
    void
    close();

    std::size_t
    items_written() const
    {
        return items_written_;
    }

    bool
    is_open() const
    {
        return opened_ && !closed_;
    }

private:
    void
    write_raw(const std::string& text, const char* what);

    std::ostream& out_;
    std::size_t items_written_ = 0;
    bool opened_ = false;
    bool closed_ = false;
};

}  // namespace bndl::output
