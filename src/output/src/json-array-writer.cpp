#include "bndl/output/json-array-writer.h"
#include "bndl/bundle/bundle-errors.h"
#include "bndl/output/pretty-print.h"

#include <sstream>
#include <stdexcept>
#include <string>

namespace bndl::output {

namespace {
constexpr const char* ITEM_INDENT = "    ";
}  // namespace

JsonArrayWriter::JsonArrayWriter(std::ostream& out) : out_(out)
{
}

void
JsonArrayWriter::write_raw(const std::string& text, const char* what)
{
    out_.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out_)
    {
        throw bundle::OutputIoError(std::string("failed to write ") + what);
    }
}

void
JsonArrayWriter::open()
{
    if (opened_)
    {
        throw std::logic_error("JsonArrayWriter: array already opened");
    }
    write_raw("[", "opening bracket");
    opened_ = true;
}

void
JsonArrayWriter::write_item(const boost::json::value& item)
{
    if (!is_open())
    {
        throw std::logic_error("JsonArrayWriter: write_item outside open()");
    }

    std::ostringstream oss;
    oss << (items_written_ == 0 ? "\n" : ",\n") << ITEM_INDENT;
    pretty_print(oss, item, ITEM_INDENT);
    write_raw(oss.str(), "array element");
    ++items_written_;
}

void
JsonArrayWriter::close()
{
    if (!is_open())
    {
        throw std::logic_error("JsonArrayWriter: close without open()");
    }
    write_raw(items_written_ == 0 ? "]" : "\n]", "closing bracket");
    closed_ = true;

    out_.flush();
    if (!out_)
    {
        throw bundle::OutputIoError("failed to flush JSON output");
    }
}

}  // namespace bndl::output
