#pragma once

#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <iterator>
#include <ostream>
#include <string>

namespace bndl::output {

/**
 * Pretty-print a JSON value with four-space indentation.
 *
 * @param os Output stream to write to
 * @param jv JSON value to print
 * @param indent Indentation of the line the value starts on; nested lines
 * are indented relative to it. No trailing newline is written.
 */
inline void
pretty_print(std::ostream& os, const boost::json::value& jv, std::string indent)
{
    switch (jv.kind())
    {
        case boost::json::kind::object: {
            const auto& obj = jv.get_object();
            if (obj.empty())
            {
                os << "{}";
                break;
            }
            os << "{\n";
            std::string inner = indent + "    ";
            for (auto it = obj.begin(); it != obj.end(); ++it)
            {
                os << inner << boost::json::serialize(it->key()) << ": ";
                pretty_print(os, it->value(), inner);
                if (std::next(it) != obj.end())
                    os << ",";
                os << "\n";
            }
            os << indent << "}";
            break;
        }
        case boost::json::kind::array: {
            const auto& arr = jv.get_array();
            if (arr.empty())
            {
                os << "[]";
                break;
            }
            os << "[\n";
            std::string inner = indent + "    ";
            for (auto it = arr.begin(); it != arr.end(); ++it)
            {
                os << inner;
                pretty_print(os, *it, inner);
                if (std::next(it) != arr.end())
                    os << ",";
                os << "\n";
            }
            os << indent << "]";
            break;
        }
        case boost::json::kind::string:
            os << boost::json::serialize(jv.get_string());
            break;
        case boost::json::kind::uint64:
            os << jv.get_uint64();
            break;
        case boost::json::kind::int64:
            os << jv.get_int64();
            break;
        case boost::json::kind::double_:
            os << jv.get_double();
            break;
        case boost::json::kind::bool_:
            os << (jv.get_bool() ? "true" : "false");
            break;
        case boost::json::kind::null:
            os << "null";
            break;
    }
}

}  // namespace bndl::output
