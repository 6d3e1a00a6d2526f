#pragma once

#include "bndl/bundle/data-item.h"

#include <boost/json/object.hpp>

namespace bndl::output {

/**
 * JSON form of a decoded DataItem.
 *
 * Fields: id, signature_type (numeric code), signature_name, signature,
 * owner, target (null when absent), anchor (null when absent), tags (array
 * of {name, value}), data. Every byte string is unpadded base64url.
 */
boost::json::object
data_item_to_json(const bundle::DataItem& item);

}  // namespace bndl::output
