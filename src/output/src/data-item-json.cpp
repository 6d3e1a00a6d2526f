#include "bndl/output/data-item-json.h"
#include "bndl/codec/base64url.h"

#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

namespace bndl::output {

namespace json = boost::json;

json::object
data_item_to_json(const bundle::DataItem& item)
{
    auto config = bundle::signature_config(
        static_cast<uint16_t>(item.signature_type));

    json::object obj;
    obj["id"] = codec::to_base64url(item.id);
    obj["signature_type"] = static_cast<uint16_t>(item.signature_type);
    obj["signature_name"] = config ? config->name : "unknown";
    obj["signature"] = codec::encode_base64url(item.signature);
    obj["owner"] = codec::encode_base64url(item.owner);

    if (item.target)
        obj["target"] = codec::to_base64url(*item.target);
    else
        obj["target"] = nullptr;

    if (item.anchor)
        obj["anchor"] =
            codec::encode_base64url(item.anchor->data(), item.anchor->size());
    else
        obj["anchor"] = nullptr;

    json::array tags;
    tags.reserve(item.tags.size());
    for (const auto& tag : item.tags)
    {
        json::object t;
        t["name"] = codec::encode_base64url(tag.name);
        t["value"] = codec::encode_base64url(tag.value);
        tags.push_back(std::move(t));
    }
    obj["tags"] = std::move(tags);

    obj["data"] = codec::encode_base64url(item.data);
    return obj;
}

}  // namespace bndl::output
