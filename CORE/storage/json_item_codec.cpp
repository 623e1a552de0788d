#include "storage/json_item_codec.hpp"

#include "utils/string_utils.hpp"

#include <sstream>
#include <stdexcept>

namespace todo::storage {

nlohmann::json JsonItemCodec::to_json(const std::vector<Item>& items) {
    nlohmann::json list = nlohmann::json::array();
    for (std::size_t i = 0; i < items.size(); ++i) {
        nlohmann::json entry = nlohmann::json::object();
        entry["id"] = i;
        entry["description"] = items[i].text;
        entry["done"] = items[i].done;
        list.push_back(std::move(entry));
    }
    nlohmann::json doc = nlohmann::json::object();
    doc["items"] = std::move(list);
    return doc;
}

std::string JsonItemCodec::encode(const std::vector<Item>& items) const {
    return to_json(items).dump(indent_) + "\n";
}

std::vector<Item> JsonItemCodec::decode(const std::string& content) const {
    std::vector<Item> items;
    if (strings::trim_copy(content).empty()) {
        return items;
    }

    const nlohmann::json doc = nlohmann::json::parse(content);
    if (!doc.is_object() || !doc.contains("items") || !doc["items"].is_array()) {
        throw std::runtime_error("expected an object with an \"items\" array");
    }

    const auto& list = doc["items"];
    items.reserve(list.size());
    for (std::size_t i = 0; i < list.size(); ++i) {
        const auto& entry = list[i];
        if (!entry.is_object() || !entry.contains("description") || !entry["description"].is_string()) {
            std::ostringstream oss;
            oss << "item " << i << " has no string \"description\"";
            throw std::runtime_error(oss.str());
        }
        Item item;
        item.index = i;
        item.text = entry["description"].get<std::string>();
        if (entry.contains("done")) {
            if (!entry["done"].is_boolean()) {
                std::ostringstream oss;
                oss << "item " << i << " has a non-boolean \"done\"";
                throw std::runtime_error(oss.str());
            }
            item.done = entry["done"].get<bool>();
        }
        items.push_back(std::move(item));
    }
    return items;
}

}
