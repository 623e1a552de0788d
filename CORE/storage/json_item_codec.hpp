#pragma once

#include "storage/item_codec.hpp"

#include <nlohmann/json.hpp>

namespace todo::storage {

// {"items": [{"id": 0, "description": "...", "done": false}, ...]}
class JsonItemCodec : public ItemCodec {
public:
    explicit JsonItemCodec(int indent = 2) : indent_(indent) {}

    std::string name() const override { return "json"; }
    std::string encode(const std::vector<Item>& items) const override;
    std::vector<Item> decode(const std::string& content) const override;

    static nlohmann::json to_json(const std::vector<Item>& items);

private:
    int indent_;
};

}
