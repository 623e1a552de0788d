#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "store/item.hpp"

namespace todo::storage {

// Converts the item list to and from one on-disk format.
// decode() throws std::runtime_error (or a subclass) on malformed input.
class ItemCodec {
public:
    virtual ~ItemCodec() = default;

    virtual std::string name() const = 0;
    virtual std::string encode(const std::vector<Item>& items) const = 0;
    virtual std::vector<Item> decode(const std::string& content) const = 0;
};

// ".csv" in any case selects CSV, everything else JSON.
std::unique_ptr<ItemCodec> codec_for(const std::filesystem::path& path);

}
