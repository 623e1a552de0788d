#pragma once

#include "storage/item_codec.hpp"

#include <string_view>

namespace todo::storage {

// Id,Description,Done with RFC 4180 quoting. Id is written for readers only.
class CsvItemCodec : public ItemCodec {
public:
    static constexpr const char* kHeader = "Id,Description,Done";

    std::string name() const override { return "csv"; }
    std::string encode(const std::vector<Item>& items) const override;
    std::vector<Item> decode(const std::string& content) const override;

    static std::string quote_field(std::string_view field);
    static std::vector<std::vector<std::string>> parse_records(std::string_view content);
};

}
