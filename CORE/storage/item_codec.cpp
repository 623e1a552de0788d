#include "storage/item_codec.hpp"

#include "storage/csv_item_codec.hpp"
#include "storage/json_item_codec.hpp"
#include "utils/string_utils.hpp"

namespace todo::storage {

std::unique_ptr<ItemCodec> codec_for(const std::filesystem::path& path) {
    if (strings::to_lower_copy(path.extension().string()) == ".csv") {
        return std::make_unique<CsvItemCodec>();
    }
    return std::make_unique<JsonItemCodec>();
}

}
