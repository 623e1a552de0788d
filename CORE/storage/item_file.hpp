#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "storage/item_codec.hpp"
#include "store/item.hpp"

namespace todo {

// Backing file for the item list. The codec follows the file extension.
class ItemFile {
public:
    explicit ItemFile(std::filesystem::path path);
    ItemFile(std::filesystem::path path, std::unique_ptr<storage::ItemCodec> codec);

    const std::filesystem::path& path() const { return path_; }

    bool exists() const;

    // Absent file -> empty list. Unreadable or malformed -> StoreError(FileAccess).
    std::vector<Item> load() const;

    // Writes "<path>.tmp" then renames it over the target.
    void save(const std::vector<Item>& items) const;

private:
    std::filesystem::path path_;
    std::unique_ptr<storage::ItemCodec> codec_;
};

}
