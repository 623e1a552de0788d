#pragma once

#include <optional>
#include <string>
#include <vector>

#include "store/item.hpp"
#include "store/store_error.hpp"

namespace todo {

class ItemFile;

// In-memory list of to-do items. Indices always mirror list position.
class ItemStore {
public:
    ItemStore() = default;
    explicit ItemStore(std::vector<Item> items);

    // Reads the backing file; an absent file yields an empty store.
    static ItemStore load(const ItemFile& file);

    // Writes every item back. Throws StoreError(FileAccess) on failure.
    void save(const ItemFile& file);

    std::vector<std::string> show() const;

    const Item& add(std::string text);

    // Both throw StoreError(NotFound) and leave the list untouched when nothing matches.
    Item remove(const Selector& selector);

    // With new_text the text is replaced; without it the done flag flips.
    const Item& update(const Selector& selector, std::optional<std::string> new_text = std::nullopt);

    const std::vector<Item>& items() const { return items_; }
    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    bool changed() const { return changed_; }

    static std::string format_line(const Item& item);

private:
    std::vector<Item>::iterator find(const Selector& selector);
    void renumber();

    std::vector<Item> items_;
    bool changed_ = false;
};

}
