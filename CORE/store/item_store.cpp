#include "store/item_store.hpp"

#include "storage/item_file.hpp"
#include "utils/log.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace todo {

const char* to_string(StoreError::Kind kind) {
    switch (kind) {
        case StoreError::Kind::FileAccess: return "file access";
        case StoreError::Kind::NotFound:   return "not found";
    }
    return "unknown";
}

ItemStore::ItemStore(std::vector<Item> items)
    : items_(std::move(items)) {
    renumber();
}

ItemStore ItemStore::load(const ItemFile& file) {
    ItemStore store(file.load());
    log::debug("store: loaded " + std::to_string(store.size()) + " item(s) from '" + file.path().string() + "'");
    return store;
}

void ItemStore::save(const ItemFile& file) {
    file.save(items_);
    changed_ = false;
    log::debug("store: saved " + std::to_string(items_.size()) + " item(s) to '" + file.path().string() + "'");
}

std::string ItemStore::format_line(const Item& item) {
    std::string line = std::to_string(item.index) + ": " + item.text;
    if (item.done) line += " [done]";
    return line;
}

std::vector<std::string> ItemStore::show() const {
    std::vector<std::string> lines;
    lines.reserve(items_.size());
    for (const auto& item : items_) {
        lines.push_back(format_line(item));
    }
    return lines;
}

const Item& ItemStore::add(std::string text) {
    Item item;
    item.index = items_.size();
    item.text = std::move(text);
    items_.push_back(std::move(item));
    changed_ = true;
    return items_.back();
}

Item ItemStore::remove(const Selector& selector) {
    auto it = find(selector);
    if (it == items_.end()) {
        throw StoreError(StoreError::Kind::NotFound, "no item with " + selector.describe());
    }
    Item removed = std::move(*it);
    items_.erase(it);
    renumber();
    changed_ = true;
    return removed;
}

const Item& ItemStore::update(const Selector& selector, std::optional<std::string> new_text) {
    auto it = find(selector);
    if (it == items_.end()) {
        throw StoreError(StoreError::Kind::NotFound, "no item with " + selector.describe());
    }
    if (new_text) {
        it->text = std::move(*new_text);
    } else {
        it->done = !it->done;
    }
    changed_ = true;
    return *it;
}

std::vector<Item>::iterator ItemStore::find(const Selector& selector) {
    if (selector.by_index()) {
        if (*selector.index >= items_.size()) return items_.end();
        return items_.begin() + static_cast<std::ptrdiff_t>(*selector.index);
    }
    return std::find_if(items_.begin(), items_.end(),
                        [&](const Item& item) { return selector.matches(item); });
}

void ItemStore::renumber() {
    for (std::size_t i = 0; i < items_.size(); ++i) {
        items_[i].index = i;
    }
}

}
