#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace todo {

struct Item {
    std::size_t index = 0;
    std::string text;
    bool done = false;
};

inline bool operator==(const Item& a, const Item& b) {
    return a.index == b.index && a.text == b.text && a.done == b.done;
}

inline bool operator!=(const Item& a, const Item& b) { return !(a == b); }

// Identifies an item either by zero-based position or by its text.
// Text matching compares trimmed values, ignoring ASCII case.
struct Selector {
    std::optional<std::size_t> index;
    std::string text;

    static Selector parse(std::string_view input);

    bool by_index() const { return index.has_value(); }
    bool matches(const Item& item) const;
    std::string describe() const;
};

}
