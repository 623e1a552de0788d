#include "store/item.hpp"

#include "utils/string_utils.hpp"

#include <charconv>
#include <system_error>
#include <limits>

namespace todo {

Selector Selector::parse(std::string_view input) {
    Selector sel;
    sel.text = strings::trim_copy(input);
    if (strings::is_digits(sel.text)) {
        std::size_t value = 0;
        const char* first = sel.text.data();
        const char* last = first + sel.text.size();
        const auto res = std::from_chars(first, last, value);
        // Too large for size_t can never be in range.
        sel.index = (res.ec == std::errc{}) ? value : std::numeric_limits<std::size_t>::max();
    }
    return sel;
}

bool Selector::matches(const Item& item) const {
    if (index) return item.index == *index;
    return strings::iequals(strings::trim_copy(item.text), text);
}

std::string Selector::describe() const {
    if (index) return "index " + text;
    return "description '" + text + "'";
}

}
