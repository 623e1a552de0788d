#include "cli/commands.hpp"

#include "storage/item_file.hpp"
#include "storage/json_item_codec.hpp"
#include "store/item_store.hpp"
#include "utils/log.hpp"
#include "utils/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace todo::cli {
namespace {

std::vector<std::string> tail(const std::vector<std::string>& args, std::size_t from) {
    if (from >= args.size()) return {};
    return std::vector<std::string>(args.begin() + static_cast<std::ptrdiff_t>(from), args.end());
}

void cmd_show(const ItemStore& store, bool as_json, std::ostream& out) {
    if (as_json) {
        std::string text;
        try {
            text = storage::JsonItemCodec::to_json(store.items()).dump(2);
        } catch (const nlohmann::json::exception& e) {
            throw StoreError(StoreError::Kind::FileAccess,
                             std::string("Unable to print items as JSON: ") + e.what());
        }
        out << text << "\n";
        return;
    }
    for (const auto& line : store.show()) {
        out << line << "\n";
    }
}

void cmd_add(ItemStore& store, const std::string& text, std::ostream& out) {
    const Item& item = store.add(text);
    out << "Added " << ItemStore::format_line(item) << "\n";
}

void cmd_remove(ItemStore& store, const std::string& selector, std::ostream& out) {
    const Item removed = store.remove(Selector::parse(selector));
    out << "Removed " << ItemStore::format_line(removed) << "\n";
}

void cmd_update(ItemStore& store,
                const std::string& selector,
                std::optional<std::string> new_text,
                std::ostream& out) {
    const bool toggling = !new_text.has_value();
    const Item& item = store.update(Selector::parse(selector), std::move(new_text));
    if (toggling) {
        out << "Marked " << item.index << " as " << (item.done ? "done" : "not done") << "\n";
    } else {
        out << "Updated " << ItemStore::format_line(item) << "\n";
    }
}

}

void print_usage(std::ostream& os) {
    os << "usage: todo <action> [arguments]\n"
       << "  show [--json]                      list items\n"
       << "  add <text>                         append an item\n"
       << "  remove <text|index>                delete the first matching item\n"
       << "  update <text|index> [<new text>]   replace the text, or toggle done\n"
       << "  help                               print this message\n"
       << "environment: TODO_FILE (backing .json/.csv file), TODO_LOG_LEVEL, TODO_LOG_FILE\n";
}

int run(const std::vector<std::string>& args,
        const config::Settings& settings,
        std::ostream& out,
        std::ostream& err) {
    if (args.empty()) {
        err << "Please specify an action.\n";
        print_usage(err);
        return kUsage;
    }

    const std::string action = strings::to_lower_copy(args[0]);
    if (action == "help" || action == "--help" || action == "-h") {
        print_usage(out);
        return kOk;
    }

    const bool needs_item = action == "add" || action == "remove" || action == "update";
    if (!needs_item && action != "show") {
        err << "The given command '" << args[0] << "' is invalid.\n";
        print_usage(err);
        return kUsage;
    }
    if (needs_item && args.size() < 2) {
        err << "Please specify an item for '" << action << "'.\n";
        return kUsage;
    }

    log::debug("cli: " + action + " on '" + settings.file.string() + "'");

    try {
        const ItemFile file(settings.file);
        ItemStore store = ItemStore::load(file);

        if (action == "show") {
            cmd_show(store, args.size() > 1 && args[1] == "--json", out);
        } else if (action == "add") {
            cmd_add(store, strings::join(tail(args, 1), " "), out);
        } else if (action == "remove") {
            cmd_remove(store, strings::join(tail(args, 1), " "), out);
        } else {
            std::optional<std::string> new_text;
            if (args.size() > 2) new_text = strings::join(tail(args, 2), " ");
            cmd_update(store, args[1], std::move(new_text), out);
        }

        if (store.changed()) {
            store.save(file);
        }
    } catch (const StoreError& e) {
        log::debug(std::string("cli: ") + to_string(e.kind()) + " error: " + e.what());
        err << "Error: " << e.what() << "\n";
        return kFailure;
    }
    return kOk;
}

}
