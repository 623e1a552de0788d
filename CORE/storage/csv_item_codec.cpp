#include "storage/csv_item_codec.hpp"

#include "utils/string_utils.hpp"

#include <sstream>
#include <stdexcept>

namespace todo::storage {

std::string CsvItemCodec::quote_field(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string CsvItemCodec::encode(const std::vector<Item>& items) const {
    std::ostringstream out;
    out << kHeader << "\n";
    for (std::size_t i = 0; i < items.size(); ++i) {
        out << i << ',' << quote_field(items[i].text) << ',' << (items[i].done ? "true" : "false") << "\n";
    }
    return out.str();
}

std::vector<std::vector<std::string>> CsvItemCodec::parse_records(std::string_view content) {
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> record;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_field = [&]() {
        record.push_back(std::move(field));
        field.clear();
        field_started = false;
    };
    auto end_record = [&]() {
        // A bare newline is a blank line, not an empty record.
        if (!record.empty() || field_started || !field.empty()) {
            end_field();
            records.push_back(std::move(record));
        }
        record.clear();
    };

    for (std::size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        switch (c) {
            case '"':
                if (!field.empty()) {
                    throw std::runtime_error("unexpected quote inside an unquoted field");
                }
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                end_field();
                field_started = true;
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                break;
            default:
                field.push_back(c);
                break;
        }
    }
    if (in_quotes) {
        throw std::runtime_error("unterminated quoted field");
    }
    end_record();
    return records;
}

std::vector<Item> CsvItemCodec::decode(const std::string& content) const {
    std::vector<Item> items;
    const auto records = parse_records(content);
    for (std::size_t r = 0; r < records.size(); ++r) {
        const auto& rec = records[r];
        if (r == 0 && !rec.empty() && strings::iequals(strings::trim_copy(rec[0]), "Id")) {
            continue;
        }
        if (rec.size() < 2) {
            std::ostringstream oss;
            oss << "record " << r + 1 << " has " << rec.size() << " field(s), expected at least 2";
            throw std::runtime_error(oss.str());
        }
        Item item;
        item.index = items.size();
        item.text = rec[1];
        item.done = rec.size() > 2 && strings::iequals(strings::trim_copy(rec[2]), "true");
        items.push_back(std::move(item));
    }
    return items;
}

}
