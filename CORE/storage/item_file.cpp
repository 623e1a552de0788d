#include "storage/item_file.hpp"

#include "store/store_error.hpp"
#include "utils/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace todo {
namespace {

[[noreturn]] void fail(const std::string& message) {
    throw StoreError(StoreError::Kind::FileAccess, message);
}

void ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    if (fs::create_directories(parent, ec)) {
        return;
    }
    if (ec && !fs::exists(parent)) {
        std::ostringstream oss;
        oss << "Failed to create directory '" << parent.string() << "': " << ec.message();
        fail(oss.str());
    }
}

}

ItemFile::ItemFile(fs::path path)
    : path_(std::move(path)), codec_(storage::codec_for(path_)) {}

ItemFile::ItemFile(fs::path path, std::unique_ptr<storage::ItemCodec> codec)
    : path_(std::move(path)), codec_(std::move(codec)) {}

bool ItemFile::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::vector<Item> ItemFile::load() const {
    std::error_code ec;
    const bool present = fs::exists(path_, ec);
    if (ec) {
        fail("Unable to check '" + path_.string() + "': " + ec.message());
    }
    if (!present) {
        log::info("item file: '" + path_.string() + "' does not exist yet, starting empty");
        return {};
    }
    if (fs::is_directory(path_, ec)) {
        fail("'" + path_.string() + "' is a directory");
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        fail("Unable to open '" + path_.string() + "' for reading.");
    }
    const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        fail("Failed while reading '" + path_.string() + "'.");
    }

    try {
        return codec_->decode(contents);
    } catch (const std::exception& e) {
        std::ostringstream oss;
        oss << "Malformed " << codec_->name() << " in '" << path_.string() << "': " << e.what();
        fail(oss.str());
    }
}

void ItemFile::save(const std::vector<Item>& items) const {
    ensure_parent_exists(path_);

    std::string payload;
    try {
        payload = codec_->encode(items);
    } catch (const nlohmann::json::exception& e) {
        std::ostringstream oss;
        oss << "Unable to encode " << codec_->name() << " for '" << path_.string() << "': " << e.what();
        fail(oss.str());
    }
    const fs::path tmp = path_.string() + ".tmp";
    std::error_code ec;
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            fail("Unable to open '" + tmp.string() + "' for writing.");
        }
        out << payload;
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmp, ec);
            fail("Stream error while writing '" + tmp.string() + "'.");
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(tmp, ec);
        fail("rename('" + tmp.string() + "' -> '" + path_.string() + "') failed: " + reason);
    }
}

}
