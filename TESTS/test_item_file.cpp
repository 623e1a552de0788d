#include "doctest/doctest.h"

#include "storage/item_file.hpp"
#include "store/item_store.hpp"
#include "support/test_paths.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using todo::ItemFile;
using todo::ItemStore;
using todo::Selector;
using todo::StoreError;
using todo_test::read_all;
using todo_test::scratch_file;
using todo_test::write_all;

TEST_CASE("missing backing file loads as an empty store") {
    const fs::path path = scratch_file("missing.json");
    const ItemFile file(path);
    CHECK_FALSE(file.exists());
    const ItemStore store = ItemStore::load(file);
    CHECK(store.empty());
    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("saving then loading yields the same ordered items in both formats") {
    for (const char* name : {"roundtrip.json", "roundtrip.csv"}) {
        CAPTURE(name);
        const ItemFile file(scratch_file(name));

        ItemStore store;
        store.add("write report");
        store.add("call, \"bob\"");
        store.add("buy milk");
        store.update(Selector::parse("1"));
        store.remove(Selector::parse("write REPORT"));
        store.save(file);
        CHECK_FALSE(store.changed());
        CHECK_FALSE(fs::exists(file.path().string() + ".tmp"));

        const ItemStore loaded = ItemStore::load(file);
        CHECK(loaded.items() == store.items());
        REQUIRE(loaded.size() == 2);
        CHECK(loaded.items()[0].done);
        CHECK(loaded.items()[1].index == 1);
    }
}

TEST_CASE("save creates missing parent directories") {
    const fs::path dir = todo_test::test_root() / "nested_dir";
    std::error_code ec;
    fs::remove_all(dir, ec);
    const ItemFile file(dir / "deeper" / "list.json");
    file.save({});
    CHECK(fs::exists(file.path()));
    CHECK(read_all(file.path()).find("\"items\"") != std::string::npos);
}

TEST_CASE("malformed backing file is reported as a file access error") {
    const fs::path path = scratch_file("broken.json");
    write_all(path, "{\n\n");
    const ItemFile file(path);
    try {
        file.load();
        FAIL("load did not throw");
    } catch (const StoreError& e) {
        CHECK(e.kind() == StoreError::Kind::FileAccess);
        CHECK(std::string(e.what()).find("broken.json") != std::string::npos);
    }
}

TEST_CASE("a directory in place of the backing file cannot be loaded or saved") {
    const fs::path path = todo_test::test_root() / "is_a_dir.json";
    std::error_code ec;
    fs::remove_all(path, ec);
    fs::create_directories(path, ec);
    const ItemFile file(path);
    CHECK_THROWS_AS(file.load(), StoreError);
    CHECK_THROWS_AS(file.save({}), StoreError);
    CHECK_FALSE(fs::exists(path.string() + ".tmp"));
}
