#include "doctest/doctest.h"

#include "storage/csv_item_codec.hpp"
#include "storage/json_item_codec.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using todo::Item;
using todo::storage::CsvItemCodec;
using todo::storage::JsonItemCodec;

namespace {

std::vector<Item> sample_items() {
    std::vector<Item> items(3);
    items[0].index = 0;
    items[0].text = "plain";
    items[1].index = 1;
    items[1].text = "needs, \"quoting\"";
    items[1].done = true;
    items[2].index = 2;
    items[2].text = "";
    return items;
}

}

TEST_CASE("codec_for picks CSV by extension regardless of case") {
    CHECK(todo::storage::codec_for("list.csv")->name() == "csv");
    CHECK(todo::storage::codec_for("list.CSV")->name() == "csv");
    CHECK(todo::storage::codec_for("list.json")->name() == "json");
    CHECK(todo::storage::codec_for("list")->name() == "json");
}

TEST_CASE("JSON codec writes an items array with advisory ids") {
    const JsonItemCodec codec;
    const auto doc = nlohmann::json::parse(codec.encode(sample_items()));
    REQUIRE(doc["items"].is_array());
    REQUIRE(doc["items"].size() == 3);
    CHECK(doc["items"][1]["id"].get<int>() == 1);
    CHECK(doc["items"][1]["description"].get<std::string>() == "needs, \"quoting\"");
    CHECK(doc["items"][1]["done"].get<bool>());
}

TEST_CASE("JSON codec rebuilds indices from array order") {
    const JsonItemCodec codec;
    const auto items = codec.decode(R"({"items": [
        {"id": 9, "description": "first"},
        {"id": 4, "description": "second", "done": true}
    ]})");
    REQUIRE(items.size() == 2);
    CHECK(items[0].index == 0);
    CHECK(items[0].text == "first");
    CHECK_FALSE(items[0].done);
    CHECK(items[1].index == 1);
    CHECK(items[1].done);
}

TEST_CASE("JSON codec round-trips and treats blank content as empty") {
    const JsonItemCodec codec;
    CHECK(codec.decode(codec.encode(sample_items())) == sample_items());
    CHECK(codec.decode("").empty());
    CHECK(codec.decode("  \n").empty());
}

TEST_CASE("JSON codec rejects malformed documents") {
    const JsonItemCodec codec;
    CHECK_THROWS(codec.decode("{"));
    CHECK_THROWS_AS(codec.decode("[]"), std::runtime_error);
    CHECK_THROWS_AS(codec.decode(R"({"items": [{"id": 0}]})"), std::runtime_error);
    CHECK_THROWS_AS(codec.decode(R"({"items": [{"description": "x", "done": "yes"}]})"), std::runtime_error);
}

TEST_CASE("CSV codec writes a header and quotes only when needed") {
    const CsvItemCodec codec;
    CHECK(codec.encode(sample_items()) ==
          "Id,Description,Done\n"
          "0,plain,false\n"
          "1,\"needs, \"\"quoting\"\"\",true\n"
          "2,,false\n");
    CHECK(CsvItemCodec::quote_field("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("CSV codec round-trips descriptions with commas, quotes and newlines") {
    const CsvItemCodec codec;
    auto items = sample_items();
    Item multi;
    multi.index = 3;
    multi.text = "line one\nline two";
    items.push_back(multi);
    CHECK(codec.decode(codec.encode(items)) == items);
}

TEST_CASE("CSV codec accepts files without a header and skips blank lines") {
    const CsvItemCodec codec;
    const auto items = codec.decode("5,alpha,true\r\n\n7,beta\n");
    REQUIRE(items.size() == 2);
    CHECK(items[0].index == 0);
    CHECK(items[0].text == "alpha");
    CHECK(items[0].done);
    CHECK(items[1].index == 1);
    CHECK(items[1].text == "beta");
    CHECK_FALSE(items[1].done);
}

TEST_CASE("CSV codec rejects short records and unterminated quotes") {
    const CsvItemCodec codec;
    CHECK_THROWS_AS(codec.decode("Id,Description,Done\njust-one-field\n"), std::runtime_error);
    CHECK_THROWS_AS(codec.decode("0,\"open quote,false\n"), std::runtime_error);
}
