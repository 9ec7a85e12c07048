#include <catch2/catch_all.hpp>
#include <sg/dictionary.h>
#include <sg/json.h>

using namespace sg;
using Catch::Approx;

TEST_CASE("Prevent precision issues") {
    std::string c = R"({"object w/array that get reparsed with int + double members":{"array":[1.0,1.0e+200]}})";
    auto dict = parse_json(c);
    auto reparse = parse_json(dict.dump());
    REQUIRE_NOTHROW(reparse.dump(4));
    INFO(reparse.dump(4));
    const auto& array = reparse.at("object w/array that get reparsed with int + double members").at("array");
    REQUIRE(array.at(0).isDouble());
    REQUIRE(array.at(1).asDouble() == Approx(1.0e+200));
}

TEST_CASE("Demonstrate how to get a Json object from a dict formatted string") {
    SECTION("Object") {
        std::string settings_string = R"({"pokemon":{"name":"Pikachu", "nicknames":["pika", "pikachu", "yellow rat"]}})";
        auto dict_object = parse_json(settings_string);
        REQUIRE(dict_object.at("pokemon").at("name").asString() == "Pikachu");
        REQUIRE(dict_object.at("pokemon").at("nicknames").asStrings().size() == 3);
    }
    SECTION("Scalars") {
        REQUIRE(parse_json("42").asInt() == 42);
        REQUIRE(parse_json("-1.5").asDouble() == Approx(-1.5));
        REQUIRE(parse_json("true").asBool());
        REQUIRE(parse_json("null").isNull());
        REQUIRE(parse_json(R"("x")").asString() == "x");
    }
}

TEST_CASE("Object members keep document order", "[json]") {
    auto d = parse_json(R"({"b": 1, "a": 2, "c": 3})");
    REQUIRE(d.keys() == std::vector<std::string>{"b", "a", "c"});
    REQUIRE(d.dump() == R"({"b":1,"a":2,"c":3})");
}

TEST_CASE("Duplicate keys keep the last value at the first position", "[json]") {
    auto d = parse_json(R"({"a": 1, "b": 2, "a": 3})");
    REQUIRE(d.keys() == std::vector<std::string>{"a", "b"});
    REQUIRE(d.at("a").asInt() == 3);
}

TEST_CASE("Unicode escapes decode to UTF-8", "[json]") {
    auto d = parse_json(R"({"name": "Mar\u00eda", "poet": "\u674e \u767d", "emoji": "\ud83d\ude00"})");
    REQUIRE(d.at("name").asString() == "Mar\xc3\xad"
                                       "a");
    REQUIRE(d.at("poet").asString() == "\xe6\x9d\x8e \xe7\x99\xbd");
    REQUIRE(d.at("emoji").asString() == "\xf0\x9f\x98\x80");
}

TEST_CASE("Comments are tolerated", "[json][comments]") {
    std::string s = R"(
// leading comment
{
  "a": 1, /* inline */
  "b": "not // a comment"
}
)";
    auto d = parse_json(s);
    REQUIRE(d.at("a").asInt() == 1);
    REQUIRE(d.at("b").asString() == "not // a comment");
}

TEST_CASE("Missing and trailing commas are tolerated", "[json]") {
    auto d = parse_json(R"({"a": 1 "b": [1 2 3,], })");
    REQUIRE(d.at("a").asInt() == 1);
    REQUIRE(d.at("b").size() == 3);
}

TEST_CASE("Integers that overflow become doubles", "[json]") {
    auto d = parse_json("123456789012345678901234567890");
    REQUIRE(d.isDouble());
    REQUIRE(d.asDouble() == Approx(1.2345678901234568e29));
}

TEST_CASE("Dump and parse agree on nested structures", "[json]") {
    std::string text = R"({"order":{"items":[{"sku":"A-1","qty":2,"price":9.5}],"paid":false,"note":null}})";
    auto d = parse_json(text);
    REQUIRE(d.dump() == text);
}

TEST_CASE("extract_json_object finds JSON wrapped in prose", "[json]") {
    std::string reply = "Sure! Here is the result:\n```json\n{\"semantic_score\": 0.9}\n```\nThanks.";
    REQUIRE(extract_json_object(reply) == "{\"semantic_score\": 0.9}");
    REQUIRE(extract_json_object("no braces here") == "no braces here");
}

TEST_CASE("The _json literal parses inline documents", "[json]") {
    using namespace json_literals;
    auto d = R"({"type": "string", "required": true})"_json;
    REQUIRE(d.at("type").asString() == "string");
    REQUIRE(d.at("required").asBool());
}

TEST_CASE("parse_json_file reports unreadable files", "[json]") {
    REQUIRE_THROWS_AS(parse_json_file("/nonexistent/definitely/missing.json"), std::runtime_error);
}
