#include <catch2/catch_all.hpp>
#include <sg/json.h>
#include <sg/structural_validator.h>

using namespace sg;
using namespace sg::json_literals;

namespace {

const Dictionary order_schema = R"({
    "order": {
        "type": "object",
        "required": true,
        "properties": {
            "id": {"type": "string", "required": true},
            "items": {
                "type": "array",
                "min_length": 1,
                "items": {
                    "type": "object",
                    "properties": {
                        "sku": {"type": "string", "required": true, "pattern": "^[A-Z]{3}-\\d+$"},
                        "price": {"type": "number", "required": true, "gt": 0}
                    }
                }
            }
        }
    }
})"_json;

StructuralResult check(const Dictionary& payload) {
    return StructuralValidator().validate(*SchemaCompiler().compile(order_schema), payload);
}

}  // namespace

TEST_CASE("Errors inside arrays of objects carry the full path", "[structural][nested]") {
    auto r = check(R"({
        "order": {
            "id": "A-1",
            "items": [
                {"sku": "ABC-1", "price": 5},
                {"sku": "ABC-2", "price": -3}
            ]
        }
    })"_json);
    REQUIRE(r.errors.size() == 1);
    auto const& e = r.errors[0];
    REQUIRE(e.kind == ErrorKind::OutOfRange);
    REQUIRE(e.path.to_string() == "order.items.1.price");
    REQUIRE(e.path.size() == 4);
    REQUIRE(e.path.tokens()[2].isIndex());
    REQUIRE(e.path.tokens()[2].asIndex() == 1);
    REQUIRE(e.to_dictionary().at("loc").dump() == R"(["order","items",1,"price"])");
}

TEST_CASE("An array of objects at the root gives a three segment path", "[structural][nested]") {
    auto schema = R"({
        "items": {
            "type": "array",
            "items": {"type": "object", "properties": {"price": {"type": "number", "min": 0}}}
        }
    })"_json;
    auto r = StructuralValidator().validate(*SchemaCompiler().compile(schema),
                                            R"({"items": [{"price": 1}, {"price": -1}]})"_json);
    REQUIRE(r.errors.size() == 1);
    auto const& tokens = r.errors[0].path.tokens();
    REQUIRE(tokens.size() == 3);
    REQUIRE(tokens[0] == PathToken::makeKey("items"));
    REQUIRE(tokens[1] == PathToken::makeIndex(1));
    REQUIRE(tokens[2] == PathToken::makeKey("price"));
}

TEST_CASE("Nested errors are reported for every element", "[structural][nested]") {
    auto r = check(R"({
        "order": {
            "items": [
                {"sku": "bad", "price": 1},
                {"price": "free"},
                null
            ]
        }
    })"_json);
    std::vector<std::string> paths;
    for (auto const& e : r.errors) paths.push_back(e.path.to_string() + ":" + to_string(e.kind));
    REQUIRE(paths == std::vector<std::string>{"order.id:missing_field",
                                              "order.items.0.sku:pattern_mismatch",
                                              "order.items.1.sku:missing_field",
                                              "order.items.1.price:type_mismatch",
                                              "order.items.2:type_mismatch"});
}

TEST_CASE("Array length is checked before the elements", "[structural][nested]") {
    auto r = check(R"({"order": {"id": "A-1", "items": []}})"_json);
    REQUIRE(r.errors.size() == 1);
    REQUIRE(r.errors[0].kind == ErrorKind::LengthViolation);
    REQUIRE(r.errors[0].path.to_string() == "order.items");
    REQUIRE(r.errors[0].message.find("items") != std::string::npos);
}

TEST_CASE("A wrongly typed container does not descend", "[structural][nested]") {
    auto r = check(R"({"order": {"id": "A-1", "items": {"sku": "ABC-1"}}})"_json);
    REQUIRE(r.errors.size() == 1);
    REQUIRE(r.errors[0].kind == ErrorKind::TypeMismatch);
    REQUIRE(r.errors[0].path.to_string() == "order.items");

    r = check(R"({"order": "A-1"})"_json);
    REQUIRE(r.errors.size() == 1);
    REQUIRE(r.errors[0].path.to_string() == "order");
}

TEST_CASE("Nested validated data keeps the declared shape", "[structural][nested]") {
    auto r = check(R"({"order": {"id": "A-1", "note": "x", "items": [{"sku": "ABC-1", "price": 2}]}})"_json);
    REQUIRE(r.is_valid());
    auto const& order = r.validated_data.at("order");
    REQUIRE_FALSE(order.has("note"));
    REQUIRE(order.at("items").at(0).at("price").isDouble());
    REQUIRE(order.at("items").at(0).at("price").asDouble() == 2.0);
}

TEST_CASE("Strict mode reports unknown nested keys", "[structural][nested]") {
    StructuralOptions options;
    options.strict_unknown_fields = true;
    auto r = StructuralValidator(options).validate(
        *SchemaCompiler().compile(order_schema),
        R"({"order": {"id": "A-1", "items": [{"sku": "ABC-1", "price": 2, "color": "red"}]}})"_json);
    REQUIRE(r.errors.size() == 1);
    REQUIRE(r.errors[0].kind == ErrorKind::UnexpectedField);
    REQUIRE(r.errors[0].path.to_string() == "order.items.0.color");
}
