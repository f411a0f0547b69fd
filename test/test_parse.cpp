#include <catch2/catch_test_macros.hpp>
#include <jr/jerry.h>
#include <string>

using namespace jr;

namespace {
    Value parse_ok(const std::string& text, const ParserOptions& options = {}) {
        auto tree = parse_text(text, options);
        INFO(text);
        REQUIRE(tree);
        return tree.value();
    }
}

TEST_CASE("numbers keep their integer or float type", "[parse]") {
    auto v = parse_ok("[1, 2.5, 3]");
    REQUIRE(v.isArray());
    REQUIRE(v.size() == 3);
    REQUIRE(v.at(0).type() == Value::Integer);
    REQUIRE(v.at(0).asInt() == 1);
    REQUIRE(v.at(1).type() == Value::Double);
    REQUIRE(v.at(1).asDouble() == 2.5);
    REQUIRE(v.at(2).type() == Value::Integer);
    REQUIRE(v.at(2).asInt() == 3);
}

TEST_CASE("empty array", "[parse][array]") {
    auto v = parse_ok("[]");
    REQUIRE(v.isArray());
    REQUIRE(v.empty());
}

TEST_CASE("strings lose their quotes", "[parse]") {
    auto v = parse_ok(R"(["", "a b", "{x}"])");
    REQUIRE(v.at(0).asString().empty());
    REQUIRE(v.at(1).asString() == "a b");
    REQUIRE(v.at(2).asString() == "{x}");
}

TEST_CASE("nested objects and arrays", "[parse]") {
    std::string config = R"({
    "pokemon": {"name": "Pikachu", "nicknames": ["pika", "yellow rat"]},
    "regions": [
        {"type": "sphere", "radius": 1.0, "center": [0, 0, 0]},
        {"type": "sphere", "radius": 1.5, "center": [1, 0, 0]}
    ],
    "matrix": [[1, 2], [3, 4], []]
})";
    auto v = parse_ok(config);

    REQUIRE(v.at("pokemon").at("name").asString() == "Pikachu");
    REQUIRE(v.at("pokemon").at("nicknames").at(1).asString() == "yellow rat");
    REQUIRE(v.at("regions").size() == 2);
    REQUIRE(v.at("regions").at(1).at("radius").asDouble() == 1.5);
    REQUIRE(v.at("regions").at(1).at("center").at(0).asInt() == 1);
    REQUIRE(v.at("matrix").at(1).at(0).asInt() == 3);
    REQUIRE(v.at("matrix").at(2).empty());
}

TEST_CASE("parsed tree matches one built by hand", "[parse]") {
    auto v = parse_ok(R"({"name": "vulcan", "port": 8080, "ratio": 0.25, "tags": ["a", "b"], "nested": {"deep": [1]}})");

    Value expected;
    expected["name"] = "vulcan";
    expected["port"] = 8080;
    expected["ratio"] = 0.25;
    expected["tags"] = Value::array();
    expected["tags"].push_back("a").push_back("b");
    expected["nested"]["deep"] = Value::array();
    expected["nested"]["deep"].push_back(1);

    REQUIRE(v == expected);
}

TEST_CASE("object keys keep first-seen order", "[parse][object]") {
    auto v = parse_ok(R"({"zeta": 1, "alpha": 2, "mid": 3})");
    REQUIRE(v.keys() == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("duplicate key keeps the last value", "[parse][object]") {
    auto v = parse_ok(R"({"a":1,"a":2})");
    REQUIRE(v.size() == 1);
    REQUIRE(v.at("a").asInt() == 2);
}

TEST_CASE("duplicate key is overwritten in place", "[parse][object]") {
    auto v = parse_ok(R"({"a": 1, "b": 2, "a": [3]})");
    REQUIRE(v.keys() == std::vector<std::string>{"a", "b"});
    REQUIRE(v.at("a").isArray());
    REQUIRE(v.at("a").at(0).asInt() == 3);
}

TEST_CASE("empty object is accepted by default", "[parse][object]") {
    auto v = parse_ok("{}");
    REQUIRE(v.isObject());
    REQUIRE(v.empty());

    auto nested = parse_ok(R"([{}, {"a": {}}])");
    REQUIRE(nested.at(0).isObject());
    REQUIRE(nested.at(1).at("a").empty());
}

TEST_CASE("strict mode rejects the empty object", "[parse][object]") {
    ParserOptions strict;
    strict.allow_empty_object = false;

    auto tree = parse_text("{}", strict);
    REQUIRE_FALSE(tree);
    REQUIRE(tree.error().kind == ParseError::Kind::MismatchedExpectation);
    REQUIRE(tree.error().expected == "string key");
    REQUIRE(tree.error().actual == "}");
    REQUIRE(tree.error().position == 1);

    // non-empty objects are unaffected
    auto v = parse_ok(R"({"a": 1})", strict);
    REQUIRE(v.at("a").asInt() == 1);
}

TEST_CASE("trailing comma in an array is accepted", "[parse][array]") {
    auto v = parse_ok("[1, 2,]");
    REQUIRE(v.size() == 2);
}

TEST_CASE("trailing comma in an object is rejected", "[parse][object]") {
    auto tree = parse_text(R"({"a": 1,})");
    REQUIRE_FALSE(tree);
    REQUIRE(tree.error().kind == ParseError::Kind::MismatchedExpectation);
    REQUIRE(tree.error().actual == "}");
}

TEST_CASE("parse works on a reader over prepared tokens", "[parse]") {
    std::vector<Token> tokens = {
        Token::makePunctuation('{'),
        Token::makeString("\"k\""),
        Token::makePunctuation(':'),
        Token::makeFloat(0.5),
        Token::makePunctuation('}'),
    };
    Reader<Token> reader(tokens);
    auto tree = parse(reader);
    REQUIRE(tree);
    REQUIRE(tree.value().at("k").asDouble() == 0.5);
    REQUIRE(reader.exhausted());
}

TEST_CASE("same input gives the same tree", "[parse]") {
    std::string text = R"({"b": [1, 2.0, "x"], "a": {"c": 3}})";
    REQUIRE(parse_ok(text) == parse_ok(text));
    REQUIRE(parse_ok(text).dump() == parse_ok(text).dump());
}
