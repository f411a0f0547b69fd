#include <catch2/catch_test_macros.hpp>
#include <jr/reader.h>
#include <string>
#include <vector>

using namespace jr;

TEST_CASE("peek does not advance", "[reader]") {
    std::string text = "ab";
    Reader<char> r(text);
    REQUIRE(*r.peek() == 'a');
    REQUIRE(*r.peek() == 'a');
    REQUIRE(r.position() == 0);
    REQUIRE(r.size() == 2);
}

TEST_CASE("advance walks forward one element at a time", "[reader]") {
    std::vector<int> data = {1, 2, 3};
    Reader<int> r(data);

    REQUIRE(r.advance().value() == 1);
    REQUIRE(r.position() == 1);
    REQUIRE(*r.peek() == 2);
    REQUIRE(r.advance().value() == 2);
    REQUIRE(r.advance().value() == 3);
    REQUIRE(r.exhausted());
    REQUIRE(r.peek() == nullptr);
}

TEST_CASE("advance past the end is OutOfBounds", "[reader]") {
    std::string text = "x";
    Reader<char> r(text);
    REQUIRE(r.advance());

    auto past = r.advance();
    REQUIRE_FALSE(past);
    REQUIRE(past.error().kind == ParseError::Kind::OutOfBounds);
    REQUIRE(past.error().position == 1);
    // a failed advance leaves the position alone
    REQUIRE(r.position() == 1);
}

TEST_CASE("empty sequence is exhausted from the start", "[reader]") {
    std::string text;
    Reader<char> r(text);
    REQUIRE(r.exhausted());
    REQUIRE(r.peek() == nullptr);
    REQUIRE_FALSE(r.advance());
}

TEST_CASE("consume accepts the expected element", "[reader][consume]") {
    std::string text = "{}";
    Reader<char> r(text);
    REQUIRE_FALSE(consume(r, '{').has_value());
    REQUIRE(r.position() == 1);
}

TEST_CASE("consume reports the expected and actual element", "[reader][consume]") {
    std::string text = "[";
    Reader<char> r(text);
    auto err = consume(r, '{');
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ParseError::Kind::MismatchedExpectation);
    REQUIRE(err->expected == "{");
    REQUIRE(err->actual == "[");
    REQUIRE(err->position == 0);
    REQUIRE(err->message() == "Expected '{', got '['");
}

TEST_CASE("consume at the end is OutOfBounds", "[reader][consume]") {
    std::string text;
    Reader<char> r(text);
    auto err = consume(r, ':');
    REQUIRE(err.has_value());
    REQUIRE(err->kind == ParseError::Kind::OutOfBounds);
}
