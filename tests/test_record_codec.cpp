#include <catch2/catch_test_macros.hpp>
#include "io/record_codec.hpp"

using namespace piiredact;

// ============================================================================
// parse_object_literal
// ============================================================================

TEST_CASE("RecordCodec parses JSON objects", "[codec]") {
    auto result = RecordCodec::parse_object_literal(R"({"phone": "9876543210", "order": 7})");
    REQUIRE(result.is_ok());
    CHECK(result.value()["phone"] == "9876543210");
    CHECK(result.value()["order"] == 7);
}

TEST_CASE("RecordCodec accepts single-quoted object literals", "[codec]") {
    auto result = RecordCodec::parse_object_literal("{'name': 'John Doe', 'city': 'Pune'}");
    REQUIRE(result.is_ok());
    CHECK(result.value()["name"] == "John Doe");
    CHECK(result.value()["city"] == "Pune");
}

TEST_CASE("RecordCodec keeps key order", "[codec]") {
    auto result = RecordCodec::parse_object_literal(R"({"z": 1, "a": 2, "m": 3})");
    REQUIRE(result.is_ok());
    auto it = result.value().begin();
    CHECK(it.key() == "z");
    ++it;
    CHECK(it.key() == "a");
    ++it;
    CHECK(it.key() == "m");
}

TEST_CASE("RecordCodec rejects malformed cells", "[codec]") {
    SECTION("Empty cell") {
        auto result = RecordCodec::parse_object_literal("");
        CHECK(result.is_error());
        CHECK(result.error_category() == ErrorCategory::PARSE_ERROR);
    }

    SECTION("Whitespace only") {
        CHECK(RecordCodec::parse_object_literal("   \n").is_error());
    }

    SECTION("Truncated object") {
        CHECK(RecordCodec::parse_object_literal(R"({"phone": "98765)").is_error());
    }

    SECTION("Apostrophe inside a value breaks quote normalization") {
        CHECK(RecordCodec::parse_object_literal("{'name': 'O'Brien'}").is_error());
    }

    SECTION("Non-object JSON") {
        auto result = RecordCodec::parse_object_literal("[1, 2, 3]");
        REQUIRE(result.is_error());
        CHECK(result.error_message().find("array") != std::string::npos);
        CHECK(RecordCodec::parse_object_literal("42").is_error());
    }
}

// ============================================================================
// serialize
// ============================================================================

TEST_CASE("RecordCodec serializes with spaced separators", "[codec]") {
    auto record = Record::parse(R"({"phone":"98XXXXXX10","name":"John"})");
    CHECK(RecordCodec::serialize(record) == R"({"phone": "98XXXXXX10", "name": "John"})");
}

TEST_CASE("RecordCodec serializes scalars and nesting", "[codec]") {
    auto record = Record::parse(R"({"n":null,"b":true,"i":42,"f":1.5,"a":[1,"x"],"o":{"k":"v"},"e":{}})");
    CHECK(RecordCodec::serialize(record) ==
          R"({"n": null, "b": true, "i": 42, "f": 1.5, "a": [1, "x"], "o": {"k": "v"}, "e": {}})");
}

TEST_CASE("RecordCodec escapes non-ASCII and control characters", "[codec]") {
    auto record = Record::object();
    record["city"] = "M\xC3\xBCnchen";
    record["note"] = "line1\nline2 \"quoted\"";
    CHECK(RecordCodec::serialize(record) ==
          R"({"city": "M\u00fcnchen", "note": "line1\nline2 \"quoted\""})");
}

TEST_CASE("RecordCodec serialize does not throw on invalid UTF-8", "[codec]") {
    auto record = Record::object();
    record["raw"] = std::string("ab\xFF", 3);
    CHECK_NOTHROW(RecordCodec::serialize(record));
}
