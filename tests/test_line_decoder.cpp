#include <catch2/catch_test_macros.hpp>
#include "line_decoder.hpp"

using namespace logwindow;

TEST_CASE("Decoding JSON lines", "[decoder]") {
    SECTION("JSON object becomes a structured record") {
        auto record = decode_line(R"({"levelname":"INFO","module":"auth","name":"login","message":"ok"})", 1.0);
        REQUIRE(record.is_structured());
        REQUIRE(record.string_field("message") == "ok");
        REQUIRE(record.field("levelname") == "INFO");
        REQUIRE(record.field("missing").is_null());
    }

    SECTION("Line terminator and surrounding whitespace are stripped") {
        auto record = decode_line("  {\"message\":\"padded\"}\r\n", 1.0);
        REQUIRE(record.is_structured());
        REQUIRE(record.string_field("message") == "padded");
    }

    SECTION("Nested values are preserved") {
        auto record = decode_line(R"({"ctx":{"user":7,"tags":["a","b"]},"ok":true})", 1.0);
        REQUIRE(record.is_structured());
        REQUIRE(record.field("ctx")["user"] == 7);
        REQUIRE(record.field("ctx")["tags"].size() == 2);
        REQUIRE(record.field("ok") == true);
    }
}

TEST_CASE("Malformed lines degrade to raw records", "[decoder]") {
    SECTION("Plain text") {
        auto record = decode_line("2024-01-01 12:00:00 something happened\n", 42.5);
        REQUIRE(record.is_raw());
        REQUIRE(record.as_raw()->text == "2024-01-01 12:00:00 something happened");
        REQUIRE(record.as_raw()->ingested_at == 42.5);
        REQUIRE(record.field("raw") == "2024-01-01 12:00:00 something happened");
        REQUIRE(record.field("ingested_at") == 42.5);
    }

    SECTION("Truncated JSON") {
        auto record = decode_line(R"({"message": "cut off)", 1.0);
        REQUIRE(record.is_raw());
        REQUIRE(record.as_raw()->text == R"({"message": "cut off)");
    }

    SECTION("JSON that is not an object") {
        REQUIRE(decode_line("42", 1.0).is_raw());
        REQUIRE(decode_line("[1,2,3]", 1.0).is_raw());
        REQUIRE(decode_line("\"text\"", 1.0).is_raw());
    }

    SECTION("Default clock stamps the fallback") {
        auto record = decode_line("not json");
        REQUIRE(record.is_raw());
        REQUIRE(record.as_raw()->ingested_at > 0.0);
    }

    SECTION("Raw record serializes as raw and ingested_at") {
        auto json = decode_line("oops", 3.0).to_json();
        REQUIRE(json["raw"] == "oops");
        REQUIRE(json["ingested_at"] == 3.0);
    }
}

TEST_CASE("Invalid UTF-8 is dropped, not fatal", "[decoder]") {
    std::string line = "{\"message\":\"caf\xC3\xA9 \xFF\xFEok\"}";
    auto record = decode_line(line, 1.0);
    REQUIRE(record.is_structured());
    REQUIRE(record.string_field("message") == "caf\xC3\xA9 ok");

    REQUIRE(sanitize_utf8("a\xC0\xAF" "b") == "ab");
    REQUIRE(sanitize_utf8("\xE2\x82\xAC") == "\xE2\x82\xAC");
    REQUIRE(sanitize_utf8("\xED\xA0\x80x") == "x");
}

TEST_CASE("Record classification", "[decoder]") {
    RecordSchema schema;

    SECTION("module and name form the category path") {
        auto record = decode_line(R"({"levelname":"ERROR","module":"auth","name":"login"})", 1.0);
        REQUIRE(record.level(schema) == "ERROR");
        REQUIRE(record.category(schema) == std::optional<std::string>("auth.login"));
    }

    SECTION("module alone is the category") {
        auto record = decode_line(R"({"module":"db"})", 1.0);
        REQUIRE(record.category(schema) == std::optional<std::string>("db"));
        REQUIRE(record.level(schema) == kUnknownLevel);
    }

    SECTION("No module means no category") {
        auto record = decode_line(R"({"name":"orphan"})", 1.0);
        REQUIRE_FALSE(record.category(schema).has_value());
    }

    SECTION("Raw records are unclassified") {
        auto record = decode_line("plain", 1.0);
        REQUIRE(record.level(schema) == kUnknownLevel);
        REQUIRE_FALSE(record.category(schema).has_value());
    }

    SECTION("Custom field names") {
        RecordSchema custom;
        custom.level_field = "severity";
        custom.module_field = "component";
        custom.name_field = "sub";
        auto record = decode_line(R"({"severity":"WARNING","component":"net","sub":"tcp"})", 1.0);
        REQUIRE(record.level(custom) == "WARNING");
        REQUIRE(record.category(custom) == std::optional<std::string>("net.tcp"));
    }
}
