#include <catch2/catch_test_macros.hpp>

#include "steenbok/core/utils.hpp"

using namespace steenbok;

TEST_CASE("trim removes whitespace", "[utils]") {
    CHECK(utils::trim("  hello  ") == "hello");
    CHECK(utils::trim("\t\nhello\r\n") == "hello");
    CHECK(utils::trim("hello") == "hello");
    CHECK(utils::trim("   ").empty());
    CHECK(utils::trim("").empty());
}

TEST_CASE("split on a delimiter", "[utils]") {
    auto parts = utils::split("a,b,,c", ',');
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == "a");
    CHECK(parts[2].empty());
    CHECK(parts[3] == "c");
    CHECK(utils::split("", ',').empty());
}

TEST_CASE("to_lower", "[utils]") {
    CHECK(utils::to_lower("En.Wikipedia.ORG") == "en.wikipedia.org");
}

TEST_CASE("url_decode", "[utils]") {
    SECTION("percent escapes") {
        CHECK(utils::url_decode("https%3A%2F%2Farxiv.org%2Fabs%2F1") == "https://arxiv.org/abs/1");
        CHECK(utils::url_decode("C%2B%2B") == "C++");
    }

    SECTION("plus is a space") {
        CHECK(utils::url_decode("a+b") == "a b");
    }

    SECTION("malformed escapes are kept literally") {
        CHECK(utils::url_decode("100%") == "100%");
        CHECK(utils::url_decode("%zz") == "%zz");
        CHECK(utils::url_decode("%4") == "%4");
    }
}

TEST_CASE("ISO-8601 timestamps", "[utils]") {
    auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    CHECK(utils::format_iso_ms(tp) == "2023-11-14T22:13:20.123Z");

    auto now = utils::timestamp_iso_ms();
    REQUIRE(now.size() == 24);
    CHECK(now[10] == 'T');
    CHECK(now.back() == 'Z');
}
