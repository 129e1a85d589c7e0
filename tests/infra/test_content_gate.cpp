#include <catch2/catch_test_macros.hpp>

#include "steenbok/infra/content_gate.hpp"

using namespace steenbok::infra;

TEST_CASE("ContentGate default tables", "[infra][content_gate]") {
    ContentGate gate;

    SECTION("Readable text types are accepted") {
        CHECK(gate.evaluate("text/html") == ContentVerdict::Accepted);
        CHECK(gate.evaluate("text/html; charset=UTF-8") == ContentVerdict::Accepted);
        CHECK(gate.evaluate("Text/HTML") == ContentVerdict::Accepted);
        CHECK(gate.evaluate("text/plain") == ContentVerdict::Accepted);
        CHECK(gate.evaluate("application/xhtml+xml") == ContentVerdict::Accepted);
    }

    SECTION("High-risk types are blocked") {
        CHECK(gate.evaluate("application/msword") == ContentVerdict::Blocked);
        CHECK(gate.evaluate("application/vnd.ms-excel") == ContentVerdict::Blocked);
        CHECK(gate.evaluate(
            "application/vnd.openxmlformats-officedocument.wordprocessingml.document") ==
              ContentVerdict::Blocked);
        CHECK(gate.evaluate("application/zip") == ContentVerdict::Blocked);
        CHECK(gate.evaluate("image/svg+xml") == ContentVerdict::Blocked);
        CHECK(gate.evaluate("application/octet-stream") == ContentVerdict::Blocked);
        CHECK(gate.evaluate("application/x-msdownload") == ContentVerdict::Blocked);
        CHECK(gate.evaluate("text/javascript; charset=utf-8") == ContentVerdict::Blocked);
    }

    SECTION("Blocklist wins over an allowed type in the same header") {
        CHECK(gate.evaluate("text/html; x=application/msword") == ContentVerdict::Blocked);
    }

    SECTION("Everything else is denied by default") {
        CHECK(gate.evaluate("") == ContentVerdict::NotAllowed);
        CHECK(gate.evaluate("application/json") == ContentVerdict::NotAllowed);
        CHECK(gate.evaluate("application/pdf") == ContentVerdict::NotAllowed);
        CHECK(gate.evaluate("image/png") == ContentVerdict::NotAllowed);
        CHECK(gate.evaluate("text/htmlx") == ContentVerdict::NotAllowed);
        CHECK_FALSE(gate.is_acceptable("application/json"));
    }
}

TEST_CASE("ContentGate media type", "[infra][content_gate]") {
    CHECK(ContentGate::media_type("Text/HTML; charset=UTF-8") == "text/html");
    CHECK(ContentGate::media_type("  text/plain  ") == "text/plain");
    CHECK(ContentGate::media_type("") == "");
}

TEST_CASE("ContentGate custom tables", "[infra][content_gate]") {
    ContentGate gate({"application/x-bad"}, {"application/json"});
    CHECK(gate.evaluate("application/json") == ContentVerdict::Accepted);
    CHECK(gate.evaluate("application/x-bad") == ContentVerdict::Blocked);
    CHECK(gate.evaluate("text/html") == ContentVerdict::NotAllowed);
    CHECK(gate.allowed_entries().size() == 1);
}
