#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "steenbok/infra/audit_log.hpp"
#include "support/fakes.hpp"

using namespace steenbok::infra;
namespace fs = std::filesystem;

namespace {

auto sample_event() -> AuditEvent {
    AuditEvent e;
    e.timestamp = "2024-05-01T12:00:00.000Z";
    e.reason = "host_blocked_ip";
    e.url = "https://meta.ac.uk/latest";
    e.origin_url = "https://arxiv.org/abs/1";
    e.redirects = 1;
    e.error = "169.254.169.254";
    return e;
}

} // anonymous namespace

TEST_CASE("AuditEvent JSON form", "[infra][audit]") {
    SECTION("absent fields are omitted") {
        AuditEvent e;
        e.timestamp = "2024-05-01T12:00:00.000Z";
        e.reason = "success";
        e.url = "https://arxiv.org/";
        e.status = 200;
        e.bytes = 1234;

        nlohmann::json j = e;
        CHECK(j["reason"] == "success");
        CHECK(j["url"] == "https://arxiv.org/");
        CHECK(j["status"] == 200);
        CHECK(j["bytes"] == 1234);
        CHECK_FALSE(j.contains("origin_url"));
        CHECK_FALSE(j.contains("redirects"));
        CHECK_FALSE(j.contains("error"));
    }

    SECTION("redirected rejection keeps both URLs") {
        nlohmann::json j = sample_event();
        CHECK(j["origin_url"] == "https://arxiv.org/abs/1");
        CHECK(j["url"] == "https://meta.ac.uk/latest");
        CHECK(j["redirects"] == 1);
        CHECK_FALSE(j.contains("status"));
    }
}

TEST_CASE("format_audit_line renders key=value pairs", "[infra][audit]") {
    auto line = format_audit_line(sample_event());
    CHECK(line.starts_with("reason=host_blocked_ip url=https://meta.ac.uk/latest"));
    CHECK(line.find("origin_url=https://arxiv.org/abs/1") != std::string::npos);
    CHECK(line.find("redirects=1") != std::string::npos);
    CHECK(line.find("error=\"169.254.169.254\"") != std::string::npos);
    CHECK(line.find("status=") == std::string::npos);
}

TEST_CASE("FileAuditSink appends one JSON line per event", "[infra][audit]") {
    auto dir = fs::temp_directory_path() / "steenbok_test_audit";
    fs::remove_all(dir);
    auto path = dir / "nested" / "audit.jsonl";

    {
        auto sink = FileAuditSink::open(path);
        REQUIRE(sink.has_value());
        (*sink)->record(sample_event());

        auto second = sample_event();
        second.reason = "success";
        second.origin_url.reset();
        second.redirects.reset();
        second.error.reset();
        second.status = 200;
        (*sink)->record(second);
    }

    std::ifstream in(path);
    REQUIRE(in.is_open());
    std::string first_line;
    std::string second_line;
    REQUIRE(std::getline(in, first_line));
    REQUIRE(std::getline(in, second_line));

    auto first = nlohmann::json::parse(first_line);
    CHECK(first["reason"] == "host_blocked_ip");
    CHECK(first["origin_url"] == "https://arxiv.org/abs/1");

    auto parsed = nlohmann::json::parse(second_line);
    CHECK(parsed["reason"] == "success");
    CHECK(parsed["status"] == 200);
    CHECK_FALSE(parsed.contains("error"));

    in.close();
    fs::remove_all(dir);
}

TEST_CASE("CompositeAuditSink fans out to every sink", "[infra][audit]") {
    auto a = std::make_shared<steenbok::testing::RecordingAuditSink>();
    auto b = std::make_shared<steenbok::testing::RecordingAuditSink>();
    CompositeAuditSink composite({a, b});

    composite.record(sample_event());

    REQUIRE(a->events.size() == 1);
    REQUIRE(b->events.size() == 1);
    CHECK(a->events[0].url == "https://meta.ac.uk/latest");
    CHECK(b->events[0].reason == "host_blocked_ip");
}
