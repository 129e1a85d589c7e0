#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "steenbok/core/config.hpp"

namespace fs = std::filesystem;

namespace {

/// Sets or clears an environment variable for the lifetime of the scope.
struct ScopedEnv {
    std::string name;

    ScopedEnv(const char* n, const char* value) : name(n) {
        if (value) {
            ::setenv(n, value, 1);
        } else {
            ::unsetenv(n);
        }
    }
    ~ScopedEnv() { ::unsetenv(name.c_str()); }
};

void clear_steenbok_env() {
    for (const auto* name : {"STEENBOK_ALLOWED_DOMAINS", "STEENBOK_ALLOWLIST_MODE",
                             "STEENBOK_ALLOWLIST_FILE", "STEENBOK_ALLOW_HTTP",
                             "STEENBOK_LOG_LEVEL", "STEENBOK_PORT", "STEENBOK_AUDIT_FILE",
                             "STEENBOK_DATA_DIR"}) {
        ::unsetenv(name);
    }
}

auto contains(const std::vector<std::string>& v, const std::string& s) -> bool {
    return std::find(v.begin(), v.end(), s) != v.end();
}

/// Config whose allowlist file lookup stays inside a scratch directory.
auto isolated_config(const fs::path& dir) -> steenbok::Config {
    auto cfg = steenbok::default_config();
    cfg.data_dir = dir.string();
    return cfg;
}

} // anonymous namespace

TEST_CASE("default_config returns the documented defaults", "[config]") {
    auto cfg = steenbok::default_config();

    SECTION("fetch defaults") {
        CHECK(cfg.fetch.timeout_ms == 10000);
        CHECK(cfg.fetch.max_bytes == 5u * 1024 * 1024);
        CHECK(cfg.fetch.max_redirects == 3);
        CHECK(cfg.fetch.allow_http == false);
        CHECK(cfg.fetch.min_interval_ms == 5000);
        CHECK(cfg.fetch.max_url_length == 2048u);
        CHECK(cfg.fetch.pin_resolved_address == true);
        CHECK(cfg.fetch.user_agent == "Steenbok-fetcher/1.0 (research)");
    }

    SECTION("server defaults") {
        CHECK(cfg.server.port == 8877);
        CHECK(cfg.server.max_connections == 64u);
    }

    SECTION("allowlist defaults") {
        CHECK(cfg.allowlist.include_defaults);
        CHECK(cfg.allowlist.env_mode == "merge");
        CHECK_FALSE(cfg.allowlist.file.has_value());
    }

    CHECK(cfg.log_level == "info");
    CHECK_FALSE(cfg.audit.file.has_value());
}

TEST_CASE("load_config parses a JSON file", "[config]") {
    auto tmp = fs::temp_directory_path() / "steenbok_test_config.json";

    SECTION("partial file keeps the other defaults") {
        {
            std::ofstream out(tmp);
            out << R"({
                "fetch": { "max_redirects": 5, "allow_http": true },
                "allowlist": { "patterns": ["example.org"], "env_mode": "replace" },
                "server": { "port": 9000 },
                "audit": { "file": "/tmp/steenbok-audit.jsonl" },
                "log_level": "debug"
            })";
        }
        auto cfg = steenbok::load_config(tmp);
        REQUIRE(cfg.has_value());
        CHECK(cfg->fetch.max_redirects == 5);
        CHECK(cfg->fetch.allow_http);
        CHECK(cfg->fetch.timeout_ms == 10000);
        CHECK(cfg->allowlist.patterns == std::vector<std::string>{"example.org"});
        CHECK(cfg->allowlist.env_mode == "replace");
        CHECK(cfg->server.port == 9000);
        CHECK(cfg->audit.file == "/tmp/steenbok-audit.jsonl");
        CHECK(cfg->log_level == "debug");
    }

    SECTION("malformed JSON") {
        {
            std::ofstream out(tmp);
            out << "{ not json";
        }
        auto cfg = steenbok::load_config(tmp);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == steenbok::ErrorCode::InvalidConfig);
    }

    SECTION("invalid env_mode") {
        {
            std::ofstream out(tmp);
            out << R"({ "allowlist": { "env_mode": "append" } })";
        }
        auto cfg = steenbok::load_config(tmp);
        REQUIRE_FALSE(cfg.has_value());
        CHECK(cfg.error().code() == steenbok::ErrorCode::InvalidConfig);
    }

    SECTION("negative redirect limit") {
        {
            std::ofstream out(tmp);
            out << R"({ "fetch": { "max_redirects": -1 } })";
        }
        auto cfg = steenbok::load_config(tmp);
        CHECK_FALSE(cfg.has_value());
    }

    fs::remove(tmp);

    SECTION("missing file yields defaults") {
        auto cfg = steenbok::load_config(fs::temp_directory_path() / "steenbok_absent.json");
        REQUIRE(cfg.has_value());
        CHECK(cfg->fetch.max_redirects == 3);
    }
}

TEST_CASE("apply_env_overrides", "[config]") {
    clear_steenbok_env();

    SECTION("recognised variables") {
        ScopedEnv http("STEENBOK_ALLOW_HTTP", "1");
        ScopedEnv port("STEENBOK_PORT", "9911");
        ScopedEnv level("STEENBOK_LOG_LEVEL", "trace");
        ScopedEnv mode("STEENBOK_ALLOWLIST_MODE", "Replace");
        ScopedEnv file("STEENBOK_ALLOWLIST_FILE", "/etc/steenbok/allow.txt");
        ScopedEnv audit("STEENBOK_AUDIT_FILE", "/var/log/steenbok.jsonl");

        auto cfg = steenbok::default_config();
        steenbok::apply_env_overrides(cfg);

        CHECK(cfg.fetch.allow_http);
        CHECK(cfg.server.port == 9911);
        CHECK(cfg.log_level == "trace");
        CHECK(cfg.allowlist.env_mode == "replace");
        CHECK(cfg.allowlist.file == "/etc/steenbok/allow.txt");
        CHECK(cfg.audit.file == "/var/log/steenbok.jsonl");
    }

    SECTION("invalid values are ignored") {
        ScopedEnv port("STEENBOK_PORT", "http");
        ScopedEnv mode("STEENBOK_ALLOWLIST_MODE", "append");
        ScopedEnv http("STEENBOK_ALLOW_HTTP", "yes");

        auto cfg = steenbok::default_config();
        steenbok::apply_env_overrides(cfg);

        CHECK(cfg.server.port == 8877);
        CHECK(cfg.allowlist.env_mode == "merge");
        CHECK_FALSE(cfg.fetch.allow_http);
    }
}

TEST_CASE("collect_allowlist_patterns", "[config]") {
    clear_steenbok_env();
    auto dir = fs::temp_directory_path() / "steenbok_test_allowlist";
    fs::create_directories(dir);
    auto file = dir / "allowlist.txt";
    fs::remove(file);

    SECTION("defaults only") {
        auto cfg = isolated_config(dir);
        auto patterns = steenbok::collect_allowlist_patterns(cfg);
        REQUIRE(patterns.has_value());
        CHECK(*patterns == steenbok::default_allowlist_patterns());
    }

    SECTION("file lines are appended, comments skipped") {
        {
            std::ofstream out(file);
            out << "# extra sources\n\nplato.stanford.edu\n  *.nature.com  \n";
        }
        auto cfg = isolated_config(dir);
        auto patterns = steenbok::collect_allowlist_patterns(cfg);
        REQUIRE(patterns.has_value());
        CHECK(contains(*patterns, "plato.stanford.edu"));
        CHECK(contains(*patterns, "*.nature.com"));
        CHECK(contains(*patterns, "arxiv.org"));
        CHECK_FALSE(contains(*patterns, "# extra sources"));
    }

    SECTION("environment list merges by default") {
        ScopedEnv env("STEENBOK_ALLOWED_DOMAINS", " example.org, ,*.example.net ");
        auto cfg = isolated_config(dir);
        auto patterns = steenbok::collect_allowlist_patterns(cfg);
        REQUIRE(patterns.has_value());
        CHECK(contains(*patterns, "example.org"));
        CHECK(contains(*patterns, "*.example.net"));
        CHECK(contains(*patterns, "arxiv.org"));
    }

    SECTION("environment list can replace everything") {
        ScopedEnv env("STEENBOK_ALLOWED_DOMAINS", "example.org");
        auto cfg = isolated_config(dir);
        cfg.allowlist.env_mode = "replace";
        auto patterns = steenbok::collect_allowlist_patterns(cfg);
        REQUIRE(patterns.has_value());
        CHECK(*patterns == std::vector<std::string>{"example.org"});
    }

    SECTION("defaults can be switched off") {
        auto cfg = isolated_config(dir);
        cfg.allowlist.include_defaults = false;
        cfg.allowlist.patterns = {"doi.org"};
        auto patterns = steenbok::collect_allowlist_patterns(cfg);
        REQUIRE(patterns.has_value());
        CHECK(*patterns == std::vector<std::string>{"doi.org"});
    }

    SECTION("explicit file path wins over the data directory") {
        auto other = dir / "custom.txt";
        {
            std::ofstream out(other);
            out << "custom.example.org\n";
        }
        auto cfg = isolated_config(dir);
        cfg.allowlist.file = other.string();
        CHECK(steenbok::allowlist_file_path(cfg) == other);
        auto patterns = steenbok::collect_allowlist_patterns(cfg);
        REQUIRE(patterns.has_value());
        CHECK(contains(*patterns, "custom.example.org"));
        fs::remove(other);
    }

    fs::remove(file);
}
