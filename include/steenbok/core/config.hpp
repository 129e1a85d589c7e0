#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "steenbok/core/error.hpp"

// std::optional serializer for nlohmann/json so the NLOHMANN_DEFINE macros
// accept optional fields.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace steenbok {

using json = nlohmann::json;

inline constexpr std::string_view kAllowedDomainsEnv = "STEENBOK_ALLOWED_DOMAINS";
inline constexpr std::string_view kAllowlistModeEnv = "STEENBOK_ALLOWLIST_MODE";
inline constexpr std::string_view kAllowlistFileEnv = "STEENBOK_ALLOWLIST_FILE";
inline constexpr std::string_view kAllowHttpEnv = "STEENBOK_ALLOW_HTTP";

struct FetchConfig {
    int timeout_ms = 10000;
    size_t max_bytes = 5 * 1024 * 1024;
    int max_redirects = 3;
    bool allow_http = false;
    int min_interval_ms = 5000;
    size_t max_url_length = 2048;
    bool pin_resolved_address = true;
    std::string user_agent = "Steenbok-fetcher/1.0 (research)";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(FetchConfig, timeout_ms, max_bytes, max_redirects,
    allow_http, min_interval_ms, max_url_length, pin_resolved_address, user_agent)

struct AllowlistConfig {
    bool include_defaults = true;
    std::optional<std::string> file;        // default: <data_dir>/allowlist.txt
    std::vector<std::string> patterns;      // extra patterns from the config file itself
    std::string env_mode = "merge";         // "merge" or "replace"
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AllowlistConfig, include_defaults, file, patterns, env_mode)

struct ServerConfig {
    uint16_t port = 8877;
    size_t max_connections = 64;
    size_t transport_threads = 4;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfig, port, max_connections, transport_threads)

struct AuditConfig {
    std::optional<std::string> file;   // JSON lines, append-only
    bool log_events = true;            // mirror every event on the process logger
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(AuditConfig, file, log_events)

struct Config {
    FetchConfig fetch;
    AllowlistConfig allowlist;
    ServerConfig server;
    AuditConfig audit;
    std::string log_level = "info";
    std::optional<std::string> data_dir;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, fetch, allowlist, server, audit, log_level, data_dir)

/// Built-in research allowlist. `*.edu` and `*.ac.uk` are intentionally broad;
/// narrow them with a file or STEENBOK_ALLOWED_DOMAINS in replace mode.
auto default_allowlist_patterns() -> const std::vector<std::string>&;

/// Loads a JSON config file. A missing file yields defaults; a malformed one
/// is an InvalidConfig error.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Applies STEENBOK_* environment overrides on top of `config`.
void apply_env_overrides(Config& config);

auto default_config() -> Config;
auto default_data_dir() -> std::filesystem::path;

/// Path of the allowlist file in effect for `config`.
auto allowlist_file_path(const Config& config) -> std::filesystem::path;

/// Collects the effective allowlist pattern lines: defaults, config patterns,
/// file lines (blank lines and '#' comments skipped), then the environment
/// list merged or replacing according to `allowlist.env_mode`.
/// Fails only when the file exists but cannot be read.
auto collect_allowlist_patterns(const Config& config) -> Result<std::vector<std::string>>;

} // namespace steenbok
