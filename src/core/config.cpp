#include "steenbok/core/config.hpp"
#include "steenbok/core/logger.hpp"
#include "steenbok/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace steenbok {

namespace {

auto getenv_str(std::string_view name) -> const char* {
    return std::getenv(std::string(name).c_str());
}

} // anonymous namespace

auto default_allowlist_patterns() -> const std::vector<std::string>& {
    static const std::vector<std::string> patterns = {
        "arxiv.org",
        "pubmed.ncbi.nlm.nih.gov",
        "*.ncbi.nlm.nih.gov",
        "jstor.org",
        "doi.org",
        "*.edu",
        "*.ac.uk",
        "wikipedia.org",
        "*.wikipedia.org",
        "en.wikipedia.org",
        "www.google.com",
        "scholar.google.com",
        "books.google.com",
        "patents.google.com",
    };
    return patterns;
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot open config file", path.string()));
    }

    try {
        json j = json::parse(file);
        auto config = j.get<Config>();
        if (config.allowlist.env_mode != "merge" && config.allowlist.env_mode != "replace") {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "allowlist.env_mode must be 'merge' or 'replace'",
                config.allowlist.env_mode));
        }
        if (config.fetch.max_redirects < 0 || config.fetch.timeout_ms <= 0 ||
            config.fetch.min_interval_ms < 0) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "fetch limits must be non-negative", path.string()));
        }
        return config;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Failed to parse config", e.what()));
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = getenv_str(kAllowHttpEnv)) {
        config.fetch.allow_http = std::string_view(val) == "1";
    }
    if (auto* val = getenv_str(kAllowlistFileEnv)) {
        config.allowlist.file = val;
    }
    if (auto* val = getenv_str(kAllowlistModeEnv)) {
        auto mode = utils::to_lower(utils::trim(val));
        if (mode == "merge" || mode == "replace") {
            config.allowlist.env_mode = mode;
        } else {
            LOG_WARN("Ignoring {}='{}' (expected merge or replace)", kAllowlistModeEnv, val);
        }
    }
    if (auto* val = std::getenv("STEENBOK_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("STEENBOK_PORT")) {
        try {
            auto port = std::stoi(val);
            if (port > 0 && port <= 65535) {
                config.server.port = static_cast<uint16_t>(port);
            } else {
                LOG_WARN("Ignoring out-of-range STEENBOK_PORT={}", val);
            }
        } catch (const std::exception&) {
            LOG_WARN("Ignoring non-numeric STEENBOK_PORT={}", val);
        }
    }
    if (auto* val = std::getenv("STEENBOK_AUDIT_FILE")) {
        config.audit.file = val;
    }
    if (auto* val = std::getenv("STEENBOK_DATA_DIR")) {
        config.data_dir = val;
    }
}

auto default_config() -> Config {
    return Config{};
}

auto default_data_dir() -> std::filesystem::path {
    if (auto* val = std::getenv("STEENBOK_DATA_DIR")) {
        return val;
    }
    auto home = std::filesystem::path(std::getenv("HOME") ? std::getenv("HOME") : "/tmp");
    return home / ".steenbok";
}

auto allowlist_file_path(const Config& config) -> std::filesystem::path {
    if (config.allowlist.file) {
        return *config.allowlist.file;
    }
    auto dir = config.data_dir ? std::filesystem::path(*config.data_dir) : default_data_dir();
    return dir / "allowlist.txt";
}

auto collect_allowlist_patterns(const Config& config) -> Result<std::vector<std::string>> {
    std::vector<std::string> env_patterns;
    bool env_present = false;
    if (auto* val = getenv_str(kAllowedDomainsEnv)) {
        for (const auto& part : utils::split(val, ',')) {
            auto pattern = utils::trim(part);
            if (!pattern.empty()) {
                env_patterns.push_back(std::move(pattern));
            }
        }
        env_present = !env_patterns.empty();
    }

    if (env_present && config.allowlist.env_mode == "replace") {
        LOG_DEBUG("Allowlist: {} replaces configured patterns ({} entries)",
                  kAllowedDomainsEnv, env_patterns.size());
        return env_patterns;
    }

    std::vector<std::string> patterns;
    if (config.allowlist.include_defaults) {
        patterns = default_allowlist_patterns();
    }
    patterns.insert(patterns.end(),
                    config.allowlist.patterns.begin(), config.allowlist.patterns.end());

    auto path = allowlist_file_path(config);
    if (std::filesystem::exists(path)) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Cannot open allowlist file", path.string()));
        }
        std::string raw_line;
        size_t added = 0;
        while (std::getline(file, raw_line)) {
            auto line = utils::trim(raw_line);
            if (line.empty() || line.front() == '#') {
                continue;
            }
            patterns.push_back(std::move(line));
            ++added;
        }
        LOG_DEBUG("Allowlist: {} patterns from {}", added, path.string());
    }

    patterns.insert(patterns.end(), env_patterns.begin(), env_patterns.end());
    return patterns;
}

} // namespace steenbok
