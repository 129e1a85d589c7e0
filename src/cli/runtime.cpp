#include "steenbok/cli/runtime.hpp"

#include "steenbok/core/logger.hpp"
#include "steenbok/infra/audit_log.hpp"
#include "steenbok/infra/host_validator.hpp"
#include "steenbok/infra/rate_limiter.hpp"

#include <chrono>

namespace steenbok::cli {

auto load_effective_config(const std::string& path, std::string_view log_level)
    -> Result<Config>
{
    Config config;
    if (!path.empty()) {
        LOG_INFO("Loading configuration from: {}", path);
        auto loaded = load_config(std::filesystem::path(path));
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    apply_env_overrides(config);
    if (!log_level.empty()) {
        config.log_level = std::string(log_level);
    }
    Logger::set_level(config.log_level);
    return config;
}

auto make_request_defaults(const FetchConfig& fetch) -> infra::FetchRequest {
    infra::FetchRequest request;
    request.max_bytes = fetch.max_bytes;
    request.max_redirects = fetch.max_redirects;
    request.allow_http = fetch.allow_http;
    return request;
}

auto reload_allowlist(const Config& config, infra::DomainAllowlist& allowlist) -> Result<void> {
    auto patterns = collect_allowlist_patterns(config);
    if (!patterns) {
        return std::unexpected(patterns.error());
    }
    return allowlist.reload(*patterns);
}

auto build_runtime(const Config& config, boost::asio::any_io_executor executor)
    -> Result<Runtime>
{
    auto patterns = collect_allowlist_patterns(config);
    if (!patterns) {
        return std::unexpected(patterns.error());
    }
    auto allowlist = infra::DomainAllowlist::from_patterns(*patterns);
    if (!allowlist) {
        return std::unexpected(allowlist.error());
    }

    auto timeout = std::chrono::milliseconds(config.fetch.timeout_ms);
    auto resolver = std::make_shared<infra::AsioHostResolver>(executor, timeout);
    auto validator = std::make_shared<infra::HostValidator>(resolver);
    auto limiter = std::make_shared<infra::RateLimiter>(
        std::chrono::milliseconds(config.fetch.min_interval_ms));

    infra::HttpClientConfig http_config;
    http_config.timeout = timeout;
    http_config.worker_threads = config.server.transport_threads;
    http_config.default_headers = {
        {"User-Agent", config.fetch.user_agent},
        {"Accept", "text/html,application/xhtml+xml,text/plain;q=0.9"},
    };
    auto transport = std::make_shared<infra::HttpClient>(http_config);

    std::vector<std::shared_ptr<infra::AuditSink>> sinks;
    if (config.audit.log_events) {
        sinks.push_back(std::make_shared<infra::LoggerAuditSink>());
    }
    if (config.audit.file) {
        auto file_sink = infra::FileAuditSink::open(*config.audit.file);
        if (!file_sink) {
            return std::unexpected(file_sink.error());
        }
        sinks.push_back(std::move(*file_sink));
    }
    auto audit = std::make_shared<infra::CompositeAuditSink>(std::move(sinks));

    infra::FetchPolicy policy;
    policy.max_url_length = config.fetch.max_url_length;
    policy.pin_resolved_address = config.fetch.pin_resolved_address;

    Runtime runtime;
    runtime.allowlist = *allowlist;
    runtime.transport = transport;
    runtime.guard = std::make_shared<infra::FetchGuard>(
        std::move(policy), runtime.allowlist, std::move(validator), std::move(limiter),
        transport, std::move(audit));
    runtime.extractor = std::make_shared<infra::HtmlTextExtractor>();
    runtime.request_defaults = make_request_defaults(config.fetch);

    LOG_DEBUG("Runtime ready: {} allowlist patterns, timeout {}ms, min interval {}ms",
              runtime.allowlist->patterns().size(), config.fetch.timeout_ms,
              config.fetch.min_interval_ms);
    return runtime;
}

} // namespace steenbok::cli
