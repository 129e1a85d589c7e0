#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>

#include "steenbok/core/config.hpp"
#include "steenbok/core/error.hpp"
#include "steenbok/infra/domain_allowlist.hpp"
#include "steenbok/infra/extractor.hpp"
#include "steenbok/infra/fetch_guard.hpp"
#include "steenbok/infra/http_client.hpp"

namespace steenbok::cli {

/// The fetch pipeline wired from configuration.
struct Runtime {
    std::shared_ptr<infra::DomainAllowlist> allowlist;
    std::shared_ptr<infra::HttpClient> transport;
    std::shared_ptr<infra::FetchGuard> guard;
    std::shared_ptr<const infra::TextExtractor> extractor;
    infra::FetchRequest request_defaults;
};

/// Config file (or defaults when `path` is empty), then environment
/// overrides, then an explicit log level. Applies the resulting log level.
auto load_effective_config(const std::string& path, std::string_view log_level)
    -> Result<Config>;

auto make_request_defaults(const FetchConfig& fetch) -> infra::FetchRequest;

/// Builds allowlist, resolver, validator, limiter, transport and audit
/// sinks. DNS and timers run on `executor`.
auto build_runtime(const Config& config, boost::asio::any_io_executor executor)
    -> Result<Runtime>;

/// Re-reads the allowlist sources and swaps them in; the active set is kept
/// when any pattern is invalid.
auto reload_allowlist(const Config& config, infra::DomainAllowlist& allowlist) -> Result<void>;

} // namespace steenbok::cli
