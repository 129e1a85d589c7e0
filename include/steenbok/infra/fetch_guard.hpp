#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "steenbok/core/error.hpp"
#include "steenbok/infra/audit_log.hpp"
#include "steenbok/infra/content_gate.hpp"
#include "steenbok/infra/domain_allowlist.hpp"
#include "steenbok/infra/host_validator.hpp"
#include "steenbok/infra/http_client.hpp"
#include "steenbok/infra/rate_limiter.hpp"
#include "steenbok/infra/url.hpp"

namespace steenbok::infra {

/// Per-call fetch parameters.
struct FetchRequest {
    std::string url;
    size_t max_bytes = 5 * 1024 * 1024;
    int max_redirects = 3;
    bool allow_http = false;
};

struct FetchSuccess {
    std::string bytes;
    std::string content_type;   // as declared by the server
    std::string final_url;      // after redirects
    int status = 0;
    int redirects = 0;
    int64_t elapsed_ms = 0;
};

/// Refused by policy; for rejections during validation no network I/O was
/// performed for `url`.
struct FetchRejected {
    ErrorCode reason;
    std::string url;
    std::string detail;
};

struct FetchFailed {
    ErrorCode reason;
    std::string url;
    std::string detail;
    std::optional<int> http_status;
};

using FetchOutcome = std::variant<FetchSuccess, FetchRejected, FetchFailed>;

/// Reason code of an outcome; nullopt for success.
[[nodiscard]] auto outcome_reason(const FetchOutcome& outcome) -> std::optional<ErrorCode>;

/// Limits that apply to every fetch issued through one FetchGuard.
struct FetchPolicy {
    size_t max_url_length = 2048;
    bool pin_resolved_address = true;
    ContentGate content_gate;
};

/// SSRF-hardened fetch orchestrator.
///
/// Each hop runs validate -> rate limit -> request. Validation checks the
/// scheme, blocks IP-literal and local hosts, consults the domain allowlist
/// and then resolves the host, rejecting it if any address is disallowed.
/// Redirects are never followed by the transport: every Location target goes
/// through the full validation again and consumes its own rate-limit slot.
/// The body is streamed under the content gate and the byte ceiling.
/// Exactly one audit event is recorded per call.
class FetchGuard {
public:
    FetchGuard(FetchPolicy policy,
               std::shared_ptr<DomainAllowlist> allowlist,
               std::shared_ptr<HostValidator> host_validator,
               std::shared_ptr<RateLimiter> rate_limiter,
               std::shared_ptr<HttpTransport> transport,
               std::shared_ptr<AuditSink> audit);

    auto fetch(FetchRequest request) -> boost::asio::awaitable<FetchOutcome>;

    [[nodiscard]] auto policy() const noexcept -> const FetchPolicy& { return policy_; }
    [[nodiscard]] auto allowlist() const noexcept -> const std::shared_ptr<DomainAllowlist>& {
        return allowlist_;
    }

private:
    struct ValidatedTarget {
        Url url;
        ValidatedHost host;
    };

    /// Validating state for one hop. No network I/O except DNS for a host
    /// that already passed the allowlist.
    auto validate_target(std::string_view url, const FetchRequest& request)
        -> boost::asio::awaitable<Result<ValidatedTarget>>;

    auto finish(FetchOutcome outcome, const FetchRequest& request,
                std::chrono::steady_clock::time_point started, int redirects)
        -> FetchOutcome;

    FetchPolicy policy_;
    std::shared_ptr<DomainAllowlist> allowlist_;
    std::shared_ptr<HostValidator> host_validator_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<AuditSink> audit_;
};

} // namespace steenbok::infra
