#include "steenbok/infra/fetch_guard.hpp"

#include "steenbok/core/logger.hpp"
#include "steenbok/core/utils.hpp"

#include <charconv>
#include <set>
#include <type_traits>

namespace steenbok::infra {

namespace net = boost::asio;

namespace {

auto is_rejection(ErrorCode code) -> bool {
    switch (code) {
        case ErrorCode::InvalidUrl:
        case ErrorCode::SchemeRejected:
        case ErrorCode::AllowlistRejected:
        case ErrorCode::HostResolutionFailed:
        case ErrorCode::HostBlockedIP:
        case ErrorCode::ContentTypeRejected:
            return true;
        default:
            return false;
    }
}

auto outcome_from_error(const Error& err, std::string url,
                        std::optional<int> status = std::nullopt) -> FetchOutcome {
    if (is_rejection(err.code())) {
        return FetchRejected{err.code(), std::move(url), err.what()};
    }
    return FetchFailed{err.code(), std::move(url), err.what(), status};
}

auto parse_content_length(std::string_view value) -> std::optional<size_t> {
    auto trimmed = utils::trim(value);
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), n);
    if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size()) {
        return std::nullopt;
    }
    return n;
}

/// Per-hop state shared with the transport callbacks.
struct HopState {
    const ContentGate* gate = nullptr;
    size_t max_bytes = 0;

    std::string body;
    std::optional<ContentVerdict> verdict;
    bool too_large = false;
    std::optional<size_t> declared_length;
};

} // anonymous namespace

auto outcome_reason(const FetchOutcome& outcome) -> std::optional<ErrorCode> {
    if (auto* rejected = std::get_if<FetchRejected>(&outcome)) return rejected->reason;
    if (auto* failed = std::get_if<FetchFailed>(&outcome)) return failed->reason;
    return std::nullopt;
}

FetchGuard::FetchGuard(FetchPolicy policy,
                       std::shared_ptr<DomainAllowlist> allowlist,
                       std::shared_ptr<HostValidator> host_validator,
                       std::shared_ptr<RateLimiter> rate_limiter,
                       std::shared_ptr<HttpTransport> transport,
                       std::shared_ptr<AuditSink> audit)
    : policy_(std::move(policy))
    , allowlist_(std::move(allowlist))
    , host_validator_(std::move(host_validator))
    , rate_limiter_(std::move(rate_limiter))
    , transport_(std::move(transport))
    , audit_(std::move(audit)) {}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

auto FetchGuard::validate_target(std::string_view url, const FetchRequest& request)
    -> net::awaitable<Result<ValidatedTarget>>
{
    if (url.size() > policy_.max_url_length) {
        co_return make_fail(make_error(ErrorCode::InvalidUrl, "URL too long",
            std::to_string(url.size()) + " > " + std::to_string(policy_.max_url_length)));
    }

    auto parsed = parse_url(url);
    if (!parsed) {
        co_return make_fail(parsed.error());
    }

    bool scheme_ok = parsed->scheme == "https" ||
                     (parsed->scheme == "http" && request.allow_http);
    if (!scheme_ok) {
        co_return make_fail(make_error(ErrorCode::SchemeRejected,
            "Scheme not allowed", parsed->scheme));
    }

    // IP literals and local names are decided without DNS, before the
    // allowlist, so they report the precise reason.
    auto literal = HostValidator::check_literal(parsed->host);
    if (!literal) {
        co_return make_fail(literal.error());
    }

    if (!allowlist_->is_allowed(parsed->host)) {
        co_return make_fail(make_error(ErrorCode::AllowlistRejected,
            "Host not on allowlist", parsed->host));
    }

    auto host = co_await host_validator_->validate(parsed->host);
    if (!host) {
        co_return make_fail(host.error());
    }

    co_return ValidatedTarget{std::move(*parsed), std::move(*host)};
}

// ---------------------------------------------------------------------------
// Audit
// ---------------------------------------------------------------------------

auto FetchGuard::finish(FetchOutcome outcome, const FetchRequest& request,
                        std::chrono::steady_clock::time_point started, int redirects)
    -> FetchOutcome
{
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    AuditEvent event;
    event.timestamp = utils::timestamp_iso_ms();
    event.elapsed_ms = elapsed;
    if (redirects > 0) {
        event.redirects = redirects;
    }

    std::visit([&](auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, FetchSuccess>) {
            o.elapsed_ms = elapsed;
            event.reason = "success";
            event.url = o.final_url;
            event.status = o.status;
            event.bytes = o.bytes.size();
        } else if constexpr (std::is_same_v<T, FetchRejected>) {
            event.reason = std::string(error_code_to_reason(o.reason));
            event.url = o.url;
            event.error = o.detail;
        } else {
            event.reason = std::string(error_code_to_reason(o.reason));
            event.url = o.url;
            event.status = o.http_status;
            event.error = o.detail;
        }
    }, outcome);

    if (redirects > 0) {
        event.origin_url = request.url;
    }

    if (audit_) {
        audit_->record(event);
    }
    return outcome;
}

// ---------------------------------------------------------------------------
// Fetch loop
// ---------------------------------------------------------------------------

auto FetchGuard::fetch(FetchRequest request) -> net::awaitable<FetchOutcome> {
    const auto started = std::chrono::steady_clock::now();
    std::string current_url = request.url;
    std::set<std::string> visited;
    int redirects = 0;

    while (true) {
        // Validating
        auto target = co_await validate_target(current_url, request);
        if (!target) {
            co_return finish(outcome_from_error(target.error(), current_url),
                             request, started, redirects);
        }
        current_url = target->url.str();

        if (!visited.insert(current_url).second) {
            co_return finish(FetchFailed{ErrorCode::TooManyRedirects, current_url,
                                         "Redirect loop detected", std::nullopt},
                             request, started, redirects);
        }

        // RateLimited
        co_await rate_limiter_->acquire();

        // Requesting
        HopState hop;
        hop.gate = &policy_.content_gate;
        hop.max_bytes = request.max_bytes;

        HttpStreamHandler handler;
        handler.on_head = [&hop](const HttpResponseHead& head) -> bool {
            // Redirects and error statuses are decided without their bodies.
            if (head.is_redirect() || !head.is_success()) {
                return false;
            }
            hop.verdict = hop.gate->evaluate(head.header("content-type"));
            if (*hop.verdict != ContentVerdict::Accepted) {
                return false;
            }
            if (auto length = parse_content_length(head.header("content-length"))) {
                hop.declared_length = length;
                if (*length > hop.max_bytes) {
                    hop.too_large = true;
                    return false;
                }
            }
            return true;
        };
        handler.on_chunk = [&hop](const char* data, size_t length) -> bool {
            if (hop.body.size() + length > hop.max_bytes) {
                hop.too_large = true;
                return false;
            }
            hop.body.append(data, length);
            return true;
        };

        HttpHopRequest hop_request{target->url,
            policy_.pin_resolved_address ? target->host.preferred_address() : std::string{}};
        auto exchange = co_await transport_->get(hop_request, handler);
        if (!exchange) {
            co_return finish(outcome_from_error(exchange.error(), current_url),
                             request, started, redirects);
        }

        const auto& head = exchange->head;

        // Redirecting
        auto location = head.header("location");
        if (head.is_redirect() && !location.empty()) {
            ++redirects;
            if (redirects > request.max_redirects) {
                co_return finish(FetchFailed{ErrorCode::TooManyRedirects, current_url,
                                             "Exceeded " + std::to_string(request.max_redirects) +
                                                 " redirects",
                                             head.status},
                                 request, started, redirects);
            }
            auto next = resolve_reference(target->url, location);
            if (!next) {
                co_return finish(outcome_from_error(next.error(), current_url, head.status),
                                 request, started, redirects);
            }
            LOG_DEBUG("FetchGuard: hop {} {} -> {} ({})", redirects, current_url,
                      next->str(), head.status);
            current_url = next->str();
            continue;
        }

        if (!head.is_success()) {
            co_return finish(FetchFailed{ErrorCode::UpstreamHttpError, current_url,
                                         "HTTP " + std::to_string(head.status), head.status},
                             request, started, redirects);
        }

        // StreamingBody
        auto content_type = head.header("content-type");
        if (hop.verdict && *hop.verdict != ContentVerdict::Accepted) {
            co_return finish(FetchRejected{ErrorCode::ContentTypeRejected, current_url,
                                           *hop.verdict == ContentVerdict::Blocked
                                               ? "Blocked content type: " + content_type
                                               : "Unsupported content type: " + content_type},
                             request, started, redirects);
        }
        if (hop.too_large) {
            auto detail = hop.declared_length
                ? "Declared length " + std::to_string(*hop.declared_length) + " exceeds " +
                      std::to_string(request.max_bytes)
                : "Body exceeds " + std::to_string(request.max_bytes) + " bytes";
            co_return finish(FetchFailed{ErrorCode::ResponseTooLarge, current_url,
                                         std::move(detail), head.status},
                             request, started, redirects);
        }
        if (exchange->stopped_by_handler) {
            co_return finish(FetchFailed{ErrorCode::InternalError, current_url,
                                         "Transfer stopped unexpectedly", head.status},
                             request, started, redirects);
        }

        // Done
        co_return finish(FetchSuccess{std::move(hop.body), std::move(content_type),
                                      current_url, head.status, redirects, 0},
                         request, started, redirects);
    }
}

} // namespace steenbok::infra
