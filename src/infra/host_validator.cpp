#include "steenbok/infra/host_validator.hpp"

#include "steenbok/core/logger.hpp"
#include "steenbok/core/utils.hpp"
#include "steenbok/infra/ip_classifier.hpp"

#include <algorithm>
#include <atomic>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace steenbok::infra {

namespace net = boost::asio;

// ---------------------------------------------------------------------------
// AsioHostResolver
// ---------------------------------------------------------------------------

AsioHostResolver::AsioHostResolver(net::any_io_executor executor,
                                   std::chrono::milliseconds timeout)
    : executor_(std::move(executor)), timeout_(timeout) {}

auto AsioHostResolver::resolve(std::string_view host)
    -> net::awaitable<Result<std::vector<net::ip::address>>>
{
    auto resolver = std::make_shared<net::ip::tcp::resolver>(executor_);
    auto timed_out = std::make_shared<std::atomic<bool>>(false);
    net::steady_timer timer(executor_, timeout_);

    timer.async_wait([weak = std::weak_ptr(resolver), timed_out](boost::system::error_code ec) {
        if (ec) return;
        if (auto r = weak.lock()) {
            *timed_out = true;
            r->cancel();
        }
    });

    boost::system::error_code ec;
    auto results = co_await resolver->async_resolve(
        std::string(host), "443",
        net::redirect_error(net::use_awaitable, ec));
    timer.cancel();

    if (*timed_out) {
        co_return make_fail(make_error(ErrorCode::HostResolutionFailed,
            "DNS resolution timed out", std::string(host)));
    }
    if (ec) {
        co_return make_fail(make_error(ErrorCode::HostResolutionFailed,
            "DNS resolution failed", std::string(host) + ": " + ec.message()));
    }

    std::vector<net::ip::address> addresses;
    for (const auto& entry : results) {
        auto addr = entry.endpoint().address();
        if (std::ranges::find(addresses, addr) == addresses.end()) {
            addresses.push_back(addr);
        }
    }
    co_return addresses;
}

// ---------------------------------------------------------------------------
// ValidatedHost
// ---------------------------------------------------------------------------

auto ValidatedHost::preferred_address() const -> std::string {
    if (addresses.empty()) return {};
    return addresses.front().to_string();
}

// ---------------------------------------------------------------------------
// HostValidator
// ---------------------------------------------------------------------------

HostValidator::HostValidator(std::shared_ptr<HostResolver> resolver)
    : resolver_(std::move(resolver)) {}

auto HostValidator::is_local_hostname(std::string_view host) -> bool {
    auto h = utils::to_lower(host);
    if (!h.empty() && h.back() == '.') h.pop_back();
    return h == "localhost" || h == "localhost.localdomain" || h.ends_with(".localhost");
}

auto HostValidator::check_literal(std::string_view host)
    -> Result<std::optional<ValidatedHost>>
{
    if (host.empty()) {
        return std::unexpected(make_error(ErrorCode::HostBlockedIP, "Empty host"));
    }
    if (is_local_hostname(host)) {
        return std::unexpected(make_error(ErrorCode::HostBlockedIP,
            "Blocked local hostname", std::string(host)));
    }

    auto literal = IpClassifier::parse_literal(host);
    if (!literal) {
        return std::optional<ValidatedHost>{};
    }
    if (IpClassifier::is_disallowed(*literal)) {
        return std::unexpected(make_error(ErrorCode::HostBlockedIP,
            "Blocked IP literal", literal->to_string()));
    }
    // Literal hosts are connected to directly; nothing to pin.
    return std::optional<ValidatedHost>{ValidatedHost{std::string(host), {}}};
}

auto HostValidator::validate(std::string_view host) -> net::awaitable<Result<ValidatedHost>> {
    auto literal = check_literal(host);
    if (!literal) {
        co_return make_fail(literal.error());
    }
    if (*literal) {
        co_return std::move(**literal);
    }

    auto resolved = co_await resolver_->resolve(host);
    if (!resolved) {
        co_return make_fail(resolved.error());
    }
    if (resolved->empty()) {
        co_return make_fail(make_error(ErrorCode::HostResolutionFailed,
            "DNS returned no addresses", std::string(host)));
    }

    // One bad answer poisons the whole name.
    for (const auto& addr : *resolved) {
        if (IpClassifier::is_disallowed(addr)) {
            co_return make_fail(make_error(ErrorCode::HostBlockedIP,
                "Host resolves to blocked IP",
                std::string(host) + " -> " + addr.to_string()));
        }
    }

    ValidatedHost validated{std::string(host), std::move(*resolved)};
    std::ranges::stable_partition(validated.addresses,
                                  [](const net::ip::address& a) { return a.is_v4(); });

    LOG_DEBUG("HostValidator: {} resolved to {} allowed address(es)",
              validated.host, validated.addresses.size());
    co_return validated;
}

} // namespace steenbok::infra
