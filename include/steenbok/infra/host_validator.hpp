#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/address.hpp>

#include "steenbok/core/error.hpp"

namespace steenbok::infra {

/// Resolves a hostname to its complete set of A/AAAA addresses.
class HostResolver {
public:
    virtual ~HostResolver() = default;

    virtual auto resolve(std::string_view host)
        -> boost::asio::awaitable<Result<std::vector<boost::asio::ip::address>>> = 0;
};

/// System resolver driven by boost::asio::ip::tcp::resolver, bounded by a
/// wall-clock timeout.
class AsioHostResolver : public HostResolver {
public:
    AsioHostResolver(boost::asio::any_io_executor executor, std::chrono::milliseconds timeout);

    auto resolve(std::string_view host)
        -> boost::asio::awaitable<Result<std::vector<boost::asio::ip::address>>> override;

private:
    boost::asio::any_io_executor executor_;
    std::chrono::milliseconds timeout_;
};

/// A hostname whose every resolved address passed the IP classifier.
struct ValidatedHost {
    std::string host;
    std::vector<boost::asio::ip::address> addresses;  // IPv4 first

    /// Address the transport should connect to, or empty for IP literals.
    [[nodiscard]] auto preferred_address() const -> std::string;
};

/// Rejects hostnames that are, or resolve to, disallowed addresses.
class HostValidator {
public:
    explicit HostValidator(std::shared_ptr<HostResolver> resolver);

    /// True for names that always denote the local machine.
    [[nodiscard]] static auto is_local_hostname(std::string_view host) -> bool;

    /// Checks a host without DNS: IP literals are classified directly and
    /// local hostnames are blocked. Returns the literal as a ValidatedHost,
    /// nullopt for names that still need resolution, or HostBlockedIP.
    [[nodiscard]] static auto check_literal(std::string_view host)
        -> Result<std::optional<ValidatedHost>>;

    /// Full validation. Fails with HostResolutionFailed when the name does not
    /// resolve (or resolves to nothing) and with HostBlockedIP when any one
    /// of the resolved addresses is disallowed.
    auto validate(std::string_view host) -> boost::asio::awaitable<Result<ValidatedHost>>;

private:
    std::shared_ptr<HostResolver> resolver_;
};

} // namespace steenbok::infra
