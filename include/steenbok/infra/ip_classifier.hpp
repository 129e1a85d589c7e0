#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <boost/asio/ip/address.hpp>

namespace steenbok::infra {

/// Classifies IP addresses that an outbound fetch must never reach.
/// All decisions are made on the parsed address bytes, never on text.
class IpClassifier {
public:
    /// True for loopback, link-local, private (RFC 1918, RFC 4193), CGNAT,
    /// unspecified, multicast, broadcast, documentation, benchmarking and
    /// other reserved ranges. IPv6 forms that embed an IPv4 address
    /// (IPv4-mapped, IPv4-compatible, NAT64, 6to4) are judged by the embedded
    /// IPv4 address.
    [[nodiscard]] static auto is_disallowed(const boost::asio::ip::address& addr) -> bool;
    [[nodiscard]] static auto is_disallowed(const boost::asio::ip::address_v4& addr) -> bool;
    [[nodiscard]] static auto is_disallowed(const boost::asio::ip::address_v6& addr) -> bool;

    /// Parses an IP literal as it appears in a URL host: dotted IPv4 or IPv6,
    /// optionally wrapped in brackets. Zone identifiers are rejected.
    /// Returns nullopt when `text` is not an IP literal.
    [[nodiscard]] static auto parse_literal(std::string_view text)
        -> std::optional<boost::asio::ip::address>;

    /// Convenience for literals: unparsable input is treated as disallowed.
    [[nodiscard]] static auto is_disallowed_literal(std::string_view text) -> bool;
};

} // namespace steenbok::infra
