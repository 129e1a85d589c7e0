#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "steenbok/core/error.hpp"

namespace steenbok::infra {

/// An absolute hierarchical URL split into its components.
/// `scheme` and `host` are lowercased; an IPv6 host is kept without brackets.
struct Url {
    std::string scheme;
    std::string userinfo;
    std::string host;
    bool ipv6_literal = false;
    std::optional<uint16_t> port;
    std::string path;       // always starts with '/'
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    [[nodiscard]] auto effective_port() const -> uint16_t;

    /// Host as it appears in a URL authority ("[::1]" for IPv6).
    [[nodiscard]] auto host_for_authority() const -> std::string;

    /// scheme://host[:port], the port omitted when it is the scheme default.
    [[nodiscard]] auto origin() const -> std::string;

    /// Path plus query, suitable for the HTTP request line.
    [[nodiscard]] auto request_target() const -> std::string;

    /// Serialized form without the fragment.
    [[nodiscard]] auto str() const -> std::string;
};

/// Parses an absolute URL with an authority component (scheme://host...).
/// Rejects control characters, whitespace, non-ASCII bytes, empty hosts,
/// percent-escapes in the host and out-of-range ports.
auto parse_url(std::string_view input) -> Result<Url>;

/// Resolves a (possibly relative) reference such as a Location header value
/// against `base`, following RFC 3986 section 5.2.
auto resolve_reference(const Url& base, std::string_view reference) -> Result<Url>;

/// RFC 3986 section 5.2.4.
auto remove_dot_segments(std::string_view path) -> std::string;

} // namespace steenbok::infra
