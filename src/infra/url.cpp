#include "steenbok/infra/url.hpp"

#include "steenbok/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace steenbok::infra {

namespace {

auto invalid(std::string message, std::string_view input) -> std::unexpected<Error> {
    return std::unexpected(make_error(ErrorCode::InvalidUrl, std::move(message), std::string(input)));
}

auto has_forbidden_bytes(std::string_view s) -> bool {
    return std::ranges::any_of(s, [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc <= 0x20 || uc == 0x7F || uc >= 0x80 || c == '\\';
    });
}

auto default_port(std::string_view scheme) -> uint16_t {
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

auto is_scheme_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

/// Splits "scheme:" off the front; returns nullopt when there is no scheme.
auto split_scheme(std::string_view s) -> std::optional<std::pair<std::string, std::string_view>> {
    auto colon = s.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    auto scheme = s.substr(0, colon);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front())) ||
        !std::ranges::all_of(scheme, is_scheme_char)) {
        return std::nullopt;
    }
    // A '/', '?' or '#' before the colon means this is a relative path.
    if (scheme.find_first_of("/?#") != std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(utils::to_lower(scheme), s.substr(colon + 1));
}

/// Parses "//authority" into `url`. `rest` must start with "//".
auto parse_authority(std::string_view authority, Url& url, std::string_view input) -> Result<void> {
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        url.userinfo = std::string(authority.substr(0, at));
        authority = authority.substr(at + 1);
    }

    std::string_view host;
    std::string_view port_text;

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return invalid("Unterminated IPv6 literal", input);
        }
        host = authority.substr(1, close - 1);
        url.ipv6_literal = true;
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return invalid("Unexpected characters after IPv6 literal", input);
            }
            port_text = after.substr(1);
        }
        if (host.find('%') != std::string_view::npos) {
            return invalid("IPv6 zone identifiers are not allowed", input);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            host = authority;
        }
        if (host.find_first_of("%[]:") != std::string_view::npos) {
            return invalid("Invalid characters in host", input);
        }
    }

    if (host.empty()) {
        return invalid("URL has no host", input);
    }
    url.host = utils::to_lower(host);

    if (!port_text.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
            value == 0 || value > 65535) {
            return invalid("Invalid port", input);
        }
        url.port = static_cast<uint16_t>(value);
    }

    return {};
}

/// Splits path?query#fragment.
void split_path_query_fragment(std::string_view rest, std::string& path,
                               std::optional<std::string>& query,
                               std::optional<std::string>& fragment) {
    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    auto q = rest.find('?');
    if (q != std::string_view::npos) {
        query = std::string(rest.substr(q + 1));
        rest = rest.substr(0, q);
    }
    path = std::string(rest);
}

auto merge_paths(const Url& base, std::string_view ref_path) -> std::string {
    if (base.path.empty()) {
        return "/" + std::string(ref_path);
    }
    auto slash = base.path.rfind('/');
    return base.path.substr(0, slash + 1) + std::string(ref_path);
}

} // anonymous namespace

auto Url::effective_port() const -> uint16_t {
    return port.value_or(default_port(scheme));
}

auto Url::host_for_authority() const -> std::string {
    return ipv6_literal ? "[" + host + "]" : host;
}

auto Url::origin() const -> std::string {
    auto out = scheme + "://" + host_for_authority();
    if (port && *port != default_port(scheme)) {
        out += ":" + std::to_string(*port);
    }
    return out;
}

auto Url::request_target() const -> std::string {
    auto out = path.empty() ? std::string("/") : path;
    if (query) {
        out += "?" + *query;
    }
    return out;
}

auto Url::str() const -> std::string {
    auto out = scheme + "://";
    if (!userinfo.empty()) {
        out += userinfo + "@";
    }
    out += host_for_authority();
    if (port) {
        out += ":" + std::to_string(*port);
    }
    out += request_target();
    return out;
}

auto parse_url(std::string_view input) -> Result<Url> {
    if (input.empty()) {
        return invalid("Empty URL", input);
    }
    if (has_forbidden_bytes(input)) {
        return invalid("URL contains whitespace, control or non-ASCII characters", input);
    }

    auto split = split_scheme(input);
    if (!split) {
        return invalid("URL has no scheme", input);
    }

    Url url;
    url.scheme = std::move(split->first);
    auto rest = split->second;

    if (!rest.starts_with("//")) {
        return invalid("URL has no authority", input);
    }
    rest = rest.substr(2);

    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);
    auto auth = parse_authority(authority, url, input);
    if (!auth) {
        return std::unexpected(auth.error());
    }

    if (authority_end != std::string_view::npos) {
        split_path_query_fragment(rest.substr(authority_end), url.path, url.query, url.fragment);
    }
    url.path = url.path.empty() ? "/" : remove_dot_segments(url.path);
    return url;
}

auto remove_dot_segments(std::string_view path) -> std::string {
    std::string input(path);
    std::string output;

    while (!input.empty()) {
        if (input.starts_with("../")) {
            input.erase(0, 3);
        } else if (input.starts_with("./")) {
            input.erase(0, 2);
        } else if (input.starts_with("/./")) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (input.starts_with("/../") || input == "/..") {
            if (input == "/..") {
                input = "/";
            } else {
                input.replace(0, 4, "/");
            }
            auto last = output.rfind('/');
            output.erase(last == std::string::npos ? 0 : last);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            auto start = input.front() == '/' ? 1 : 0;
            auto next = input.find('/', start);
            auto segment_len = next == std::string::npos ? input.size() : next;
            output += input.substr(0, segment_len);
            input.erase(0, segment_len);
        }
    }
    return output;
}

auto resolve_reference(const Url& base, std::string_view reference) -> Result<Url> {
    auto ref = utils::trim(reference);
    if (has_forbidden_bytes(ref)) {
        return invalid("Reference contains whitespace, control or non-ASCII characters", ref);
    }

    if (split_scheme(ref)) {
        return parse_url(ref);
    }

    Url target;
    target.scheme = base.scheme;

    if (std::string_view(ref).starts_with("//")) {
        return parse_url(base.scheme + ":" + ref);
    }

    target.userinfo = base.userinfo;
    target.host = base.host;
    target.ipv6_literal = base.ipv6_literal;
    target.port = base.port;

    std::string ref_path;
    std::optional<std::string> ref_query;
    std::optional<std::string> ref_fragment;
    split_path_query_fragment(ref, ref_path, ref_query, ref_fragment);
    target.fragment = std::move(ref_fragment);

    if (ref_path.empty()) {
        target.path = base.path;
        target.query = ref_query ? ref_query : base.query;
    } else {
        if (ref_path.front() == '/') {
            target.path = remove_dot_segments(ref_path);
        } else {
            target.path = remove_dot_segments(merge_paths(base, ref_path));
        }
        target.query = std::move(ref_query);
    }
    if (target.path.empty() || target.path.front() != '/') {
        target.path.insert(0, "/");
    }
    return target;
}

} // namespace steenbok::infra
