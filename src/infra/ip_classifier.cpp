#include "steenbok/infra/ip_classifier.hpp"

#include "steenbok/core/logger.hpp"

#include <array>
#include <string>

namespace steenbok::infra {

namespace net = boost::asio;

namespace {

struct Ipv4Range {
    uint32_t network;
    int prefix;
};

// IANA IPv4 special-purpose registry entries that are not globally reachable.
constexpr std::array<Ipv4Range, 16> kBlockedV4 = {{
    {0x00000000, 8},   // 0.0.0.0/8 "this network"
    {0x0A000000, 8},   // 10.0.0.0/8
    {0x64400000, 10},  // 100.64.0.0/10 CGNAT
    {0x7F000000, 8},   // 127.0.0.0/8 loopback
    {0xA9FE0000, 16},  // 169.254.0.0/16 link-local
    {0xAC100000, 12},  // 172.16.0.0/12
    {0xC0000000, 24},  // 192.0.0.0/24 IETF protocol assignments
    {0xC0000200, 24},  // 192.0.2.0/24 TEST-NET-1
    {0xC0586300, 24},  // 192.88.99.0/24 6to4 relay anycast
    {0xC0A80000, 16},  // 192.168.0.0/16
    {0xC6120000, 15},  // 198.18.0.0/15 benchmarking
    {0xC6336400, 24},  // 198.51.100.0/24 TEST-NET-2
    {0xCB007100, 24},  // 203.0.113.0/24 TEST-NET-3
    {0xE0000000, 4},   // 224.0.0.0/4 multicast
    {0xF0000000, 4},   // 240.0.0.0/4 reserved, includes 255.255.255.255
    {0xFFFFFFFF, 32},  // broadcast
}};

auto in_range(uint32_t ip, const Ipv4Range& range) -> bool {
    uint32_t mask = range.prefix == 0 ? 0 : (~uint32_t{0} << (32 - range.prefix));
    return (ip & mask) == (range.network & mask);
}

auto embedded_v4(const net::ip::address_v6::bytes_type& b, size_t offset) -> net::ip::address_v4 {
    return net::ip::address_v4(net::ip::address_v4::bytes_type{
        b[offset], b[offset + 1], b[offset + 2], b[offset + 3]});
}

auto all_zero(const net::ip::address_v6::bytes_type& b, size_t from, size_t to) -> bool {
    for (size_t i = from; i < to; ++i) {
        if (b[i] != 0) return false;
    }
    return true;
}

} // anonymous namespace

auto IpClassifier::is_disallowed(const net::ip::address_v4& addr) -> bool {
    auto ip = addr.to_uint();
    for (const auto& range : kBlockedV4) {
        if (in_range(ip, range)) return true;
    }
    return false;
}

auto IpClassifier::is_disallowed(const net::ip::address_v6& addr) -> bool {
    if (addr.is_unspecified() || addr.is_loopback()) return true;
    if (addr.is_link_local() || addr.is_site_local()) return true;
    if (addr.is_multicast()) return true;

    auto b = addr.to_bytes();

    // ::ffff:a.b.c.d
    if (addr.is_v4_mapped()) {
        return is_disallowed(embedded_v4(b, 12));
    }

    // ::ffff:0:a.b.c.d IPv4-translated (SIIT)
    if (all_zero(b, 0, 8) && b[8] == 0xff && b[9] == 0xff && b[10] == 0x00 && b[11] == 0x00) {
        return is_disallowed(embedded_v4(b, 12));
    }

    // ::a.b.c.d (deprecated IPv4-compatible form)
    if (all_zero(b, 0, 12)) {
        return is_disallowed(embedded_v4(b, 12));
    }

    // 64:ff9b::/96 NAT64 well-known prefix
    if (b[0] == 0x00 && b[1] == 0x64 && b[2] == 0xff && b[3] == 0x9b && all_zero(b, 4, 12)) {
        return is_disallowed(embedded_v4(b, 12));
    }

    // 64:ff9b:1::/48 local-use NAT64
    if (b[0] == 0x00 && b[1] == 0x64 && b[2] == 0xff && b[3] == 0x9b &&
        b[4] == 0x00 && b[5] == 0x01) {
        return true;
    }

    // 2002::/16 6to4 carries the IPv4 address in bytes 2..5
    if (b[0] == 0x20 && b[1] == 0x02) {
        return is_disallowed(embedded_v4(b, 2));
    }

    // fc00::/7 unique local
    if ((b[0] & 0xFE) == 0xFC) return true;

    // 100::/64 discard-only
    if (b[0] == 0x01 && b[1] == 0x00 && all_zero(b, 2, 8)) return true;

    // 2001::/23 IETF protocol assignments (Teredo, ORCHID, benchmarking, ...)
    if (b[0] == 0x20 && b[1] == 0x01 && (b[2] & 0xFE) == 0x00) return true;

    // 2001:db8::/32 documentation
    if (b[0] == 0x20 && b[1] == 0x01 && b[2] == 0x0d && b[3] == 0xb8) return true;

    // 3fff::/20 documentation
    if (b[0] == 0x3f && b[1] == 0xff && (b[2] & 0xF0) == 0x00) return true;

    return false;
}

auto IpClassifier::is_disallowed(const net::ip::address& addr) -> bool {
    if (addr.is_v4()) return is_disallowed(addr.to_v4());
    return is_disallowed(addr.to_v6());
}

auto IpClassifier::parse_literal(std::string_view text) -> std::optional<net::ip::address> {
    bool bracketed = false;
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        text = text.substr(1, text.size() - 2);
        bracketed = true;
    }
    if (text.empty() || text.find('%') != std::string_view::npos) {
        return std::nullopt;
    }

    boost::system::error_code ec;
    if (bracketed) {
        auto v6 = net::ip::make_address_v6(std::string(text), ec);
        if (ec) return std::nullopt;
        return net::ip::address(v6);
    }

    auto addr = net::ip::make_address(std::string(text), ec);
    if (ec) return std::nullopt;
    return addr;
}

auto IpClassifier::is_disallowed_literal(std::string_view text) -> bool {
    auto addr = parse_literal(text);
    if (!addr) {
        LOG_DEBUG("IpClassifier: '{}' is not an IP literal, treating as disallowed", text);
        return true;
    }
    return is_disallowed(*addr);
}

} // namespace steenbok::infra
