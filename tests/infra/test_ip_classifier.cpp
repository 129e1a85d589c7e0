#include <catch2/catch_test_macros.hpp>

#include "steenbok/infra/ip_classifier.hpp"

using namespace steenbok::infra;

namespace {

auto blocked(const char* text) -> bool {
    return IpClassifier::is_disallowed(boost::asio::ip::make_address(text));
}

} // anonymous namespace

TEST_CASE("IpClassifier IPv4 ranges", "[infra][ip_classifier]") {
    SECTION("RFC 1918") {
        CHECK(blocked("10.0.0.1"));
        CHECK(blocked("10.255.255.255"));
        CHECK(blocked("172.16.0.1"));
        CHECK(blocked("172.31.255.255"));
        CHECK_FALSE(blocked("172.15.255.255"));
        CHECK_FALSE(blocked("172.32.0.1"));
        CHECK(blocked("192.168.1.1"));
    }

    SECTION("Loopback, link-local and this-network") {
        CHECK(blocked("127.0.0.1"));
        CHECK(blocked("127.8.9.10"));
        CHECK(blocked("169.254.169.254"));
        CHECK(blocked("0.0.0.0"));
        CHECK(blocked("0.1.2.3"));
    }

    SECTION("CGNAT 100.64.0.0/10") {
        CHECK(blocked("100.64.0.1"));
        CHECK(blocked("100.127.255.255"));
        CHECK_FALSE(blocked("100.63.255.255"));
        CHECK_FALSE(blocked("100.128.0.1"));
    }

    SECTION("Documentation, benchmarking and protocol ranges") {
        CHECK(blocked("192.0.0.8"));
        CHECK(blocked("192.0.2.10"));
        CHECK(blocked("198.18.0.1"));
        CHECK(blocked("198.19.255.254"));
        CHECK_FALSE(blocked("198.20.0.1"));
        CHECK(blocked("198.51.100.7"));
        CHECK(blocked("203.0.113.9"));
        CHECK(blocked("192.88.99.1"));
    }

    SECTION("Multicast, reserved and broadcast") {
        CHECK(blocked("224.0.0.1"));
        CHECK(blocked("239.255.255.250"));
        CHECK(blocked("240.0.0.1"));
        CHECK(blocked("255.255.255.255"));
    }

    SECTION("Public addresses") {
        CHECK_FALSE(blocked("8.8.8.8"));
        CHECK_FALSE(blocked("1.1.1.1"));
        CHECK_FALSE(blocked("93.184.216.34"));
        CHECK_FALSE(blocked("198.35.26.96"));
    }
}

TEST_CASE("IpClassifier IPv6 ranges", "[infra][ip_classifier]") {
    SECTION("Special addresses") {
        CHECK(blocked("::"));
        CHECK(blocked("::1"));
        CHECK(blocked("fe80::1"));
        CHECK(blocked("fec0::1"));
        CHECK(blocked("ff02::1"));
        CHECK(blocked("fc00::1"));
        CHECK(blocked("fd12:3456::1"));
        CHECK(blocked("100::1"));
        CHECK(blocked("2001:db8::1"));
        CHECK(blocked("2001::1"));
        CHECK(blocked("3fff::1"));
        CHECK(blocked("64:ff9b:1::1"));
    }

    SECTION("Embedded IPv4 is classified by its IPv4 address") {
        CHECK(blocked("::ffff:127.0.0.1"));
        CHECK(blocked("::ffff:169.254.169.254"));
        CHECK(blocked("::ffff:10.1.2.3"));
        CHECK_FALSE(blocked("::ffff:8.8.8.8"));
        CHECK(blocked("64:ff9b::a9fe:a9fe"));
        CHECK_FALSE(blocked("64:ff9b::808:808"));
        CHECK(blocked("2002:7f00:1::"));
        CHECK_FALSE(blocked("2002:808:808::"));
        CHECK(blocked("::127.0.0.1"));
    }

    SECTION("IPv4-translated ::ffff:0:0/96") {
        CHECK(blocked("::ffff:0:7f00:1"));
        CHECK(blocked("::ffff:0:a9fe:a9fe"));
        CHECK(blocked("::ffff:0:192.168.0.1"));
        CHECK_FALSE(blocked("::ffff:0:808:808"));
    }

    SECTION("Public addresses") {
        CHECK_FALSE(blocked("2001:4860:4860::8888"));
        CHECK_FALSE(blocked("2606:4700:4700::1111"));
        CHECK_FALSE(blocked("2620:0:862:ed1a::1"));
    }
}

TEST_CASE("IpClassifier literal parsing", "[infra][ip_classifier]") {
    SECTION("Literals parse") {
        CHECK(IpClassifier::parse_literal("127.0.0.1").has_value());
        CHECK(IpClassifier::parse_literal("::1").has_value());
        CHECK(IpClassifier::parse_literal("[::1]").has_value());
    }

    SECTION("Non-literals") {
        CHECK_FALSE(IpClassifier::parse_literal("example.org").has_value());
        CHECK_FALSE(IpClassifier::parse_literal("").has_value());
        CHECK_FALSE(IpClassifier::parse_literal("[127.0.0.1]").has_value());
        CHECK_FALSE(IpClassifier::parse_literal("fe80::1%eth0").has_value());
    }

    SECTION("Unparsable text is treated as disallowed") {
        CHECK(IpClassifier::is_disallowed_literal("not-an-ip"));
        CHECK(IpClassifier::is_disallowed_literal("10.0.0.1"));
        CHECK_FALSE(IpClassifier::is_disallowed_literal("8.8.8.8"));
    }
}
