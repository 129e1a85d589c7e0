#include <catch2/catch_test_macros.hpp>

#include "steenbok/core/error.hpp"

using namespace steenbok;

TEST_CASE("Error formatting", "[error]") {
    SECTION("message only") {
        auto err = make_error(ErrorCode::InvalidUrl, "URL has no host");
        CHECK(err.code() == ErrorCode::InvalidUrl);
        CHECK(err.what() == "URL has no host");
        CHECK(err.detail().empty());
    }

    SECTION("message with detail") {
        auto err = make_error(ErrorCode::HostBlockedIP, "Blocked IP literal", "10.0.0.1");
        CHECK(err.what() == "Blocked IP literal: 10.0.0.1");
        CHECK(err.detail() == "10.0.0.1");
    }
}

TEST_CASE("Audit reason names", "[error]") {
    CHECK(error_code_to_reason(ErrorCode::SchemeRejected) == "scheme_rejected");
    CHECK(error_code_to_reason(ErrorCode::AllowlistRejected) == "allowlist_rejected");
    CHECK(error_code_to_reason(ErrorCode::HostResolutionFailed) == "host_resolution_failed");
    CHECK(error_code_to_reason(ErrorCode::HostBlockedIP) == "host_blocked_ip");
    CHECK(error_code_to_reason(ErrorCode::TooManyRedirects) == "too_many_redirects");
    CHECK(error_code_to_reason(ErrorCode::ContentTypeRejected) == "content_type_rejected");
    CHECK(error_code_to_reason(ErrorCode::ResponseTooLarge) == "response_too_large");
    CHECK(error_code_to_reason(ErrorCode::NetworkTimeout) == "network_timeout");
    CHECK(error_code_to_reason(ErrorCode::NetworkError) == "network_error");
    CHECK(error_code_to_reason(ErrorCode::UpstreamHttpError) == "upstream_http_error");
}

TEST_CASE("Result carries values and errors", "[error]") {
    Result<int> ok = 42;
    REQUIRE(ok.has_value());
    CHECK(*ok == 42);

    Result<int> failed = std::unexpected(make_error(ErrorCode::IoError, "disk"));
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code() == ErrorCode::IoError);

    Result<void> converted = make_fail(make_error(ErrorCode::InternalError, "x"));
    CHECK_FALSE(converted.has_value());
    CHECK(ok_result().has_value());
}
