#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace steenbok::utils {

/// ISO-8601 UTC timestamp with millisecond precision, e.g. 2026-10-18T09:15:02.123Z.
auto timestamp_iso_ms() -> std::string;
auto format_iso_ms(std::chrono::system_clock::time_point tp) -> std::string;

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto url_decode(std::string_view s) -> std::string;

} // namespace steenbok::utils
