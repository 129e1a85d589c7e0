#include "steenbok/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace steenbok {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
}

void Logger::init(std::string_view name, std::string_view level) {
    // stdout carries fetched text in CLI mode, so diagnostics go to stderr.
    auto existing = spdlog::get(std::string(name));
    g_logger = existing ? existing : spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ [%^%l%$] [steenbok] %v",
                          spdlog::pattern_time_type::utc);
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

void Logger::set_level(std::string_view level) {
    auto& logger = get();
    if (level == "trace") logger->set_level(spdlog::level::trace);
    else if (level == "debug") logger->set_level(spdlog::level::debug);
    else if (level == "info") logger->set_level(spdlog::level::info);
    else if (level == "warn") logger->set_level(spdlog::level::warn);
    else if (level == "error") logger->set_level(spdlog::level::err);
    else if (level == "critical") logger->set_level(spdlog::level::critical);
    else {
        logger->set_level(spdlog::level::info);
        logger->warn("Unknown log level '{}', using info", level);
    }
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace steenbok
