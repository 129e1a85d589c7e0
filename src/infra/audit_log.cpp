#include "steenbok/infra/audit_log.hpp"

#include "steenbok/core/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

namespace steenbok::infra {

void to_json(nlohmann::json& j, const AuditEvent& e) {
    j = nlohmann::json{
        {"timestamp", e.timestamp},
        {"reason", e.reason},
        {"url", e.url},
    };
    if (e.origin_url) j["origin_url"] = *e.origin_url;
    if (e.status) j["status"] = *e.status;
    if (e.bytes) j["bytes"] = *e.bytes;
    if (e.elapsed_ms) j["elapsed_ms"] = *e.elapsed_ms;
    if (e.redirects) j["redirects"] = *e.redirects;
    if (e.error) j["error"] = *e.error;
}

auto format_audit_line(const AuditEvent& e) -> std::string {
    auto line = fmt::format("reason={} url={}", e.reason, e.url);
    if (e.origin_url) line += fmt::format(" origin_url={}", *e.origin_url);
    if (e.status) line += fmt::format(" status={}", *e.status);
    if (e.bytes) line += fmt::format(" bytes={}", *e.bytes);
    if (e.elapsed_ms) line += fmt::format(" elapsed_ms={}", *e.elapsed_ms);
    if (e.redirects) line += fmt::format(" redirects={}", *e.redirects);
    if (e.error) line += fmt::format(" error=\"{}\"", *e.error);
    return line;
}

void LoggerAuditSink::record(const AuditEvent& event) {
    LOG_INFO("audit {}", format_audit_line(event));
}

auto FileAuditSink::open(const std::filesystem::path& path)
    -> Result<std::shared_ptr<FileAuditSink>> {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
        auto writer = std::make_shared<spdlog::logger>("steenbok-audit", std::move(sink));
        writer->set_pattern("%v");
        writer->set_level(spdlog::level::info);
        writer->flush_on(spdlog::level::info);
        return std::make_shared<FileAuditSink>(std::move(writer));
    } catch (const spdlog::spdlog_ex& e) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot open audit log", path.string() + ": " + e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot create audit log directory", e.what()));
    }
}

FileAuditSink::FileAuditSink(std::shared_ptr<spdlog::logger> writer)
    : writer_(std::move(writer)) {}

void FileAuditSink::record(const AuditEvent& event) {
    nlohmann::json j = event;
    writer_->info(j.dump());
}

CompositeAuditSink::CompositeAuditSink(std::vector<std::shared_ptr<AuditSink>> sinks)
    : sinks_(std::move(sinks)) {}

void CompositeAuditSink::record(const AuditEvent& event) {
    for (const auto& sink : sinks_) {
        sink->record(event);
    }
}

} // namespace steenbok::infra
