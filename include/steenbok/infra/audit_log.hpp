#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include "steenbok/core/error.hpp"

namespace steenbok::infra {

/// One record per terminal outcome of a fetch attempt.
struct AuditEvent {
    std::string timestamp;      // ISO-8601 UTC, millisecond precision
    std::string reason;         // "success" or an error_code_to_reason() value
    std::string url;            // URL of the hop the attempt ended on
    std::optional<std::string> origin_url;  // requested URL, when a redirect moved it
    std::optional<int> status;
    std::optional<size_t> bytes;
    std::optional<int64_t> elapsed_ms;
    std::optional<int> redirects;
    std::optional<std::string> error;
};

void to_json(nlohmann::json& j, const AuditEvent& e);

/// key=value rendering used on the process log.
auto format_audit_line(const AuditEvent& e) -> std::string;

/// Receives audit events. Implementations must be safe to call from
/// concurrent fetches.
class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditEvent& event) = 0;
};

/// Writes each event at info level on the process logger.
class LoggerAuditSink : public AuditSink {
public:
    void record(const AuditEvent& event) override;
};

/// Appends each event as one JSON line to a file.
class FileAuditSink : public AuditSink {
public:
    /// Opens (creating if needed) the audit file in append mode.
    static auto open(const std::filesystem::path& path) -> Result<std::shared_ptr<FileAuditSink>>;

    explicit FileAuditSink(std::shared_ptr<spdlog::logger> writer);

    void record(const AuditEvent& event) override;

private:
    std::shared_ptr<spdlog::logger> writer_;
};

/// Fans each event out to several sinks.
class CompositeAuditSink : public AuditSink {
public:
    explicit CompositeAuditSink(std::vector<std::shared_ptr<AuditSink>> sinks);

    void record(const AuditEvent& event) override;

private:
    std::vector<std::shared_ptr<AuditSink>> sinks_;
};

} // namespace steenbok::infra
