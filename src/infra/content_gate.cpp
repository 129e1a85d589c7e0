#include "steenbok/infra/content_gate.hpp"

#include "steenbok/core/utils.hpp"

#include <algorithm>

namespace steenbok::infra {

namespace {

// Substring entries: "application/vnd.ms-" covers the whole legacy Office
// family, "officedocument" the OOXML one.
const std::vector<std::string>& default_blocked() {
    static const std::vector<std::string> entries = {
        "application/msword",
        "application/vnd.ms-",
        "application/vnd.openxmlformats-officedocument",
        "application/vnd.oasis.opendocument",
        "application/rtf",
        "text/rtf",
        "application/zip",
        "application/x-zip",
        "application/x-rar",
        "application/vnd.rar",
        "application/x-7z",
        "application/gzip",
        "application/x-gzip",
        "application/x-tar",
        "application/x-bzip",
        "application/java-archive",
        "image/svg+xml",
        "application/octet-stream",
        "application/x-msdownload",
        "application/x-msdos-program",
        "application/x-executable",
        "application/x-elf",
        "application/x-mach-binary",
        "application/x-sh",
        "application/x-shellscript",
        "application/vnd.microsoft.portable-executable",
        "application/javascript",
        "application/x-javascript",
        "application/ecmascript",
        "text/javascript",
        "text/ecmascript",
        "text/vbscript",
        "application/wasm",
    };
    return entries;
}

const std::vector<std::string>& default_allowed() {
    static const std::vector<std::string> entries = {
        "text/html",
        "text/plain",
        "application/xhtml+xml",
    };
    return entries;
}

} // anonymous namespace

ContentGate::ContentGate()
    : ContentGate(default_blocked(), default_allowed()) {}

ContentGate::ContentGate(std::vector<std::string> blocked, std::vector<std::string> allowed)
    : blocked_(std::move(blocked)), allowed_(std::move(allowed)) {
    for (auto& entry : blocked_) entry = utils::to_lower(entry);
    for (auto& entry : allowed_) entry = utils::to_lower(entry);
}

auto ContentGate::media_type(std::string_view content_type) -> std::string {
    auto semi = content_type.find(';');
    return utils::to_lower(utils::trim(content_type.substr(0, semi)));
}

auto ContentGate::evaluate(std::string_view content_type) const -> ContentVerdict {
    auto lowered = utils::to_lower(content_type);

    for (const auto& entry : blocked_) {
        if (lowered.find(entry) != std::string::npos) {
            return ContentVerdict::Blocked;
        }
    }

    auto type = media_type(lowered);
    if (type.empty()) {
        return ContentVerdict::NotAllowed;
    }
    if (std::ranges::find(allowed_, type) != allowed_.end()) {
        return ContentVerdict::Accepted;
    }
    return ContentVerdict::NotAllowed;
}

} // namespace steenbok::infra
