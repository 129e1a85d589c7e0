#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace steenbok::infra {

enum class ContentVerdict {
    Accepted,
    Blocked,      // matched the high-risk blocklist
    NotAllowed,   // default-deny: not on the allowlist
};

/// Accept/reject decision over a declared Content-Type header.
///
/// The blocklist is consulted first and matches anywhere in the lowercased
/// header, so a header that also names an allowed type cannot smuggle a
/// blocked one through. The allowlist then requires an exact media-type match.
class ContentGate {
public:
    /// Default tables: office documents, archives, SVG, executables,
    /// octet-stream and script types blocked; HTML, plain text and XHTML allowed.
    ContentGate();

    ContentGate(std::vector<std::string> blocked, std::vector<std::string> allowed);

    [[nodiscard]] auto evaluate(std::string_view content_type) const -> ContentVerdict;

    [[nodiscard]] auto is_acceptable(std::string_view content_type) const -> bool {
        return evaluate(content_type) == ContentVerdict::Accepted;
    }

    /// "Text/HTML; charset=UTF-8" -> "text/html".
    [[nodiscard]] static auto media_type(std::string_view content_type) -> std::string;

    [[nodiscard]] auto blocked_entries() const noexcept -> const std::vector<std::string>& {
        return blocked_;
    }
    [[nodiscard]] auto allowed_entries() const noexcept -> const std::vector<std::string>& {
        return allowed_;
    }

private:
    std::vector<std::string> blocked_;
    std::vector<std::string> allowed_;
};

} // namespace steenbok::infra
