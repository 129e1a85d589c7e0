#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "steenbok/core/error.hpp"

namespace steenbok::infra {

/// Immutable, parsed set of allowlist patterns.
struct AllowlistPatternSet {
    std::unordered_set<std::string> exact;    // normalized hostnames
    std::vector<std::string> wildcard_suffixes; // "*.edu" is stored as "edu"

    [[nodiscard]] auto size() const noexcept -> size_t {
        return exact.size() + wildcard_suffixes.size();
    }
};

/// Default-deny hostname allowlist with exact and `*.suffix` patterns.
///
/// Lookups take a snapshot of the current pattern set; `replace` swaps the
/// whole set at once so a reload is never observed half-applied.
class DomainAllowlist {
public:
    DomainAllowlist() = default;
    explicit DomainAllowlist(AllowlistPatternSet patterns);

    /// Parses pattern lines. Fails on the first invalid pattern; nothing is
    /// applied in that case.
    [[nodiscard]] static auto parse(const std::vector<std::string>& lines)
        -> Result<AllowlistPatternSet>;

    /// Convenience: parse and construct.
    [[nodiscard]] static auto from_patterns(const std::vector<std::string>& lines)
        -> Result<std::shared_ptr<DomainAllowlist>>;

    /// Lowercases, strips one trailing dot and validates DNS label syntax.
    /// Returns an empty string for hostnames that are not valid DNS names.
    [[nodiscard]] static auto normalize_hostname(std::string_view host) -> std::string;

    /// True if `hostname` matches an exact pattern, or ends in ".suffix" for a
    /// wildcard `*.suffix`. The bare suffix only matches when it is listed
    /// exactly as well.
    [[nodiscard]] auto is_allowed(std::string_view hostname) const -> bool;

    /// Atomically replaces the active pattern set.
    void replace(AllowlistPatternSet patterns);

    /// Parses and replaces in one step; the active set is untouched on error.
    auto reload(const std::vector<std::string>& lines) -> Result<void>;

    /// Patterns currently in effect, in display form (wildcards as "*.suffix").
    [[nodiscard]] auto patterns() const -> std::vector<std::string>;

private:
    [[nodiscard]] auto snapshot() const -> std::shared_ptr<const AllowlistPatternSet>;

    mutable std::mutex mutex_;
    std::shared_ptr<const AllowlistPatternSet> patterns_ =
        std::make_shared<const AllowlistPatternSet>();
};

} // namespace steenbok::infra
