#include "steenbok/infra/domain_allowlist.hpp"

#include "steenbok/core/logger.hpp"
#include "steenbok/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace steenbok::infra {

namespace {

constexpr size_t kMaxHostnameLength = 253;
constexpr size_t kMaxLabelLength = 63;

auto is_valid_label(std::string_view label) -> bool {
    if (label.empty() || label.size() > kMaxLabelLength) {
        return false;
    }
    auto alnum = [](unsigned char c) { return std::isalnum(c) != 0; };
    if (!alnum(static_cast<unsigned char>(label.front())) ||
        !alnum(static_cast<unsigned char>(label.back()))) {
        return false;
    }
    return std::ranges::all_of(label, [&](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc < 0x80 && (alnum(uc) || c == '-');
    });
}

auto is_valid_dns_name(std::string_view host) -> bool {
    if (host.empty() || host.size() > kMaxHostnameLength) {
        return false;
    }
    size_t start = 0;
    while (true) {
        auto dot = host.find('.', start);
        auto end = (dot == std::string_view::npos) ? host.size() : dot;
        if (!is_valid_label(host.substr(start, end - start))) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        start = dot + 1;
    }
}

} // anonymous namespace

DomainAllowlist::DomainAllowlist(AllowlistPatternSet patterns)
    : patterns_(std::make_shared<const AllowlistPatternSet>(std::move(patterns))) {}

auto DomainAllowlist::normalize_hostname(std::string_view host) -> std::string {
    auto lowered = utils::to_lower(host);
    if (!lowered.empty() && lowered.back() == '.') {
        lowered.pop_back();
    }
    if (!is_valid_dns_name(lowered)) {
        return {};
    }
    return lowered;
}

auto DomainAllowlist::parse(const std::vector<std::string>& lines)
    -> Result<AllowlistPatternSet> {
    AllowlistPatternSet set;

    for (const auto& raw : lines) {
        auto line = utils::trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        if (line.starts_with("*.")) {
            auto suffix = normalize_hostname(std::string_view(line).substr(2));
            if (suffix.empty()) {
                return std::unexpected(make_error(ErrorCode::InvalidConfig,
                    "Invalid wildcard allowlist pattern", line));
            }
            if (std::ranges::find(set.wildcard_suffixes, suffix) == set.wildcard_suffixes.end()) {
                set.wildcard_suffixes.push_back(std::move(suffix));
            }
            continue;
        }

        auto host = normalize_hostname(line);
        if (host.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "Invalid allowlist pattern", line));
        }
        set.exact.insert(std::move(host));
    }

    return set;
}

auto DomainAllowlist::from_patterns(const std::vector<std::string>& lines)
    -> Result<std::shared_ptr<DomainAllowlist>> {
    auto parsed = parse(lines);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return std::make_shared<DomainAllowlist>(std::move(*parsed));
}

auto DomainAllowlist::snapshot() const -> std::shared_ptr<const AllowlistPatternSet> {
    std::lock_guard lock(mutex_);
    return patterns_;
}

auto DomainAllowlist::is_allowed(std::string_view hostname) const -> bool {
    auto host = normalize_hostname(hostname);
    if (host.empty()) {
        return false;
    }

    auto set = snapshot();
    if (set->exact.contains(host)) {
        return true;
    }

    for (const auto& suffix : set->wildcard_suffixes) {
        // Requires at least one extra label in front of the suffix.
        if (host.size() > suffix.size() + 1 &&
            host.ends_with(suffix) &&
            host[host.size() - suffix.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

void DomainAllowlist::replace(AllowlistPatternSet patterns) {
    auto next = std::make_shared<const AllowlistPatternSet>(std::move(patterns));
    std::lock_guard lock(mutex_);
    patterns_ = std::move(next);
}

auto DomainAllowlist::reload(const std::vector<std::string>& lines) -> Result<void> {
    auto parsed = parse(lines);
    if (!parsed) {
        LOG_WARN("Allowlist reload rejected, keeping current set: {}", parsed.error().what());
        return std::unexpected(parsed.error());
    }
    auto count = parsed->size();
    replace(std::move(*parsed));
    LOG_INFO("Allowlist reloaded ({} patterns)", count);
    return {};
}

auto DomainAllowlist::patterns() const -> std::vector<std::string> {
    auto set = snapshot();
    std::vector<std::string> out(set->exact.begin(), set->exact.end());
    for (const auto& suffix : set->wildcard_suffixes) {
        out.push_back("*." + suffix);
    }
    std::ranges::sort(out);
    return out;
}

} // namespace steenbok::infra
