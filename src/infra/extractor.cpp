#include "steenbok/infra/extractor.hpp"
#include "steenbok/infra/content_gate.hpp"
#include "steenbok/core/logger.hpp"
#include "steenbok/core/utils.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>

namespace steenbok::infra {

namespace {

// Elements whose content is never reader-visible text.
constexpr std::array<std::string_view, 5> kSkippedElements = {
    "script", "style", "noscript", "template", "svg",
};

constexpr std::array<std::string_view, 24> kBlockElements = {
    "br", "p", "div", "li", "ul", "ol", "tr", "td", "th", "table",
    "h1", "h2", "h3", "h4", "h5", "h6", "section", "article", "header",
    "footer", "blockquote", "pre", "hr", "title",
};

// Elements without a closing tag.
constexpr std::array<std::string_view, 13> kVoidElements = {
    "area", "base", "br", "col", "embed", "hr", "img", "input", "link",
    "meta", "source", "track", "wbr",
};

template <size_t N>
auto contains(const std::array<std::string_view, N>& names, std::string_view name) -> bool {
    for (auto n : names) {
        if (n == name) return true;
    }
    return false;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD;
    }
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/// True when `key:0` occurs in `style` with nothing numeric after the zero.
auto has_zero_property(std::string_view style, std::string_view key) -> bool {
    size_t pos = 0;
    while ((pos = style.find(key, pos)) != std::string_view::npos) {
        pos += key.size();
        if (pos < style.size() && style[pos] == '0') {
            auto next = pos + 1;
            if (next >= style.size() ||
                !(std::isdigit(static_cast<unsigned char>(style[next])) || style[next] == '.')) {
                return true;
            }
        }
    }
    return false;
}

auto is_hidden_attribute(std::string_view name, std::string_view value) -> bool {
    if (name == "hidden") {
        return true;
    }
    if (name == "aria-hidden") {
        return utils::trim(value) == "true";
    }
    if (name == "class") {
        for (const auto& token : utils::split(value, ' ')) {
            if (utils::trim(token) == "sr-only") return true;
        }
        return false;
    }
    if (name == "style") {
        std::string compact;
        for (char c : value) {
            if (!is_space(c)) compact += c;
        }
        return compact.find("display:none") != std::string::npos ||
               compact.find("visibility:hidden") != std::string::npos ||
               has_zero_property(compact, "opacity:") ||
               has_zero_property(compact, "font-size:");
    }
    return false;
}

/// Position just past the tag closing the element `name` opened before
/// `from`, counting nested elements of the same name; npos when unclosed.
auto skip_element(std::string_view lower, std::string_view name, size_t from) -> size_t {
    int depth = 1;
    size_t pos = from;
    while (true) {
        auto lt = lower.find('<', pos);
        if (lt == std::string_view::npos) {
            return std::string_view::npos;
        }
        bool closing = lt + 1 < lower.size() && lower[lt + 1] == '/';
        size_t name_at = lt + (closing ? 2 : 1);
        size_t name_end = name_at + name.size();
        bool same_name = lower.compare(name_at, name.size(), name) == 0 &&
            (name_end >= lower.size() ||
             !std::isalnum(static_cast<unsigned char>(lower[name_end])));
        if (!same_name) {
            pos = lt + 1;
            continue;
        }
        auto gt = lower.find('>', name_end);
        if (gt == std::string_view::npos) {
            return std::string_view::npos;
        }
        if (closing) {
            if (--depth == 0) return gt + 1;
        } else if (lower[gt - 1] != '/') {
            ++depth;
        }
        pos = gt + 1;
    }
}

/// Collapses whitespace runs to one space per line and drops empty lines.
auto collapse_whitespace(std::string_view text) -> std::string {
    std::string out;
    std::string line;
    bool pending_space = false;

    auto flush_line = [&]() {
        if (!line.empty()) {
            if (!out.empty()) out += '\n';
            out += line;
        }
        line.clear();
        pending_space = false;
    };

    for (char c : text) {
        if (c == '\n') {
            flush_line();
        } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
            pending_space = !line.empty();
        } else {
            if (pending_space) {
                line += ' ';
                pending_space = false;
            }
            line += c;
        }
    }
    flush_line();
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Hidden markers
// ---------------------------------------------------------------------------

auto HtmlTextExtractor::is_hidden_tag(std::string_view attributes) -> bool {
    const size_t n = attributes.size();
    size_t i = 0;
    while (i < n) {
        while (i < n && (is_space(attributes[i]) || attributes[i] == '/')) ++i;

        size_t name_start = i;
        while (i < n && !is_space(attributes[i]) && attributes[i] != '=' &&
               attributes[i] != '/' && attributes[i] != '>') {
            ++i;
        }
        auto name = attributes.substr(name_start, i - name_start);
        if (name.empty()) {
            ++i;
            continue;
        }

        while (i < n && is_space(attributes[i])) ++i;
        std::string_view value;
        if (i < n && attributes[i] == '=') {
            ++i;
            while (i < n && is_space(attributes[i])) ++i;
            if (i < n && (attributes[i] == '"' || attributes[i] == '\'')) {
                auto quote = attributes[i];
                auto close = attributes.find(quote, i + 1);
                if (close == std::string_view::npos) close = n;
                value = attributes.substr(i + 1, close - i - 1);
                i = close + 1;
            } else {
                size_t value_start = i;
                while (i < n && !is_space(attributes[i]) && attributes[i] != '>') ++i;
                value = attributes.substr(value_start, i - value_start);
            }
        }

        if (is_hidden_attribute(name, value)) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// Entities
// ---------------------------------------------------------------------------

auto HtmlTextExtractor::decode_entities(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            out += text[i++];
            continue;
        }
        auto semi = text.find(';', i + 1);
        if (semi == std::string_view::npos || semi - i > 10) {
            out += text[i++];
            continue;
        }
        auto name = text.substr(i + 1, semi - i - 1);

        if (!name.empty() && name.front() == '#') {
            auto digits = name.substr(1);
            int base = 10;
            if (!digits.empty() && (digits.front() == 'x' || digits.front() == 'X')) {
                digits.remove_prefix(1);
                base = 16;
            }
            uint32_t cp = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), cp, base);
            if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
                out += text[i++];
                continue;
            }
            append_utf8(out, cp);
        } else if (name == "amp") {
            out += '&';
        } else if (name == "lt") {
            out += '<';
        } else if (name == "gt") {
            out += '>';
        } else if (name == "quot") {
            out += '"';
        } else if (name == "apos") {
            out += '\'';
        } else if (name == "nbsp") {
            out += ' ';
        } else {
            out += text[i++];
            continue;
        }
        i = semi + 1;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Markup
// ---------------------------------------------------------------------------

auto HtmlTextExtractor::html_to_text(std::string_view html) -> std::string {
    auto lower = utils::to_lower(html);
    const size_t n = html.size();

    std::string text;
    text.reserve(n / 2);

    size_t i = 0;
    while (i < n) {
        if (html[i] != '<') {
            text += html[i++];
            continue;
        }

        if (lower.compare(i, 4, "<!--") == 0) {
            auto end = lower.find("-->", i + 4);
            i = end == std::string::npos ? n : end + 3;
            continue;
        }

        size_t j = i + 1;
        bool closing = false;
        if (j < n && html[j] == '/') {
            closing = true;
            ++j;
        }
        size_t name_start = j;
        while (j < n && std::isalnum(static_cast<unsigned char>(lower[j]))) {
            ++j;
        }
        auto name = std::string_view(lower).substr(name_start, j - name_start);

        bool declaration = !closing && j < n && (lower[j] == '!' || lower[j] == '?');
        if (name.empty() && !declaration) {
            // A bare '<' in text.
            text += html[i++];
            continue;
        }

        auto gt = lower.find('>', j);
        if (gt == std::string::npos) {
            break;
        }

        if (!closing && contains(kSkippedElements, name)) {
            auto close = lower.find("</" + std::string(name), gt + 1);
            if (close == std::string::npos) {
                break;
            }
            auto close_gt = lower.find('>', close);
            i = close_gt == std::string::npos ? n : close_gt + 1;
            continue;
        }

        if (!closing && !name.empty() && is_hidden_tag(std::string_view(lower).substr(j, gt - j))) {
            bool self_closing = lower[gt - 1] == '/';
            if (self_closing || contains(kVoidElements, name)) {
                i = gt + 1;
                continue;
            }
            auto end = skip_element(lower, name, gt + 1);
            // An unclosed hidden element only loses its own tag.
            i = end == std::string_view::npos ? gt + 1 : end;
            continue;
        }

        if (contains(kBlockElements, name)) {
            text += '\n';
        }
        i = gt + 1;
    }

    return collapse_whitespace(decode_entities(text));
}

auto HtmlTextExtractor::extract(std::string_view bytes, std::string_view content_type,
                                std::string_view url) const -> Result<std::string> {
    auto media = ContentGate::media_type(content_type);

    std::string text;
    if (media == "text/plain") {
        text = utils::trim(bytes);
    } else if (media == "text/html" || media == "application/xhtml+xml" || media.empty()) {
        text = html_to_text(bytes);
    } else {
        return std::unexpected(make_error(ErrorCode::ExtractionFailed,
            "Unsupported content type for extraction", media));
    }

    if (text.empty()) {
        return std::unexpected(make_error(ErrorCode::ExtractionFailed,
            "No text content", std::string(url)));
    }

    LOG_DEBUG("Extracted {} chars from {} ({} bytes)", text.size(), url, bytes.size());
    return text;
}

} // namespace steenbok::infra
