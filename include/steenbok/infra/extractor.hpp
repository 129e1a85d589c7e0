#pragma once

#include <string>
#include <string_view>

#include "steenbok/core/error.hpp"

namespace steenbok::infra {

/// Turns accepted response bytes into plain text.
class TextExtractor {
public:
    virtual ~TextExtractor() = default;

    virtual auto extract(std::string_view bytes, std::string_view content_type,
                         std::string_view url) const -> Result<std::string> = 0;
};

/// HTML and plain-text extractor.
///
/// HTML is scanned once, left to right. Script, style, noscript, template
/// and svg elements, comments and elements hidden from readers are dropped
/// together with their nested content; remaining tags are stripped, entities
/// decoded and whitespace collapsed. Block-level tags become line breaks.
/// text/plain is returned trimmed.
class HtmlTextExtractor : public TextExtractor {
public:
    auto extract(std::string_view bytes, std::string_view content_type,
                 std::string_view url) const -> Result<std::string> override;

    /// True when a lowercased opening-tag attribute list marks the element
    /// hidden: `hidden`, `aria-hidden="true"`, class `sr-only`, or a style with
    /// display:none, visibility:hidden, zero opacity or zero font size.
    [[nodiscard]] static auto is_hidden_tag(std::string_view attributes) -> bool;

    /// Decodes named (amp, lt, gt, quot, apos, nbsp) and numeric entities.
    [[nodiscard]] static auto decode_entities(std::string_view text) -> std::string;

    [[nodiscard]] static auto html_to_text(std::string_view html) -> std::string;
};

} // namespace steenbok::infra
