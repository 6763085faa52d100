#pragma once

#include <string>
#include <string_view>

namespace folio::compile {

enum class HtmlFlavor {
    Web,        // <del>, <mark>
    QtRichText, // <s>, background-colour span; QTextDocument has no <mark>
};

/**
 * CommonMark -> HTML through cmark's document tree. Raw HTML in the input
 * is not passed through. Void elements are written self-closed, so the
 * output also serves as XHTML body content.
 *
 * ~~x~~ and ==x== inside a single text node become strikethrough and
 * highlight elements. Backslash-escaped tildes and equals signs stay
 * literal.
 */
[[nodiscard]] std::string render_markdown_html(std::string_view markdown, HtmlFlavor flavor = HtmlFlavor::Web);

} // namespace folio::compile
