#pragma once

#include "text/rich_text.hpp"

#include <string>
#include <string_view>

namespace folio::text {

struct MarkdownOptions {
    // Markdown has no underline; emit <u>..</u> only when the consumer renders HTML.
    bool html_underline = false;
};

/**
 * Runs -> Markdown.
 *
 * Markers wrap the trimmed text of each run so that surrounding
 * whitespace stays outside them; whitespace-only runs are copied through.
 * A linked run becomes [text](url) and nothing else. Lines whose text is
 * all heading-styled become '#' lines. Literal characters that could
 * read back as markup are backslash-escaped. The result is passed through
 * cleanup_markdown().
 */
[[nodiscard]] std::string runs_to_markdown(const RunList& runs, const MarkdownOptions& options = {});

/**
 * Markdown -> runs.
 *
 * Per line, links are claimed first, then bold-italic, bold, italic,
 * strikethrough and highlight spans. A candidate that overlaps an already
 * claimed span is discarded, so markers never nest. A backslash before a
 * marker character, '[', ']', '#' or another backslash makes it literal. '#', '##' and '###' prefixes
 * turn the rest of the line into a bold heading run. Everything else
 * carries `base`.
 */
[[nodiscard]] RunList markdown_to_runs(std::string_view markdown, const TextAttributes& base = {});

/**
 * Normalises emitted Markdown:
 *  - CRLF and CR become LF
 *  - empty marker pairs (****, ~~~~, ====) are removed, which also joins
 *    **a****b** into **ab**
 *  - identical markers separated only by spaces are joined: **a** **b** -> **a b**
 *  - trailing spaces and tabs are stripped from every line
 *  - three or more consecutive newlines become two
 *  - leading newlines and trailing whitespace are removed
 *
 * Backslash-escaped characters never count as markers.
 *
 * Steps repeat until nothing changes, so cleanup_markdown(cleanup_markdown(s))
 * == cleanup_markdown(s).
 */
[[nodiscard]] std::string cleanup_markdown(std::string_view markdown);

/**
 * Markdown with formatting syntax removed, for plain-text output.
 */
[[nodiscard]] std::string strip_markdown(std::string_view markdown);

} // namespace folio::text
