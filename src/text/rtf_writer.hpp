#pragma once

#include "text/rich_text.hpp"

#include <string>
#include <string_view>

namespace folio::text {

struct RtfWriterOptions {
    std::string font_name = "Helvetica";
    double font_size = 12.0;
};

/**
 * Serialises runs as a Cocoa-flavoured RTF document that parse_rtf()
 * reads back to the same runs. Non-ASCII text is written as \uN escapes.
 */
[[nodiscard]] std::string write_rtf(const RunList& runs, const RtfWriterOptions& options = {});

/**
 * markdown_to_runs() followed by write_rtf().
 */
[[nodiscard]] std::string markdown_to_rtf(std::string_view markdown, const RtfWriterOptions& options = {});

/**
 * Escapes one piece of text for an RTF body.
 */
[[nodiscard]] std::string escape_rtf(std::string_view utf8);

} // namespace folio::text
