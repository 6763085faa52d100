#pragma once

#include "compile/text_import.hpp"
#include "text/rich_text.hpp"

#include <QString>

namespace folio::compile {

struct HtmlRuns {
    text::RunList runs;
    std::string title;     // <title>, empty when absent
    size_t dropped_objects{0};
};

/**
 * Lays `html` out in a QTextDocument and walks its blocks and fragments.
 * Blocks are separated by a blank line; line breaks inside a block stay
 * single newlines. Bold, italic, strikethrough, underline, background
 * colour and anchors carry over; h1..h3 give heading levels and deeper
 * headings are capped at 3. Images and other embedded objects are dropped
 * and counted.
 */
[[nodiscard]] HtmlRuns html_to_runs(const QString& html);

/**
 * Reads a .html or .htm file into a one-document manuscript whose content
 * is Markdown. The title is the <title> element, then the file name.
 * Needs a QGuiApplication.
 */
[[nodiscard]] Res<TextImport> import_html_file(const QString& path);

} // namespace folio::compile
