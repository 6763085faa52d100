#pragma once

#include "core/manuscript.hpp"
#include "core/operation.hpp"
#include "core/result.hpp"

#include <QString>

#include <optional>
#include <string>
#include <string_view>

namespace folio::compile {

struct TextImport {
    Manuscript manuscript;
    OperationReport report;
};

/**
 * Splits off a leading "---" YAML block and returns its `title:` value,
 * unquoted. `body` receives the text after the block.
 */
[[nodiscard]] std::optional<std::string> take_front_matter_title(std::string_view text, std::string& body);

/**
 * A manuscript whose draft holds one document titled like the manuscript.
 */
[[nodiscard]] Manuscript single_document_manuscript(const std::string& title, std::string content);

/**
 * A one-document manuscript. The title is the front matter title, then
 * (Markdown only) the first '#' heading, which is removed from the
 * content, then `fallback_title`.
 */
[[nodiscard]] Manuscript manuscript_from_text(std::string_view text, const std::string& fallback_title, bool markdown);

/**
 * Reads a .md, .markdown or .txt file. Bytes that are not UTF-8 are read as
 * Windows-1252 with an info warning.
 */
[[nodiscard]] Res<TextImport> import_text_file(const QString& path);

[[nodiscard]] bool is_text_import_path(const QString& path);

} // namespace folio::compile
