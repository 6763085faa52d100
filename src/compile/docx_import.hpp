#pragma once

#include "compile/text_import.hpp"
#include "text/rich_text.hpp"

#include <QByteArray>
#include <QString>

#include <map>

namespace folio::compile {

/**
 * Relationship Id -> Target from a .rels part. Used to resolve the r:id
 * of w:hyperlink elements.
 */
[[nodiscard]] std::map<QString, QString> parse_docx_relationships(const QByteArray& rels_xml);

/**
 * Runs for the body of word/document.xml.
 *
 * Each non-empty w:p becomes one block, and blocks are separated by a
 * blank line. w:br and w:cr are line breaks, w:tab a tab. Run properties
 * w:b, w:i, w:strike, w:dstrike, w:u and w:highlight map to the matching
 * attributes unless their w:val switches them off. HeadingN and Title
 * paragraph styles give heading levels, capped at 3. Hyperlinks are
 * resolved through `links`; anchors inside the document are dropped.
 *
 * Fails with XmlParsingFailed on malformed XML.
 */
[[nodiscard]] Res<text::RunList> docx_document_runs(const QByteArray& document_xml,
                                                    const std::map<QString, QString>& links = {});

/**
 * dc:title from docProps/core.xml, empty when absent.
 */
[[nodiscard]] std::string docx_core_title(const QByteArray& core_xml);

/**
 * Reads a .docx package into a one-document manuscript whose content is
 * Markdown. The title is the core properties title, then the file name.
 */
[[nodiscard]] Res<TextImport> import_docx_file(const QString& path);

} // namespace folio::compile
