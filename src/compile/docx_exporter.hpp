#pragma once

#include "compile/exporter.hpp"

#include <string>
#include <vector>

namespace folio::compile {

/**
 * Office Open XML word-processing package. Content Markdown becomes
 * paragraphs whose runs keep bold, italic, strikethrough, underline,
 * highlight and hyperlinks; '#' lines become Heading paragraphs.
 *
 * Parts: [Content_Types].xml, _rels/.rels, word/document.xml,
 * word/styles.xml, word/_rels/document.xml.rels, docProps/core.xml,
 * docProps/app.xml, plus word/footer1.xml with page numbers.
 */
class DocxExporter final : public Exporter {
public:
    [[nodiscard]] ExportFormat format() const override { return ExportFormat::Docx; }
    [[nodiscard]] Res<QByteArray> render(const CompileJob& job, ProgressReporter& progress) const override;
};

/**
 * The part paths DocxExporter writes for `settings`, in archive order.
 */
[[nodiscard]] std::vector<std::string> docx_part_names(const CompileSettings& settings);

} // namespace folio::compile
