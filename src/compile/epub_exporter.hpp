#pragma once

#include "compile/exporter.hpp"

#include <string>
#include <vector>

namespace folio::compile {

/**
 * EPUB 3 with an EPUB 2 NCX for older readers.
 *
 * The "mimetype" entry comes first and is stored uncompressed. OEBPS holds
 * content.opf, toc.ncx, nav.xhtml, styles.css, then title.xhtml and
 * toc-page.xhtml when enabled, then chapter-001.xhtml onwards, one per
 * document.
 */
class EpubExporter final : public Exporter {
public:
    [[nodiscard]] ExportFormat format() const override { return ExportFormat::Epub; }
    [[nodiscard]] Res<QByteArray> render(const CompileJob& job, ProgressReporter& progress) const override;
};

/**
 * "chapter-007.xhtml" for index 6.
 */
[[nodiscard]] std::string chapter_file_name(size_t index);

} // namespace folio::compile
