#pragma once

#include "compile/exporter.hpp"

namespace folio::compile {

/**
 * Single-column PDF laid out with QTextDocument and painted onto a
 * QPdfWriter page by page. Needs a QGuiApplication for fonts.
 *
 * Fails with PdfGenerationFailed when the writer cannot be opened or
 * produces no output.
 */
class PdfExporter final : public Exporter {
public:
    [[nodiscard]] ExportFormat format() const override { return ExportFormat::Pdf; }
    [[nodiscard]] Res<QByteArray> render(const CompileJob& job, ProgressReporter& progress) const override;
};

/**
 * The HTML handed to QTextDocument. Page breaks are CSS
 * page-break-before.
 */
[[nodiscard]] std::string pdf_source_html(const CompileJob& job, ProgressReporter& progress);

} // namespace folio::compile
