#include "compile/exporter.hpp"

#include "compile/docx_exporter.hpp"
#include "compile/epub_exporter.hpp"
#include "compile/html_exporter.hpp"
#include "compile/markdown_exporter.hpp"
#include "compile/pdf_exporter.hpp"
#include "compile/plain_text_exporter.hpp"

#include <algorithm>

namespace folio::compile {

std::unique_ptr<Exporter> make_exporter(ExportFormat format) {
    switch (format) {
        case ExportFormat::Pdf: return std::make_unique<PdfExporter>();
        case ExportFormat::Docx: return std::make_unique<DocxExporter>();
        case ExportFormat::Epub: return std::make_unique<EpubExporter>();
        case ExportFormat::Markdown: return std::make_unique<MarkdownExporter>();
        case ExportFormat::PlainText: return std::make_unique<PlainTextExporter>();
        case ExportFormat::Html: return std::make_unique<HtmlExporter>();
    }
    return nullptr;
}

void report_document(ProgressReporter& progress, size_t index, size_t total, const std::string& title) {
    const double done = static_cast<double>(index + 1) / static_cast<double>(std::max<size_t>(total, 1));
    progress.stage(PipelineStage::ConvertingContent, 0.1 + 0.8 * done, "Compiling " + title);
}

QByteArray to_bytes(const std::string& text) {
    return QByteArray(text.data(), static_cast<qsizetype>(text.size()));
}

} // namespace folio::compile
