#include "compile/pdf_exporter.hpp"

#include "compile/cmark_html.hpp"
#include "text/xml_escape.hpp"
#include "util/log_categories.hpp"

#include <QAbstractTextDocumentLayout>
#include <QBuffer>
#include <QFont>
#include <QFontMetricsF>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QTextDocument>

#include <algorithm>
#include <cmath>

namespace folio::compile {

namespace {

using text::escape_xml;

constexpr const char* kPageBreak = "<div style=\"page-break-before: always\"></div>\n";

Error pdf_error(const std::string& detail) {
    return make_error(ErrorCode::PdfGenerationFailed, detail);
}

std::string separator_html(DocumentSeparator separator) {
    switch (separator) {
        case DocumentSeparator::None: return {};
        case DocumentSeparator::BlankLine: return "<p>&#160;</p>\n";
        case DocumentSeparator::ThreeAsterisks: return "<p align=\"center\">* * *</p>\n";
        case DocumentSeparator::PageBreak:
        case DocumentSeparator::ChapterHeading: return kPageBreak;
    }
    return {};
}

} // namespace

std::string pdf_source_html(const CompileJob& job, ProgressReporter& progress) {
    const auto& settings = job.settings;
    std::string html = "<html><body>\n";

    if (settings.include_title_page) {
        html += "<p>&#160;</p><p>&#160;</p><p>&#160;</p>\n";
        html += "<h1 align=\"center\">" + escape_xml(job.title) + "</h1>\n";
        if (!job.author.empty()) {
            html += "<p align=\"center\"><i>by " + escape_xml(job.author) + "</i></p>\n";
        }
        if (settings.include_table_of_contents || !job.documents.empty()) html += kPageBreak;
    }

    if (settings.include_table_of_contents) {
        html += "<h1>Table of Contents</h1>\n";
        for (const auto& doc : job.documents) {
            html += "<p style=\"margin-left: " + std::to_string(doc.depth * 20) + "px\">" + escape_xml(doc.title) + "</p>\n";
        }
        if (!job.documents.empty()) html += kPageBreak;
    }

    const size_t n = job.documents.size();
    for (size_t i = 0; i < n; ++i) {
        const auto& doc = job.documents[i];
        report_document(progress, i, n, doc.title);
        if (settings.include_chapter_titles && !doc.title.empty()) {
            const char* tag = doc.depth == 0 ? "h1" : "h2";
            html += std::string("<") + tag + ">" + escape_xml(doc.title) + "</" + tag + ">\n";
        }
        html += render_markdown_html(doc.content, HtmlFlavor::QtRichText);
        if (i + 1 < n) html += separator_html(settings.separator);
    }
    html += "</body></html>\n";
    return html;
}

Res<QByteArray> PdfExporter::render(const CompileJob& job, ProgressReporter& progress) const {
    const auto& settings = job.settings;

    QByteArray out;
    QBuffer buffer(&out);
    if (!buffer.open(QIODevice::WriteOnly)) {
        return Res<QByteArray>::err(pdf_error("cannot open output buffer"));
    }

    QPdfWriter writer(&buffer);
    writer.setTitle(QString::fromStdString(job.title));
    writer.setCreator(QStringLiteral("Folio"));
    const QPageSize page_size(QSizeF(settings.page_size.width, settings.page_size.height), QPageSize::Point,
                              QString(), QPageSize::ExactMatch);
    const QMarginsF margins(settings.margins.left, settings.margins.top, settings.margins.right, settings.margins.bottom);
    if (!writer.setPageLayout(QPageLayout(page_size, QPageLayout::Portrait, margins, QPageLayout::Point))) {
        return Res<QByteArray>::err(pdf_error("page layout rejected"));
    }

    QTextDocument doc;
    doc.documentLayout()->setPaintDevice(&writer);
    QFont font(QString::fromUtf8(font_family(settings.font_style).data()));
    font.setPointSizeF(settings.font_size);
    doc.setDefaultFont(font);
    const int line_percent = static_cast<int>(std::lround(settings.line_spacing * 100));
    doc.setDefaultStyleSheet(QStringLiteral("p { line-height: %1%; }").arg(line_percent));
    doc.setHtml(QString::fromStdString(pdf_source_html(job, progress)));

    const QRectF paint_rect = writer.pageLayout().paintRectPixels(writer.resolution());
    QFont footer_font(font);
    footer_font.setPointSizeF(settings.font_size * 0.8);
    const double footer_height = settings.include_page_numbers ? QFontMetricsF(footer_font, &writer).height() * 2 : 0.0;
    const QSizeF body(paint_rect.width(), paint_rect.height() - footer_height);
    doc.setPageSize(body);

    progress.stage(PipelineStage::Finalizing, 0.9, "Rendering pages");
    QPainter painter;
    if (!painter.begin(&writer)) {
        return Res<QByteArray>::err(pdf_error("cannot start painting"));
    }

    const int pages = std::max(1, doc.pageCount());
    for (int page = 0; page < pages; ++page) {
        if (page > 0 && !writer.newPage()) {
            painter.end();
            return Res<QByteArray>::err(pdf_error("cannot start page " + std::to_string(page + 1)));
        }
        painter.save();
        painter.translate(0, -page * body.height());
        doc.drawContents(&painter, QRectF(QPointF(0, page * body.height()), body));
        painter.restore();

        if (settings.include_page_numbers) {
            painter.setFont(footer_font);
            painter.drawText(QRectF(0, body.height(), body.width(), footer_height), Qt::AlignCenter,
                             QString::number(page + 1));
        }
    }
    painter.end();
    buffer.close();

    if (out.isEmpty()) {
        return Res<QByteArray>::err(pdf_error("writer produced no output"));
    }
    qCDebug(folioCompileLog) << "PDF:" << pages << "pages," << out.size() << "bytes";
    return Res<QByteArray>::ok(std::move(out));
}

} // namespace folio::compile
