#include "compile/plain_text_exporter.hpp"

#include "core/manuscript.hpp"
#include "text/markdown_bridge.hpp"

#include <QString>

namespace folio::compile {

namespace {

std::string upper(const std::string& text) {
    return QString::fromStdString(text).toUpper().toStdString();
}

std::string underline(const std::string& text, char c) {
    return std::string(count_characters(text), c);
}

std::string separator_text(DocumentSeparator separator) {
    switch (separator) {
        case DocumentSeparator::None: return "\n\n";
        case DocumentSeparator::BlankLine: return "\n\n\n";
        case DocumentSeparator::ThreeAsterisks: return "\n\n* * *\n\n";
        case DocumentSeparator::PageBreak: return "\n\n" + std::string(40, '-') + "\n\n";
        case DocumentSeparator::ChapterHeading: return "\n\n";
    }
    return "\n\n";
}

} // namespace

Res<QByteArray> PlainTextExporter::render(const CompileJob& job, ProgressReporter& progress) const {
    const auto& settings = job.settings;
    std::string out;

    out += upper(job.title) + "\n" + underline(job.title, '=') + "\n\n";
    if (!job.author.empty()) {
        out += "by " + job.author + "\n\n";
    }

    if (settings.include_table_of_contents) {
        out += "TABLE OF CONTENTS\n-----------------\n\n";
        for (const auto& doc : job.documents) {
            out += std::string(static_cast<size_t>(doc.depth) * 2, ' ') + "• " + doc.title + "\n";
        }
        out += "\n" + std::string(40, '-') + "\n\n";
    }

    const size_t n = job.documents.size();
    for (size_t i = 0; i < n; ++i) {
        const auto& doc = job.documents[i];
        report_document(progress, i, n, doc.title);

        if (settings.include_chapter_titles && !doc.title.empty()) {
            out += upper(doc.title) + "\n" + underline(doc.title, '-') + "\n\n";
        }
        const auto content = text::strip_markdown(doc.content);
        if (!content.empty()) {
            out += content + "\n";
        }
        if (i + 1 < n) {
            out += separator_text(settings.separator);
        }
    }
    return Res<QByteArray>::ok(to_bytes(out));
}

} // namespace folio::compile
