#include "compile/markdown_exporter.hpp"

#include <QDateTime>
#include <QTimeZone>

#include <algorithm>
#include <cctype>

namespace folio::compile {

namespace {

std::string escape_yaml(std::string_view text) {
    std::string out;
    for (char c : text) {
        if (c == '\\' || c == '"') out += '\\';
        out += c;
    }
    return out;
}

std::string trimmed(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::string utc_date(const Timestamp& ts) {
    return QDateTime::fromMSecsSinceEpoch(ts.millis(), QTimeZone::UTC).toString("yyyy-MM-dd").toStdString();
}

} // namespace

std::string heading_anchor(std::string_view title) {
    std::string out;
    for (unsigned char c : title) {
        if (c == ' ') {
            out += '-';
        } else if (c >= 0x80 || std::isalnum(c)) {
            out += static_cast<char>(c >= 0x80 ? c : std::tolower(c));
        } else if (c == '-') {
            out += '-';
        }
    }
    return out;
}

std::string compile_markdown(const CompileJob& job, ProgressReporter& progress, MarkdownLayout layout) {
    const auto& settings = job.settings;
    std::string md;

    if (layout.front_matter && settings.include_front_matter) {
        md += "---\n";
        md += "title: \"" + escape_yaml(job.title) + "\"\n";
        if (!job.author.empty()) {
            md += "author: \"" + escape_yaml(job.author) + "\"\n";
        }
        md += "date: \"" + utc_date(job.now) + "\"\n";
        md += "---\n\n";
    }

    if (layout.title_block) {
        md += "# " + job.title + "\n\n";
        if (!job.author.empty()) {
            md += "*by " + job.author + "*\n\n";
        }
    }

    if (settings.include_table_of_contents) {
        md += "## Table of Contents\n\n";
        for (const auto& doc : job.documents) {
            md += std::string(static_cast<size_t>(doc.depth) * 2, ' ');
            md += "- [" + doc.title + "](#" + heading_anchor(doc.title) + ")\n";
        }
        md += "\n---\n\n";
    }

    const size_t n = job.documents.size();
    for (size_t i = 0; i < n; ++i) {
        const auto& doc = job.documents[i];
        report_document(progress, i, n, doc.title);

        if (settings.include_chapter_titles && !doc.title.empty()) {
            const int level = std::min(doc.depth + 2, 6);
            md += std::string(static_cast<size_t>(level), '#') + " " + doc.title + "\n\n";
        }
        const auto content = trimmed(doc.content);
        if (!content.empty()) {
            md += content;
            md += '\n';
        }
        if (i + 1 < n) {
            md += markdown_separator(settings.separator);
            if (settings.separator == DocumentSeparator::ChapterHeading ||
                settings.separator == DocumentSeparator::None) {
                md += '\n';
            }
        }
    }
    return md;
}

Res<QByteArray> MarkdownExporter::render(const CompileJob& job, ProgressReporter& progress) const {
    return Res<QByteArray>::ok(to_bytes(compile_markdown(job, progress)));
}

} // namespace folio::compile
