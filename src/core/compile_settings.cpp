#include "core/compile_settings.hpp"

#include <algorithm>
#include <cctype>

namespace folio {

namespace {

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void flatten(const Folder& folder, int depth, const std::string& parent_title,
             std::vector<CompilableDocument>& out) {
    for (const auto* doc : sorted_documents(folder)) {
        if (!doc->include_in_compile) continue;
        out.push_back(CompilableDocument{
            .id = doc->id,
            .title = doc->title,
            .content = doc->content,
            .order = doc->order,
            .depth = depth,
            .parent_title = parent_title,
        });
    }
    for (const auto* sub : sorted_subfolders(folder)) {
        flatten(*sub, depth + 1, sub->title, out);
    }
}

} // namespace

std::string_view format_display_name(ExportFormat format) noexcept {
    switch (format) {
        case ExportFormat::Pdf: return "PDF";
        case ExportFormat::Docx: return "Word";
        case ExportFormat::Epub: return "EPUB";
        case ExportFormat::Markdown: return "Markdown";
        case ExportFormat::PlainText: return "Plain Text";
        case ExportFormat::Html: return "HTML";
    }
    return "PDF";
}

std::string_view file_extension(ExportFormat format) noexcept {
    switch (format) {
        case ExportFormat::Pdf: return "pdf";
        case ExportFormat::Docx: return "docx";
        case ExportFormat::Epub: return "epub";
        case ExportFormat::Markdown: return "md";
        case ExportFormat::PlainText: return "txt";
        case ExportFormat::Html: return "html";
    }
    return "pdf";
}

std::string_view mime_type(ExportFormat format) noexcept {
    switch (format) {
        case ExportFormat::Pdf: return "application/pdf";
        case ExportFormat::Docx: return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
        case ExportFormat::Epub: return "application/epub+zip";
        case ExportFormat::Markdown: return "text/markdown";
        case ExportFormat::PlainText: return "text/plain";
        case ExportFormat::Html: return "text/html";
    }
    return "application/octet-stream";
}

std::optional<ExportFormat> parse_export_format(std::string_view name) {
    const auto n = lowercase(name);
    if (n == "pdf") return ExportFormat::Pdf;
    if (n == "docx" || n == "word") return ExportFormat::Docx;
    if (n == "epub") return ExportFormat::Epub;
    if (n == "md" || n == "markdown") return ExportFormat::Markdown;
    if (n == "txt" || n == "text" || n == "plain text" || n == "plaintext") return ExportFormat::PlainText;
    if (n == "html" || n == "htm") return ExportFormat::Html;
    return std::nullopt;
}

std::string_view font_family(FontStyle style) noexcept {
    switch (style) {
        case FontStyle::Serif: return "Georgia";
        case FontStyle::SansSerif: return "Helvetica Neue";
        case FontStyle::Monospace: return "Menlo";
    }
    return "Georgia";
}

std::string_view markdown_separator(DocumentSeparator separator) noexcept {
    switch (separator) {
        case DocumentSeparator::None: return "";
        case DocumentSeparator::BlankLine: return "\n\n";
        case DocumentSeparator::ThreeAsterisks: return "\n\n***\n\n";
        case DocumentSeparator::PageBreak: return "\n\n---\n\n";
        case DocumentSeparator::ChapterHeading: return "";
    }
    return "";
}

std::vector<CompilableDocument> collect_compilable_documents(const Folder& folder) {
    std::vector<CompilableDocument> out;
    flatten(folder, 0, folder.title, out);
    return out;
}

CompileStatistics compute_statistics(const std::vector<CompilableDocument>& documents) {
    CompileStatistics stats;
    stats.document_count = documents.size();
    for (const auto& doc : documents) {
        stats.word_count += doc.word_count();
        stats.character_count += count_characters(doc.content);
    }
    stats.estimated_pages = (stats.word_count + 249) / 250;
    return stats;
}

std::string compile_filename(std::string_view title, ExportFormat format) {
    return slugify(title) + "." + std::string(file_extension(format));
}

} // namespace folio
