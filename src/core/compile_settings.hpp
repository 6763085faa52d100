#pragma once

#include "core/manuscript.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

enum class ExportFormat {
    Pdf,
    Docx,
    Epub,
    Markdown,
    PlainText,
    Html,
};

[[nodiscard]] std::string_view format_display_name(ExportFormat format) noexcept;
[[nodiscard]] std::string_view file_extension(ExportFormat format) noexcept;
[[nodiscard]] std::string_view mime_type(ExportFormat format) noexcept;

/**
 * Accepts display names, extensions and lowercase ids ("docx", "Word", "txt", "text").
 */
[[nodiscard]] std::optional<ExportFormat> parse_export_format(std::string_view name);

enum class PageSizePreset {
    Letter,
    A4,
    Custom,
};

/**
 * Page dimensions in PostScript points.
 */
struct PageSize {
    PageSizePreset preset{PageSizePreset::Letter};
    double width{612};
    double height{792};

    [[nodiscard]] static PageSize letter() { return {PageSizePreset::Letter, 612, 792}; }
    [[nodiscard]] static PageSize a4() { return {PageSizePreset::A4, 595, 842}; }

    bool operator==(const PageSize&) const = default;
};

enum class FontStyle {
    Serif,
    SansSerif,
    Monospace,
};

[[nodiscard]] std::string_view font_family(FontStyle style) noexcept;

enum class DocumentSeparator {
    None,
    BlankLine,
    ThreeAsterisks,
    PageBreak,
    ChapterHeading,
};

/**
 * Text placed between documents in flat outputs. ChapterHeading is empty:
 * exporters emit a heading instead.
 */
[[nodiscard]] std::string_view markdown_separator(DocumentSeparator separator) noexcept;

struct Margins {
    double top{72};
    double left{72};
    double bottom{72};
    double right{72};

    bool operator==(const Margins&) const = default;
};

/**
 * Options consumed by every compile exporter.
 */
struct CompileSettings {
    std::optional<std::string> title_override;
    std::optional<std::string> author_override;
    bool include_front_matter{true};
    bool include_table_of_contents{false};
    DocumentSeparator separator{DocumentSeparator::ChapterHeading};

    PageSize page_size{PageSize::letter()};
    FontStyle font_style{FontStyle::Serif};
    double font_size{12};
    double line_spacing{1.5};
    Margins margins{};
    bool include_page_numbers{true};
    bool include_title_page{true};
    bool include_chapter_titles{true};

    ExportFormat format{ExportFormat::Pdf};

    bool operator==(const CompileSettings&) const = default;
};

/**
 * A document ready for compilation. Depth is 0 for documents directly in
 * the compiled folder, 1 for a subfolder, and so on.
 */
struct CompilableDocument {
    Uuid id;
    std::string title;
    std::string content;
    int order{0};
    int depth{0};
    std::string parent_title;

    [[nodiscard]] size_t word_count() const { return count_words(content); }
};

/**
 * Depth-first flattening: a folder's documents by order, then its
 * subfolders by order. Documents with include_in_compile == false are
 * dropped.
 */
[[nodiscard]] std::vector<CompilableDocument> collect_compilable_documents(const Folder& folder);

struct CompileStatistics {
    size_t document_count{0};
    size_t word_count{0};
    size_t character_count{0};
    size_t estimated_pages{0};  // 250 words per page, rounded up
};

[[nodiscard]] CompileStatistics compute_statistics(const std::vector<CompilableDocument>& documents);

/**
 * Output filename: slugified title plus the format extension.
 */
[[nodiscard]] std::string compile_filename(std::string_view title, ExportFormat format);

} // namespace folio
