#pragma once

#include "compile/exporter.hpp"

namespace folio::compile {

/**
 * Which wrapper parts compile_markdown() writes around the documents.
 * HTML and PDF output add their own title block.
 */
struct MarkdownLayout {
    bool front_matter = true;
    bool title_block = true;
};

/**
 * Document headings start at "##" (depth 0) and are capped at "######".
 * The YAML front matter carries title, author and date when
 * include_front_matter is set.
 */
[[nodiscard]] std::string compile_markdown(const CompileJob& job, ProgressReporter& progress,
                                           MarkdownLayout layout = {});

/**
 * "Chapter One: Start!" -> "chapter-one-start"
 */
[[nodiscard]] std::string heading_anchor(std::string_view title);

class MarkdownExporter final : public Exporter {
public:
    [[nodiscard]] ExportFormat format() const override { return ExportFormat::Markdown; }
    [[nodiscard]] Res<QByteArray> render(const CompileJob& job, ProgressReporter& progress) const override;
};

} // namespace folio::compile
