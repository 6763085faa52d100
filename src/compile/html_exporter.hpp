#pragma once

#include "compile/exporter.hpp"

namespace folio::compile {

/**
 * A standalone HTML page: title and author block followed by the compiled
 * Markdown rendered through cmark.
 */
[[nodiscard]] std::string compile_html(const CompileJob& job, ProgressReporter& progress);

[[nodiscard]] std::string css_font_stack(FontStyle style);

class HtmlExporter final : public Exporter {
public:
    [[nodiscard]] ExportFormat format() const override { return ExportFormat::Html; }
    [[nodiscard]] Res<QByteArray> render(const CompileJob& job, ProgressReporter& progress) const override;
};

} // namespace folio::compile
