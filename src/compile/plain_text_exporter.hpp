#pragma once

#include "compile/exporter.hpp"

namespace folio::compile {

/**
 * Title in capitals underlined with '=', document titles underlined with
 * '-', Markdown syntax stripped from the content.
 */
class PlainTextExporter final : public Exporter {
public:
    [[nodiscard]] ExportFormat format() const override { return ExportFormat::PlainText; }
    [[nodiscard]] Res<QByteArray> render(const CompileJob& job, ProgressReporter& progress) const override;
};

} // namespace folio::compile
