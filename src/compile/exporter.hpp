#pragma once

#include "core/compile_settings.hpp"
#include "core/operation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>

#include <memory>
#include <string>
#include <vector>

namespace folio::compile {

/**
 * Everything an exporter needs: the flattened documents plus resolved
 * title and author.
 */
struct CompileJob {
    std::vector<CompilableDocument> documents;
    std::string title;
    std::string author;
    CompileSettings settings;
    Timestamp now = Timestamp::now();
};

class Exporter {
public:
    virtual ~Exporter() = default;

    [[nodiscard]] virtual ExportFormat format() const = 0;

    /**
     * Produces the output file. Progress runs from 0.1 to 0.9 across the
     * documents.
     */
    [[nodiscard]] virtual Res<QByteArray> render(const CompileJob& job, ProgressReporter& progress) const = 0;
};

[[nodiscard]] std::unique_ptr<Exporter> make_exporter(ExportFormat format);

// Shared by the exporters.
void report_document(ProgressReporter& progress, size_t index, size_t total, const std::string& title);
[[nodiscard]] QByteArray to_bytes(const std::string& text);

} // namespace folio::compile
