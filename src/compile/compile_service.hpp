#pragma once

#include "compile/exporter.hpp"
#include "core/compile_settings.hpp"
#include "core/manuscript.hpp"

#include <QByteArray>

#include <string>

namespace folio::compile {

struct CompileOutput {
    QByteArray data;
    std::string filename;
    CompileStatistics statistics;
};

/**
 * Override when set and non-empty, otherwise the manuscript title, otherwise
 * "Untitled".
 */
[[nodiscard]] std::string resolve_title(const Manuscript& manuscript, const CompileSettings& settings);
[[nodiscard]] std::string resolve_author(const Manuscript& manuscript, const CompileSettings& settings);

[[nodiscard]] CompileJob make_compile_job(const Manuscript& manuscript, const CompileSettings& settings);

/**
 * Compiles the draft folder into settings.format. Fails with NoDocuments
 * when no document is marked for compilation.
 */
[[nodiscard]] Res<CompileOutput> compile_manuscript(const Manuscript& manuscript,
                                                    const CompileSettings& settings,
                                                    ProgressCallback progress = {});

} // namespace folio::compile
