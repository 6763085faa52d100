#pragma once

#include "archive/zip_writer.hpp"
#include "core/manuscript.hpp"
#include "core/operation.hpp"
#include "core/result.hpp"
#include "scrivener/binder_xml_writer.hpp"

#include <QString>

#include <future>

namespace folio::scrivener {

/**
 * Scrivener 3 format number written to Files/version.txt.
 */
constexpr const char* kBundleFormatVersion = "16";

struct ExportResult {
    QString path;
    OperationReport report;
};

/**
 * Clears label and status references that point at nothing, one warning
 * per cleared reference. A folder or document whose id was already seen
 * gets a fresh id, also with a warning. Run before the mappings are built
 * so the writer never meets an unmapped or shared id.
 */
void sanitize_references(Manuscript& manuscript, OperationReport& report);

/**
 * Writes `manuscript` as a Scrivener 3 bundle at `destination`
 * (".../Name.scriv"). The bundle is built in a staging directory beside
 * the destination and renamed into place. An existing bundle at the
 * destination is moved aside, replaced, then deleted; if the new bundle
 * cannot be moved in, the old one is put back. Any other existing path is
 * InvalidDestination.
 */
[[nodiscard]] Res<ExportResult> export_scrivener(const Manuscript& manuscript,
                                                 const QString& destination,
                                                 ProgressCallback progress = {},
                                                 CancellationToken cancel = {},
                                                 const BinderWriterOptions& options = {});

/**
 * Packs the files below `bundle_dir` into a ZIP with entries named
 * "<bundle dir name>/<relative path>", sorted.
 */
[[nodiscard]] Res<archive::Bytes> package_bundle(const QString& bundle_dir, Timestamp modified = Timestamp::now());

/**
 * Exports into a temporary bundle and writes it to `zip_path` as a ZIP.
 */
[[nodiscard]] Res<ExportResult> export_scrivener_zip(const Manuscript& manuscript,
                                                     const QString& zip_path,
                                                     ProgressCallback progress = {},
                                                     CancellationToken cancel = {},
                                                     const BinderWriterOptions& options = {});

[[nodiscard]] std::future<Res<ExportResult>> export_scrivener_async(Manuscript manuscript,
                                                                    QString destination,
                                                                    ProgressCallback progress = {},
                                                                    CancellationToken cancel = {});

} // namespace folio::scrivener
