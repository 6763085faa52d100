#pragma once

#include "core/manuscript.hpp"
#include "core/operation.hpp"
#include "core/result.hpp"
#include "scrivener/binder_converter.hpp"
#include "scrivener/binder_model.hpp"
#include "scrivener/import_options.hpp"

#include <QString>

#include <future>
#include <optional>
#include <string>
#include <vector>

namespace folio::scrivener {

/**
 * Reads per-item files out of a .scriv directory.
 *
 * v2: Files/Docs/<id>.rtf, <id>_notes.rtf, <id>_synopsis.txt
 * v3: Files/Data/<UUID>/content.rtf, notes.rtf, synopsis.txt
 *
 * A v3 item without a UUID falls back to the v2 layout.
 */
class BundleContentSource final : public ContentSource {
public:
    BundleContentSource(QString bundle_path, FormatVersion version);

    [[nodiscard]] bool has_content(const BinderItem& item) const override;
    [[nodiscard]] std::optional<std::string> content(const BinderItem& item) const override;
    [[nodiscard]] std::optional<std::string> notes(const BinderItem& item) const override;
    [[nodiscard]] std::optional<std::string> synopsis(const BinderItem& item) const override;

private:
    enum class Part { Content, Notes, Synopsis };

    [[nodiscard]] QString path_for(const BinderItem& item, Part part) const;
    [[nodiscard]] std::optional<std::string> read(const BinderItem& item, Part part) const;

    QString bundle_;
    FormatVersion version_;
};

struct BundleValidation {
    QString manifest_path;
    std::string title;
    FormatVersion version{FormatVersion::V2};
    size_t item_count{0};
    bool has_media{false};
    std::vector<std::string> warnings;
};

constexpr size_t kLargeProjectItemCount = 500;

/**
 * project.scrivx when present, otherwise the first *.scrivx by name.
 */
[[nodiscard]] std::optional<QString> find_manifest(const QString& bundle_path);

/**
 * V3 when Files/Data exists, V2 otherwise.
 */
[[nodiscard]] FormatVersion detect_version(const QString& bundle_path);

/**
 * Checks a bundle without converting anything. Fails with NotADirectory,
 * MissingManifest, FileReadFailed or XmlParsingFailed.
 */
[[nodiscard]] Res<BundleValidation> validate_bundle(const QString& bundle_path);

struct ImportResult {
    Manuscript manuscript;
    OperationReport report;
};

/**
 * Imports a .scriv bundle: validate, parse the manifest, convert every
 * binder item, then read the writing history.
 */
[[nodiscard]] Res<ImportResult> import_scrivener(const QString& bundle_path,
                                                 const ImportOptions& options = {},
                                                 ProgressCallback progress = {},
                                                 CancellationToken cancel = {});

[[nodiscard]] std::future<Res<ImportResult>> import_scrivener_async(QString bundle_path,
                                                                    ImportOptions options = {},
                                                                    ProgressCallback progress = {},
                                                                    CancellationToken cancel = {});

} // namespace folio::scrivener
