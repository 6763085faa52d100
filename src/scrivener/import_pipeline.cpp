#include "scrivener/import_pipeline.hpp"

#include "scrivener/binder_xml_parser.hpp"
#include "scrivener/id_mapping.hpp"
#include "scrivener/writing_history.hpp"
#include "util/file_io.hpp"
#include "util/log_categories.hpp"

#include <QDir>
#include <QFileInfo>

#include <algorithm>

namespace folio::scrivener {

namespace {

Error cancelled_error() {
    return make_error(ErrorCode::Cancelled, "import cancelled");
}

std::string to_std(const QByteArray& bytes) {
    return std::string(bytes.constData(), static_cast<size_t>(bytes.size()));
}

} // namespace

// ============================================================================
// BundleContentSource
// ============================================================================

BundleContentSource::BundleContentSource(QString bundle_path, FormatVersion version)
    : bundle_(std::move(bundle_path)), version_(version) {}

QString BundleContentSource::path_for(const BinderItem& item, Part part) const {
    const QDir root(bundle_);
    if (version_ == FormatVersion::V3 && item.uuid) {
        QString dir = root.filePath("Files/Data/" + QString::fromStdString(item.uuid->to_upper_string()));
        if (!QFileInfo(dir).isDir()) {
            const QString lower = root.filePath("Files/Data/" + QString::fromStdString(item.uuid->to_string()));
            if (QFileInfo(lower).isDir()) dir = lower;
        }
        switch (part) {
            case Part::Content: return dir + "/content.rtf";
            case Part::Notes: return dir + "/notes.rtf";
            case Part::Synopsis: return dir + "/synopsis.txt";
        }
    }
    const QString base = root.filePath("Files/Docs/" + QString::fromStdString(item.id));
    switch (part) {
        case Part::Content: return base + ".rtf";
        case Part::Notes: return base + "_notes.rtf";
        case Part::Synopsis: return base + "_synopsis.txt";
    }
    return {};
}

std::optional<std::string> BundleContentSource::read(const BinderItem& item, Part part) const {
    const QString path = path_for(item, part);
    if (!QFileInfo::exists(path)) {
        return std::nullopt;
    }
    auto bytes = util::read_file_bytes(path);
    if (!bytes) {
        qCWarning(folioImportLog) << "Cannot read" << path;
        return std::nullopt;
    }
    return to_std(*bytes);
}

bool BundleContentSource::has_content(const BinderItem& item) const {
    return QFileInfo(path_for(item, Part::Content)).isFile();
}

std::optional<std::string> BundleContentSource::content(const BinderItem& item) const {
    return read(item, Part::Content);
}

std::optional<std::string> BundleContentSource::notes(const BinderItem& item) const {
    return read(item, Part::Notes);
}

std::optional<std::string> BundleContentSource::synopsis(const BinderItem& item) const {
    auto text = read(item, Part::Synopsis);
    if (text && text->find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }
    return text;
}

// ============================================================================
// Validation
// ============================================================================

std::optional<QString> find_manifest(const QString& bundle_path) {
    const QDir dir(bundle_path);
    if (QFileInfo(dir.filePath("project.scrivx")).isFile()) {
        return dir.filePath("project.scrivx");
    }
    const auto entries = dir.entryList({"*.scrivx"}, QDir::Files, QDir::Name);
    if (entries.isEmpty()) {
        return std::nullopt;
    }
    return dir.filePath(entries.first());
}

FormatVersion detect_version(const QString& bundle_path) {
    return QFileInfo(QDir(bundle_path).filePath("Files/Data")).isDir() ? FormatVersion::V3 : FormatVersion::V2;
}

Res<BundleValidation> validate_bundle(const QString& bundle_path) {
    const QFileInfo info(bundle_path);
    if (!info.isDir()) {
        return Res<BundleValidation>::err(
            make_error(ErrorCode::NotADirectory, bundle_path.toStdString() + " is not a directory"));
    }

    auto manifest = find_manifest(bundle_path);
    if (!manifest) {
        return Res<BundleValidation>::err(
            make_error(ErrorCode::MissingManifest, "no .scrivx file in " + bundle_path.toStdString()));
    }

    auto bytes = util::read_file_bytes(*manifest);
    if (!bytes) {
        return Res<BundleValidation>::err(make_error(ErrorCode::FileReadFailed, manifest->toStdString()));
    }
    auto project = parse_binder_xml(*bytes);
    if (project.is_err()) {
        return Res<BundleValidation>::err(project.unwrap_err());
    }
    const auto& parsed = project.unwrap();

    BundleValidation result;
    result.manifest_path = *manifest;
    result.title = parsed.title;
    result.version = detect_version(bundle_path);
    result.item_count = count_binder_items(parsed.binder);
    result.has_media = contains_media(parsed.binder);

    if (result.item_count > kLargeProjectItemCount) {
        result.warnings.push_back("large project: " + std::to_string(result.item_count) + " items");
    }
    const QDir dir(bundle_path);
    if (!QFileInfo(dir.filePath("Files/Data")).isDir() && !QFileInfo(dir.filePath("Files/Docs")).isDir()) {
        result.warnings.push_back("no content directory found");
    }
    return Res<BundleValidation>::ok(std::move(result));
}

// ============================================================================
// Import
// ============================================================================

Res<ImportResult> import_scrivener(const QString& bundle_path,
                                   const ImportOptions& options,
                                   ProgressCallback progress,
                                   CancellationToken cancel) {
    ProgressReporter reporter(std::move(progress));
    qCInfo(folioImportLog) << "Importing" << bundle_path;

    reporter.stage(PipelineStage::Validating, 0.0, "Validating project");
    auto validation = validate_bundle(bundle_path);
    if (validation.is_err()) {
        qCWarning(folioImportLog) << "Validation failed:" << QString::fromStdString(describe(validation.unwrap_err()));
        return Res<ImportResult>::err(validation.unwrap_err());
    }
    const auto& checked = validation.unwrap();

    ImportResult result;
    for (const auto& w : checked.warnings) {
        result.report.warn(checked.title, w, Severity::Info);
    }
    if (cancel.is_cancelled()) return Res<ImportResult>::err(cancelled_error());

    reporter.stage(PipelineStage::ReadingStructure, 0.05, "Reading project structure");
    auto bytes = util::read_file_bytes(checked.manifest_path);
    if (!bytes) {
        return Res<ImportResult>::err(make_error(ErrorCode::FileReadFailed, checked.manifest_path.toStdString()));
    }
    auto parsed = parse_binder_xml(*bytes);
    if (parsed.is_err()) {
        return Res<ImportResult>::err(parsed.unwrap_err());
    }
    ScrivenerProject project = std::move(parsed).unwrap();
    project.version = checked.version;
    const auto mappings = build_import_mappings(project);
    if (cancel.is_cancelled()) return Res<ImportResult>::err(cancelled_error());

    reporter.stage(PipelineStage::ConvertingContent, 0.1, "Converting documents");
    BundleContentSource source(bundle_path, project.version);
    BinderConverter converter(source, mappings, options);
    converter.set_cancellation(cancel);
    const double total = std::max<size_t>(checked.item_count, 1);
    converter.on_item([&](const std::string& title, size_t visited) {
        reporter.report(0.1 + 0.8 * (static_cast<double>(visited) / total), "Converting " + title);
    });

    const QString fallback = QFileInfo(bundle_path).completeBaseName();
    auto manuscript = converter.convert_project(project, fallback.toStdString());
    if (manuscript.is_err()) {
        qCInfo(folioImportLog) << "Import stopped:" << QString::fromStdString(manuscript.unwrap_err().message);
        return Res<ImportResult>::err(manuscript.unwrap_err());
    }
    result.manuscript = std::move(manuscript).unwrap();
    converter.tally().merge_into(result.report);

    reporter.stage(PipelineStage::Finalizing, 0.9, "Reading writing history");
    if (options.import_writing_history) {
        const QString history_path = QDir(bundle_path).filePath("Files/writing.history");
        if (QFileInfo(history_path).isFile()) {
            auto history_bytes = util::read_file_bytes(history_path);
            auto history = history_bytes
                ? parse_writing_history(*history_bytes)
                : Res<std::vector<WritingDay>>::err(make_error(ErrorCode::FileReadFailed, "unreadable"));
            if (history.is_ok()) {
                result.manuscript.writing_history = std::move(history).unwrap();
            } else {
                result.report.warn("writing.history", "writing history skipped: " + history.unwrap_err().message,
                                   Severity::Info);
            }
        }
    }

    reporter.stage(PipelineStage::Complete, 1.0, "Import complete");
    qCInfo(folioImportLog).noquote() << "Imported" << QString::fromStdString(result.manuscript.title) << "-"
                                     << QString::fromStdString(result.report.summary());
    return Res<ImportResult>::ok(std::move(result));
}

std::future<Res<ImportResult>> import_scrivener_async(QString bundle_path,
                                                      ImportOptions options,
                                                      ProgressCallback progress,
                                                      CancellationToken cancel) {
    return std::async(std::launch::async,
                      [path = std::move(bundle_path), options, progress = std::move(progress), cancel]() mutable {
                          return import_scrivener(path, options, std::move(progress), std::move(cancel));
                      });
}

} // namespace folio::scrivener
