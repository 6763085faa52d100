#include "scrivener/export_pipeline.hpp"

#include "scrivener/id_mapping.hpp"
#include "scrivener/writing_history.hpp"
#include "text/rtf_writer.hpp"
#include "util/file_io.hpp"
#include "util/log_categories.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QTemporaryDir>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace folio::scrivener {

namespace {

Error cancelled_error() {
    return make_error(ErrorCode::Cancelled, "export cancelled");
}

Error mkdir_error(const QString& path) {
    return make_error(ErrorCode::FileWriteFailed, "cannot create directory " + path.toStdString());
}

void sanitize_folder(Folder& folder, const Manuscript& m, OperationReport& report) {
    for (auto& doc : folder.documents) {
        if (doc.label_id && !find_label(m, *doc.label_id)) {
            report.warn(doc.title, "unknown label " + *doc.label_id + " removed");
            doc.label_id.reset();
        }
        if (doc.status_id && !find_status(m, *doc.status_id)) {
            report.warn(doc.title, "unknown status " + *doc.status_id + " removed");
            doc.status_id.reset();
        }
    }
    for (auto& sub : folder.subfolders) {
        sanitize_folder(sub, m, report);
    }
}

// Every folder and document needs its own binder UUID, or two items would
// share one Files/Data directory.
void reassign_duplicate_ids(Folder& folder, std::unordered_set<Uuid>& seen, OperationReport& report) {
    if (!seen.insert(folder.id).second) {
        report.warn(folder.title, "duplicate id " + folder.id.to_string() + " replaced");
        folder.id = Uuid::generate();
        seen.insert(folder.id);
    }
    for (auto& doc : folder.documents) {
        if (seen.insert(doc.id).second) continue;
        report.warn(doc.title, "duplicate id " + doc.id.to_string() + " replaced");
        doc.id = Uuid::generate();
        seen.insert(doc.id);
    }
    for (auto& sub : folder.subfolders) {
        reassign_duplicate_ids(sub, seen, report);
    }
}

bool has_items(const std::optional<Folder>& folder) {
    return folder && (!folder->documents.empty() || !folder->subfolders.empty());
}

// Writes Files/Data/<UUID>/ for every document of one tree.
class ContentWriter {
public:
    ContentWriter(QDir data_dir, const ExportMappings& mappings, ProgressReporter& reporter,
                  const CancellationToken& cancel, size_t total)
        : data_(std::move(data_dir)), mappings_(mappings), reporter_(reporter), cancel_(cancel), total_(total) {}

    Res<void> write_folder(const Folder& folder, OperationReport& report) {
        ++report.folders;
        for (const auto* doc : sorted_documents(folder)) {
            if (cancel_.is_cancelled()) return Res<void>::err(cancelled_error());
            auto written = write_document(*doc);
            if (written.is_err()) return written;
            ++report.documents;
            ++done_;
            reporter_.report(0.1 + 0.8 * (static_cast<double>(done_) / static_cast<double>(std::max<size_t>(total_, 1))),
                             "Writing " + doc->title);
        }
        for (const auto* sub : sorted_subfolders(folder)) {
            auto written = write_folder(*sub, report);
            if (written.is_err()) return written;
        }
        return Res<void>::ok();
    }

private:
    Res<void> write_document(const Document& doc) {
        const auto it = mappings_.uuids.find(doc.id);
        if (it == mappings_.uuids.end()) {
            throw std::logic_error("document " + doc.title + " has no UUID mapping");
        }
        const QString name = QString::fromStdString(it->second.to_upper_string());
        if (!data_.mkpath(name)) {
            return Res<void>::err(mkdir_error(data_.filePath(name)));
        }
        const QDir dir(data_.filePath(name));

        auto content = util::write_bytes_atomic(dir.filePath("content.rtf"), text::markdown_to_rtf(doc.content));
        if (content.is_err()) return content;
        if (!doc.notes.empty()) {
            auto notes = util::write_bytes_atomic(dir.filePath("notes.rtf"), text::markdown_to_rtf(doc.notes));
            if (notes.is_err()) return notes;
        }
        if (!doc.synopsis.empty()) {
            auto synopsis = util::write_bytes_atomic(dir.filePath("synopsis.txt"), std::string_view(doc.synopsis));
            if (synopsis.is_err()) return synopsis;
        }
        return Res<void>::ok();
    }

    QDir data_;
    const ExportMappings& mappings_;
    ProgressReporter& reporter_;
    const CancellationToken& cancel_;
    size_t total_;
    size_t done_{0};
};

// Fills `bundle_dir` with the manifest, content and settings of one bundle.
Res<void> write_bundle(const Manuscript& manuscript,
                       const QString& bundle_dir,
                       const QString& manifest_name,
                       ProgressReporter& reporter,
                       const CancellationToken& cancel,
                       const BinderWriterOptions& options,
                       OperationReport& report) {
    reporter.stage(PipelineStage::ReadingStructure, 0.05, "Assigning identifiers");
    const auto mappings = build_export_mappings(manuscript);
    if (cancel.is_cancelled()) return Res<void>::err(cancelled_error());

    const QDir root(bundle_dir);
    for (const char* sub : {"Files/Data", "Settings"}) {
        if (!root.mkpath(sub)) return Res<void>::err(mkdir_error(root.filePath(sub)));
    }

    auto manifest = util::write_bytes_atomic(root.filePath(manifest_name),
                                             write_binder_xml(manuscript, mappings, options));
    if (manifest.is_err()) return manifest;
    auto version = util::write_bytes_atomic(root.filePath("Files/version.txt"), std::string_view(kBundleFormatVersion));
    if (version.is_err()) return version;

    reporter.stage(PipelineStage::ConvertingContent, 0.1, "Writing documents");
    size_t total = count_documents(manuscript.draft);
    if (has_items(manuscript.research)) total += count_documents(*manuscript.research);
    if (has_items(manuscript.trash)) total += count_documents(*manuscript.trash);

    ContentWriter writer(QDir(root.filePath("Files/Data")), mappings, reporter, cancel, total);
    auto draft = writer.write_folder(manuscript.draft, report);
    if (draft.is_err()) return draft;
    for (const auto* extra : {&manuscript.research, &manuscript.trash}) {
        if (!has_items(*extra)) continue;
        auto written = writer.write_folder(**extra, report);
        if (written.is_err()) return written;
    }

    reporter.stage(PipelineStage::Finalizing, 0.9, "Writing project settings");
    if (!manuscript.writing_history.empty()) {
        auto history = util::write_bytes_atomic(root.filePath("Files/writing.history"),
                                                write_writing_history(manuscript.writing_history));
        if (history.is_err()) return history;
    }
    return Res<void>::ok();
}

QString bundle_base_name(const QString& destination) {
    QString name = QFileInfo(destination).fileName();
    if (name.endsWith(".scriv", Qt::CaseInsensitive)) name.chop(6);
    if (name.endsWith(".zip", Qt::CaseInsensitive)) name.chop(4);
    return name;
}

bool is_bundle_dir(const QString& path) {
    return QFileInfo(path).isDir() && !QDir(path).entryList({"*.scrivx"}, QDir::Files).isEmpty();
}

} // namespace

void sanitize_references(Manuscript& manuscript, OperationReport& report) {
    const Manuscript& m = manuscript;
    sanitize_folder(manuscript.draft, m, report);
    if (manuscript.research) sanitize_folder(*manuscript.research, m, report);
    if (manuscript.trash) sanitize_folder(*manuscript.trash, m, report);

    std::unordered_set<Uuid> seen;
    reassign_duplicate_ids(manuscript.draft, seen, report);
    if (manuscript.research) reassign_duplicate_ids(*manuscript.research, seen, report);
    if (manuscript.trash) reassign_duplicate_ids(*manuscript.trash, seen, report);
}

Res<ExportResult> export_scrivener(const Manuscript& manuscript,
                                   const QString& destination,
                                   ProgressCallback progress,
                                   CancellationToken cancel,
                                   const BinderWriterOptions& options) {
    ProgressReporter reporter(std::move(progress));
    qCInfo(folioExportLog) << "Exporting to" << destination;

    reporter.stage(PipelineStage::Validating, 0.0, "Checking destination");
    const QFileInfo dest(destination);
    const QString name = bundle_base_name(destination);
    if (destination.isEmpty() || name.isEmpty()) {
        return Res<ExportResult>::err(make_error(ErrorCode::InvalidDestination, "empty destination"));
    }
    if (!dest.absoluteDir().exists()) {
        return Res<ExportResult>::err(make_error(ErrorCode::InvalidDestination,
                                                 dest.absolutePath().toStdString() + " does not exist"));
    }
    if (dest.exists() && !is_bundle_dir(destination)) {
        return Res<ExportResult>::err(make_error(ErrorCode::InvalidDestination,
                                                 destination.toStdString() + " exists and is not a project"));
    }

    ExportResult result;
    Manuscript clean = manuscript;
    sanitize_references(clean, result.report);
    if (cancel.is_cancelled()) return Res<ExportResult>::err(cancelled_error());

    QTemporaryDir staging(dest.absoluteDir().filePath(".folio-export-XXXXXX"));
    if (!staging.isValid()) {
        return Res<ExportResult>::err(make_error(ErrorCode::FileWriteFailed,
                                                 "cannot create staging directory: " + staging.errorString().toStdString()));
    }
    const QString staged = staging.filePath(name + ".scriv");

    auto written = write_bundle(clean, staged, name + ".scrivx", reporter, cancel, options, result.report);
    if (written.is_err()) {
        qCWarning(folioExportLog) << "Export failed:" << QString::fromStdString(describe(written.unwrap_err()));
        return Res<ExportResult>::err(written.unwrap_err());
    }
    if (cancel.is_cancelled()) return Res<ExportResult>::err(cancelled_error());

    // The previous bundle moves into the staging directory first, so a
    // failed rename leaves it in place.
    const QString previous = staging.filePath(name + ".previous.scriv");
    const bool replacing = dest.exists();
    if (replacing && !QDir().rename(dest.absoluteFilePath(), previous)) {
        return Res<ExportResult>::err(make_error(ErrorCode::FileWriteFailed,
                                                 "cannot replace " + destination.toStdString()));
    }
    if (!QDir().rename(staged, dest.absoluteFilePath())) {
        if (replacing && !QDir().rename(previous, dest.absoluteFilePath())) {
            qCWarning(folioExportLog) << "Previous bundle left at" << previous;
            staging.setAutoRemove(false);
        }
        return Res<ExportResult>::err(make_error(ErrorCode::FileWriteFailed,
                                                 "cannot move bundle to " + destination.toStdString()));
    }
    if (replacing && !QDir(previous).removeRecursively()) {
        qCWarning(folioExportLog) << "Cannot remove previous bundle" << previous;
    }

    result.path = dest.absoluteFilePath();
    reporter.stage(PipelineStage::Complete, 1.0, "Export complete");
    qCInfo(folioExportLog).noquote() << "Exported" << result.path << "-" << QString::fromStdString(result.report.summary());
    return Res<ExportResult>::ok(std::move(result));
}

Res<archive::Bytes> package_bundle(const QString& bundle_dir, Timestamp modified) {
    const QDir root(bundle_dir);
    const QString prefix = QFileInfo(bundle_dir).fileName() + "/";

    std::vector<QString> files;
    QDirIterator it(bundle_dir, QDir::Files | QDir::Hidden, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        files.push_back(root.relativeFilePath(it.next()));
    }
    std::sort(files.begin(), files.end());

    archive::ZipArchiveWriter zip(modified);
    for (const auto& rel : files) {
        auto bytes = util::read_file_bytes(root.filePath(rel));
        if (!bytes) {
            return Res<archive::Bytes>::err(make_error(ErrorCode::FileReadFailed, root.filePath(rel).toStdString()));
        }
        auto added = zip.add_entry((prefix + rel).toStdString(),
                                   std::string_view(bytes->constData(), static_cast<size_t>(bytes->size())));
        if (added.is_err()) return Res<archive::Bytes>::err(added.unwrap_err());
    }
    qCDebug(folioZipLog) << "Packed" << zip.entry_count() << "entries from" << bundle_dir;
    return zip.finalize();
}

Res<ExportResult> export_scrivener_zip(const Manuscript& manuscript,
                                       const QString& zip_path,
                                       ProgressCallback progress,
                                       CancellationToken cancel,
                                       const BinderWriterOptions& options) {
    const QFileInfo dest(zip_path);
    if (zip_path.isEmpty() || !dest.absoluteDir().exists() || dest.isDir()) {
        return Res<ExportResult>::err(make_error(ErrorCode::InvalidDestination, "bad zip destination " + zip_path.toStdString()));
    }

    QTemporaryDir scratch;
    if (!scratch.isValid()) {
        return Res<ExportResult>::err(make_error(ErrorCode::FileWriteFailed,
                                                 "cannot create staging directory: " + scratch.errorString().toStdString()));
    }
    const QString bundle = scratch.filePath(bundle_base_name(zip_path) + ".scriv");

    auto exported = export_scrivener(manuscript, bundle, std::move(progress), cancel, options);
    if (exported.is_err()) return exported;
    ExportResult result = std::move(exported).unwrap();

    auto zipped = package_bundle(bundle, options.now);
    if (zipped.is_err()) return Res<ExportResult>::err(zipped.unwrap_err());

    auto saved = util::write_bytes_atomic(dest.absoluteFilePath(), std::span<const uint8_t>(zipped.unwrap()));
    if (saved.is_err()) return Res<ExportResult>::err(saved.unwrap_err());

    result.path = dest.absoluteFilePath();
    qCInfo(folioExportLog) << "Wrote zipped bundle" << result.path;
    return Res<ExportResult>::ok(std::move(result));
}

std::future<Res<ExportResult>> export_scrivener_async(Manuscript manuscript,
                                                      QString destination,
                                                      ProgressCallback progress,
                                                      CancellationToken cancel) {
    return std::async(std::launch::async, [m = std::move(manuscript), dest = std::move(destination),
                                           progress = std::move(progress), cancel]() mutable {
        return export_scrivener(m, dest, std::move(progress), std::move(cancel));
    });
}

} // namespace folio::scrivener
