#include "cli/manuscript_tree.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>

namespace folio::cli {

namespace {

[[nodiscard]] QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString render_id_suffix(const Uuid& id, bool include_ids) {
    return include_ids ? (QStringLiteral(" (") + qs(id.to_string()) + QStringLiteral(")")) : QString{};
}

[[nodiscard]] QString document_details(const Manuscript& m, const Document& doc, const TreeOptions& options) {
    QStringList parts;
    if (doc.label_id) {
        if (const auto* label = find_label(m, *doc.label_id)) parts << QStringLiteral("label: ") + qs(label->name);
    }
    if (doc.status_id) {
        if (const auto* status = find_status(m, *doc.status_id)) parts << QStringLiteral("status: ") + qs(status->name);
    }
    if (!doc.include_in_compile) parts << QStringLiteral("excluded");
    if (options.include_word_counts) parts << QStringLiteral("%1 words").arg(static_cast<qulonglong>(count_words(doc.content)));
    return parts.isEmpty() ? QString{} : QStringLiteral(" [") + parts.join(QStringLiteral(", ")) + QLatin1Char(']');
}

void render_folder(QStringList& out, const Manuscript& m, const Folder& folder, int depth, const TreeOptions& options) {
    const auto indent = QString(depth * 2, QLatin1Char(' '));
    out.append(indent + QStringLiteral("- ") + qs(folder.title) + QLatin1Char('/') +
               render_id_suffix(folder.id, options.include_ids));
    const auto child_indent = QString((depth + 1) * 2, QLatin1Char(' '));
    for (const auto* doc : sorted_documents(folder)) {
        out.append(child_indent + QStringLiteral("- ") + qs(doc->title) + render_id_suffix(doc->id, options.include_ids) +
                   document_details(m, *doc, options));
    }
    for (const auto* sub : sorted_subfolders(folder)) {
        render_folder(out, m, *sub, depth + 1, options);
    }
}

[[nodiscard]] QJsonObject document_to_json(const Manuscript& m, const Document& doc, const TreeOptions& options) {
    QJsonObject obj;
    if (options.include_ids) obj.insert(QStringLiteral("id"), qs(doc.id.to_string()));
    obj.insert(QStringLiteral("title"), qs(doc.title));
    obj.insert(QStringLiteral("order"), doc.order);
    obj.insert(QStringLiteral("includeInCompile"), doc.include_in_compile);
    if (doc.label_id) {
        if (const auto* label = find_label(m, *doc.label_id)) obj.insert(QStringLiteral("label"), qs(label->name));
    }
    if (doc.status_id) {
        if (const auto* status = find_status(m, *doc.status_id)) obj.insert(QStringLiteral("status"), qs(status->name));
    }
    QJsonArray keywords;
    for (const auto& k : doc.keywords) keywords.append(qs(k));
    obj.insert(QStringLiteral("keywords"), keywords);
    if (options.include_word_counts) obj.insert(QStringLiteral("words"), static_cast<qint64>(count_words(doc.content)));
    return obj;
}

[[nodiscard]] QJsonObject folder_to_json(const Manuscript& m, const Folder& folder, const TreeOptions& options) {
    QJsonObject obj;
    obj.insert(QStringLiteral("kind"), QString::fromUtf8(folder_kind_name(folder.kind).data()));
    if (options.include_ids) obj.insert(QStringLiteral("id"), qs(folder.id.to_string()));
    obj.insert(QStringLiteral("title"), qs(folder.title));

    QJsonArray documents;
    for (const auto* doc : sorted_documents(folder)) documents.append(document_to_json(m, *doc, options));
    obj.insert(QStringLiteral("documents"), documents);

    QJsonArray subfolders;
    for (const auto* sub : sorted_subfolders(folder)) subfolders.append(folder_to_json(m, *sub, options));
    obj.insert(QStringLiteral("subfolders"), subfolders);
    return obj;
}

} // namespace

QString format_manuscript_tree(const Manuscript& manuscript, const TreeOptions& options) {
    QStringList out;
    out.append(qs(manuscript.title) +
               (manuscript.author.empty() ? QString{} : QStringLiteral(" by ") + qs(manuscript.author)));
    render_folder(out, manuscript, manuscript.draft, 0, options);
    if (manuscript.research) render_folder(out, manuscript, *manuscript.research, 0, options);
    if (manuscript.trash) render_folder(out, manuscript, *manuscript.trash, 0, options);
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QJsonObject manuscript_to_json(const Manuscript& manuscript, const TreeOptions& options) {
    QJsonArray folders;
    folders.append(folder_to_json(manuscript, manuscript.draft, options));
    if (manuscript.research) folders.append(folder_to_json(manuscript, *manuscript.research, options));
    if (manuscript.trash) folders.append(folder_to_json(manuscript, *manuscript.trash, options));

    QJsonObject root;
    root.insert(QStringLiteral("title"), qs(manuscript.title));
    root.insert(QStringLiteral("author"), qs(manuscript.author));
    root.insert(QStringLiteral("folders"), folders);
    return root;
}

QString format_manuscript_tree_json(const Manuscript& manuscript, const TreeOptions& options) {
    return QString::fromUtf8(QJsonDocument(manuscript_to_json(manuscript, options)).toJson(QJsonDocument::Compact)) +
           QLatin1Char('\n');
}

QString format_report(const OperationReport& report) {
    QStringList out;
    out.append(qs(report.summary()));
    for (const auto& w : report.warnings) {
        out.append(QStringLiteral("  [%1] %2: %3")
                       .arg(QString::fromUtf8(severity_name(w.severity).data()), qs(w.item_title), qs(w.message)));
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QJsonObject report_to_json(const OperationReport& report) {
    QJsonObject obj;
    obj.insert(QStringLiteral("documents"), static_cast<qint64>(report.documents));
    obj.insert(QStringLiteral("folders"), static_cast<qint64>(report.folders));
    obj.insert(QStringLiteral("skipped"), static_cast<qint64>(report.skipped_items));
    QJsonArray warnings;
    for (const auto& w : report.warnings) {
        QJsonObject wo;
        wo.insert(QStringLiteral("item"), qs(w.item_title));
        wo.insert(QStringLiteral("message"), qs(w.message));
        wo.insert(QStringLiteral("severity"), QString::fromUtf8(severity_name(w.severity).data()));
        warnings.append(wo);
    }
    obj.insert(QStringLiteral("warnings"), warnings);
    return obj;
}

} // namespace folio::cli
