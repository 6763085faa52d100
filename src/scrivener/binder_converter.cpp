#include "scrivener/binder_converter.hpp"

#include "scrivener/icon_mapper.hpp"
#include "scrivener/label_colors.hpp"
#include "text/markdown_bridge.hpp"
#include "text/rtf_reader.hpp"

#include <algorithm>

namespace folio::scrivener {

namespace {

Error cancelled_error() {
    return make_error(ErrorCode::Cancelled, "import cancelled");
}

const Label* find_local_label(const ImportMappings& m, const std::string& id) {
    const auto it = std::find_if(m.labels.begin(), m.labels.end(), [&](const Label& l) { return l.id == id; });
    return it == m.labels.end() ? nullptr : &*it;
}

} // namespace

void ConversionTally::merge_into(OperationReport& report) const {
    report.documents += documents;
    report.folders += folders;
    report.skipped_items += skipped;
    report.warnings.insert(report.warnings.end(), warnings.begin(), warnings.end());
}

BinderConverter::BinderConverter(const ContentSource& source, const ImportMappings& mappings, ImportOptions options)
    : source_(source), mappings_(mappings), options_(options) {}

void BinderConverter::visited(const BinderItem& item) {
    ++tally_.visited;
    if (on_item_) on_item_(item.title, tally_.visited);
}

void BinderConverter::skip_subtree(const BinderItem& item, const std::string& reason) {
    const auto n = 1 + count_binder_items(item.children);
    tally_.skipped += n;
    tally_.visited += n - 1;
    tally_.warn(item.title, reason, Severity::Info);
    visited(item);
}

std::string BinderConverter::decode_markdown(const std::string& bytes, const std::string& title, const char* what) {
    auto decoded = text::decode_rich_text(bytes);
    if (!decoded.problem.empty()) {
        const auto severity = decoded.source == text::DecodeSource::Empty ? Severity::Error : Severity::Info;
        tally_.warn(title, std::string(what) + ": " + decoded.problem, severity);
    }
    return text::runs_to_markdown(decoded.runs);
}

Res<Manuscript> BinderConverter::convert_project(const ScrivenerProject& project, const std::string& fallback_title) {
    Manuscript m = create_manuscript(project.title.empty() ? fallback_title : project.title, project.author);
    m.labels = mappings_.labels;
    m.statuses = mappings_.statuses;
    m.targets = project.targets;

    std::optional<Folder> draft;
    std::vector<Folder> extras;

    for (const auto& item : project.binder) {
        if (cancelled()) return Res<Manuscript>::err(cancelled_error());

        switch (item.kind) {
            case BinderItemKind::DraftFolder: {
                auto folder = convert_folder(item);
                if (folder.is_err()) return Res<Manuscript>::err(folder.unwrap_err());
                draft = std::move(folder).unwrap();
                break;
            }
            case BinderItemKind::ResearchFolder: {
                if (!options_.import_research) {
                    skip_subtree(item, "research folder not imported");
                    break;
                }
                auto folder = convert_folder(item);
                if (folder.is_err()) return Res<Manuscript>::err(folder.unwrap_err());
                m.research = std::move(folder).unwrap();
                m.research->kind = FolderKind::Research;
                break;
            }
            case BinderItemKind::TrashFolder: {
                if (!options_.import_trash) {
                    skip_subtree(item, "trash not imported");
                    break;
                }
                auto folder = convert_folder(item);
                if (folder.is_err()) return Res<Manuscript>::err(folder.unwrap_err());
                m.trash = std::move(folder).unwrap();
                m.trash->kind = FolderKind::Trash;
                break;
            }
            case BinderItemKind::Pdf:
            case BinderItemKind::Image:
            case BinderItemKind::WebPage:
                skip_subtree(item, "media item skipped");
                break;
            default: {
                auto folder = convert_folder(item, static_cast<int>(extras.size()));
                if (folder.is_err()) return Res<Manuscript>::err(folder.unwrap_err());
                extras.push_back(std::move(folder).unwrap());
                break;
            }
        }
    }

    if (draft) {
        m.draft = std::move(*draft);
    }
    m.draft.kind = FolderKind::Draft;

    int next_order = 0;
    for (const auto& sub : m.draft.subfolders) {
        next_order = std::max(next_order, sub.order + 1);
    }
    for (auto& extra : extras) {
        extra.order = next_order++;
        m.draft.subfolders.push_back(std::move(extra));
    }
    return Res<Manuscript>::ok(std::move(m));
}

Res<Folder> BinderConverter::convert_folder(const BinderItem& item, int order) {
    if (cancelled()) return Res<Folder>::err(cancelled_error());

    const bool own_content = source_.has_content(item);
    Folder folder = create_folder(item.title, FolderKind::Subfolder, order);
    if (item.created) folder.created = *item.created;
    ++tally_.folders;

    if (own_content) {
        auto doc = convert_document(item, 0);
        if (doc.is_err()) return Res<Folder>::err(doc.unwrap_err());
        folder.documents.push_back(std::move(doc).unwrap());
    } else {
        visited(item);
    }

    const int offset = own_content ? 1 : 0;
    for (size_t i = 0; i < item.children.size(); ++i) {
        if (cancelled()) return Res<Folder>::err(cancelled_error());

        const auto& child = item.children[i];
        const int child_order = static_cast<int>(i) + offset;

        if (is_media(child.kind)) {
            skip_subtree(child, "media item skipped");
            continue;
        }
        if (child.kind == BinderItemKind::TrashFolder && !options_.import_trash) {
            skip_subtree(child, "trash not imported");
            continue;
        }

        const bool child_has_children = !child.children.empty();
        if (child.kind == BinderItemKind::Text && !child_has_children) {
            auto doc = convert_document(child, child_order);
            if (doc.is_err()) return Res<Folder>::err(doc.unwrap_err());
            folder.documents.push_back(std::move(doc).unwrap());
            continue;
        }

        switch (classify_binder_item(source_.has_content(child), child_has_children)) {
            case BinderShape::DocumentOnly: {
                auto doc = convert_document(child, child_order);
                if (doc.is_err()) return Res<Folder>::err(doc.unwrap_err());
                folder.documents.push_back(std::move(doc).unwrap());
                break;
            }
            case BinderShape::FolderOnly:
            case BinderShape::Both: {
                auto sub = convert_folder(child, child_order);
                if (sub.is_err()) return sub;
                folder.subfolders.push_back(std::move(sub).unwrap());
                break;
            }
            case BinderShape::Empty: {
                Folder empty = create_folder(child.title, FolderKind::Subfolder, child_order);
                if (child.created) empty.created = *child.created;
                folder.subfolders.push_back(std::move(empty));
                ++tally_.folders;
                visited(child);
                break;
            }
        }
    }
    return Res<Folder>::ok(std::move(folder));
}

Res<Document> BinderConverter::convert_document(const BinderItem& item, int order) {
    if (cancelled()) return Res<Document>::err(cancelled_error());

    Document doc = create_document(item.title, {}, order);
    if (item.created) doc.created = *item.created;
    doc.include_in_compile = item.include_in_compile;

    if (options_.convert_rtf) {
        if (auto bytes = source_.content(item)) {
            doc.content = decode_markdown(*bytes, item.title, "content");
        } else if (item.kind == BinderItemKind::Text) {
            tally_.warn(item.title, "no content file; imported empty", Severity::Info);
        }
        if (auto bytes = source_.notes(item)) {
            doc.notes = decode_markdown(*bytes, item.title, "notes");
        }
    }

    if (auto synopsis = source_.synopsis(item)) {
        doc.synopsis = *synopsis;
    } else {
        doc.synopsis = item.synopsis;
    }

    const auto icon = map_icon(item.icon_file_name, item.kind);
    doc.icon_name = icon.symbol;
    doc.color_name = icon.color_name;

    if (item.label_id) {
        const auto it = mappings_.label_ids.find(*item.label_id);
        if (it != mappings_.label_ids.end()) {
            doc.label_id = it->second;
            if (const auto* label = find_local_label(mappings_, it->second)) {
                doc.color_name = label_color_name(*label);
            }
        } else {
            tally_.warn(item.title, "label " + std::to_string(*item.label_id) + " is not declared; dropped");
        }
    }
    if (doc.color_name.empty()) {
        doc.color_name = "Brown";
    }

    if (item.status_id) {
        const auto it = mappings_.status_ids.find(*item.status_id);
        if (it != mappings_.status_ids.end()) {
            doc.status_id = it->second;
        } else {
            tally_.warn(item.title, "status " + std::to_string(*item.status_id) + " is not declared; dropped");
        }
    }

    for (int id : item.keyword_ids) {
        const auto it = mappings_.keywords.find(id);
        if (it == mappings_.keywords.end()) {
            tally_.warn(item.title, "keyword " + std::to_string(id) + " is not declared; dropped", Severity::Info);
            continue;
        }
        if (std::find(doc.keywords.begin(), doc.keywords.end(), it->second) == doc.keywords.end()) {
            doc.keywords.push_back(it->second);
        }
    }

    ++tally_.documents;
    visited(item);
    return Res<Document>::ok(std::move(doc));
}

} // namespace folio::scrivener
