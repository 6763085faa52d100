#include "scrivener/id_mapping.hpp"

#include <set>

namespace folio::scrivener {

namespace {

void map_folder(const Folder& folder, std::unordered_map<Uuid, Uuid>& out) {
    out.emplace(folder.id, Uuid::generate());
    for (const auto& doc : folder.documents) {
        out.emplace(doc.id, Uuid::generate());
    }
    for (const auto& sub : folder.subfolders) {
        map_folder(sub, out);
    }
}

} // namespace

std::unordered_map<Uuid, Uuid> build_uuid_mapping(const Manuscript& manuscript) {
    std::unordered_map<Uuid, Uuid> out;
    map_folder(manuscript.draft, out);
    if (manuscript.research) map_folder(*manuscript.research, out);
    if (manuscript.trash) map_folder(*manuscript.trash, out);
    return out;
}

std::map<std::string, int> build_label_id_mapping(const Manuscript& manuscript) {
    std::map<std::string, int> out;
    for (size_t i = 0; i < manuscript.labels.size(); ++i) {
        out.emplace(manuscript.labels[i].id, static_cast<int>(i));
    }
    return out;
}

std::map<std::string, int> build_status_id_mapping(const Manuscript& manuscript) {
    std::map<std::string, int> out;
    for (size_t i = 0; i < manuscript.statuses.size(); ++i) {
        out.emplace(manuscript.statuses[i].id, static_cast<int>(i));
    }
    return out;
}

std::map<std::string, int> build_keyword_id_mapping(const Manuscript& manuscript) {
    std::set<std::string> all;
    collect_keywords(manuscript.draft, all);
    if (manuscript.research) collect_keywords(*manuscript.research, all);

    std::map<std::string, int> out;
    int next = 0;
    for (const auto& keyword : all) {
        out.emplace(keyword, next++);
    }
    return out;
}

ExportMappings build_export_mappings(const Manuscript& manuscript) {
    ExportMappings m;
    m.uuids = build_uuid_mapping(manuscript);
    m.labels = build_label_id_mapping(manuscript);
    m.statuses = build_status_id_mapping(manuscript);
    m.keywords = build_keyword_id_mapping(manuscript);
    return m;
}

ImportMappings build_import_mappings(const ScrivenerProject& project) {
    ImportMappings m;
    for (const auto& label : project.labels) {
        if (m.label_ids.count(label.id)) continue;
        Label local{"scriv-label-" + std::to_string(label.id), label.name, color_to_hex(label.color)};
        m.label_ids.emplace(label.id, local.id);
        m.labels.push_back(std::move(local));
    }
    for (const auto& status : project.statuses) {
        if (m.status_ids.count(status.id)) continue;
        Status local{"scriv-status-" + std::to_string(status.id), status.name};
        m.status_ids.emplace(status.id, local.id);
        m.statuses.push_back(std::move(local));
    }
    for (const auto& keyword : project.keywords) {
        m.keywords.emplace(keyword.id, keyword.name);
    }
    return m;
}

std::string color_to_hex(const QColor& color) {
    if (!color.isValid()) {
        return "#808080";
    }
    return color.name(QColor::HexRgb).toUpper().toStdString();
}

} // namespace folio::scrivener
