#pragma once

#include "core/manuscript.hpp"
#include "scrivener/binder_model.hpp"

#include <QColor>

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio::scrivener {

/**
 * Tables from local ids to Scrivener ids, built once per export and
 * read-only afterwards.
 */
struct ExportMappings {
    std::unordered_map<Uuid, Uuid> uuids;   // document/folder id -> binder UUID
    std::map<std::string, int> labels;      // label id -> Label ID
    std::map<std::string, int> statuses;    // status id -> Status ID
    std::map<std::string, int> keywords;    // keyword text -> Keyword ID
};

/**
 * A fresh UUID for every folder and document, assigned in one pre-order
 * walk of draft, research, then trash. Local ids must be unique;
 * sanitize_references() replaces duplicates before an export.
 */
[[nodiscard]] std::unordered_map<Uuid, Uuid> build_uuid_mapping(const Manuscript& manuscript);

/**
 * Labels and statuses are numbered by their position in the table.
 */
[[nodiscard]] std::map<std::string, int> build_label_id_mapping(const Manuscript& manuscript);
[[nodiscard]] std::map<std::string, int> build_status_id_mapping(const Manuscript& manuscript);

/**
 * Keywords used in draft and research (not trash), numbered in sorted
 * order.
 */
[[nodiscard]] std::map<std::string, int> build_keyword_id_mapping(const Manuscript& manuscript);

[[nodiscard]] ExportMappings build_export_mappings(const Manuscript& manuscript);

/**
 * Tables from Scrivener ids back to local values, built once per import.
 * When a Scrivener ID is declared twice the first declaration wins.
 */
struct ImportMappings {
    std::vector<Label> labels;
    std::vector<Status> statuses;
    std::map<int, std::string> label_ids;   // Label ID -> label id
    std::map<int, std::string> status_ids;  // Status ID -> status id
    std::map<int, std::string> keywords;    // Keyword ID -> keyword text
};

[[nodiscard]] ImportMappings build_import_mappings(const ScrivenerProject& project);

/**
 * "#RRGGBB", uppercase.
 */
[[nodiscard]] std::string color_to_hex(const QColor& color);

} // namespace folio::scrivener
