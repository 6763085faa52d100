#pragma once

#include "core/manuscript.hpp"
#include "core/operation.hpp"

#include <QJsonObject>
#include <QString>

namespace folio::cli {

struct TreeOptions {
    bool include_ids = false;
    bool include_word_counts = false;
};

// Indented outline: folders end in '/', documents show label and status.
[[nodiscard]] QString format_manuscript_tree(const Manuscript& manuscript, const TreeOptions& options = {});

// JSON output:
// {
//   "title", "author",
//   "folders": [{ "kind", "title", "id"?, "documents": [...], "subfolders": [...] }]
// }
[[nodiscard]] QJsonObject manuscript_to_json(const Manuscript& manuscript, const TreeOptions& options = {});
[[nodiscard]] QString format_manuscript_tree_json(const Manuscript& manuscript, const TreeOptions& options = {});

// "12 documents, 3 folders, 0 skipped, 1 warning" followed by one line per warning.
[[nodiscard]] QString format_report(const OperationReport& report);

[[nodiscard]] QJsonObject report_to_json(const OperationReport& report);

} // namespace folio::cli
