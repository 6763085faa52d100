#pragma once

#include "core/manuscript.hpp"
#include "scrivener/id_mapping.hpp"
#include "text/xml_escape.hpp"

#include <string>
#include <string_view>

namespace folio::scrivener {

struct BinderWriterOptions {
    // Stamped into Modified attributes, targets and the writing summary.
    Timestamp now = Timestamp::now();
    std::string creator = "Folio-1.0";
    std::string device = "folio";
};

/**
 * Serialises a manuscript as a Scrivener 3 .scrivx manifest.
 *
 * The Binder holds the draft, then research and trash when they have
 * content. It is followed by Collections, Keywords (when any), SectionTypes,
 * LabelSettings, StatusSettings, ProjectTargets, RecentWritingHistory,
 * PrintSettings and ProjectProperties, in that order.
 *
 * Every id written must be present in `mappings`. A folder, document,
 * label, status or keyword without a mapping throws std::logic_error, with
 * one exception: keywords on items inside the trash are left out of the
 * keyword table and are omitted silently.
 */
[[nodiscard]] std::string write_binder_xml(const Manuscript& manuscript,
                                           const ExportMappings& mappings,
                                           const BinderWriterOptions& options = {});

using text::escape_xml;

/**
 * "#4A90D9" -> "0.290196 0.564706 0.850980". Malformed hex is mid-gray.
 */
[[nodiscard]] std::string hex_to_scrivener_color(std::string_view hex);

} // namespace folio::scrivener
