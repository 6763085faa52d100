#pragma once

#include "core/result.hpp"
#include "scrivener/binder_model.hpp"

#include <QByteArray>
#include <QColor>
#include <QString>

#include <optional>

namespace folio::scrivener {

/**
 * Parses a .scrivx manifest in one streaming pass.
 *
 * Reads the binder tree, label and status tables (with or without the
 * <Labels>/<StatusItems> wrappers), both keyword schemas, project targets
 * and the project title. Label and status ID -1 are the "none" sentinels
 * and are not added to the tables; an item carrying them has no label or
 * status. Duplicate or missing IDs are kept as given.
 *
 * The returned version is a guess from the manifest alone (V3 when items
 * carry UUID attributes); the import pipeline replaces it with what the
 * bundle layout says.
 *
 * Fails with XmlParsingFailed when the document is not well-formed.
 */
[[nodiscard]] Res<ScrivenerProject> parse_binder_xml(const QByteArray& xml);

/**
 * Accepts ISO-8601 with or without time, "yyyy-MM-dd HH:mm:ss Z",
 * "yyyy-MM-dd HH:mm:ss", "yyyy-MM-dd'T'HH:mm:ss", "yyyy-MM-dd'T'HH:mm:ssZ"
 * and "yyyy-MM-dd". Times without an offset are taken as UTC. Anything
 * else is nullopt.
 */
[[nodiscard]] std::optional<Timestamp> parse_scrivener_date(const QString& text);

/**
 * "R G B" with components in [0, 1]. Malformed input is mid-gray.
 */
[[nodiscard]] QColor parse_scrivener_color(const QString& text);

} // namespace folio::scrivener
