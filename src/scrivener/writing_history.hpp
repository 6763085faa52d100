#pragma once

#include "core/manuscript.hpp"
#include "core/result.hpp"

#include <QByteArray>

#include <string>
#include <vector>

namespace folio::scrivener {

/**
 * Reads Files/writing.history. <Day> elements without a valid yyyy-MM-dd
 * Date are ignored; WordCount/Words, DraftWordCount/TotalWords and
 * Duration/SessionDuration are all accepted.
 *
 * Fails with XmlParsingFailed on malformed XML.
 */
[[nodiscard]] Res<std::vector<WritingDay>> parse_writing_history(const QByteArray& xml);

[[nodiscard]] std::string write_writing_history(const std::vector<WritingDay>& days);

} // namespace folio::scrivener
