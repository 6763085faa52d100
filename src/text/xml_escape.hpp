#pragma once

#include <string>
#include <string_view>

namespace folio::text {

/**
 * Escapes & < > " ' for element text and attribute values.
 */
[[nodiscard]] std::string escape_xml(std::string_view text);

} // namespace folio::text
