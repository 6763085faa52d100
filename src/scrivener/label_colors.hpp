#pragma once

#include "core/manuscript.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace folio::scrivener {

/**
 * Named colour for a document carrying this label: a colour word (or
 * "urgent", "done", ...) in the label name first, then the nearest named
 * colour to the label's hex value, then "Brown".
 */
[[nodiscard]] std::string label_color_name(const Label& label);

/**
 * Nearest named colour to "#RRGGBB", or nullopt when the hex is malformed
 * or nothing is close.
 */
[[nodiscard]] std::optional<std::string> nearest_color_name(std::string_view hex);

} // namespace folio::scrivener
