#pragma once

#include "scrivener/binder_model.hpp"

#include <string>
#include <string_view>

namespace folio::scrivener {

/**
 * Symbolic icon for a binder item plus an optional colour name taken from
 * a "Category (Colour)" icon file name.
 */
struct IconHint {
    std::string symbol;
    std::string color_name;  // empty when the icon carries no colour

    bool operator==(const IconHint&) const = default;
};

/**
 * "Flag (Red)" -> {"flag", "Red"}; "Lightbulb" -> {"lightbulb", ""}.
 * Unknown or empty names fall back to a default for the item kind.
 */
[[nodiscard]] IconHint map_icon(std::string_view icon_file_name, BinderItemKind kind);

[[nodiscard]] std::string_view default_icon(BinderItemKind kind) noexcept;

} // namespace folio::scrivener
