#include "scrivener/binder_model.hpp"

#include <array>
#include <utility>

namespace folio::scrivener {

namespace {

constexpr std::array<std::pair<std::string_view, BinderItemKind>, 9> kKindNames = {{
    {"DraftFolder", BinderItemKind::DraftFolder},
    {"ResearchFolder", BinderItemKind::ResearchFolder},
    {"TrashFolder", BinderItemKind::TrashFolder},
    {"Folder", BinderItemKind::Folder},
    {"Text", BinderItemKind::Text},
    {"PDF", BinderItemKind::Pdf},
    {"Image", BinderItemKind::Image},
    {"WebPage", BinderItemKind::WebPage},
    {"Root", BinderItemKind::Root},
}};

} // namespace

BinderItemKind parse_binder_item_kind(std::string_view type) noexcept {
    for (const auto& [name, kind] : kKindNames) {
        if (name == type) return kind;
    }
    return BinderItemKind::Other;
}

std::string_view binder_item_kind_name(BinderItemKind kind) noexcept {
    for (const auto& [name, k] : kKindNames) {
        if (k == kind) return name;
    }
    return "Other";
}

std::string_view format_version_name(FormatVersion version) noexcept {
    return version == FormatVersion::V2 ? "Scrivener 2" : "Scrivener 3";
}

size_t count_binder_items(const std::vector<BinderItem>& items) {
    size_t n = 0;
    for (const auto& item : items) {
        n += 1 + count_binder_items(item.children);
    }
    return n;
}

bool contains_media(const std::vector<BinderItem>& items) {
    for (const auto& item : items) {
        if (is_media(item.kind) || contains_media(item.children)) return true;
    }
    return false;
}

} // namespace folio::scrivener
