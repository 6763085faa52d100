#pragma once

#include "core/manuscript.hpp"
#include "core/types.hpp"

#include <QColor>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::scrivener {

enum class BinderItemKind {
    DraftFolder,
    ResearchFolder,
    TrashFolder,
    Folder,
    Text,
    Pdf,
    Image,
    WebPage,
    Root,
    Other,
};

/**
 * The Type attribute of a BinderItem. Unknown values map to Other.
 */
[[nodiscard]] BinderItemKind parse_binder_item_kind(std::string_view type) noexcept;
[[nodiscard]] std::string_view binder_item_kind_name(BinderItemKind kind) noexcept;

[[nodiscard]] inline bool is_media(BinderItemKind kind) noexcept {
    return kind == BinderItemKind::Pdf || kind == BinderItemKind::Image || kind == BinderItemKind::WebPage;
}

/**
 * One node of the Scrivener binder. Any kind may carry both its own text
 * and children.
 */
struct BinderItem {
    std::string id;              // ID attribute (v2) or UUID (v3)
    std::optional<Uuid> uuid;    // v3 only
    BinderItemKind kind{BinderItemKind::Text};
    std::string title;
    std::optional<Timestamp> created;
    std::optional<Timestamp> modified;
    std::string synopsis;
    std::optional<int> label_id;
    std::optional<int> status_id;
    bool include_in_compile{true};
    std::optional<int> target_word_count;
    std::string icon_file_name;
    std::vector<int> keyword_ids;
    std::vector<BinderItem> children;
};

struct ScrivenerLabel {
    int id{0};
    std::string name;
    QColor color;
};

struct ScrivenerStatus {
    int id{0};
    std::string name;
};

struct ScrivenerKeyword {
    int id{0};
    std::string name;
    QColor color;
};

enum class FormatVersion {
    V2,  // Files/Docs/<id>.rtf
    V3,  // Files/Data/<uuid>/content.rtf
};

[[nodiscard]] std::string_view format_version_name(FormatVersion version) noexcept;

/**
 * Everything read from a .scrivx manifest.
 */
struct ScrivenerProject {
    std::string title;
    std::string author;
    FormatVersion version{FormatVersion::V3};
    std::vector<BinderItem> binder;
    std::vector<ScrivenerLabel> labels;
    std::vector<ScrivenerStatus> statuses;
    std::vector<ScrivenerKeyword> keywords;
    WritingTargets targets;
};

enum class BinderShape {
    DocumentOnly,
    FolderOnly,
    Both,
    Empty,
};

[[nodiscard]] constexpr BinderShape classify_binder_item(bool has_content, bool has_children) noexcept {
    if (has_content && has_children) return BinderShape::Both;
    if (has_content) return BinderShape::DocumentOnly;
    if (has_children) return BinderShape::FolderOnly;
    return BinderShape::Empty;
}

[[nodiscard]] size_t count_binder_items(const std::vector<BinderItem>& items);

[[nodiscard]] bool contains_media(const std::vector<BinderItem>& items);

} // namespace folio::scrivener
