#pragma once

#include "core/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

/**
 * Label - a coloured tag a document can carry. At most one per document.
 */
struct Label {
    std::string id;
    std::string name;
    std::string color_hex;  // "#RRGGBB"

    bool operator==(const Label&) const = default;
};

/**
 * Status - workflow state of a document ("To Do", "First Draft", ...).
 */
struct Status {
    std::string id;
    std::string name;

    bool operator==(const Status&) const = default;
};

/**
 * Document - one piece of prose in the manuscript tree.
 *
 * Content, notes and synopsis are Markdown. Order is a sibling sort key,
 * not globally unique. Keywords are free text; their ids only exist inside
 * a single import or export.
 */
struct Document {
    Uuid id;
    std::string title;
    std::string content;
    std::string notes;
    std::string synopsis;
    Timestamp created;
    int order{0};
    std::optional<std::string> label_id;
    std::optional<std::string> status_id;
    std::vector<std::string> keywords;
    bool include_in_compile{true};
    std::string color_name;  // hint, e.g. "Red"
    std::string icon_name;   // hint, e.g. "flag"

    bool operator==(const Document&) const = default;
};

enum class FolderKind {
    Draft,
    Research,
    Trash,
    Subfolder,
};

[[nodiscard]] std::string_view folder_kind_name(FolderKind kind) noexcept;

/**
 * Folder - an ordered container of documents and folders.
 *
 * Documents are listed before subfolders when the tree is walked.
 */
struct Folder {
    Uuid id;
    std::string title;
    Timestamp created;
    FolderKind kind{FolderKind::Subfolder};
    int order{0};
    std::vector<Document> documents;
    std::vector<Folder> subfolders;

    bool operator==(const Folder&) const = default;
};

enum class SessionReset {
    Midnight,
    Time,
    Never,
};

/**
 * Word-count goals for the draft and for a writing session.
 */
struct WritingTargets {
    int draft_word_count{0};
    std::optional<Timestamp> draft_deadline;
    bool deadline_ignored{true};
    bool count_included_only{false};
    int session_word_count{0};
    SessionReset session_reset{SessionReset::Midnight};
    std::string session_reset_time;  // "HH:mm", used with SessionReset::Time
    bool allow_negatives{false};

    bool operator==(const WritingTargets&) const = default;
};

/**
 * One day of the writing log.
 */
struct WritingDay {
    std::string date;  // yyyy-MM-dd
    int words{0};
    int draft_words{0};
    int duration_seconds{0};

    bool operator==(const WritingDay&) const = default;
};

/**
 * Manuscript - the whole writing project as handed to import/export.
 *
 * Exactly one draft folder. Research and trash are optional siblings of it,
 * never nested inside.
 */
struct Manuscript {
    std::string title;
    std::string author;
    Timestamp created;
    Timestamp modified;
    Folder draft;
    std::optional<Folder> research;
    std::optional<Folder> trash;
    std::vector<Label> labels;
    std::vector<Status> statuses;
    WritingTargets targets;
    std::vector<WritingDay> writing_history;

    bool operator==(const Manuscript&) const = default;
};

// ============================================================================
// Construction
// ============================================================================

[[nodiscard]] Document create_document(std::string title, std::string content = {}, int order = 0);

[[nodiscard]] Folder create_folder(std::string title, FolderKind kind = FolderKind::Subfolder, int order = 0);

/**
 * An empty manuscript with a "Draft" folder.
 */
[[nodiscard]] Manuscript create_manuscript(std::string title, std::string author = {});

// ============================================================================
// Queries
// ============================================================================

[[nodiscard]] const Label* find_label(const Manuscript& manuscript, std::string_view id);

[[nodiscard]] const Status* find_status(const Manuscript& manuscript, std::string_view id);

/**
 * Documents by ascending order. Ties keep their stored sequence.
 */
[[nodiscard]] std::vector<const Document*> sorted_documents(const Folder& folder);

[[nodiscard]] std::vector<const Folder*> sorted_subfolders(const Folder& folder);

[[nodiscard]] size_t count_documents(const Folder& folder);

[[nodiscard]] size_t count_folders(const Folder& folder);

/**
 * Deduplicated keywords of every document below `folder`.
 */
void collect_keywords(const Folder& folder, std::set<std::string>& out);

/**
 * Whitespace-separated word count.
 */
[[nodiscard]] size_t count_words(std::string_view text);

/**
 * Number of Unicode scalar values in UTF-8 text.
 */
[[nodiscard]] size_t count_characters(std::string_view utf8);

/**
 * "My Novel: Part 1" -> "my-novel-part-1". Empty input yields "manuscript".
 */
[[nodiscard]] std::string slugify(std::string_view title);

} // namespace folio
