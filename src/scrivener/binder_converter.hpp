#pragma once

#include "core/manuscript.hpp"
#include "core/operation.hpp"
#include "core/result.hpp"
#include "scrivener/binder_model.hpp"
#include "scrivener/id_mapping.hpp"
#include "scrivener/import_options.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace folio::scrivener {

/**
 * Where the converter gets per-item files from. The bundle reader
 * implements it over the filesystem; tests use an in-memory map.
 */
class ContentSource {
public:
    virtual ~ContentSource() = default;

    // True when the item has its own text file, whatever it contains.
    [[nodiscard]] virtual bool has_content(const BinderItem& item) const = 0;

    // Raw bytes (usually RTF) of the item's text, nullopt when absent or unreadable.
    [[nodiscard]] virtual std::optional<std::string> content(const BinderItem& item) const = 0;
    [[nodiscard]] virtual std::optional<std::string> notes(const BinderItem& item) const = 0;

    // Plain UTF-8 synopsis file.
    [[nodiscard]] virtual std::optional<std::string> synopsis(const BinderItem& item) const = 0;
};

/**
 * Counters and warnings gathered while converting one binder.
 */
struct ConversionTally {
    size_t documents{0};
    size_t folders{0};
    size_t skipped{0};
    size_t visited{0};
    std::vector<ImportWarning> warnings;

    void warn(std::string item_title, std::string message, Severity severity = Severity::Warning) {
        warnings.push_back(ImportWarning{std::move(item_title), std::move(message), severity});
    }

    void merge_into(OperationReport& report) const;
};

/**
 * Turns a parsed binder into the manuscript tree.
 *
 * Every item is classified by BinderShape:
 *   DocumentOnly -> Document
 *   FolderOnly   -> Folder
 *   Both         -> Folder whose first document (order 0) is the item's own
 *                   text; the children follow at orders 1, 2, ...
 *   Empty        -> empty Folder
 * A Text item without children is always a Document, even when its content
 * file is missing. PDF, image and web page items are skipped.
 *
 * Content problems never abort the conversion; they become warnings. The
 * only failure is cancellation.
 */
class BinderConverter {
public:
    using ItemCallback = std::function<void(const std::string& title, size_t visited)>;

    BinderConverter(const ContentSource& source, const ImportMappings& mappings, ImportOptions options = {});

    void set_cancellation(CancellationToken token) { cancel_ = std::move(token); }

    // Called once per binder item as it is finished.
    void on_item(ItemCallback callback) { on_item_ = std::move(callback); }

    /**
     * Converts the whole project. Top-level DraftFolder, ResearchFolder and
     * TrashFolder become the draft, research and trash folders (subject to
     * the options); any other top-level item is appended to the draft.
     * The title falls back to `fallback_title` when the manifest has none.
     */
    [[nodiscard]] Res<Manuscript> convert_project(const ScrivenerProject& project, const std::string& fallback_title);

    [[nodiscard]] Res<Folder> convert_folder(const BinderItem& item, int order = 0);
    [[nodiscard]] Res<Document> convert_document(const BinderItem& item, int order);

    [[nodiscard]] const ConversionTally& tally() const noexcept { return tally_; }

private:
    [[nodiscard]] bool cancelled() const { return cancel_ && cancel_->is_cancelled(); }
    void visited(const BinderItem& item);
    void skip_subtree(const BinderItem& item, const std::string& reason);
    [[nodiscard]] std::string decode_markdown(const std::string& bytes, const std::string& title, const char* what);

    const ContentSource& source_;
    const ImportMappings& mappings_;
    ImportOptions options_;
    std::optional<CancellationToken> cancel_;
    ItemCallback on_item_;
    ConversionTally tally_;
};

} // namespace folio::scrivener
