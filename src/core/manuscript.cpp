#include "core/manuscript.hpp"

#include <algorithm>
#include <cctype>

namespace folio {

std::string_view folder_kind_name(FolderKind kind) noexcept {
    switch (kind) {
        case FolderKind::Draft: return "draft";
        case FolderKind::Research: return "research";
        case FolderKind::Trash: return "trash";
        case FolderKind::Subfolder: return "subfolder";
    }
    return "subfolder";
}

Document create_document(std::string title, std::string content, int order) {
    return Document{
        .id = Uuid::generate(),
        .title = std::move(title),
        .content = std::move(content),
        .created = Timestamp::now(),
        .order = order,
    };
}

Folder create_folder(std::string title, FolderKind kind, int order) {
    return Folder{
        .id = Uuid::generate(),
        .title = std::move(title),
        .created = Timestamp::now(),
        .kind = kind,
        .order = order,
    };
}

Manuscript create_manuscript(std::string title, std::string author) {
    const auto now = Timestamp::now();
    return Manuscript{
        .title = std::move(title),
        .author = std::move(author),
        .created = now,
        .modified = now,
        .draft = create_folder("Draft", FolderKind::Draft),
    };
}

const Label* find_label(const Manuscript& manuscript, std::string_view id) {
    for (const auto& label : manuscript.labels) {
        if (label.id == id) return &label;
    }
    return nullptr;
}

const Status* find_status(const Manuscript& manuscript, std::string_view id) {
    for (const auto& status : manuscript.statuses) {
        if (status.id == id) return &status;
    }
    return nullptr;
}

std::vector<const Document*> sorted_documents(const Folder& folder) {
    std::vector<const Document*> out;
    out.reserve(folder.documents.size());
    for (const auto& doc : folder.documents) out.push_back(&doc);
    std::stable_sort(out.begin(), out.end(),
                     [](const Document* a, const Document* b) { return a->order < b->order; });
    return out;
}

std::vector<const Folder*> sorted_subfolders(const Folder& folder) {
    std::vector<const Folder*> out;
    out.reserve(folder.subfolders.size());
    for (const auto& sub : folder.subfolders) out.push_back(&sub);
    std::stable_sort(out.begin(), out.end(),
                     [](const Folder* a, const Folder* b) { return a->order < b->order; });
    return out;
}

size_t count_documents(const Folder& folder) {
    size_t n = folder.documents.size();
    for (const auto& sub : folder.subfolders) n += count_documents(sub);
    return n;
}

size_t count_folders(const Folder& folder) {
    size_t n = folder.subfolders.size();
    for (const auto& sub : folder.subfolders) n += count_folders(sub);
    return n;
}

void collect_keywords(const Folder& folder, std::set<std::string>& out) {
    for (const auto& doc : folder.documents) {
        for (const auto& kw : doc.keywords) {
            if (!kw.empty()) out.insert(kw);
        }
    }
    for (const auto& sub : folder.subfolders) collect_keywords(sub, out);
}

size_t count_words(std::string_view text) {
    size_t words = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

size_t count_characters(std::string_view utf8) {
    // Count everything that is not a continuation byte.
    return static_cast<size_t>(std::count_if(utf8.begin(), utf8.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string slugify(std::string_view title) {
    std::string out;
    out.reserve(title.size());
    bool pending_dash = false;
    for (unsigned char c : title) {
        if (std::isalnum(c)) {
            if (pending_dash && !out.empty()) out += '-';
            pending_dash = false;
            out += static_cast<char>(std::tolower(c));
        } else if (c >= 0x80) {
            // Keep non-ASCII letters as-is; filesystems accept UTF-8.
            if (pending_dash && !out.empty()) out += '-';
            pending_dash = false;
            out += static_cast<char>(c);
        } else {
            pending_dash = true;
        }
    }
    if (out.empty()) return "manuscript";
    return out;
}

} // namespace folio
