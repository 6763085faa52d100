#include "scrivener/binder_xml_writer.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <utility>
#include <vector>

namespace folio::scrivener {

namespace {

constexpr std::array<std::string_view, 8> kKeywordPalette = {
    "0.993495 0.701227 0.732594",  // red
    "0.995418 0.790968 0.65239",   // orange
    "0.99772 0.892753 0.652574",   // yellow
    "0.715848 0.948734 0.697698",  // green
    "0.702312 0.888297 0.97426",   // blue
    "0.957564 0.766768 0.999625",  // purple
    "0.943039 0.654989 0.986895",  // pink
    "0.584909 0.947715 0.802964",  // teal
};

std::string_view folder_type(FolderKind kind) {
    switch (kind) {
        case FolderKind::Draft: return "DraftFolder";
        case FolderKind::Research: return "ResearchFolder";
        case FolderKind::Trash: return "TrashFolder";
        case FolderKind::Subfolder: return "Folder";
    }
    return "Folder";
}

std::string_view reset_type(SessionReset reset) {
    switch (reset) {
        case SessionReset::Midnight: return "Midnight";
        case SessionReset::Time: return "Time";
        case SessionReset::Never: return "Never";
    }
    return "Midnight";
}

std::string_view yes_no(bool v) {
    return v ? "Yes" : "No";
}

bool has_content(const Folder& folder) {
    return !folder.documents.empty() || !folder.subfolders.empty();
}

size_t folder_word_count(const Folder& folder, size_t& chars) {
    size_t words = 0;
    for (const auto& doc : folder.documents) {
        words += count_words(doc.content);
        chars += count_characters(doc.content);
    }
    for (const auto& sub : folder.subfolders) {
        words += folder_word_count(sub, chars);
    }
    return words;
}

class BinderXmlWriter {
public:
    BinderXmlWriter(const Manuscript& manuscript, const ExportMappings& mappings, const BinderWriterOptions& options)
        : manuscript_(manuscript), mappings_(mappings), options_(options) {}

    std::string build() {
        out_ += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        out_ += "<ScrivenerProject Identifier=\"" + Uuid::generate().to_upper_string() +
                "\" Version=\"2.0\" Creator=\"" + escape_xml(options_.creator) +
                "\" Device=\"" + escape_xml(options_.device) +
                "\" Modified=\"" + options_.now.to_scrivener_string() +
                "\" ModID=\"" + Uuid::generate().to_upper_string() + "\">\n";

        line(1, "<Binder>");
        write_folder(manuscript_.draft, FolderKind::Draft, 2, false);
        if (manuscript_.research && has_content(*manuscript_.research)) {
            write_folder(*manuscript_.research, FolderKind::Research, 2, false);
        }
        if (manuscript_.trash && has_content(*manuscript_.trash)) {
            write_folder(*manuscript_.trash, FolderKind::Trash, 2, true);
        }
        line(1, "</Binder>");

        write_collections();
        write_keywords();
        write_section_types();
        write_label_settings();
        write_status_settings();
        write_project_targets();
        write_recent_writing_history();
        write_print_settings();
        write_project_properties();

        out_ += "</ScrivenerProject>\n";
        return std::move(out_);
    }

private:
    void line(int indent, std::string_view text) {
        out_.append(static_cast<size_t>(indent) * 4, ' ');
        out_ += text;
        out_ += '\n';
    }

    std::string uuid_for(const Uuid& id, std::string_view title) const {
        const auto it = mappings_.uuids.find(id);
        if (it == mappings_.uuids.end()) {
            throw std::logic_error("no binder UUID mapped for \"" + std::string(title) + "\"");
        }
        return it->second.to_upper_string();
    }

    void write_folder(const Folder& folder, FolderKind kind, int indent, bool in_trash) {
        const bool special = kind != FolderKind::Subfolder;
        line(indent, "<BinderItem UUID=\"" + uuid_for(folder.id, folder.title) + "\" Type=\"" +
                         std::string(folder_type(kind)) + "\" Created=\"" + folder.created.to_scrivener_string() +
                         "\" Modified=\"" + options_.now.to_scrivener_string() + "\">");
        line(indent + 1, "<Title>" + escape_xml(folder.title) + "</Title>");
        line(indent + 1, "<MetaData>");
        line(indent + 2, "<IncludeInCompile>Yes</IncludeInCompile>");
        line(indent + 1, "</MetaData>");
        if (!special) {
            line(indent + 1, "<TextSettings>");
            line(indent + 2, "<TextSelection>0,0</TextSelection>");
            line(indent + 1, "</TextSettings>");
        }

        const auto docs = sorted_documents(folder);
        const auto subs = sorted_subfolders(folder);
        if (!docs.empty() || !subs.empty()) {
            line(indent + 1, "<Children>");
            for (const auto* doc : docs) {
                write_document(*doc, indent + 2, in_trash);
            }
            for (const auto* sub : subs) {
                write_folder(*sub, FolderKind::Subfolder, indent + 2, in_trash);
            }
            line(indent + 1, "</Children>");
        }
        line(indent, "</BinderItem>");
    }

    void write_document(const Document& doc, int indent, bool in_trash) {
        line(indent, "<BinderItem UUID=\"" + uuid_for(doc.id, doc.title) + "\" Type=\"Text\" Created=\"" +
                         doc.created.to_scrivener_string() + "\" Modified=\"" +
                         options_.now.to_scrivener_string() + "\">");
        line(indent + 1, "<Title>" + escape_xml(doc.title) + "</Title>");
        line(indent + 1, "<MetaData>");
        line(indent + 2, "<IncludeInCompile>" + std::string(yes_no(doc.include_in_compile)) + "</IncludeInCompile>");

        if (doc.label_id) {
            const auto it = mappings_.labels.find(*doc.label_id);
            if (it == mappings_.labels.end()) {
                throw std::logic_error("label \"" + *doc.label_id + "\" of \"" + doc.title + "\" is not mapped");
            }
            line(indent + 2, "<LabelID>" + std::to_string(it->second) + "</LabelID>");
        }
        if (doc.status_id) {
            const auto it = mappings_.statuses.find(*doc.status_id);
            if (it == mappings_.statuses.end()) {
                throw std::logic_error("status \"" + *doc.status_id + "\" of \"" + doc.title + "\" is not mapped");
            }
            line(indent + 2, "<StatusID>" + std::to_string(it->second) + "</StatusID>");
        }

        std::vector<int> keyword_ids;
        for (const auto& keyword : doc.keywords) {
            const auto it = mappings_.keywords.find(keyword);
            if (it != mappings_.keywords.end()) {
                keyword_ids.push_back(it->second);
            } else if (!in_trash) {
                throw std::logic_error("keyword \"" + keyword + "\" of \"" + doc.title + "\" is not mapped");
            }
        }
        if (!keyword_ids.empty()) {
            line(indent + 2, "<Keywords>");
            for (int id : keyword_ids) {
                line(indent + 3, "<KeywordID>" + std::to_string(id) + "</KeywordID>");
            }
            line(indent + 2, "</Keywords>");
        }
        line(indent + 1, "</MetaData>");

        line(indent + 1, "<TextSettings>");
        line(indent + 2, "<TextSelection>0,0</TextSelection>");
        line(indent + 1, "</TextSettings>");
        if (!doc.synopsis.empty()) {
            line(indent + 1, "<Synopsis>" + escape_xml(doc.synopsis) + "</Synopsis>");
        }
        line(indent, "</BinderItem>");
    }

    void write_collections() {
        line(1, "<Collections>");
        line(2, "<Collection Type=\"Binder\" ID=\"" + Uuid::generate().to_upper_string() + "\" Color=\"1.0 1.0 1.0\">");
        line(3, "<Title>Binder</Title>");
        line(2, "</Collection>");
        line(1, "</Collections>");
    }

    void write_keywords() {
        if (mappings_.keywords.empty()) {
            return;
        }
        std::vector<std::pair<int, std::string>> by_id;
        by_id.reserve(mappings_.keywords.size());
        for (const auto& [text, id] : mappings_.keywords) {
            by_id.emplace_back(id, text);
        }
        std::sort(by_id.begin(), by_id.end());

        line(1, "<Keywords>");
        for (const auto& [id, text] : by_id) {
            line(2, "<Keyword ID=\"" + std::to_string(id) + "\">");
            line(3, "<Title>" + escape_xml(text) + "</Title>");
            line(3, "<Color>" + std::string(kKeywordPalette[static_cast<size_t>(id) % kKeywordPalette.size()]) +
                        "</Color>");
            line(2, "</Keyword>");
        }
        line(1, "</Keywords>");
    }

    void write_section_types() {
        const auto heading = Uuid::generate().to_upper_string();
        const auto sub_heading = Uuid::generate().to_upper_string();
        const auto section = Uuid::generate().to_upper_string();
        line(1, "<SectionTypes>");
        line(2, "<TypeDefinitions>");
        line(3, "<Type ID=\"" + heading + "\">Heading</Type>");
        line(3, "<Type ID=\"" + sub_heading + "\">Sub-Heading</Type>");
        line(3, "<Type ID=\"" + section + "\">Section</Type>");
        line(2, "</TypeDefinitions>");
        line(2, "<LevelTypes>");
        line(3, "<Folders>");
        line(4, "<Type>" + heading + "</Type>");
        line(3, "</Folders>");
        line(3, "<Containers>");
        line(4, "<Type>" + section + "</Type>");
        line(3, "</Containers>");
        line(3, "<Files>");
        line(4, "<Type>" + section + "</Type>");
        line(3, "</Files>");
        line(2, "</LevelTypes>");
        line(1, "</SectionTypes>");
    }

    void write_label_settings() {
        line(1, "<LabelSettings>");
        line(2, "<Title>Label</Title>");
        line(2, "<DefaultLabelID>-1</DefaultLabelID>");
        line(2, "<Labels>");
        line(3, "<Label ID=\"-1\">No Label</Label>");
        for (const auto& label : manuscript_.labels) {
            const auto it = mappings_.labels.find(label.id);
            if (it == mappings_.labels.end()) {
                throw std::logic_error("label \"" + label.id + "\" is not mapped");
            }
            line(3, "<Label ID=\"" + std::to_string(it->second) + "\" Color=\"" +
                        hex_to_scrivener_color(label.color_hex) + "\">" + escape_xml(label.name) + "</Label>");
        }
        line(2, "</Labels>");
        line(1, "</LabelSettings>");
    }

    void write_status_settings() {
        line(1, "<StatusSettings>");
        line(2, "<Title>Status</Title>");
        line(2, "<DefaultStatusID>-1</DefaultStatusID>");
        line(2, "<StatusItems>");
        line(3, "<Status ID=\"-1\">No Status</Status>");
        for (const auto& status : manuscript_.statuses) {
            const auto it = mappings_.statuses.find(status.id);
            if (it == mappings_.statuses.end()) {
                throw std::logic_error("status \"" + status.id + "\" is not mapped");
            }
            line(3, "<Status ID=\"" + std::to_string(it->second) + "\">" + escape_xml(status.name) + "</Status>");
        }
        line(2, "</StatusItems>");
        line(1, "</StatusSettings>");
    }

    void write_project_targets() {
        const auto& t = manuscript_.targets;
        line(1, "<ProjectTargets Notify=\"No\">");

        std::string draft = "<DraftTarget Type=\"Words\" CountIncludedOnly=\"" +
                            std::string(yes_no(t.count_included_only)) + "\" CurrentCompileGroupOnly=\"No\"";
        if (t.draft_deadline) {
            draft += " Deadline=\"" + t.draft_deadline->to_scrivener_string() + "\"";
        }
        draft += " IgnoreDeadline=\"" + std::string(yes_no(t.deadline_ignored)) + "\">" +
                 std::to_string(t.draft_word_count) + "</DraftTarget>";
        line(2, draft);

        const auto tomorrow = options_.now + std::chrono::hours(24);
        const auto reset_time = t.session_reset_time.empty() ? std::string("00:00") : t.session_reset_time;
        line(2, "<SessionTarget Type=\"Words\" CountDraftOnly=\"Yes\" AllowNegatives=\"" +
                    std::string(yes_no(t.allow_negatives)) + "\" NextResetDate=\"" +
                    tomorrow.to_scrivener_string() + "\" ResetType=\"" + std::string(reset_type(t.session_reset)) +
                    "\" ResetTime=\"" + escape_xml(reset_time) +
                    "\" DeterminedFromDeadline=\"No\" WritingDays=\"\" CanWriteOnDeadlineDate=\"No\">" +
                    std::to_string(t.session_word_count) + "</SessionTarget>");
        line(2, "<PreviousSession Words=\"0\" Characters=\"0\" Date=\"" + options_.now.to_scrivener_string() + "\"/>");
        line(1, "</ProjectTargets>");
    }

    void write_recent_writing_history() {
        size_t draft_chars = 0;
        const size_t draft_words = folder_word_count(manuscript_.draft, draft_chars);
        size_t other_chars = 0;
        size_t other_words = 0;
        if (manuscript_.research) {
            other_words = folder_word_count(*manuscript_.research, other_chars);
        }
        line(1, "<RecentWritingHistory Date=\"" + options_.now.to_scrivener_string() + "\">");
        line(2, "<DraftWordCount>" + std::to_string(draft_words) + "</DraftWordCount>");
        line(2, "<DraftCharCount>" + std::to_string(draft_chars) + "</DraftCharCount>");
        line(2, "<OtherWordCount>" + std::to_string(other_words) + "</OtherWordCount>");
        line(2, "<OtherCharCount>" + std::to_string(other_chars) + "</OtherCharCount>");
        line(1, "</RecentWritingHistory>");
    }

    void write_print_settings() {
        line(1, "<PrintSettings PaperSize=\"612.0,792.0\" LeftMargin=\"72.0\" RightMargin=\"72.0\" "
                "TopMargin=\"90.0\" BottomMargin=\"90.0\" PaperType=\"na-letter\" Orientation=\"Portrait\" "
                "HorizontalPagination=\"Clip\" VerticalPagination=\"Auto\" ScaleFactor=\"1.0\" "
                "HorizontallyCentered=\"Yes\" VerticallyCentered=\"Yes\" Collates=\"Yes\" PagesAcross=\"1\" "
                "PagesDown=\"1\"/>");
    }

    void write_project_properties() {
        line(1, "<ProjectProperties>");
        line(2, "<ProjectTitle>" + escape_xml(manuscript_.title) + "</ProjectTitle>");
        if (!manuscript_.author.empty()) {
            line(2, "<FullName>" + escape_xml(manuscript_.author) + "</FullName>");
        }
        line(1, "</ProjectProperties>");
    }

    const Manuscript& manuscript_;
    const ExportMappings& mappings_;
    const BinderWriterOptions& options_;
    std::string out_;
};

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string write_binder_xml(const Manuscript& manuscript,
                             const ExportMappings& mappings,
                             const BinderWriterOptions& options) {
    BinderXmlWriter writer(manuscript, mappings, options);
    return writer.build();
}

std::string hex_to_scrivener_color(std::string_view hex) {
    while (!hex.empty() && (hex.front() == ' ' || hex.front() == '#')) hex.remove_prefix(1);
    while (!hex.empty() && hex.back() == ' ') hex.remove_suffix(1);
    if (hex.size() != 6) {
        return "0.5 0.5 0.5";
    }
    double rgb[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_digit(hex[i * 2]);
        const int lo = hex_digit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return "0.5 0.5 0.5";
        rgb[i] = (hi * 16 + lo) / 255.0;
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f %.6f %.6f", rgb[0], rgb[1], rgb[2]);
    return buf;
}

} // namespace folio::scrivener
