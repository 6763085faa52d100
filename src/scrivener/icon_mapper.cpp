#include "scrivener/icon_mapper.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace folio::scrivener {

namespace {

using Entry = std::pair<std::string_view, std::string_view>;

// Category names as they appear before "(Colour)".
constexpr std::array<Entry, 30> kCategories = {{
    {"flag", "flag"},         {"book", "book"},           {"note", "note"},
    {"notebook", "book"},     {"circle", "circle"},       {"square", "square"},
    {"triangle", "triangle"}, {"diamond", "diamond"},     {"label", "tag"},
    {"tag", "tag"},           {"star", "star"},           {"heart", "heart"},
    {"bookmark", "bookmark"}, {"to do", "checkmark"},     {"todo", "checkmark"},
    {"checkbox", "checkmark"},{"document", "document"},   {"doc", "document"},
    {"folder", "folder"},     {"text", "document"},       {"character", "person"},
    {"person", "person"},     {"people", "people"},       {"location", "pin"},
    {"place", "pin"},         {"house", "house"},         {"lightbulb", "lightbulb"},
    {"idea", "lightbulb"},    {"clock", "clock"},         {"photo", "photo"},
}};

// Whole icon names without a colour variant.
constexpr std::array<Entry, 34> kNames = {{
    {"calendar", "calendar"},   {"clock", "clock"},         {"lightbulb", "lightbulb"},
    {"idea", "lightbulb"},      {"speech bubble", "bubble"},{"warning", "warning"},
    {"question", "question"},   {"research", "search"},     {"search", "search"},
    {"star", "star"},           {"heart", "heart"},         {"lock", "lock"},
    {"key", "key"},             {"pin", "pin"},             {"link", "link"},
    {"camera", "photo"},        {"photo", "photo"},         {"image", "photo"},
    {"film", "film"},           {"music", "music"},         {"globe", "globe"},
    {"map", "map"},             {"location", "pin"},        {"house", "house"},
    {"person", "person"},       {"character", "person"},    {"people", "people"},
    {"scene", "scene"},         {"chapter", "book"},        {"notes", "note"},
    {"note", "note"},           {"trash", "trash"},         {"folder", "folder"},
    {"flag", "flag"},
}};

constexpr std::array<std::string_view, 16> kColors = {
    "red", "orange", "yellow", "green", "blue", "purple", "violet", "pink",
    "cyan", "teal", "magenta", "lime", "indigo", "gray", "grey", "brown",
};

std::string lower_trimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string capitalized(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    if (s == "Grey") s = "Gray";
    return s;
}

std::string_view lookup(const auto& table, std::string_view key) {
    for (const auto& [k, v] : table) {
        if (k == key) return v;
    }
    return {};
}

} // namespace

std::string_view default_icon(BinderItemKind kind) noexcept {
    switch (kind) {
        case BinderItemKind::DraftFolder: return "book";
        case BinderItemKind::ResearchFolder: return "search";
        case BinderItemKind::TrashFolder: return "trash";
        case BinderItemKind::Folder:
        case BinderItemKind::Root: return "folder";
        case BinderItemKind::Text: return "document";
        case BinderItemKind::Pdf: return "pdf";
        case BinderItemKind::Image: return "photo";
        case BinderItemKind::WebPage: return "globe";
        case BinderItemKind::Other: return "document";
    }
    return "document";
}

IconHint map_icon(std::string_view icon_file_name, BinderItemKind kind) {
    const auto name = lower_trimmed(icon_file_name);
    if (name.empty()) {
        return IconHint{std::string(default_icon(kind)), {}};
    }

    // "Category (Variant)"
    const auto open = name.rfind('(');
    if (open != std::string::npos && name.back() == ')') {
        const auto category = lower_trimmed(std::string_view(name).substr(0, open));
        const auto variant = lower_trimmed(std::string_view(name).substr(open + 1, name.size() - open - 2));
        const auto symbol = lookup(kCategories, category);
        if (!symbol.empty()) {
            IconHint hint{std::string(symbol), {}};
            if (std::find(kColors.begin(), kColors.end(), variant) != kColors.end()) {
                hint.color_name = capitalized(variant);
            } else if (variant == "ticked" || variant == "checked") {
                hint.color_name = "Green";
            }
            return hint;
        }
    }

    if (const auto symbol = lookup(kNames, name); !symbol.empty()) {
        return IconHint{std::string(symbol), {}};
    }
    for (const auto& [key, symbol] : kNames) {
        if (name.find(key) != std::string::npos) {
            return IconHint{std::string(symbol), {}};
        }
    }
    return IconHint{std::string(default_icon(kind)), {}};
}

} // namespace folio::scrivener
