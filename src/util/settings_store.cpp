#include "util/settings_store.hpp"

#include <QSettings>

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace folio::util {

namespace {

constexpr const char* kSettingsFormat = "compile/format";
constexpr const char* kSettingsTitleOverride = "compile/title_override";
constexpr const char* kSettingsAuthorOverride = "compile/author_override";
constexpr const char* kSettingsFrontMatter = "compile/front_matter";
constexpr const char* kSettingsTableOfContents = "compile/table_of_contents";
constexpr const char* kSettingsSeparator = "compile/separator";
constexpr const char* kSettingsPageSize = "compile/page_size";
constexpr const char* kSettingsPageWidth = "compile/page_width";
constexpr const char* kSettingsPageHeight = "compile/page_height";
constexpr const char* kSettingsFontStyle = "compile/font_style";
constexpr const char* kSettingsFontSize = "compile/font_size";
constexpr const char* kSettingsLineSpacing = "compile/line_spacing";
constexpr const char* kSettingsMarginTop = "compile/margin_top";
constexpr const char* kSettingsMarginLeft = "compile/margin_left";
constexpr const char* kSettingsMarginBottom = "compile/margin_bottom";
constexpr const char* kSettingsMarginRight = "compile/margin_right";
constexpr const char* kSettingsPageNumbers = "compile/page_numbers";
constexpr const char* kSettingsTitlePage = "compile/title_page";
constexpr const char* kSettingsChapterTitles = "compile/chapter_titles";

constexpr const char* kSettingsImportResearch = "import/research";
constexpr const char* kSettingsImportTrash = "import/trash";
constexpr const char* kSettingsConvertRtf = "import/convert_rtf";
constexpr const char* kSettingsWritingHistory = "import/writing_history";

constexpr std::array<std::pair<DocumentSeparator, std::string_view>, 5> kSeparatorIds = {{
    {DocumentSeparator::None, "none"},
    {DocumentSeparator::BlankLine, "blankLine"},
    {DocumentSeparator::ThreeAsterisks, "threeAsterisks"},
    {DocumentSeparator::PageBreak, "pageBreak"},
    {DocumentSeparator::ChapterHeading, "chapterHeading"},
}};

constexpr std::array<std::pair<FontStyle, std::string_view>, 3> kFontStyleIds = {{
    {FontStyle::Serif, "serif"},
    {FontStyle::SansSerif, "sansSerif"},
    {FontStyle::Monospace, "monospace"},
}};

QString key(const char* k) {
    return QString::fromLatin1(k);
}

std::string string_value(const QSettings& s, const char* k) {
    return s.value(key(k), QString{}).toString().toStdString();
}

double clamp_or(double value, double lo, double hi, double fallback) {
    if (std::isnan(value)) return fallback;
    return std::clamp(value, lo, hi);
}

std::string_view page_size_id(PageSizePreset preset) {
    switch (preset) {
        case PageSizePreset::Letter: return "letter";
        case PageSizePreset::A4: return "a4";
        case PageSizePreset::Custom: return "custom";
    }
    return "letter";
}

} // namespace

std::string_view separator_id(DocumentSeparator separator) noexcept {
    for (const auto& [value, id] : kSeparatorIds) {
        if (value == separator) return id;
    }
    return "chapterHeading";
}

std::optional<DocumentSeparator> parse_separator(std::string_view id) {
    for (const auto& [value, name] : kSeparatorIds) {
        if (name == id) return value;
    }
    return std::nullopt;
}

std::string_view font_style_id(FontStyle style) noexcept {
    for (const auto& [value, id] : kFontStyleIds) {
        if (value == style) return id;
    }
    return "serif";
}

std::optional<FontStyle> parse_font_style(std::string_view id) {
    for (const auto& [value, name] : kFontStyleIds) {
        if (name == id) return value;
    }
    return std::nullopt;
}

CompileSettings normalize_compile_settings(CompileSettings s) {
    const CompileSettings defaults;
    s.font_size = clamp_or(s.font_size, kMinFontSize, kMaxFontSize, defaults.font_size);
    s.line_spacing = clamp_or(s.line_spacing, kMinLineSpacing, kMaxLineSpacing, defaults.line_spacing);
    for (double* m : {&s.margins.top, &s.margins.left, &s.margins.bottom, &s.margins.right}) {
        *m = clamp_or(*m, 0.0, kMaxMargin, 72.0);
    }
    switch (s.page_size.preset) {
        case PageSizePreset::Letter: s.page_size = PageSize::letter(); break;
        case PageSizePreset::A4: s.page_size = PageSize::a4(); break;
        case PageSizePreset::Custom:
            s.page_size.width = clamp_or(s.page_size.width, kMinPageDimension, kMaxPageDimension, 612);
            s.page_size.height = clamp_or(s.page_size.height, kMinPageDimension, kMaxPageDimension, 792);
            break;
    }
    // Margins may not swallow the page.
    const double max_h = (s.page_size.width - kMinPageDimension) / 2;
    const double max_v = (s.page_size.height - kMinPageDimension) / 2;
    s.margins.left = std::min(s.margins.left, max_h);
    s.margins.right = std::min(s.margins.right, max_h);
    s.margins.top = std::min(s.margins.top, max_v);
    s.margins.bottom = std::min(s.margins.bottom, max_v);

    if (s.title_override && s.title_override->empty()) s.title_override.reset();
    if (s.author_override && s.author_override->empty()) s.author_override.reset();
    return s;
}

SettingsStore::SettingsStore() : settings_(std::make_unique<QSettings>()) {}

SettingsStore::SettingsStore(const QString& ini_path)
    : settings_(std::make_unique<QSettings>(ini_path, QSettings::IniFormat)) {}

SettingsStore::~SettingsStore() = default;

CompileSettings SettingsStore::load_compile_settings() const {
    const auto& s = *settings_;
    CompileSettings out;

    if (auto format = parse_export_format(string_value(s, kSettingsFormat))) out.format = *format;
    if (auto title = string_value(s, kSettingsTitleOverride); !title.empty()) out.title_override = title;
    if (auto author = string_value(s, kSettingsAuthorOverride); !author.empty()) out.author_override = author;

    out.include_front_matter = s.value(key(kSettingsFrontMatter), out.include_front_matter).toBool();
    out.include_table_of_contents = s.value(key(kSettingsTableOfContents), out.include_table_of_contents).toBool();
    out.include_page_numbers = s.value(key(kSettingsPageNumbers), out.include_page_numbers).toBool();
    out.include_title_page = s.value(key(kSettingsTitlePage), out.include_title_page).toBool();
    out.include_chapter_titles = s.value(key(kSettingsChapterTitles), out.include_chapter_titles).toBool();

    if (auto sep = parse_separator(string_value(s, kSettingsSeparator))) out.separator = *sep;
    if (auto style = parse_font_style(string_value(s, kSettingsFontStyle))) out.font_style = *style;

    const auto preset = string_value(s, kSettingsPageSize);
    if (preset == "a4") {
        out.page_size = PageSize::a4();
    } else if (preset == "custom") {
        out.page_size.preset = PageSizePreset::Custom;
        out.page_size.width = s.value(key(kSettingsPageWidth), 612.0).toDouble();
        out.page_size.height = s.value(key(kSettingsPageHeight), 792.0).toDouble();
    }

    out.font_size = s.value(key(kSettingsFontSize), out.font_size).toDouble();
    out.line_spacing = s.value(key(kSettingsLineSpacing), out.line_spacing).toDouble();
    out.margins.top = s.value(key(kSettingsMarginTop), out.margins.top).toDouble();
    out.margins.left = s.value(key(kSettingsMarginLeft), out.margins.left).toDouble();
    out.margins.bottom = s.value(key(kSettingsMarginBottom), out.margins.bottom).toDouble();
    out.margins.right = s.value(key(kSettingsMarginRight), out.margins.right).toDouble();
    return normalize_compile_settings(out);
}

void SettingsStore::save_compile_settings(const CompileSettings& in) {
    const auto c = normalize_compile_settings(in);
    auto& s = *settings_;
    s.setValue(key(kSettingsFormat), QString::fromUtf8(file_extension(c.format).data()));
    s.setValue(key(kSettingsTitleOverride), QString::fromStdString(c.title_override.value_or("")));
    s.setValue(key(kSettingsAuthorOverride), QString::fromStdString(c.author_override.value_or("")));
    s.setValue(key(kSettingsFrontMatter), c.include_front_matter);
    s.setValue(key(kSettingsTableOfContents), c.include_table_of_contents);
    s.setValue(key(kSettingsSeparator), QString::fromUtf8(separator_id(c.separator).data()));
    s.setValue(key(kSettingsPageSize), QString::fromUtf8(page_size_id(c.page_size.preset).data()));
    s.setValue(key(kSettingsPageWidth), c.page_size.width);
    s.setValue(key(kSettingsPageHeight), c.page_size.height);
    s.setValue(key(kSettingsFontStyle), QString::fromUtf8(font_style_id(c.font_style).data()));
    s.setValue(key(kSettingsFontSize), c.font_size);
    s.setValue(key(kSettingsLineSpacing), c.line_spacing);
    s.setValue(key(kSettingsMarginTop), c.margins.top);
    s.setValue(key(kSettingsMarginLeft), c.margins.left);
    s.setValue(key(kSettingsMarginBottom), c.margins.bottom);
    s.setValue(key(kSettingsMarginRight), c.margins.right);
    s.setValue(key(kSettingsPageNumbers), c.include_page_numbers);
    s.setValue(key(kSettingsTitlePage), c.include_title_page);
    s.setValue(key(kSettingsChapterTitles), c.include_chapter_titles);
}

scrivener::ImportOptions SettingsStore::load_import_options() const {
    const auto& s = *settings_;
    scrivener::ImportOptions out;
    out.import_research = s.value(key(kSettingsImportResearch), out.import_research).toBool();
    out.import_trash = s.value(key(kSettingsImportTrash), out.import_trash).toBool();
    out.convert_rtf = s.value(key(kSettingsConvertRtf), out.convert_rtf).toBool();
    out.import_writing_history = s.value(key(kSettingsWritingHistory), out.import_writing_history).toBool();
    return out;
}

void SettingsStore::save_import_options(const scrivener::ImportOptions& options) {
    auto& s = *settings_;
    s.setValue(key(kSettingsImportResearch), options.import_research);
    s.setValue(key(kSettingsImportTrash), options.import_trash);
    s.setValue(key(kSettingsConvertRtf), options.convert_rtf);
    s.setValue(key(kSettingsWritingHistory), options.import_writing_history);
}

bool SettingsStore::sync() {
    settings_->sync();
    return settings_->status() == QSettings::NoError;
}

QString SettingsStore::file_name() const {
    return settings_->fileName();
}

} // namespace folio::util
