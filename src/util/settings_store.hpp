#pragma once

#include "core/compile_settings.hpp"
#include "scrivener/import_options.hpp"

#include <QString>

#include <memory>

class QSettings;

namespace folio::util {

constexpr double kMinFontSize = 6.0;
constexpr double kMaxFontSize = 72.0;
constexpr double kMinLineSpacing = 1.0;
constexpr double kMaxLineSpacing = 3.0;
constexpr double kMaxMargin = 288.0;
constexpr double kMinPageDimension = 72.0;
constexpr double kMaxPageDimension = 5000.0;

/**
 * Persists CompileSettings under compile/* and ImportOptions under
 * import/*. Values are normalised on load; unknown enum names fall back
 * to the defaults.
 */
class SettingsStore {
public:
    // Default application scope (organisation/application names).
    SettingsStore();
    // An INI file, created on first save.
    explicit SettingsStore(const QString& ini_path);
    ~SettingsStore();

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    [[nodiscard]] CompileSettings load_compile_settings() const;
    void save_compile_settings(const CompileSettings& settings);

    [[nodiscard]] scrivener::ImportOptions load_import_options() const;
    void save_import_options(const scrivener::ImportOptions& options);

    // Writes pending changes; false when QSettings reports an error.
    [[nodiscard]] bool sync();

    [[nodiscard]] QString file_name() const;

private:
    std::unique_ptr<QSettings> settings_;
};

[[nodiscard]] CompileSettings normalize_compile_settings(CompileSettings settings);

[[nodiscard]] std::string_view separator_id(DocumentSeparator separator) noexcept;
[[nodiscard]] std::optional<DocumentSeparator> parse_separator(std::string_view id);
[[nodiscard]] std::string_view font_style_id(FontStyle style) noexcept;
[[nodiscard]] std::optional<FontStyle> parse_font_style(std::string_view id);

} // namespace folio::util
