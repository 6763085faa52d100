#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QGuiApplication>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

#include "cli/manuscript_tree.hpp"
#include "compile/compile_service.hpp"
#include "compile/docx_import.hpp"
#include "compile/html_import.hpp"
#include "compile/text_import.hpp"
#include "scrivener/export_pipeline.hpp"
#include "scrivener/import_pipeline.hpp"
#include "util/file_io.hpp"
#include "util/log_categories.hpp"
#include "util/logging.hpp"
#include "util/settings_store.hpp"

#include <memory>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

QString qs(const std::string& s) {
    return QString::fromStdString(s);
}

int fail(const folio::Error& error) {
    QTextStream(stderr) << qs(folio::describe(error)) << QLatin1Char('\n');
    return kExitFailed;
}

int usage(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return kExitUsage;
}

folio::ProgressCallback log_progress() {
    return [](double fraction, const std::string& status) {
        qCDebug(folioCliLog).noquote() << QStringLiteral("%1%").arg(static_cast<int>(fraction * 100), 3) << qs(status);
    };
}

bool is_bundle(const QString& path) {
    return QFileInfo(path).isDir();
}

bool is_docx_path(const QString& path) {
    return QFileInfo(path).suffix().compare(QStringLiteral("docx"), Qt::CaseInsensitive) == 0;
}

bool is_html_path(const QString& path) {
    const auto suffix = QFileInfo(path).suffix().toLower();
    return suffix == QStringLiteral("html") || suffix == QStringLiteral("htm");
}

folio::Res<folio::compile::TextImport> import_single_file(const QString& path) {
    if (is_docx_path(path)) return folio::compile::import_docx_file(path);
    if (is_html_path(path)) return folio::compile::import_html_file(path);
    return folio::compile::import_text_file(path);
}

folio::Res<folio::scrivener::ImportResult> load_input(const QString& path, const folio::scrivener::ImportOptions& options) {
    using Result = folio::Res<folio::scrivener::ImportResult>;
    if (is_bundle(path)) {
        return folio::scrivener::import_scrivener(path, options, log_progress());
    }
    if (folio::compile::is_text_import_path(path) || is_docx_path(path) || is_html_path(path)) {
        auto text = import_single_file(path);
        if (text.is_err()) return Result::err(text.unwrap_err());
        auto imported = std::move(text).unwrap();
        return Result::ok(folio::scrivener::ImportResult{std::move(imported.manuscript), std::move(imported.report)});
    }
    return Result::err(folio::make_error(folio::ErrorCode::NotADirectory,
                                         path.toStdString() + " is neither a .scriv bundle nor a text, .docx or .html file"));
}

std::unique_ptr<folio::util::SettingsStore> open_settings(const QString& ini_path) {
    if (ini_path.isEmpty()) return std::make_unique<folio::util::SettingsStore>();
    return std::make_unique<folio::util::SettingsStore>(ini_path);
}

int run_inspect(const QString& input, const folio::util::SettingsStore& store, bool json) {
    auto validation = folio::scrivener::validate_bundle(input);
    if (validation.is_err()) return fail(validation.unwrap_err());
    const auto& checked = validation.unwrap();

    auto imported = folio::scrivener::import_scrivener(input, store.load_import_options(), log_progress());
    if (imported.is_err()) return fail(imported.unwrap_err());
    const auto& result = imported.unwrap();

    const folio::cli::TreeOptions tree{.include_ids = false, .include_word_counts = true};
    if (json) {
        QJsonObject project;
        project.insert(QStringLiteral("version"), QString::fromUtf8(folio::scrivener::format_version_name(checked.version).data()));
        project.insert(QStringLiteral("items"), static_cast<qint64>(checked.item_count));
        project.insert(QStringLiteral("hasMedia"), checked.has_media);

        QJsonObject root;
        root.insert(QStringLiteral("project"), project);
        root.insert(QStringLiteral("report"), folio::cli::report_to_json(result.report));
        root.insert(QStringLiteral("manuscript"), folio::cli::manuscript_to_json(result.manuscript, tree));
        QTextStream(stdout) << QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact)) << QLatin1Char('\n');
        return kExitOk;
    }

    QTextStream out(stdout);
    out << QStringLiteral("Scrivener %1, %2 items%3\n")
               .arg(QString::fromUtf8(folio::scrivener::format_version_name(checked.version).data()))
               .arg(static_cast<qulonglong>(checked.item_count))
               .arg(checked.has_media ? QStringLiteral(", contains media") : QString{});
    out << folio::cli::format_report(result.report);
    out << folio::cli::format_manuscript_tree(result.manuscript, tree);
    return kExitOk;
}

int run_compile(const QString& input, const QCommandLineParser& parser, const folio::util::SettingsStore& store,
                const QCommandLineOption& format_option, const QCommandLineOption& out_option,
                const QCommandLineOption& title_option, const QCommandLineOption& author_option) {
    auto settings = store.load_compile_settings();
    if (parser.isSet(format_option)) {
        const auto format = folio::parse_export_format(parser.value(format_option).toStdString());
        if (!format) return usage(QStringLiteral("Unknown format: ") + parser.value(format_option));
        settings.format = *format;
    }
    if (parser.isSet(title_option)) settings.title_override = parser.value(title_option).toStdString();
    if (parser.isSet(author_option)) settings.author_override = parser.value(author_option).toStdString();

    auto loaded = load_input(input, store.load_import_options());
    if (loaded.is_err()) return fail(loaded.unwrap_err());
    const auto& imported = loaded.unwrap();

    auto compiled = folio::compile::compile_manuscript(imported.manuscript, settings, log_progress());
    if (compiled.is_err()) return fail(compiled.unwrap_err());
    const auto& output = compiled.unwrap();

    const QString destination = parser.isSet(out_option) ? parser.value(out_option)
                                                         : QDir::current().filePath(qs(output.filename));
    auto written = folio::util::write_bytes_atomic(destination, output.data);
    if (written.is_err()) return fail(written.unwrap_err());

    const auto& stats = output.statistics;
    QTextStream(stdout) << QStringLiteral("Wrote %1 (%2 documents, %3 words, ~%4 pages)\n")
                               .arg(destination)
                               .arg(static_cast<qulonglong>(stats.document_count))
                               .arg(static_cast<qulonglong>(stats.word_count))
                               .arg(static_cast<qulonglong>(stats.estimated_pages));
    return kExitOk;
}

int run_convert(const QString& input, const QString& destination, const folio::util::SettingsStore& store) {
    auto imported = folio::scrivener::import_scrivener(input, store.load_import_options(), log_progress());
    if (imported.is_err()) return fail(imported.unwrap_err());
    const auto& result = imported.unwrap();

    const bool zipped = destination.endsWith(QStringLiteral(".zip"), Qt::CaseInsensitive);
    auto exported = zipped
        ? folio::scrivener::export_scrivener_zip(result.manuscript, destination, log_progress())
        : folio::scrivener::export_scrivener(result.manuscript, destination, log_progress());
    if (exported.is_err()) return fail(exported.unwrap_err());

    QTextStream out(stdout);
    out << QStringLiteral("Imported: ") << folio::cli::format_report(result.report);
    out << QStringLiteral("Exported: ") << folio::cli::format_report(exported.unwrap().report);
    out << QStringLiteral("Wrote ") << exported.unwrap().path << QLatin1Char('\n');
    return kExitOk;
}

} // namespace

int main(int argc, char *argv[])
{
    // The CLI never opens a window; PDF output still needs a GUI application for fonts.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);

    app.setApplicationName("Folio");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Folio");
    app.setOrganizationDomain("folio.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Folio manuscript interchange"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption formatOption(
        QStringList{QStringLiteral("f"), QStringLiteral("format")},
        QStringLiteral("Compile format: markdown, text, html, docx, epub or pdf."),
        QStringLiteral("format"));
    parser.addOption(formatOption);

    const QCommandLineOption outOption(
        QStringList{QStringLiteral("o"), QStringLiteral("out")},
        QStringLiteral("Output file or bundle path."),
        QStringLiteral("path"));
    parser.addOption(outOption);

    const QCommandLineOption titleOption(
        QStringList{QStringLiteral("title")},
        QStringLiteral("Override the compiled title."),
        QStringLiteral("title"));
    parser.addOption(titleOption);

    const QCommandLineOption authorOption(
        QStringList{QStringLiteral("author")},
        QStringLiteral("Override the compiled author."),
        QStringLiteral("author"));
    parser.addOption(authorOption);

    const QCommandLineOption settingsOption(
        QStringList{QStringLiteral("settings")},
        QStringLiteral("Read compile and import settings from an INI file."),
        QStringLiteral("ini"));
    parser.addOption(settingsOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Write log output to a file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run: inspect, compile or convert."));
    parser.addPositionalArgument(QStringLiteral("input"),
                                 QStringLiteral("A .scriv bundle, or a .md/.txt/.docx/.html file for compile."));
    parser.process(app);

    const bool verbose = parser.isSet(verboseOption);
    if (verbose) {
        folio::util::enable_debug_categories();
    }
    if (parser.isSet(logFileOption)) {
        folio::util::install_file_logging(parser.value(logFileOption), verbose);
        qCInfo(folioCliLog) << "Folio: logging to" << parser.value(logFileOption);
    }

    const auto positional = parser.positionalArguments();
    if (positional.size() < 2) {
        parser.showHelp(kExitUsage);
    }
    const auto command = positional.at(0);
    const auto input = positional.at(1);
    const auto store = open_settings(parser.value(settingsOption));

    if (command == QStringLiteral("inspect")) {
        return run_inspect(input, *store, parser.isSet(jsonOption));
    }
    if (command == QStringLiteral("compile")) {
        return run_compile(input, parser, *store, formatOption, outOption, titleOption, authorOption);
    }
    if (command == QStringLiteral("convert")) {
        if (!parser.isSet(outOption)) {
            return usage(QStringLiteral("convert needs --out <dest.scriv|dest.zip>"));
        }
        return run_convert(input, parser.value(outOption), *store);
    }
    return usage(QStringLiteral("Unknown command: ") + command);
}
