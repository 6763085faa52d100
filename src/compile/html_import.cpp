#include "compile/html_import.hpp"

#include "text/markdown_bridge.hpp"
#include "util/file_io.hpp"
#include "util/log_categories.hpp"

#include <QFileInfo>
#include <QFont>
#include <QStringConverter>
#include <QTextBlock>
#include <QTextDocument>
#include <QTextFragment>

#include <algorithm>

namespace folio::compile {

namespace {

using text::RunList;
using text::TextAttributes;

TextAttributes attributes_of(const QTextCharFormat& format, int heading_level) {
    TextAttributes a;
    a.bold = format.fontWeight() >= QFont::Bold;
    a.italic = format.fontItalic();
    a.strikethrough = format.fontStrikeOut();
    a.highlight = format.background().style() != Qt::NoBrush;
    if (format.isAnchor() && !format.anchorHref().isEmpty() && !format.anchorHref().startsWith(QLatin1Char('#'))) {
        a.link = format.anchorHref().toStdString();
    } else {
        a.underline = format.fontUnderline();
    }
    a.heading_level = heading_level;
    return a;
}

// QTextDocument stores <br> as U+2028 and embedded objects as U+FFFC.
std::string fragment_text(const QString& text, size_t& dropped) {
    QString out;
    out.reserve(text.size());
    for (const QChar c : text) {
        if (c == QChar::LineSeparator) {
            out += QLatin1Char('\n');
        } else if (c == QChar::ObjectReplacementCharacter) {
            ++dropped;
        } else if (c == QChar::Nbsp) {
            out += QLatin1Char(' ');
        } else {
            out += c;
        }
    }
    return out.toStdString();
}

} // namespace

HtmlRuns html_to_runs(const QString& html) {
    QTextDocument doc;
    doc.setHtml(html);

    HtmlRuns result;
    result.title = doc.metaInformation(QTextDocument::DocumentTitle).trimmed().toStdString();

    for (QTextBlock block = doc.begin(); block.isValid(); block = block.next()) {
        const int level = std::min(block.blockFormat().headingLevel(), 3);
        RunList line;
        for (auto it = block.begin(); !it.atEnd(); ++it) {
            const QTextFragment fragment = it.fragment();
            if (!fragment.isValid()) continue;
            text::append_run(line, fragment_text(fragment.text(), result.dropped_objects),
                             attributes_of(fragment.charFormat(), level));
        }
        const auto plain = text::plain_text(line);
        if (plain.find_first_not_of(" \t\n") == std::string::npos) continue;
        if (!result.runs.empty()) text::append_run(result.runs, "\n\n", {});
        result.runs.insert(result.runs.end(), line.begin(), line.end());
    }
    result.runs = text::normalize_runs(std::move(result.runs));
    return result;
}

Res<TextImport> import_html_file(const QString& path) {
    const QFileInfo info(path);
    if (!info.isFile()) {
        return Res<TextImport>::err(make_error(ErrorCode::FileReadFailed, path.toStdString() + " is not a file"));
    }
    auto bytes = util::read_file_bytes(path);
    if (!bytes) {
        return Res<TextImport>::err(make_error(ErrorCode::FileReadFailed, path.toStdString()));
    }

    // Honours a BOM or <meta charset>; UTF-8 otherwise.
    auto decoder = QStringDecoder::decoderForHtml(*bytes);
    QString html;
    if (decoder.isValid()) {
        html = decoder.decode(*bytes);
    } else {
        html = QString::fromUtf8(*bytes);
    }

    const auto parsed = html_to_runs(html);
    TextImport result;
    const auto name = info.fileName().toStdString();
    if (parsed.dropped_objects > 0) {
        result.report.warn(name, std::to_string(parsed.dropped_objects) + " image(s) or embedded object(s) dropped",
                           Severity::Info);
    }

    const auto title = parsed.title.empty() ? info.completeBaseName().toStdString() : parsed.title;
    result.manuscript = single_document_manuscript(title, text::runs_to_markdown(parsed.runs));
    result.report.documents = 1;
    qCInfo(folioImportLog) << "Imported HTML" << path;
    return Res<TextImport>::ok(std::move(result));
}

} // namespace folio::compile
