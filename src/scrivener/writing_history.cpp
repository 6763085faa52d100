#include "scrivener/writing_history.hpp"

#include "text/xml_escape.hpp"

#include <QDate>
#include <QXmlStreamReader>

namespace folio::scrivener {

namespace {

int attr_int(const QXmlStreamAttributes& attrs, const char* primary, const char* alternate) {
    auto value = attrs.value(QLatin1String(primary));
    if (value.isEmpty()) value = attrs.value(QLatin1String(alternate));
    bool ok = false;
    const double v = value.toString().toDouble(&ok);
    return ok ? static_cast<int>(v) : 0;
}

} // namespace

Res<std::vector<WritingDay>> parse_writing_history(const QByteArray& xml) {
    std::vector<WritingDay> days;
    QXmlStreamReader reader(xml);
    while (!reader.atEnd()) {
        reader.readNext();
        if (!reader.isStartElement() || reader.name() != QStringLiteral("Day")) {
            continue;
        }
        const auto attrs = reader.attributes();
        const auto date_text = attrs.value(QStringLiteral("Date")).toString().left(10);
        if (!QDate::fromString(date_text, QStringLiteral("yyyy-MM-dd")).isValid()) {
            continue;
        }
        days.push_back(WritingDay{
            .date = date_text.toStdString(),
            .words = attr_int(attrs, "WordCount", "Words"),
            .draft_words = attr_int(attrs, "DraftWordCount", "TotalWords"),
            .duration_seconds = attr_int(attrs, "Duration", "SessionDuration"),
        });
    }
    if (reader.hasError()) {
        return Res<std::vector<WritingDay>>::err(make_error(
            ErrorCode::XmlParsingFailed,
            QStringLiteral("writing.history line %1: %2")
                .arg(reader.lineNumber())
                .arg(reader.errorString())
                .toStdString()));
    }
    return Res<std::vector<WritingDay>>::ok(std::move(days));
}

std::string write_writing_history(const std::vector<WritingDay>& days) {
    std::string out = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<WritingHistory>\n";
    for (const auto& day : days) {
        out += "    <Day Date=\"" + text::escape_xml(day.date) + "\" WordCount=\"" + std::to_string(day.words) +
               "\" DraftWordCount=\"" + std::to_string(day.draft_words) +
               "\" Duration=\"" + std::to_string(day.duration_seconds) + "\"/>\n";
    }
    out += "</WritingHistory>\n";
    return out;
}

} // namespace folio::scrivener
