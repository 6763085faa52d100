#include "scrivener/binder_xml_parser.hpp"

#include <QDate>
#include <QDateTime>
#include <QRegularExpression>
#include <QTime>
#include <QTimeZone>
#include <QXmlStreamReader>

#include <algorithm>
#include <vector>

namespace folio::scrivener {

namespace {

std::string to_std(const QString& s) {
    return s.toStdString();
}

bool is_yes(const QString& value) {
    const auto v = value.trimmed().toLower();
    return v == QStringLiteral("yes") || v == QStringLiteral("true") || v == QStringLiteral("1");
}

std::optional<int> to_int(const QString& text) {
    bool ok = false;
    const int v = text.trimmed().toInt(&ok);
    if (!ok) return std::nullopt;
    return v;
}

SessionReset parse_session_reset(const QString& value) {
    const auto v = value.trimmed().toLower();
    if (v == QStringLiteral("time")) return SessionReset::Time;
    if (v == QStringLiteral("never")) return SessionReset::Never;
    return SessionReset::Midnight;
}

class BinderXmlParser {
public:
    Res<ScrivenerProject> parse(const QByteArray& xml) {
        QXmlStreamReader reader(xml);
        while (!reader.atEnd()) {
            reader.readNext();
            if (reader.isStartElement()) {
                start_element(reader.name().toString(), reader.attributes());
            } else if (reader.isEndElement()) {
                end_element(reader.name().toString());
            } else if (reader.isCharacters()) {
                text_ += reader.text();
            }
        }
        if (reader.hasError()) {
            return Res<ScrivenerProject>::err(make_error(
                ErrorCode::XmlParsingFailed,
                QStringLiteral("line %1, column %2: %3")
                    .arg(reader.lineNumber())
                    .arg(reader.columnNumber())
                    .arg(reader.errorString())
                    .toStdString()));
        }

        project_.binder = std::move(children_stack_.front());
        project_.version = saw_uuid_ ? FormatVersion::V3 : FormatVersion::V2;
        return Res<ScrivenerProject>::ok(std::move(project_));
    }

private:
    void start_element(const QString& name, const QXmlStreamAttributes& attrs) {
        text_.clear();

        if (name == QStringLiteral("Binder")) {
            in_binder_ = true;
        } else if (name == QStringLiteral("BinderItem")) {
            BinderItem item;
            const auto uuid_attr = attrs.value(QStringLiteral("UUID")).toString();
            const auto id_attr = attrs.value(QStringLiteral("ID")).toString();
            if (!uuid_attr.isEmpty()) {
                item.uuid = Uuid::parse(uuid_attr.toStdString());
                saw_uuid_ = true;
            }
            if (!id_attr.isEmpty()) {
                item.id = to_std(id_attr);
            } else if (!uuid_attr.isEmpty()) {
                item.id = to_std(uuid_attr);
            } else {
                item.id = Uuid::generate().to_upper_string();
            }
            const auto type = attrs.hasAttribute(QStringLiteral("Type"))
                                  ? attrs.value(QStringLiteral("Type")).toString()
                                  : QStringLiteral("Text");
            item.kind = parse_binder_item_kind(type.toStdString());
            item.created = parse_scrivener_date(attrs.value(QStringLiteral("Created")).toString());
            item.modified = parse_scrivener_date(attrs.value(QStringLiteral("Modified")).toString());
            item_stack_.push_back(std::move(item));
            children_stack_.emplace_back();
        } else if (name == QStringLiteral("LabelSettings")) {
            in_label_settings_ = true;
        } else if (name == QStringLiteral("StatusSettings")) {
            in_status_settings_ = true;
        } else if (name == QStringLiteral("ProjectTargets")) {
            in_project_targets_ = true;
        } else if (name == QStringLiteral("KeywordSettings")) {
            in_keyword_settings_ = true;
        } else if (name == QStringLiteral("Keywords")) {
            if (!item_stack_.empty()) {
                in_item_keywords_ = true;
                item_keyword_ids_.clear();
            } else {
                in_keyword_settings_ = true;
            }
        } else if (name == QStringLiteral("Label")) {
            if (in_label_settings_) {
                current_label_id_ = to_int(attrs.value(QStringLiteral("ID")).toString());
                current_label_color_ = attrs.value(QStringLiteral("Color")).toString();
            }
        } else if (name == QStringLiteral("Status")) {
            if (in_status_settings_) {
                current_status_id_ = to_int(attrs.value(QStringLiteral("ID")).toString());
            }
        } else if (name == QStringLiteral("Keyword")) {
            if (in_keyword_settings_) {
                current_keyword_id_ = to_int(attrs.value(QStringLiteral("ID")).toString());
                current_keyword_color_ = attrs.value(QStringLiteral("Color")).toString();
                current_keyword_title_.reset();
            }
        } else if (name == QStringLiteral("DraftTarget")) {
            if (in_project_targets_) {
                auto& t = project_.targets;
                if (attrs.hasAttribute(QStringLiteral("Deadline"))) {
                    t.draft_deadline = parse_scrivener_date(attrs.value(QStringLiteral("Deadline")).toString());
                }
                t.deadline_ignored = is_yes(attrs.value(QStringLiteral("IgnoreDeadline")).toString());
                t.count_included_only = !attrs.hasAttribute(QStringLiteral("CountIncludedOnly")) ||
                                        is_yes(attrs.value(QStringLiteral("CountIncludedOnly")).toString());
            }
        } else if (name == QStringLiteral("SessionTarget")) {
            if (in_project_targets_) {
                auto& t = project_.targets;
                t.session_reset = parse_session_reset(attrs.value(QStringLiteral("ResetType")).toString());
                t.session_reset_time = to_std(attrs.value(QStringLiteral("ResetTime")).toString());
                t.allow_negatives = is_yes(attrs.value(QStringLiteral("AllowNegatives")).toString());
            }
        }
    }

    void end_element(const QString& name) {
        const auto text = text_.trimmed();
        BinderItem* top = item_stack_.empty() ? nullptr : &item_stack_.back();

        if (name == QStringLiteral("Binder")) {
            in_binder_ = false;
        } else if (name == QStringLiteral("BinderItem")) {
            finish_item();
        } else if (name == QStringLiteral("LabelSettings")) {
            in_label_settings_ = false;
        } else if (name == QStringLiteral("StatusSettings")) {
            in_status_settings_ = false;
        } else if (name == QStringLiteral("ProjectTargets")) {
            in_project_targets_ = false;
        } else if (name == QStringLiteral("KeywordSettings")) {
            in_keyword_settings_ = false;
        } else if (name == QStringLiteral("Keywords")) {
            if (in_item_keywords_) {
                if (top) top->keyword_ids = item_keyword_ids_;
                in_item_keywords_ = false;
                item_keyword_ids_.clear();
            } else {
                in_keyword_settings_ = false;
            }
        } else if (name == QStringLiteral("KeywordID")) {
            if (in_item_keywords_) {
                if (auto id = to_int(text)) item_keyword_ids_.push_back(*id);
            }
        } else if (name == QStringLiteral("ProjectTitle")) {
            project_.title = to_std(text);
        } else if (name == QStringLiteral("FullName")) {
            project_.author = to_std(text);
        } else if (name == QStringLiteral("Title")) {
            if (in_keyword_settings_ && current_keyword_id_) {
                current_keyword_title_ = text;
            } else if (top && in_binder_) {
                top->title = to_std(text);
            }
        } else if (name == QStringLiteral("Color")) {
            if (in_keyword_settings_ && current_keyword_id_) {
                current_keyword_color_ = text;
            }
        } else if (name == QStringLiteral("Synopsis")) {
            if (top) top->synopsis = to_std(text);
        } else if (name == QStringLiteral("LabelID")) {
            if (top) {
                const auto id = to_int(text);
                top->label_id = (id && *id >= 0) ? id : std::nullopt;
            }
        } else if (name == QStringLiteral("StatusID")) {
            if (top) {
                const auto id = to_int(text);
                top->status_id = (id && *id >= 0) ? id : std::nullopt;
            }
        } else if (name == QStringLiteral("IncludeInCompile")) {
            if (top) top->include_in_compile = is_yes(text);
        } else if (name == QStringLiteral("Target")) {
            if (top && !in_project_targets_) top->target_word_count = to_int(text);
        } else if (name == QStringLiteral("IconFileName")) {
            if (top && !text.isEmpty()) top->icon_file_name = to_std(text);
        } else if (name == QStringLiteral("DraftTarget")) {
            if (in_project_targets_) project_.targets.draft_word_count = to_int(text).value_or(0);
        } else if (name == QStringLiteral("SessionTarget")) {
            if (in_project_targets_) project_.targets.session_word_count = to_int(text).value_or(0);
        } else if (name == QStringLiteral("Label")) {
            if (in_label_settings_ && current_label_id_) {
                if (*current_label_id_ >= 0) {
                    project_.labels.push_back(ScrivenerLabel{
                        *current_label_id_, to_std(text), parse_scrivener_color(current_label_color_)});
                }
                current_label_id_.reset();
                current_label_color_.clear();
            }
        } else if (name == QStringLiteral("Status")) {
            if (in_status_settings_ && current_status_id_) {
                if (*current_status_id_ >= 0) {
                    project_.statuses.push_back(ScrivenerStatus{*current_status_id_, to_std(text)});
                }
                current_status_id_.reset();
            }
        } else if (name == QStringLiteral("Keyword")) {
            if (in_keyword_settings_ && current_keyword_id_) {
                const auto title = current_keyword_title_.value_or(text);
                project_.keywords.push_back(ScrivenerKeyword{
                    *current_keyword_id_, to_std(title), parse_scrivener_color(current_keyword_color_)});
                current_keyword_id_.reset();
                current_keyword_color_.clear();
                current_keyword_title_.reset();
            }
        }

        text_.clear();
    }

    void finish_item() {
        if (item_stack_.empty()) {
            return;
        }
        auto item = std::move(item_stack_.back());
        item_stack_.pop_back();
        item.children = std::move(children_stack_.back());
        children_stack_.pop_back();
        if (item.title.empty()) {
            item.title = "Untitled";
        }
        children_stack_.back().push_back(std::move(item));
    }

    ScrivenerProject project_;
    QString text_;

    std::vector<BinderItem> item_stack_;
    // Front is the top-level binder list; one more frame per open item.
    std::vector<std::vector<BinderItem>> children_stack_ = std::vector<std::vector<BinderItem>>(1);

    bool in_binder_ = false;
    bool in_label_settings_ = false;
    bool in_status_settings_ = false;
    bool in_keyword_settings_ = false;
    bool in_project_targets_ = false;
    bool in_item_keywords_ = false;
    bool saw_uuid_ = false;

    std::optional<int> current_label_id_;
    QString current_label_color_;
    std::optional<int> current_status_id_;
    std::optional<int> current_keyword_id_;
    QString current_keyword_color_;
    std::optional<QString> current_keyword_title_;
    std::vector<int> item_keyword_ids_;
};

} // namespace

Res<ScrivenerProject> parse_binder_xml(const QByteArray& xml) {
    BinderXmlParser parser;
    return parser.parse(xml);
}

std::optional<Timestamp> parse_scrivener_date(const QString& text) {
    static const QRegularExpression pattern(QStringLiteral(
        R"(^(\d{4}-\d{2}-\d{2})(?:[ T](\d{2}:\d{2}(?::\d{2})?)(?:\.\d+)?\s*(Z|[+-]\d{2}:?\d{2})?)?$)"));

    const auto m = pattern.match(text.trimmed());
    if (!m.hasMatch()) {
        return std::nullopt;
    }

    const auto date = QDate::fromString(m.captured(1), QStringLiteral("yyyy-MM-dd"));
    if (!date.isValid()) {
        return std::nullopt;
    }

    QTime time(0, 0);
    const auto time_text = m.captured(2);
    if (!time_text.isEmpty()) {
        time = QTime::fromString(time_text,
                                 time_text.size() == 5 ? QStringLiteral("HH:mm") : QStringLiteral("HH:mm:ss"));
        if (!time.isValid()) {
            return std::nullopt;
        }
    }

    int offset_seconds = 0;
    const auto zone = m.captured(3);
    if (!zone.isEmpty() && zone != QStringLiteral("Z")) {
        auto digits = zone.mid(1);
        digits.remove(QLatin1Char(':'));
        const int hours = digits.left(2).toInt();
        const int minutes = digits.mid(2, 2).toInt();
        offset_seconds = (hours * 3600 + minutes * 60) * (zone.startsWith(QLatin1Char('-')) ? -1 : 1);
    }

    const QDateTime dt(date, time, QTimeZone::fromSecondsAheadOfUtc(offset_seconds));
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return Timestamp(static_cast<int64_t>(dt.toMSecsSinceEpoch()));
}

QColor parse_scrivener_color(const QString& text) {
    const auto parts = text.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() < 3) {
        return QColor::fromRgbF(0.5f, 0.5f, 0.5f);
    }
    float c[3];
    for (int i = 0; i < 3; ++i) {
        bool ok = false;
        const double v = parts[i].toDouble(&ok);
        if (!ok) {
            return QColor::fromRgbF(0.5f, 0.5f, 0.5f);
        }
        c[i] = static_cast<float>(std::clamp(v, 0.0, 1.0));
    }
    return QColor::fromRgbF(c[0], c[1], c[2]);
}

} // namespace folio::scrivener
