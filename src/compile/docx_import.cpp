#include "compile/docx_import.hpp"

#include "archive/zip_reader.hpp"
#include "text/markdown_bridge.hpp"
#include "util/file_io.hpp"
#include "util/log_categories.hpp"

#include <QFileInfo>
#include <QXmlStreamReader>

#include <algorithm>

namespace folio::compile {

namespace {

using text::RunList;
using text::TextAttributes;

QByteArray to_byte_array(const archive::Bytes& bytes) {
    return QByteArray(reinterpret_cast<const char*>(bytes.data()), static_cast<qsizetype>(bytes.size()));
}

// By local name, so w:val and a bare val both match.
QString attribute(const QXmlStreamReader& xr, QLatin1String name) {
    const auto attrs = xr.attributes();
    for (const auto& attr : attrs) {
        if (attr.name() == name) return attr.value().toString();
    }
    return {};
}

// <w:b/> and <w:b w:val="1"/> are on; "0", "false" and "none" are off.
bool switched_on(const QXmlStreamReader& xr) {
    const auto val = attribute(xr, QLatin1String("val"));
    return val.isEmpty() || !(val == QLatin1String("0") || val == QLatin1String("false") || val == QLatin1String("none"));
}

int heading_level_for_style(QStringView style) {
    if (style.compare(QLatin1String("Title"), Qt::CaseInsensitive) == 0) return 1;
    QString compact = style.toString().remove(QLatin1Char(' '));
    if (!compact.startsWith(QLatin1String("heading"), Qt::CaseInsensitive)) return 0;
    bool ok = false;
    const int level = compact.mid(7).toInt(&ok);
    if (!ok || level < 1) return 0;
    return std::min(level, 3);
}

class DocumentXmlReader {
public:
    DocumentXmlReader(const QByteArray& xml, const std::map<QString, QString>& links)
        : xr_(xml), links_(links) {}

    Res<RunList> read() {
        while (!xr_.atEnd()) {
            xr_.readNext();
            if (xr_.isStartElement() && xr_.name() == QLatin1String("p")) {
                read_paragraph();
            }
        }
        if (xr_.hasError()) {
            return Res<RunList>::err(make_error(ErrorCode::XmlParsingFailed,
                                                "word/document.xml: " + xr_.errorString().toStdString()));
        }
        return Res<RunList>::ok(text::normalize_runs(std::move(out_)));
    }

private:
    void read_paragraph() {
        RunList para;
        int level = 0;
        QString link;
        while (!xr_.atEnd()) {
            xr_.readNext();
            if (xr_.isStartElement()) {
                const auto name = xr_.name();
                if (name == QLatin1String("pPr")) {
                    level = read_paragraph_properties();
                } else if (name == QLatin1String("hyperlink")) {
                    const auto id = attribute(xr_, QLatin1String("id"));
                    const auto it = links_.find(id);
                    link = it == links_.end() ? QString() : it->second;
                } else if (name == QLatin1String("r")) {
                    read_run(para, link);
                }
            } else if (xr_.isEndElement()) {
                if (xr_.name() == QLatin1String("hyperlink")) {
                    link.clear();
                } else if (xr_.name() == QLatin1String("p")) {
                    break;
                }
            }
        }

        const auto plain = text::plain_text(para);
        if (plain.find_first_not_of(" \t\n") == std::string::npos) return;
        if (level > 0) {
            for (auto& run : para) run.attrs.heading_level = level;
        }
        if (!out_.empty()) text::append_run(out_, "\n\n", {});
        out_.insert(out_.end(), para.begin(), para.end());
    }

    int read_paragraph_properties() {
        int level = 0;
        while (!xr_.atEnd()) {
            xr_.readNext();
            if (xr_.isStartElement() && xr_.name() == QLatin1String("pStyle")) {
                level = heading_level_for_style(attribute(xr_, QLatin1String("val")));
            } else if (xr_.isEndElement() && xr_.name() == QLatin1String("pPr")) {
                break;
            }
        }
        return level;
    }

    TextAttributes read_run_properties() {
        TextAttributes a;
        while (!xr_.atEnd()) {
            xr_.readNext();
            if (xr_.isStartElement()) {
                const auto name = xr_.name();
                if (name == QLatin1String("b")) {
                    a.bold = switched_on(xr_);
                } else if (name == QLatin1String("i")) {
                    a.italic = switched_on(xr_);
                } else if (name == QLatin1String("strike") || name == QLatin1String("dstrike")) {
                    a.strikethrough = a.strikethrough || switched_on(xr_);
                } else if (name == QLatin1String("u")) {
                    a.underline = switched_on(xr_);
                } else if (name == QLatin1String("highlight")) {
                    a.highlight = switched_on(xr_);
                }
            } else if (xr_.isEndElement() && xr_.name() == QLatin1String("rPr")) {
                break;
            }
        }
        return a;
    }

    void read_run(RunList& para, const QString& link) {
        TextAttributes attrs;
        while (!xr_.atEnd()) {
            xr_.readNext();
            if (xr_.isStartElement()) {
                const auto name = xr_.name();
                if (name == QLatin1String("rPr")) {
                    attrs = read_run_properties();
                    if (!link.isEmpty()) {
                        attrs.link = link.toStdString();
                        // Word underlines hyperlinks through the character style.
                        attrs.underline = false;
                    }
                } else if (name == QLatin1String("t")) {
                    text::append_run(para, xr_.readElementText().toStdString(), with_link(attrs, link));
                } else if (name == QLatin1String("tab")) {
                    text::append_run(para, "\t", with_link(attrs, link));
                } else if (name == QLatin1String("br") || name == QLatin1String("cr")) {
                    text::append_run(para, "\n", {});
                } else if (name == QLatin1String("noBreakHyphen")) {
                    text::append_run(para, "-", with_link(attrs, link));
                }
            } else if (xr_.isEndElement() && xr_.name() == QLatin1String("r")) {
                break;
            }
        }
    }

    static TextAttributes with_link(TextAttributes attrs, const QString& link) {
        if (!link.isEmpty()) attrs.link = link.toStdString();
        return attrs;
    }

    QXmlStreamReader xr_;
    const std::map<QString, QString>& links_;
    RunList out_;
};

} // namespace

std::map<QString, QString> parse_docx_relationships(const QByteArray& rels_xml) {
    std::map<QString, QString> out;
    QXmlStreamReader xr(rels_xml);
    while (!xr.atEnd()) {
        xr.readNext();
        if (xr.isStartElement() && xr.name() == QLatin1String("Relationship")) {
            const auto id = attribute(xr, QLatin1String("Id"));
            if (!id.isEmpty()) out.emplace(id, attribute(xr, QLatin1String("Target")));
        }
    }
    if (xr.hasError()) {
        qCWarning(folioImportLog) << "Relationships part is malformed:" << xr.errorString();
    }
    return out;
}

Res<RunList> docx_document_runs(const QByteArray& document_xml, const std::map<QString, QString>& links) {
    return DocumentXmlReader(document_xml, links).read();
}

std::string docx_core_title(const QByteArray& core_xml) {
    QXmlStreamReader xr(core_xml);
    while (!xr.atEnd()) {
        xr.readNext();
        if (xr.isStartElement() && xr.name() == QLatin1String("title")) {
            return xr.readElementText().trimmed().toStdString();
        }
    }
    return {};
}

Res<TextImport> import_docx_file(const QString& path) {
    const QFileInfo info(path);
    if (!info.isFile()) {
        return Res<TextImport>::err(make_error(ErrorCode::FileReadFailed, path.toStdString() + " is not a file"));
    }
    auto bytes = util::read_file_bytes(path);
    if (!bytes) {
        return Res<TextImport>::err(make_error(ErrorCode::FileReadFailed, path.toStdString()));
    }

    auto opened = archive::ZipArchiveReader::open(archive::Bytes(bytes->begin(), bytes->end()))
                      .with_context(info.fileName().toStdString());
    if (opened.is_err()) return Res<TextImport>::err(opened.unwrap_err());
    const auto zip = std::move(opened).unwrap();

    auto document = zip.read("word/document.xml").with_context(info.fileName().toStdString());
    if (document.is_err()) return Res<TextImport>::err(document.unwrap_err());

    TextImport result;
    const auto name = info.fileName().toStdString();
    std::map<QString, QString> links;
    if (zip.find("word/_rels/document.xml.rels")) {
        auto rels = zip.read("word/_rels/document.xml.rels");
        if (rels.is_ok()) {
            links = parse_docx_relationships(to_byte_array(rels.unwrap()));
        } else {
            result.report.warn(name, "hyperlinks dropped: " + rels.unwrap_err().message);
        }
    }

    auto runs = docx_document_runs(to_byte_array(document.unwrap()), links);
    if (runs.is_err()) return Res<TextImport>::err(runs.unwrap_err());

    std::string title;
    if (zip.find("docProps/core.xml")) {
        auto core = zip.read("docProps/core.xml");
        if (core.is_ok()) title = docx_core_title(to_byte_array(core.unwrap()));
    }
    if (title.empty()) title = info.completeBaseName().toStdString();

    result.manuscript = single_document_manuscript(title, text::runs_to_markdown(runs.unwrap()));
    result.report.documents = 1;
    qCInfo(folioImportLog) << "Imported DOCX" << path;
    return Res<TextImport>::ok(std::move(result));
}

} // namespace folio::compile
