#include "compile/docx_exporter.hpp"

#include "archive/zip_writer.hpp"
#include "text/markdown_bridge.hpp"
#include "text/xml_escape.hpp"
#include "util/log_categories.hpp"

#include <algorithm>
#include <cmath>

namespace folio::compile {

namespace {

using text::escape_xml;

constexpr const char* kXmlDecl = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
constexpr const char* kFooterRelId = "rId2";

struct Hyperlink {
    std::string id;
    std::string target;
};

int twips(double points) {
    return static_cast<int>(std::lround(points * 20));
}

// Builds word/document.xml and collects the hyperlink relationships it needs.
class DocumentBody {
public:
    explicit DocumentBody(const CompileSettings& settings) : settings_(settings) {}

    void paragraph(const std::string& text, const std::string& style, bool centered = false) {
        xml_ += "<w:p><w:pPr><w:pStyle w:val=\"" + style + "\"/>";
        if (centered) xml_ += "<w:jc w:val=\"center\"/>";
        xml_ += "</w:pPr>";
        if (!text.empty()) {
            xml_ += "<w:r><w:t xml:space=\"preserve\">" + escape_xml(text) + "</w:t></w:r>";
        }
        xml_ += "</w:p>\n";
    }

    void page_break() { xml_ += "<w:p><w:r><w:br w:type=\"page\"/></w:r></w:p>\n"; }

    void title_page(const std::string& title, const std::string& author) {
        for (int i = 0; i < 6; ++i) paragraph({}, "Normal");
        paragraph(title, "Title", true);
        if (!author.empty()) {
            paragraph({}, "Normal");
            paragraph("by " + author, "Subtitle", true);
        }
    }

    void table_of_contents(const std::vector<CompilableDocument>& docs) {
        paragraph("Table of Contents", "Heading1");
        for (const auto& doc : docs) {
            paragraph(doc.title, "TOC" + std::to_string(std::min(doc.depth + 1, 3)));
        }
    }

    void separator(DocumentSeparator sep) {
        switch (sep) {
            case DocumentSeparator::None: break;
            case DocumentSeparator::BlankLine: paragraph({}, "Normal"); break;
            case DocumentSeparator::ThreeAsterisks: paragraph("* * *", "Normal", true); break;
            case DocumentSeparator::PageBreak:
            case DocumentSeparator::ChapterHeading: page_break(); break;
        }
    }

    // Consecutive text lines form one paragraph joined by <w:br/>; blank
    // lines end it and heading lines stand alone.
    void content(std::string_view markdown) {
        const auto lines = text::split_lines(text::markdown_to_runs(markdown));
        std::vector<const text::RunList*> pending;
        auto flush = [&] {
            if (pending.empty()) return;
            xml_ += "<w:p><w:pPr><w:pStyle w:val=\"Normal\"/></w:pPr>";
            for (size_t i = 0; i < pending.size(); ++i) {
                if (i > 0) xml_ += "<w:r><w:br/></w:r>";
                runs(*pending[i]);
            }
            xml_ += "</w:p>\n";
            pending.clear();
        };
        for (const auto& line : lines) {
            const auto plain = text::plain_text(line);
            if (plain.find_first_not_of(" \t") == std::string::npos) {
                flush();
                continue;
            }
            const int level = line.front().attrs.heading_level;
            if (level > 0) {
                flush();
                xml_ += "<w:p><w:pPr><w:pStyle w:val=\"Heading" + std::to_string(std::min(level, 3)) + "\"/></w:pPr>";
                runs(line);
                xml_ += "</w:p>\n";
                continue;
            }
            pending.push_back(&line);
        }
        flush();
    }

    [[nodiscard]] std::string document_xml() const {
        const auto& m = settings_.margins;
        std::string out = kXmlDecl;
        out += "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\" "
               "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">\n<w:body>\n";
        out += xml_;
        out += "<w:sectPr>";
        if (settings_.include_page_numbers) {
            out += "<w:footerReference w:type=\"default\" r:id=\"" + std::string(kFooterRelId) + "\"/>";
        }
        out += "<w:pgSz w:w=\"" + std::to_string(twips(settings_.page_size.width)) + "\" w:h=\"" +
               std::to_string(twips(settings_.page_size.height)) + "\"/>";
        out += "<w:pgMar w:top=\"" + std::to_string(twips(m.top)) + "\" w:right=\"" + std::to_string(twips(m.right)) +
               "\" w:bottom=\"" + std::to_string(twips(m.bottom)) + "\" w:left=\"" + std::to_string(twips(m.left)) +
               "\" w:header=\"720\" w:footer=\"720\" w:gutter=\"0\"/>";
        if (settings_.include_page_numbers) {
            out += "<w:pgNumType w:start=\"1\"/>";
        }
        out += "</w:sectPr>\n</w:body>\n</w:document>\n";
        return out;
    }

    [[nodiscard]] const std::vector<Hyperlink>& links() const noexcept { return links_; }

private:
    void runs(const text::RunList& line) {
        for (const auto& run : line) {
            if (run.attrs.link.empty()) {
                run_xml(run, false);
                continue;
            }
            const auto id = "rId" + std::to_string(100 + links_.size());
            links_.push_back(Hyperlink{id, run.attrs.link});
            xml_ += "<w:hyperlink r:id=\"" + id + "\">";
            run_xml(run, true);
            xml_ += "</w:hyperlink>";
        }
    }

    void run_xml(const text::FormattedRun& run, bool hyperlink) {
        const auto& a = run.attrs;
        xml_ += "<w:r>";
        if (hyperlink || a.bold || a.italic || a.strikethrough || a.underline || a.highlight) {
            xml_ += "<w:rPr>";
            if (hyperlink) xml_ += "<w:rStyle w:val=\"Hyperlink\"/>";
            if (a.bold) xml_ += "<w:b/>";
            if (a.italic) xml_ += "<w:i/>";
            if (a.strikethrough) xml_ += "<w:strike/>";
            if (a.underline && !hyperlink) xml_ += "<w:u w:val=\"single\"/>";
            if (a.highlight) xml_ += "<w:highlight w:val=\"yellow\"/>";
            xml_ += "</w:rPr>";
        }
        xml_ += "<w:t xml:space=\"preserve\">" + escape_xml(run.text) + "</w:t></w:r>";
    }

    const CompileSettings& settings_;
    std::string xml_;
    std::vector<Hyperlink> links_;
};

std::string content_types_xml(bool footer) {
    std::string out = kXmlDecl;
    out += "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">\n";
    out += "    <Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>\n";
    out += "    <Default Extension=\"xml\" ContentType=\"application/xml\"/>\n";
    out += "    <Override PartName=\"/word/document.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>\n";
    out += "    <Override PartName=\"/word/styles.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml\"/>\n";
    if (footer) {
        out += "    <Override PartName=\"/word/footer1.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.footer+xml\"/>\n";
    }
    out += "    <Override PartName=\"/docProps/core.xml\" ContentType=\"application/vnd.openxmlformats-package.core-properties+xml\"/>\n";
    out += "    <Override PartName=\"/docProps/app.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.extended-properties+xml\"/>\n";
    out += "</Types>\n";
    return out;
}

std::string package_rels_xml() {
    std::string out = kXmlDecl;
    out += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">\n";
    out += "    <Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" Target=\"word/document.xml\"/>\n";
    out += "    <Relationship Id=\"rId2\" Type=\"http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties\" Target=\"docProps/core.xml\"/>\n";
    out += "    <Relationship Id=\"rId3\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/extended-properties\" Target=\"docProps/app.xml\"/>\n";
    out += "</Relationships>\n";
    return out;
}

std::string document_rels_xml(bool footer, const std::vector<Hyperlink>& links) {
    std::string out = kXmlDecl;
    out += "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">\n";
    out += "    <Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" Target=\"styles.xml\"/>\n";
    if (footer) {
        out += "    <Relationship Id=\"" + std::string(kFooterRelId) +
               "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/footer\" Target=\"footer1.xml\"/>\n";
    }
    for (const auto& link : links) {
        out += "    <Relationship Id=\"" + link.id +
               "\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink\" Target=\"" +
               escape_xml(link.target) + "\" TargetMode=\"External\"/>\n";
    }
    out += "</Relationships>\n";
    return out;
}

std::string style_xml(const std::string& id, const std::string& name, const std::string& ppr, const std::string& rpr) {
    std::string out = "    <w:style w:type=\"paragraph\" w:styleId=\"" + id + "\">";
    out += "<w:name w:val=\"" + name + "\"/><w:basedOn w:val=\"Normal\"/>";
    if (!ppr.empty()) out += "<w:pPr>" + ppr + "</w:pPr>";
    if (!rpr.empty()) out += "<w:rPr>" + rpr + "</w:rPr>";
    out += "</w:style>\n";
    return out;
}

std::string styles_xml(const CompileSettings& settings) {
    const std::string font(font_family(settings.font_style));
    const int half_points = static_cast<int>(std::lround(settings.font_size * 2));
    const int line = static_cast<int>(std::lround(settings.line_spacing * 240));

    std::string out = kXmlDecl;
    out += "<w:styles xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">\n";
    out += "    <w:docDefaults><w:rPrDefault><w:rPr><w:rFonts w:ascii=\"" + escape_xml(font) + "\" w:hAnsi=\"" +
           escape_xml(font) + "\"/><w:sz w:val=\"" + std::to_string(half_points) +
           "\"/></w:rPr></w:rPrDefault><w:pPrDefault><w:pPr><w:spacing w:line=\"" + std::to_string(line) +
           "\" w:lineRule=\"auto\"/></w:pPr></w:pPrDefault></w:docDefaults>\n";
    out += "    <w:style w:type=\"paragraph\" w:styleId=\"Normal\" w:default=\"1\"><w:name w:val=\"Normal\"/>"
           "<w:pPr><w:spacing w:after=\"200\"/></w:pPr></w:style>\n";
    out += style_xml("Title", "Title", "<w:spacing w:after=\"300\"/><w:jc w:val=\"center\"/>", "<w:b/><w:sz w:val=\"72\"/>");
    out += style_xml("Subtitle", "Subtitle", "<w:jc w:val=\"center\"/>", "<w:i/><w:sz w:val=\"36\"/><w:color w:val=\"666666\"/>");
    out += style_xml("Heading1", "heading 1", "<w:spacing w:before=\"480\" w:after=\"240\"/><w:outlineLvl w:val=\"0\"/>",
                     "<w:b/><w:sz w:val=\"" + std::to_string(half_points + 12) + "\"/>");
    out += style_xml("Heading2", "heading 2", "<w:spacing w:before=\"360\" w:after=\"200\"/><w:outlineLvl w:val=\"1\"/>",
                     "<w:b/><w:sz w:val=\"" + std::to_string(half_points + 8) + "\"/>");
    out += style_xml("Heading3", "heading 3", "<w:spacing w:before=\"240\" w:after=\"160\"/><w:outlineLvl w:val=\"2\"/>",
                     "<w:b/><w:sz w:val=\"" + std::to_string(half_points + 4) + "\"/>");
    out += style_xml("TOC1", "toc 1", {}, {});
    out += style_xml("TOC2", "toc 2", "<w:ind w:left=\"240\"/>", {});
    out += style_xml("TOC3", "toc 3", "<w:ind w:left=\"480\"/>", {});
    out += style_xml("Footer", "footer", "<w:jc w:val=\"center\"/>", {});
    out += "    <w:style w:type=\"character\" w:styleId=\"Hyperlink\"><w:name w:val=\"Hyperlink\"/>"
           "<w:rPr><w:color w:val=\"0563C1\"/><w:u w:val=\"single\"/></w:rPr></w:style>\n";
    out += "</w:styles>\n";
    return out;
}

std::string footer_xml() {
    std::string out = kXmlDecl;
    out += "<w:ftr xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">\n";
    out += "    <w:p><w:pPr><w:pStyle w:val=\"Footer\"/><w:jc w:val=\"center\"/></w:pPr>"
           "<w:r><w:fldChar w:fldCharType=\"begin\"/></w:r>"
           "<w:r><w:instrText xml:space=\"preserve\"> PAGE </w:instrText></w:r>"
           "<w:r><w:fldChar w:fldCharType=\"separate\"/></w:r>"
           "<w:r><w:t>1</w:t></w:r>"
           "<w:r><w:fldChar w:fldCharType=\"end\"/></w:r></w:p>\n";
    out += "</w:ftr>\n";
    return out;
}

std::string core_props_xml(const CompileJob& job) {
    const auto date = job.now.to_iso_string();
    std::string out = kXmlDecl;
    out += "<cp:coreProperties xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\" "
           "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" xmlns:dcterms=\"http://purl.org/dc/terms/\" "
           "xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\">\n";
    out += "    <dc:title>" + escape_xml(job.title) + "</dc:title>\n";
    out += "    <dc:creator>" + escape_xml(job.author) + "</dc:creator>\n";
    out += "    <dcterms:created xsi:type=\"dcterms:W3CDTF\">" + date + "</dcterms:created>\n";
    out += "    <dcterms:modified xsi:type=\"dcterms:W3CDTF\">" + date + "</dcterms:modified>\n";
    out += "</cp:coreProperties>\n";
    return out;
}

std::string app_props_xml() {
    std::string out = kXmlDecl;
    out += "<Properties xmlns=\"http://schemas.openxmlformats.org/officeDocument/2006/extended-properties\">\n";
    out += "    <Application>Folio</Application>\n";
    out += "</Properties>\n";
    return out;
}

} // namespace

std::vector<std::string> docx_part_names(const CompileSettings& settings) {
    std::vector<std::string> parts = {
        "[Content_Types].xml",
        "_rels/.rels",
        "word/_rels/document.xml.rels",
        "word/document.xml",
        "word/styles.xml",
    };
    if (settings.include_page_numbers) parts.emplace_back("word/footer1.xml");
    parts.emplace_back("docProps/core.xml");
    parts.emplace_back("docProps/app.xml");
    return parts;
}

Res<QByteArray> DocxExporter::render(const CompileJob& job, ProgressReporter& progress) const {
    const auto& settings = job.settings;
    DocumentBody body(settings);

    if (settings.include_title_page) {
        body.title_page(job.title, job.author);
        if (settings.include_table_of_contents || !job.documents.empty()) body.page_break();
    }
    if (settings.include_table_of_contents) {
        body.table_of_contents(job.documents);
        if (!job.documents.empty()) body.page_break();
    }

    const size_t n = job.documents.size();
    for (size_t i = 0; i < n; ++i) {
        const auto& doc = job.documents[i];
        report_document(progress, i, n, doc.title);
        if (settings.include_chapter_titles && !doc.title.empty()) {
            body.paragraph(doc.title, doc.depth == 0 ? "Heading1" : "Heading2");
        }
        body.content(doc.content);
        if (i + 1 < n) body.separator(settings.separator);
    }

    const bool footer = settings.include_page_numbers;
    archive::ZipArchiveWriter zip(job.now);
    for (const auto& part : docx_part_names(settings)) {
        std::string data;
        if (part == "[Content_Types].xml") data = content_types_xml(footer);
        else if (part == "_rels/.rels") data = package_rels_xml();
        else if (part == "word/_rels/document.xml.rels") data = document_rels_xml(footer, body.links());
        else if (part == "word/document.xml") data = body.document_xml();
        else if (part == "word/styles.xml") data = styles_xml(settings);
        else if (part == "word/footer1.xml") data = footer_xml();
        else if (part == "docProps/core.xml") data = core_props_xml(job);
        else data = app_props_xml();

        auto added = zip.add_entry(part, data);
        if (added.is_err()) return Res<QByteArray>::err(added.unwrap_err());
    }

    auto bytes = zip.finalize();
    if (bytes.is_err()) return Res<QByteArray>::err(bytes.unwrap_err());
    const auto& data = bytes.unwrap();
    qCDebug(folioCompileLog) << "DOCX package:" << zip.entry_count() << "parts," << data.size() << "bytes";
    return Res<QByteArray>::ok(QByteArray(reinterpret_cast<const char*>(data.data()), static_cast<qsizetype>(data.size())));
}

} // namespace folio::compile
