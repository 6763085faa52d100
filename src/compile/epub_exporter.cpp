#include "compile/epub_exporter.hpp"

#include "archive/zip_writer.hpp"
#include "compile/cmark_html.hpp"
#include "compile/html_exporter.hpp"
#include "text/xml_escape.hpp"
#include "util/log_categories.hpp"

#include <cstdio>

namespace folio::compile {

namespace {

using text::escape_xml;

constexpr const char* kEpubMime = "application/epub+zip";

struct Chapter {
    std::string file;
    std::string title;
    std::string xhtml;
};

std::string xhtml_page(const std::string& title, const std::string& body) {
    std::string out = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<!DOCTYPE html>\n";
    out += "<html xmlns=\"http://www.w3.org/1999/xhtml\" xmlns:epub=\"http://www.idpf.org/2007/ops\">\n<head>\n";
    out += "    <meta charset=\"UTF-8\"/>\n";
    out += "    <title>" + escape_xml(title) + "</title>\n";
    out += "    <link rel=\"stylesheet\" type=\"text/css\" href=\"styles.css\"/>\n";
    out += "</head>\n<body>\n" + body + "</body>\n</html>\n";
    return out;
}

std::string container_xml() {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<container version=\"1.0\" xmlns=\"urn:oasis:names:tc:opendocument:xmlns:container\">\n"
           "    <rootfiles>\n"
           "        <rootfile full-path=\"OEBPS/content.opf\" media-type=\"application/oebps-package+xml\"/>\n"
           "    </rootfiles>\n"
           "</container>\n";
}

std::string content_opf(const CompileJob& job, const std::string& book_id, const std::vector<Chapter>& chapters) {
    std::string out = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out += "<package xmlns=\"http://www.idpf.org/2007/opf\" version=\"3.0\" unique-identifier=\"bookid\">\n";
    out += "    <metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\">\n";
    out += "        <dc:identifier id=\"bookid\">urn:uuid:" + book_id + "</dc:identifier>\n";
    out += "        <dc:title>" + escape_xml(job.title) + "</dc:title>\n";
    out += "        <dc:creator>" + escape_xml(job.author) + "</dc:creator>\n";
    out += "        <dc:language>en</dc:language>\n";
    out += "        <meta property=\"dcterms:modified\">" + job.now.to_iso_string() + "</meta>\n";
    out += "    </metadata>\n    <manifest>\n";
    out += "        <item id=\"nav\" href=\"nav.xhtml\" media-type=\"application/xhtml+xml\" properties=\"nav\"/>\n";
    out += "        <item id=\"ncx\" href=\"toc.ncx\" media-type=\"application/x-dtbncx+xml\"/>\n";
    out += "        <item id=\"css\" href=\"styles.css\" media-type=\"text/css\"/>\n";
    for (size_t i = 0; i < chapters.size(); ++i) {
        out += "        <item id=\"chapter-" + std::to_string(i) + "\" href=\"" + chapters[i].file +
               "\" media-type=\"application/xhtml+xml\"/>\n";
    }
    out += "    </manifest>\n    <spine toc=\"ncx\">\n";
    for (size_t i = 0; i < chapters.size(); ++i) {
        out += "        <itemref idref=\"chapter-" + std::to_string(i) + "\"/>\n";
    }
    out += "    </spine>\n</package>\n";
    return out;
}

std::string toc_ncx(const CompileJob& job, const std::string& book_id, const std::vector<Chapter>& chapters) {
    std::string out = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out += "<ncx xmlns=\"http://www.daisy.org/z3986/2005/ncx/\" version=\"2005-1\">\n    <head>\n";
    out += "        <meta name=\"dtb:uid\" content=\"urn:uuid:" + book_id + "\"/>\n";
    out += "        <meta name=\"dtb:depth\" content=\"1\"/>\n";
    out += "        <meta name=\"dtb:totalPageCount\" content=\"0\"/>\n";
    out += "        <meta name=\"dtb:maxPageNumber\" content=\"0\"/>\n";
    out += "    </head>\n    <docTitle><text>" + escape_xml(job.title) + "</text></docTitle>\n    <navMap>\n";
    for (size_t i = 0; i < chapters.size(); ++i) {
        const auto n = std::to_string(i + 1);
        out += "        <navPoint id=\"navpoint-" + n + "\" playOrder=\"" + n + "\">";
        out += "<navLabel><text>" + escape_xml(chapters[i].title) + "</text></navLabel>";
        out += "<content src=\"" + chapters[i].file + "\"/></navPoint>\n";
    }
    out += "    </navMap>\n</ncx>\n";
    return out;
}

std::string nav_xhtml(const CompileJob& job, const std::vector<Chapter>& chapters) {
    std::string body = "<nav epub:type=\"toc\" id=\"toc\">\n<h1>Table of Contents</h1>\n<ol>\n";
    for (const auto& c : chapters) {
        body += "    <li><a href=\"" + c.file + "\">" + escape_xml(c.title) + "</a></li>\n";
    }
    body += "</ol>\n</nav>\n";
    return xhtml_page(job.title, body);
}

std::string styles_css(const CompileSettings& settings) {
    char metrics[96];
    std::snprintf(metrics, sizeof(metrics), "    font-size: %gpt;\n    line-height: %g;\n",
                  settings.font_size, settings.line_spacing);
    std::string css = "body {\n    font-family: " + css_font_stack(settings.font_style) + ";\n";
    css += metrics;
    css += "    margin: 1em;\n    text-align: justify;\n}\n";
    css += "h1 { font-size: 2em; font-weight: bold; margin-top: 1em; margin-bottom: 0.5em; text-align: left; }\n";
    css += "h2 { font-size: 1.5em; font-weight: bold; margin-top: 1em; margin-bottom: 0.5em; }\n";
    css += "p { margin: 0.5em 0; text-indent: 1.5em; }\n";
    css += "h1 + p, h2 + p { text-indent: 0; }\n";
    css += ".title-page { text-align: center; margin-top: 30%; }\n";
    css += ".title-page h1 { font-size: 2.5em; text-align: center; }\n";
    css += ".title-page .author { font-size: 1.2em; font-style: italic; color: #666; margin-top: 1em; }\n";
    css += "nav ol { list-style-type: none; padding-left: 0; }\n";
    css += "nav li { margin: 0.5em 0; }\n";
    css += "nav a { text-decoration: none; color: #333; }\n";
    return css;
}

std::string title_page(const CompileJob& job) {
    std::string body = "<div class=\"title-page\">\n<h1>" + escape_xml(job.title) + "</h1>\n";
    if (!job.author.empty()) {
        body += "<p class=\"author\">by " + escape_xml(job.author) + "</p>\n";
    }
    body += "</div>\n";
    return xhtml_page(job.title, body);
}

std::string toc_page(const CompileJob& job) {
    std::string body = "<h1>Table of Contents</h1>\n";
    for (size_t i = 0; i < job.documents.size(); ++i) {
        const auto& doc = job.documents[i];
        body += "<p";
        if (doc.depth > 0) body += " style=\"margin-left: " + std::to_string(doc.depth * 20) + "px\"";
        body += "><a href=\"" + chapter_file_name(i) + "\">" + escape_xml(doc.title) + "</a></p>\n";
    }
    return xhtml_page("Table of Contents", body);
}

std::string chapter_page(const CompilableDocument& doc, const CompileSettings& settings) {
    std::string body;
    if (settings.include_chapter_titles && !doc.title.empty()) {
        const char* tag = doc.depth == 0 ? "h1" : "h2";
        body += std::string("<") + tag + ">" + escape_xml(doc.title) + "</" + tag + ">\n";
    }
    body += render_markdown_html(doc.content);
    return xhtml_page(doc.title, body);
}

} // namespace

std::string chapter_file_name(size_t index) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "chapter-%03zu.xhtml", index + 1);
    return buf;
}

Res<QByteArray> EpubExporter::render(const CompileJob& job, ProgressReporter& progress) const {
    const auto& settings = job.settings;
    const auto book_id = Uuid::generate().to_upper_string();

    std::vector<Chapter> chapters;
    if (settings.include_title_page) {
        chapters.push_back({"title.xhtml", "Title Page", title_page(job)});
    }
    if (settings.include_table_of_contents) {
        chapters.push_back({"toc-page.xhtml", "Table of Contents", toc_page(job)});
    }
    const size_t n = job.documents.size();
    for (size_t i = 0; i < n; ++i) {
        const auto& doc = job.documents[i];
        report_document(progress, i, n, doc.title);
        chapters.push_back({chapter_file_name(i), doc.title, chapter_page(doc, settings)});
    }

    struct Part {
        std::string path;
        std::string data;
        bool compress;
    };
    std::vector<Part> parts = {
        {"mimetype", kEpubMime, false},
        {"META-INF/container.xml", container_xml(), true},
        {"OEBPS/content.opf", content_opf(job, book_id, chapters), true},
        {"OEBPS/toc.ncx", toc_ncx(job, book_id, chapters), true},
        {"OEBPS/nav.xhtml", nav_xhtml(job, chapters), true},
        {"OEBPS/styles.css", styles_css(settings), true},
    };
    for (auto& chapter : chapters) {
        parts.push_back({"OEBPS/" + chapter.file, std::move(chapter.xhtml), true});
    }

    archive::ZipArchiveWriter zip(job.now);
    for (const auto& part : parts) {
        auto added = zip.add_entry(part.path, part.data, part.compress);
        if (added.is_err()) return Res<QByteArray>::err(added.unwrap_err());
    }

    auto bytes = zip.finalize();
    if (bytes.is_err()) return Res<QByteArray>::err(bytes.unwrap_err());
    const auto& data = bytes.unwrap();
    qCDebug(folioCompileLog) << "EPUB package:" << chapters.size() << "pages," << data.size() << "bytes";
    return Res<QByteArray>::ok(QByteArray(reinterpret_cast<const char*>(data.data()), static_cast<qsizetype>(data.size())));
}

} // namespace folio::compile
