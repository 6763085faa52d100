#include <catch2/catch_test_macros.hpp>

#include "compile/compile_service.hpp"
#include "compile/docx_exporter.hpp"
#include "compile/epub_exporter.hpp"
#include "compile/html_exporter.hpp"
#include "compile/markdown_exporter.hpp"
#include "compile/pdf_exporter.hpp"

#include <zlib.h>

#include <cstring>
#include <map>

using namespace folio;
using namespace folio::compile;

namespace {

struct ZipEntry {
    std::string name;
    uint16_t method = 0;
    std::string data;
};

uint32_t le(const QByteArray& bytes, qsizetype at, int width) {
    uint32_t v = 0;
    for (int i = width - 1; i >= 0; --i) v = (v << 8) | static_cast<uint8_t>(bytes[at + i]);
    return v;
}

std::string inflate_raw(const char* data, size_t size, size_t expected) {
    std::string out(expected, '\0');
    z_stream zs{};
    REQUIRE(inflateInit2(&zs, -MAX_WBITS) == Z_OK);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    zs.avail_in = static_cast<uInt>(size);
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());
    const int rc = inflate(&zs, Z_FINISH);
    inflateEnd(&zs);
    REQUIRE(rc == Z_STREAM_END);
    return out;
}

// Walks the local headers in archive order.
std::vector<ZipEntry> read_zip(const QByteArray& bytes) {
    std::vector<ZipEntry> entries;
    qsizetype at = 0;
    while (at + 30 <= bytes.size() && le(bytes, at, 4) == 0x04034b50) {
        ZipEntry e;
        e.method = static_cast<uint16_t>(le(bytes, at + 8, 2));
        const auto compressed = le(bytes, at + 18, 4);
        const auto uncompressed = le(bytes, at + 22, 4);
        const auto name_len = le(bytes, at + 26, 2);
        const auto extra_len = le(bytes, at + 28, 2);
        e.name = bytes.mid(at + 30, name_len).toStdString();
        const qsizetype data_at = at + 30 + name_len + extra_len;
        const char* raw = bytes.constData() + data_at;
        e.data = e.method == 8 ? inflate_raw(raw, compressed, uncompressed) : std::string(raw, compressed);
        entries.push_back(std::move(e));
        at = data_at + compressed;
    }
    return entries;
}

std::map<std::string, std::string> by_name(const std::vector<ZipEntry>& entries) {
    std::map<std::string, std::string> out;
    for (const auto& e : entries) out[e.name] = e.data;
    return out;
}

CompilableDocument doc(std::string title, std::string content, int depth = 0) {
    CompilableDocument d;
    d.title = std::move(title);
    d.content = std::move(content);
    d.depth = depth;
    return d;
}

CompileJob sample_job(ExportFormat format) {
    CompileJob job;
    job.title = "Night";
    job.author = "A. Writer";
    job.now = Timestamp(1'700'000'000'000);
    job.settings.format = format;
    job.documents = {doc("One", "Hello **world**, see [site](https://example.org)."), doc("Inner", "Deep", 1)};
    return job;
}

std::string render(const CompileJob& job) {
    ProgressReporter progress;
    auto result = make_exporter(job.settings.format)->render(job, progress);
    REQUIRE(result.is_ok());
    return std::move(result).unwrap().toStdString();
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("make_exporter: one exporter per format", "[compile]") {
    for (auto format : {ExportFormat::Pdf, ExportFormat::Docx, ExportFormat::Epub, ExportFormat::Markdown,
                        ExportFormat::PlainText, ExportFormat::Html}) {
        const auto exporter = make_exporter(format);
        REQUIRE(exporter != nullptr);
        REQUIRE(exporter->format() == format);
    }
}

TEST_CASE("Markdown export: front matter, headings and separators", "[compile][markdown]") {
    auto job = sample_job(ExportFormat::Markdown);
    job.documents = {doc("One", "  Hello **world**\n\n"), doc("Inner", "Deep", 1)};

    REQUIRE(render(job) ==
            "---\n"
            "title: \"Night\"\n"
            "author: \"A. Writer\"\n"
            "date: \"2023-11-14\"\n"
            "---\n\n"
            "# Night\n\n"
            "*by A. Writer*\n\n"
            "## One\n\n"
            "Hello **world**\n\n"
            "### Inner\n\n"
            "Deep\n");

    SECTION("three asterisks between documents") {
        job.settings.separator = DocumentSeparator::ThreeAsterisks;
        REQUIRE(contains(render(job), "Hello **world**\n\n\n***\n\n### Inner"));
    }

    SECTION("table of contents links to heading anchors") {
        job.settings.include_table_of_contents = true;
        const auto md = render(job);
        REQUIRE(contains(md, "- [One](#one)\n  - [Inner](#inner)\n"));
    }

    SECTION("heading depth is capped") {
        job.documents = {doc("Deepest", "x", 9)};
        REQUIRE(contains(render(job), "\n###### Deepest\n"));
    }

    SECTION("quotes in the title are escaped in front matter") {
        job.title = "Say \"hi\"";
        REQUIRE(contains(render(job), "title: \"Say \\\"hi\\\"\"\n"));
    }

    SECTION("no front matter") {
        job.settings.include_front_matter = false;
        REQUIRE(render(job).starts_with("# Night\n"));
    }
}

TEST_CASE("heading_anchor", "[compile][markdown]") {
    REQUIRE(heading_anchor("Chapter One: Start!") == "chapter-one-start");
    REQUIRE(heading_anchor("Already-dashed") == "already-dashed");
}

TEST_CASE("Plain text export: underlined titles, no Markdown", "[compile][text]") {
    const auto text = render(sample_job(ExportFormat::PlainText));
    REQUIRE(text.starts_with("NIGHT\n=====\n\nby A. Writer\n\n"));
    REQUIRE(contains(text, "ONE\n---\n\n"));
    REQUIRE(contains(text, "INNER\n-----\n\nDeep\n"));
    REQUIRE_FALSE(contains(text, "**"));
    REQUIRE(contains(text, "Hello world"));
}

TEST_CASE("HTML export: standalone page", "[compile][html]") {
    auto job = sample_job(ExportFormat::Html);
    job.title = "Salt & Pepper";
    const auto html = render(job);

    REQUIRE(html.starts_with("<!doctype html>"));
    REQUIRE(contains(html, "<title>Salt &amp; Pepper</title>"));
    REQUIRE(contains(html, "<h1>Salt &amp; Pepper</h1>"));
    REQUIRE(contains(html, "by A. Writer"));
    REQUIRE(contains(html, "<h2>One</h2>"));
    REQUIRE(contains(html, "<h3>Inner</h3>"));
    REQUIRE(contains(html, "<strong>world</strong>"));
    REQUIRE(contains(html, "<a href=\"https://example.org\">site</a>"));
    REQUIRE(contains(html, "font-family: Georgia"));
    // The title block is written once, not again from the Markdown.
    REQUIRE(html.find("Salt &amp; Pepper</h1>") == html.rfind("Salt &amp; Pepper</h1>"));

    SECTION("strikethrough and highlight") {
        job.documents = {doc("One", "Light ~~fades~~ and ==glows==.")};
        const auto marked = render(job);
        REQUIRE(contains(marked, "Light <del>fades</del> and <mark>glows</mark>."));
        REQUIRE_FALSE(contains(marked, "~~"));
    }
}

TEST_CASE("render_markdown_html: raw HTML is not passed through", "[compile][html]") {
    const auto html = render_markdown_html("a <script>x</script> b\n\n---\n");
    REQUIRE_FALSE(contains(html, "<script>"));
    REQUIRE(contains(html, "<hr />"));
}

TEST_CASE("render_markdown_html: strikethrough and highlight", "[compile][html]") {
    const auto html = render_markdown_html("Light ~~fades~~ and ==glows== **~~both~~**\n");
    REQUIRE(contains(html, "Light <del>fades</del> and <mark>glows</mark> <strong><del>both</del></strong>"));

    SECTION("markers nest") {
        REQUIRE(contains(render_markdown_html("~~==x==~~"), "<del><mark>x</mark></del>"));
    }

    SECTION("escaped and unbalanced markers stay literal") {
        const auto literal = render_markdown_html("a \\~\\~b\\~\\~ 2 == 2 ~~ x");
        REQUIRE_FALSE(contains(literal, "<del>"));
        REQUIRE_FALSE(contains(literal, "<mark>"));
        REQUIRE(contains(literal, "2 == 2 ~~ x"));
    }

    SECTION("Qt rich text tags") {
        const auto qt = render_markdown_html("~~a~~ ==b==", HtmlFlavor::QtRichText);
        REQUIRE(contains(qt, "<s>a</s> <span style=\"background-color:#ffff00\">b</span>"));
    }
}

TEST_CASE("DOCX export: package parts", "[compile][docx]") {
    auto job = sample_job(ExportFormat::Docx);
    const auto bytes = QByteArray::fromStdString(render(job));
    REQUIRE(bytes.startsWith("PK"));

    const auto entries = read_zip(bytes);
    std::vector<std::string> names;
    for (const auto& e : entries) names.push_back(e.name);
    REQUIRE(names == docx_part_names(job.settings));

    const auto parts = by_name(entries);
    const auto& document = parts.at("word/document.xml");
    REQUIRE(contains(document, "<w:pStyle w:val=\"Heading1\"/>"));
    REQUIRE(contains(document, "<w:b/>"));
    REQUIRE(contains(document, "<w:hyperlink r:id=\"rId100\">"));
    REQUIRE(contains(document, "<w:t xml:space=\"preserve\">world</w:t>"));

    const auto& rels = parts.at("word/_rels/document.xml.rels");
    REQUIRE(contains(rels, "Id=\"rId100\""));
    REQUIRE(contains(rels, "Target=\"https://example.org\""));
    REQUIRE(contains(rels, "TargetMode=\"External\""));
    REQUIRE(contains(rels, "Id=\"rId2\""));
    REQUIRE(contains(parts.at("docProps/core.xml"), "<dc:title>Night</dc:title>"));

    SECTION("no footer without page numbers") {
        job.settings.include_page_numbers = false;
        const auto plain = by_name(read_zip(QByteArray::fromStdString(render(job))));
        REQUIRE(plain.count("word/footer1.xml") == 0);
        REQUIRE_FALSE(contains(plain.at("[Content_Types].xml"), "footer"));
    }
}

TEST_CASE("EPUB export: mimetype first and one page per document", "[compile][epub]") {
    auto job = sample_job(ExportFormat::Epub);
    job.settings.include_table_of_contents = true;
    const auto entries = read_zip(QByteArray::fromStdString(render(job)));

    REQUIRE(entries.at(0).name == "mimetype");
    REQUIRE(entries.at(0).method == 0);
    REQUIRE(entries.at(0).data == "application/epub+zip");

    const auto parts = by_name(entries);
    for (const char* name : {"META-INF/container.xml", "OEBPS/content.opf", "OEBPS/toc.ncx", "OEBPS/nav.xhtml",
                             "OEBPS/styles.css", "OEBPS/title.xhtml", "OEBPS/toc-page.xhtml",
                             "OEBPS/chapter-001.xhtml", "OEBPS/chapter-002.xhtml"}) {
        INFO(name);
        REQUIRE(parts.count(name) == 1);
    }
    REQUIRE(contains(parts.at("OEBPS/content.opf"), "<dc:title>Night</dc:title>"));
    REQUIRE(contains(parts.at("OEBPS/chapter-001.xhtml"), "<strong>world</strong>"));

    SECTION("strikethrough and highlight reach the chapter page") {
        job.documents = {doc("One", "Light ~~fades~~ and ==glows==.")};
        const auto chapter = by_name(read_zip(QByteArray::fromStdString(render(job)))).at("OEBPS/chapter-001.xhtml");
        REQUIRE(contains(chapter, "Light <del>fades</del> and <mark>glows</mark>."));
    }
    REQUIRE(chapter_file_name(6) == "chapter-007.xhtml");
}

TEST_CASE("PDF export", "[compile][pdf]") {
    auto job = sample_job(ExportFormat::Pdf);

    SECTION("source HTML breaks pages between chapters") {
        ProgressReporter progress;
        const auto html = pdf_source_html(job, progress);
        REQUIRE(contains(html, "<h1 align=\"center\">Night</h1>"));
        REQUIRE(contains(html, "<h1>One</h1>"));
        REQUIRE(contains(html, "<h2>Inner</h2>"));
        REQUIRE(contains(html, "page-break-before: always"));
    }

    SECTION("strikethrough uses tags QTextDocument understands") {
        job.documents = {doc("One", "Light ~~fades~~.")};
        ProgressReporter progress;
        REQUIRE(contains(pdf_source_html(job, progress), "Light <s>fades</s>."));
    }

    SECTION("renders a PDF file") {
        const auto pdf = render(job);
        REQUIRE(pdf.starts_with("%PDF"));
    }
}

TEST_CASE("compile_manuscript", "[compile]") {
    auto m = create_manuscript("The Night", "A. Writer");

    SECTION("nothing to compile") {
        auto skipped = create_document("Draft notes", "not for print");
        skipped.include_in_compile = false;
        m.draft.documents.push_back(skipped);
        auto result = compile_manuscript(m, CompileSettings{});
        REQUIRE(result.is_err());
        REQUIRE(error_code_of(result.unwrap_err()) == ErrorCode::NoDocuments);
    }

    SECTION("Markdown output with statistics and progress") {
        m.draft.documents.push_back(create_document("One", "three small words", 0));
        CompileSettings settings;
        settings.format = ExportFormat::Markdown;
        settings.title_override = "Override";

        std::vector<double> seen;
        auto result = compile_manuscript(m, settings, [&](double f, const std::string&) { seen.push_back(f); });
        REQUIRE(result.is_ok());
        const auto out = std::move(result).unwrap();
        REQUIRE(out.filename == "override.md");
        REQUIRE(out.statistics.document_count == 1);
        REQUIRE(out.statistics.word_count == 3);
        REQUIRE(out.data.contains("# Override"));
        REQUIRE(seen.front() == 0.0);
        REQUIRE(seen.back() == 1.0);
    }
}

TEST_CASE("resolve_title and resolve_author", "[compile]") {
    auto m = create_manuscript("", "Someone");
    CompileSettings settings;
    REQUIRE(resolve_title(m, settings) == "Untitled");

    settings.title_override = "";
    REQUIRE(resolve_title(m, settings) == "Untitled");

    m.title = "Kept";
    REQUIRE(resolve_title(m, settings) == "Kept");
    settings.title_override = "Replaced";
    REQUIRE(resolve_title(m, settings) == "Replaced");

    REQUIRE(resolve_author(m, settings) == "Someone");
    settings.author_override = "Pen Name";
    REQUIRE(resolve_author(m, settings) == "Pen Name");
}
