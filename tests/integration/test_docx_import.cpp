#include <catch2/catch_test_macros.hpp>

#include "archive/zip_writer.hpp"
#include "compile/docx_exporter.hpp"
#include "compile/docx_import.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace folio;
using namespace folio::compile;
using text::RunList;
using text::TextAttributes;

namespace {

constexpr const char* kDocumentXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\" "
    "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"><w:body>"
    "<w:p><w:pPr><w:pStyle w:val=\"Heading1\"/></w:pPr><w:r><w:t>Chapter</w:t></w:r></w:p>"
    "<w:p><w:r><w:t xml:space=\"preserve\">Plain </w:t></w:r>"
    "<w:r><w:rPr><w:b/></w:rPr><w:t>bold</w:t></w:r>"
    "<w:r><w:t xml:space=\"preserve\"> and </w:t></w:r>"
    "<w:r><w:rPr><w:b w:val=\"0\"/><w:i/></w:rPr><w:t>italic</w:t></w:r></w:p>"
    "<w:p/>"
    "<w:p><w:r><w:rPr><w:strike/></w:rPr><w:t>gone</w:t></w:r>"
    "<w:r><w:br/><w:t xml:space=\"preserve\">next </w:t></w:r>"
    "<w:r><w:rPr><w:highlight w:val=\"yellow\"/></w:rPr><w:t>marked</w:t></w:r></w:p>"
    "<w:p><w:hyperlink r:id=\"rId5\"><w:r><w:rPr><w:rStyle w:val=\"Hyperlink\"/><w:u w:val=\"single\"/></w:rPr>"
    "<w:t>site</w:t></w:r></w:hyperlink></w:p>"
    "<w:sectPr/></w:body></w:document>\n";

constexpr const char* kRelsXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" "
    "Target=\"styles.xml\"/>"
    "<Relationship Id=\"rId5\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink\" "
    "Target=\"https://example.org\" TargetMode=\"External\"/>"
    "</Relationships>\n";

constexpr const char* kCoreXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<cp:coreProperties xmlns:cp=\"http://schemas.openxmlformats.org/package/2006/metadata/core-properties\" "
    "xmlns:dc=\"http://purl.org/dc/elements/1.1/\"><dc:title> Winter Notes </dc:title>"
    "<dc:creator>A. Writer</dc:creator></cp:coreProperties>\n";

TextAttributes attrs(bool bold, bool italic, bool strike = false, bool highlight = false) {
    TextAttributes a;
    a.bold = bold;
    a.italic = italic;
    a.strikethrough = strike;
    a.highlight = highlight;
    return a;
}

QString write_file(const QTemporaryDir& dir, const QString& name, const QByteArray& bytes) {
    const auto path = dir.filePath(name);
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(bytes) == bytes.size());
    return path;
}

QByteArray package(const std::vector<std::pair<std::string, std::string>>& parts) {
    archive::ZipArchiveWriter zip(Timestamp(int64_t{1'700'000'000'000}));
    for (const auto& [path, data] : parts) {
        REQUIRE(zip.add_entry(path, data).is_ok());
    }
    auto bytes = zip.finalize();
    REQUIRE(bytes.is_ok());
    const auto& raw = bytes.unwrap();
    return QByteArray(reinterpret_cast<const char*>(raw.data()), static_cast<qsizetype>(raw.size()));
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("parse_docx_relationships", "[import][docx]") {
    const auto links = parse_docx_relationships(kRelsXml);
    REQUIRE(links.size() == 2);
    REQUIRE(links.at(QStringLiteral("rId5")) == QStringLiteral("https://example.org"));
    REQUIRE(links.at(QStringLiteral("rId1")) == QStringLiteral("styles.xml"));
}

TEST_CASE("docx_document_runs: paragraphs and run properties", "[import][docx]") {
    const std::map<QString, QString> links{{QStringLiteral("rId5"), QStringLiteral("https://example.org")}};
    auto runs = docx_document_runs(kDocumentXml, links);
    REQUIRE(runs.is_ok());

    TextAttributes heading;
    heading.heading_level = 1;
    TextAttributes link;
    link.link = "https://example.org";
    const RunList expected{
        {"Chapter", heading},
        {"\n\nPlain ", {}},
        {"bold", attrs(true, false)},
        {" and ", {}},
        {"italic", attrs(false, true)},
        {"\n\n", {}},
        {"gone", attrs(false, false, true)},
        {"\nnext ", {}},
        {"marked", attrs(false, false, false, true)},
        {"\n\n", {}},
        {"site", link},
    };
    REQUIRE(runs.unwrap() == expected);

    SECTION("unknown relationship drops the link, keeps the text") {
        auto unlinked = docx_document_runs(kDocumentXml);
        REQUIRE(unlinked.is_ok());
        REQUIRE(unlinked.unwrap().back().text == "site");
        REQUIRE(unlinked.unwrap().back().attrs.link.empty());
    }

    SECTION("heading styles past 3 are capped") {
        auto deep = docx_document_runs(
            "<w:document xmlns:w=\"urn:w\"><w:body>"
            "<w:p><w:pPr><w:pStyle w:val=\"Heading5\"/></w:pPr><w:r><w:t>Deep</w:t></w:r></w:p>"
            "<w:p><w:pPr><w:pStyle w:val=\"Title\"/></w:pPr><w:r><w:t>Top</w:t></w:r></w:p>"
            "</w:body></w:document>");
        REQUIRE(deep.is_ok());
        REQUIRE(deep.unwrap().front().attrs.heading_level == 3);
        REQUIRE(deep.unwrap().back().attrs.heading_level == 1);
    }

    SECTION("malformed XML") {
        auto broken = docx_document_runs("<w:document xmlns:w=\"urn:w\"><w:body><w:p><w:r><w:t>x</w:r>");
        REQUIRE(broken.is_err());
        REQUIRE(error_code_of(broken.unwrap_err()) == ErrorCode::XmlParsingFailed);
    }
}

TEST_CASE("docx_core_title", "[import][docx]") {
    REQUIRE(docx_core_title(kCoreXml) == "Winter Notes");
    REQUIRE(docx_core_title("<cp:coreProperties xmlns:cp=\"urn:cp\"/>").empty());
}

TEST_CASE("import_docx_file", "[import][docx]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());

    SECTION("a full package") {
        const auto path = write_file(tmp, QStringLiteral("notes.docx"),
                                     package({{"word/document.xml", kDocumentXml},
                                              {"word/_rels/document.xml.rels", kRelsXml},
                                              {"docProps/core.xml", kCoreXml}}));
        auto imported = import_docx_file(path);
        REQUIRE(imported.is_ok());
        const auto& result = imported.unwrap();
        REQUIRE(result.report.documents == 1);
        REQUIRE(result.report.warnings.empty());
        REQUIRE(result.manuscript.title == "Winter Notes");
        REQUIRE(result.manuscript.draft.documents.size() == 1);

        const auto& doc = result.manuscript.draft.documents.front();
        REQUIRE(doc.title == "Winter Notes");
        REQUIRE(doc.content ==
                "# Chapter\n\nPlain **bold** and *italic*\n\n~~gone~~\nnext ==marked==\n\n[site](https://example.org)");
    }

    SECTION("without core properties the file name is the title") {
        const auto path = write_file(tmp, QStringLiteral("Draft Two.docx"), package({{"word/document.xml", kDocumentXml}}));
        auto imported = import_docx_file(path);
        REQUIRE(imported.is_ok());
        REQUIRE(imported.unwrap().manuscript.title == "Draft Two");
    }

    SECTION("a zip without word/document.xml") {
        const auto path = write_file(tmp, QStringLiteral("other.docx"), package({{"readme.txt", "hello"}}));
        auto imported = import_docx_file(path);
        REQUIRE(imported.is_err());
        REQUIRE(error_code_of(imported.unwrap_err()) == ErrorCode::FileReadFailed);
    }

    SECTION("not a zip at all") {
        const auto path = write_file(tmp, QStringLiteral("fake.docx"), "plain text pretending");
        auto imported = import_docx_file(path);
        REQUIRE(imported.is_err());
        REQUIRE(error_code_of(imported.unwrap_err()) == ErrorCode::EncodingError);
    }

    SECTION("missing file") {
        REQUIRE(import_docx_file(tmp.filePath(QStringLiteral("absent.docx"))).is_err());
    }
}

TEST_CASE("import_docx_file: reads DocxExporter output", "[import][docx]") {
    CompilableDocument one;
    one.title = "One";
    one.content = "Hello **world**, see [site](https://example.org).\n\nA ~~struck~~ and ==marked== line.";
    CompileJob job;
    job.title = "Night";
    job.author = "A. Writer";
    job.now = Timestamp(1'700'000'000'000);
    job.settings.format = ExportFormat::Docx;
    job.documents = {one};

    ProgressReporter progress;
    auto rendered = DocxExporter().render(job, progress);
    REQUIRE(rendered.is_ok());

    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());
    const auto path = write_file(tmp, QStringLiteral("night.docx"), rendered.unwrap());

    auto imported = import_docx_file(path);
    REQUIRE(imported.is_ok());
    const auto& result = imported.unwrap();
    REQUIRE(result.manuscript.title == "Night");

    const auto& content = result.manuscript.draft.documents.front().content;
    REQUIRE(contains(content, "# One"));
    REQUIRE(contains(content, "Hello **world**, see [site](https://example.org)."));
    REQUIRE(contains(content, "A ~~struck~~ and ==marked== line."));
}
