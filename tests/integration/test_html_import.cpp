#include <catch2/catch_test_macros.hpp>

#include "compile/html_import.hpp"
#include "text/markdown_bridge.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace folio;
using namespace folio::compile;

namespace {

constexpr const char* kPage =
    "<html><head><title> Spring </title></head><body>"
    "<h1>Opening</h1>"
    "<p>Some <b>bold</b>, <i>italic</i> and <s>struck</s> text.<br>Next line</p>"
    "<p><span style=\"background-color:yellow\">marked</span> <a href=\"https://example.org\">site</a> <u>under</u></p>"
    "<p><img src=\"missing.png\"></p>"
    "<h5>Deep</h5>"
    "</body></html>";

QString write_file(const QTemporaryDir& dir, const QString& name, const QByteArray& bytes) {
    const auto path = dir.filePath(name);
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(bytes) == bytes.size());
    return path;
}

const text::FormattedRun* run_with_text(const text::RunList& runs, const std::string& text) {
    for (const auto& run : runs) {
        if (run.text == text) return &run;
    }
    return nullptr;
}

} // namespace

TEST_CASE("html_to_runs: blocks and character formats", "[import][html]") {
    const auto parsed = html_to_runs(QString::fromUtf8(kPage));
    REQUIRE(parsed.title == "Spring");
    REQUIRE(parsed.dropped_objects == 1);

    const auto* heading = run_with_text(parsed.runs, "Opening");
    REQUIRE(heading != nullptr);
    REQUIRE(heading->attrs.heading_level == 1);

    const auto* link = run_with_text(parsed.runs, "site");
    REQUIRE(link != nullptr);
    REQUIRE(link->attrs.link == "https://example.org");
    REQUIRE_FALSE(link->attrs.underline);

    const auto* under = run_with_text(parsed.runs, "under");
    REQUIRE(under != nullptr);
    REQUIRE(under->attrs.underline);

    const auto* marked = run_with_text(parsed.runs, "marked");
    REQUIRE(marked != nullptr);
    REQUIRE(marked->attrs.highlight);

    const auto* deep = run_with_text(parsed.runs, "Deep");
    REQUIRE(deep != nullptr);
    REQUIRE(deep->attrs.heading_level == 3);

    REQUIRE(text::runs_to_markdown(parsed.runs) ==
            "# Opening\n\n"
            "Some **bold**, *italic* and ~~struck~~ text.\nNext line\n\n"
            "==marked== [site](https://example.org) under\n\n"
            "### Deep");
}

TEST_CASE("html_to_runs: fragments without formatting", "[import][html]") {
    SECTION("plain paragraphs") {
        const auto parsed = html_to_runs(QStringLiteral("<p>one</p><p>two&nbsp;words</p>"));
        REQUIRE(parsed.title.empty());
        REQUIRE(parsed.dropped_objects == 0);
        REQUIRE(parsed.runs == text::RunList{{"one\n\ntwo words", {}}});
    }

    SECTION("empty document") {
        REQUIRE(html_to_runs(QString()).runs.empty());
    }
}

TEST_CASE("import_html_file", "[import][html]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());

    SECTION("title from the page, dropped image reported") {
        const auto path = write_file(tmp, QStringLiteral("page.html"), kPage);
        auto imported = import_html_file(path);
        REQUIRE(imported.is_ok());
        const auto& result = imported.unwrap();
        REQUIRE(result.manuscript.title == "Spring");
        REQUIRE(result.report.documents == 1);
        REQUIRE(result.report.warnings.size() == 1);
        REQUIRE(result.report.warnings[0].severity == Severity::Info);
        REQUIRE_FALSE(result.report.has_errors());
        REQUIRE(result.manuscript.draft.documents.at(0).content.rfind("# Opening\n\n", 0) == 0);
    }

    SECTION("file name when the page has no title") {
        const auto path = write_file(tmp, QStringLiteral("Field Notes.htm"), "<p>caf\xc3\xa9</p>");
        auto imported = import_html_file(path);
        REQUIRE(imported.is_ok());
        REQUIRE(imported.unwrap().manuscript.title == "Field Notes");
        REQUIRE(imported.unwrap().manuscript.draft.documents.at(0).content == "caf\xc3\xa9");
        REQUIRE(imported.unwrap().report.warnings.empty());
    }

    SECTION("declared charset is honoured") {
        const auto path = write_file(tmp, QStringLiteral("latin.html"),
                                     "<html><head><meta charset=\"ISO-8859-1\"></head><body><p>caf\xe9</p></body></html>");
        auto imported = import_html_file(path);
        REQUIRE(imported.is_ok());
        REQUIRE(imported.unwrap().manuscript.draft.documents.at(0).content == "caf\xc3\xa9");
    }

    SECTION("missing file") {
        auto imported = import_html_file(tmp.filePath(QStringLiteral("absent.html")));
        REQUIRE(imported.is_err());
        REQUIRE(error_code_of(imported.unwrap_err()) == ErrorCode::FileReadFailed);
    }
}
