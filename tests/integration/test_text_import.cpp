#include <catch2/catch_test_macros.hpp>

#include "compile/text_import.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace folio;
using namespace folio::compile;

namespace {

QString write_file(const QTemporaryDir& dir, const QString& name, const QByteArray& bytes) {
    const auto path = dir.filePath(name);
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(bytes) == bytes.size());
    return path;
}

} // namespace

TEST_CASE("take_front_matter_title", "[import][text]") {
    std::string body;

    SECTION("quoted title") {
        REQUIRE(take_front_matter_title("---\ntitle: \"The Night\"\ntags: x\n---\nBody", body) == "The Night");
        REQUIRE(body == "Body");
    }

    SECTION("block without a title") {
        REQUIRE_FALSE(take_front_matter_title("---\nauthor: me\n...\nText", body).has_value());
        REQUIRE(body == "Text");
    }

    SECTION("unterminated block is left alone") {
        const std::string text = "---\ntitle: Lost\nno end";
        REQUIRE_FALSE(take_front_matter_title(text, body).has_value());
        REQUIRE(body == text);
    }

    SECTION("a rule later in the file is not front matter") {
        const std::string text = "Intro\n---\ntitle: x\n---\n";
        REQUIRE_FALSE(take_front_matter_title(text, body).has_value());
        REQUIRE(body == text);
    }
}

TEST_CASE("manuscript_from_text: title resolution", "[import][text]") {
    SECTION("front matter wins over headings") {
        const auto m = manuscript_from_text("---\ntitle: Meta\n---\n# Heading\nText", "file", true);
        REQUIRE(m.title == "Meta");
        REQUIRE(m.draft.documents.at(0).content == "# Heading\nText");
    }

    SECTION("first heading is taken and removed") {
        const auto m = manuscript_from_text("Intro\n# Heading\nText", "file", true);
        REQUIRE(m.title == "Heading");
        REQUIRE(m.draft.documents.size() == 1);
        REQUIRE(m.draft.documents[0].title == "Heading");
        REQUIRE(m.draft.documents[0].content == "Intro\nText");
    }

    SECTION("plain text keeps headings and uses the file name") {
        const auto m = manuscript_from_text("# Not a heading\nText", "notes", false);
        REQUIRE(m.title == "notes");
        REQUIRE(m.draft.documents[0].content == "# Not a heading\nText");
    }

    SECTION("'##' is not a title") {
        const auto m = manuscript_from_text("## Section\nText", "fallback", true);
        REQUIRE(m.title == "fallback");
    }
}

TEST_CASE("import_text_file", "[import][text]") {
    QTemporaryDir tmp;
    REQUIRE(tmp.isValid());

    SECTION("UTF-8 Markdown with a byte order mark") {
        const auto path = write_file(tmp, "story.md", "\xEF\xBB\xBF# Story\n\nOnce upon a time");
        auto result = import_text_file(path);
        REQUIRE(result.is_ok());
        const auto imported = std::move(result).unwrap();
        REQUIRE(imported.manuscript.title == "Story");
        REQUIRE(imported.manuscript.draft.documents.at(0).content == "Once upon a time");
        REQUIRE(imported.report.documents == 1);
        REQUIRE(imported.report.warnings.empty());
    }

    SECTION("Windows-1252 text") {
        const auto path = write_file(tmp, "draft.txt", "caf\xE9 \x93quoted\x94");
        auto result = import_text_file(path);
        REQUIRE(result.is_ok());
        const auto imported = std::move(result).unwrap();
        REQUIRE(imported.manuscript.title == "draft");
        REQUIRE(imported.manuscript.draft.documents.at(0).content ==
                "caf\xC3\xA9 \xE2\x80\x9Cquoted\xE2\x80\x9D");
        REQUIRE(imported.report.warnings.size() == 1);
        REQUIRE(imported.report.warnings[0].severity == Severity::Info);
    }

    SECTION("missing file") {
        auto result = import_text_file(tmp.filePath("absent.md"));
        REQUIRE(result.is_err());
        REQUIRE(error_code_of(result.unwrap_err()) == ErrorCode::FileReadFailed);
    }

    SECTION("directories are not text files") {
        REQUIRE(QDir(tmp.path()).mkdir("folder.md"));
        auto result = import_text_file(tmp.filePath("folder.md"));
        REQUIRE(result.is_err());
    }
}

TEST_CASE("is_text_import_path", "[import][text]") {
    REQUIRE(is_text_import_path("a/b/Notes.MD"));
    REQUIRE(is_text_import_path("x.markdown"));
    REQUIRE(is_text_import_path("x.txt"));
    REQUIRE_FALSE(is_text_import_path("x.scriv"));
    REQUIRE_FALSE(is_text_import_path("README"));
}
