#include <catch2/catch_test_macros.hpp>

#include "text/rtf_reader.hpp"
#include "text/rtf_writer.hpp"

using namespace folio;
using namespace folio::text;

namespace {

RunList parse(std::string_view rtf) {
    auto result = parse_rtf(rtf);
    REQUIRE(result.is_ok());
    return std::move(result).unwrap().runs;
}

} // namespace

TEST_CASE("parse_rtf: groups scope formatting", "[rtf]") {
    TextAttributes bold;
    bold.bold = true;
    REQUIRE(parse(R"({\rtf1\ansi {\b bold} plain})") == RunList{{"bold", bold}, {" plain", {}}});
}

TEST_CASE("parse_rtf: character escapes", "[rtf]") {
    SECTION("hex escapes are Windows-1252") {
        REQUIRE(plain_text(parse(R"({\rtf1 caf\'e9 \'93q\'94})")) == "caf\xC3\xA9 \xE2\x80\x9Cq\xE2\x80\x9D");
    }

    SECTION("unicode escapes skip their fallback") {
        REQUIRE(plain_text(parse(R"({\rtf1\uc1 \u8212?dash})")) == "\xE2\x80\x94" "dash");
    }

    SECTION("surrogate pairs combine") {
        REQUIRE(plain_text(parse(R"({\rtf1 \u-10179?\u-8704?})")) == "\xF0\x9F\x98\x80");
    }

    SECTION("escaped braces and backslash") {
        REQUIRE(plain_text(parse(R"({\rtf1 a\{b\}c\\d})")) == "a{b}c\\d");
    }

    SECTION("paragraphs and tabs") {
        REQUIRE(plain_text(parse("{\\rtf1 one\\par\ntwo\\tab three}")) == "one\ntwo\tthree");
    }
}

TEST_CASE("parse_rtf: tables and destinations are skipped", "[rtf]") {
    const auto runs = parse(
        R"({\rtf1\ansi{\fonttbl\f0\fswiss Helvetica;}{\colortbl;\red255\green255\blue255;})"
        R"({\*\expandedcolortbl;;}{\info{\title Hidden}}\f0\fs24 Hello})");
    REQUIRE(plain_text(runs) == "Hello");
}

TEST_CASE("parse_rtf: hyperlink fields", "[rtf]") {
    const auto runs = parse(R"({\rtf1 see {\field{\*\fldinst{HYPERLINK "https://example.org"}}{\fldrslt site}}.})");

    TextAttributes link;
    link.link = "https://example.org";
    REQUIRE(runs == RunList{{"see ", {}}, {"site", link}, {".", {}}});
}

TEST_CASE("parse_rtf: large bold text is a heading", "[rtf]") {
    const auto runs = parse(R"({\rtf1 {\fs48\b Big}{\fs36\b Mid}{\fs28\b Small}{\fs48 Large plain}})");
    REQUIRE(runs.size() == 4);
    REQUIRE(runs[0].attrs.heading_level == 1);
    REQUIRE(runs[1].attrs.heading_level == 2);
    REQUIRE(runs[2].attrs.heading_level == 3);
    REQUIRE(runs[3].attrs.heading_level == 0);
}

TEST_CASE("parse_rtf: truncated input keeps what was read", "[rtf]") {
    auto result = parse_rtf(R"({\rtf1 abc {\b def)");
    REQUIRE(result.is_ok());
    const auto doc = std::move(result).unwrap();
    REQUIRE_FALSE(doc.complete);
    REQUIRE(plain_text(doc.runs) == "abc def");
}

TEST_CASE("parse_rtf: rejects non-RTF input", "[rtf]") {
    auto result = parse_rtf("just words");
    REQUIRE(result.is_err());
    REQUIRE(error_code_of(result.unwrap_err()) == ErrorCode::EncodingError);
}

TEST_CASE("decode_rich_text: falls back to plain text", "[rtf]") {
    SECTION("RTF") {
        const auto decoded = decode_rich_text(R"({\rtf1 hi})");
        REQUIRE(decoded.source == DecodeSource::Rtf);
        REQUIRE(decoded.problem.empty());
        REQUIRE(plain_text(decoded.runs) == "hi");
    }

    SECTION("UTF-8 text") {
        const auto decoded = decode_rich_text("plain words");
        REQUIRE(decoded.source == DecodeSource::PlainText);
        REQUIRE_FALSE(decoded.problem.empty());
        REQUIRE(plain_text(decoded.runs) == "plain words");
    }

    SECTION("binary") {
        const auto decoded = decode_rich_text("\xFF\xFE");
        REQUIRE(decoded.source == DecodeSource::Empty);
        REQUIRE_FALSE(decoded.problem.empty());
        REQUIRE(decoded.runs.empty());
    }

    SECTION("empty input is not a problem") {
        const auto decoded = decode_rich_text("");
        REQUIRE(decoded.problem.empty());
        REQUIRE(decoded.runs.empty());
    }
}

TEST_CASE("write_rtf: headings use a larger bold font", "[rtf]") {
    const auto rtf = markdown_to_rtf("# Title\nBody");
    REQUIRE(rtf.starts_with("{\\rtf1"));
    REQUIRE(rtf.find("{\\fs48\\b Title}") != std::string::npos);
    REQUIRE(rtf.find("\\par\nBody") != std::string::npos);
}

TEST_CASE("write_rtf: escapes", "[rtf]") {
    REQUIRE(escape_rtf("a{b}\\") == "a\\{b\\}\\\\");
    REQUIRE(escape_rtf("caf\xC3\xA9") == "caf\\u233?");
    REQUIRE(escape_rtf("\xF0\x9F\x98\x80") == "\\u-10179?\\u-8704?");
}

TEST_CASE("write_rtf: output reads back to the same runs", "[rtf]") {
    TextAttributes heading;
    heading.bold = true;
    heading.heading_level = 1;
    TextAttributes bold;
    bold.bold = true;
    TextAttributes mixed;
    mixed.italic = true;
    mixed.strikethrough = true;
    mixed.highlight = true;
    TextAttributes link;
    link.link = "https://example.org/a?b=c";

    const RunList runs{
        {"Title", heading},
        {"\nSome ", {}},
        {"bold", bold},
        {" caf\xC3\xA9 ", {}},
        {"marked", mixed},
        {" ", {}},
        {"link", link},
    };
    REQUIRE(parse(write_rtf(runs)) == runs);
}
