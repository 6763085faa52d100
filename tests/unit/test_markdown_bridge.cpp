#include <catch2/catch_test_macros.hpp>

#include "text/markdown_bridge.hpp"
#include "text/rtf_reader.hpp"
#include "text/rtf_writer.hpp"

using namespace folio::text;

namespace {

TextAttributes bold() {
    TextAttributes a;
    a.bold = true;
    return a;
}

TextAttributes italic() {
    TextAttributes a;
    a.italic = true;
    return a;
}

} // namespace

TEST_CASE("markdown_to_runs: adjacent bold spans stay separate", "[markdown]") {
    const auto runs = markdown_to_runs("**bold** **more**");

    REQUIRE(runs.size() == 3);
    REQUIRE(runs[0] == FormattedRun{"bold", bold()});
    REQUIRE(runs[1] == FormattedRun{" ", {}});
    REQUIRE(runs[2] == FormattedRun{"more", bold()});

    SECTION("and join back into one span") {
        REQUIRE(runs_to_markdown(runs) == "**bold more**");
    }
}

TEST_CASE("markdown_to_runs: inline markers", "[markdown]") {
    SECTION("italic with either marker") {
        REQUIRE(markdown_to_runs("*a*") == RunList{{"a", italic()}});
        REQUIRE(markdown_to_runs("_a_") == RunList{{"a", italic()}});
    }

    SECTION("bold italic") {
        TextAttributes both;
        both.bold = true;
        both.italic = true;
        REQUIRE(markdown_to_runs("***loud***") == RunList{{"loud", both}});
    }

    SECTION("strikethrough and highlight") {
        TextAttributes strike;
        strike.strikethrough = true;
        TextAttributes mark;
        mark.highlight = true;
        const auto runs = markdown_to_runs("~~gone~~ ==seen==");
        REQUIRE(runs == RunList{{"gone", strike}, {" ", {}}, {"seen", mark}});
    }

    SECTION("underscores inside words are literal") {
        REQUIRE(markdown_to_runs("snake_case_name") == RunList{{"snake_case_name", {}}});
    }

    SECTION("unmatched markers are literal") {
        REQUIRE(markdown_to_runs("2 * 3 = 6") == RunList{{"2 * 3 = 6", {}}});
    }
}

TEST_CASE("markdown_to_runs: links", "[markdown]") {
    TextAttributes link;
    link.link = "https://example.org";

    const auto runs = markdown_to_runs("see [site](https://example.org) now");
    REQUIRE(runs == RunList{{"see ", {}}, {"site", link}, {" now", {}}});
    REQUIRE(runs_to_markdown(runs) == "see [site](https://example.org) now");
}

TEST_CASE("markdown_to_runs: headings", "[markdown]") {
    const auto runs = markdown_to_runs("## Part Two\nBody");

    TextAttributes heading;
    heading.bold = true;
    heading.heading_level = 2;
    REQUIRE(runs == RunList{{"Part Two", heading}, {"\nBody", {}}});

    SECTION("headings are written without bold markers") {
        REQUIRE(runs_to_markdown(runs) == "## Part Two\nBody");
    }

    SECTION("four hashes are not a heading") {
        REQUIRE(markdown_to_runs("#### deep")[0].attrs.heading_level == 0);
    }
}

TEST_CASE("runs_to_markdown: markers hug the text", "[markdown]") {
    SECTION("surrounding spaces stay outside") {
        const RunList runs{{"a", {}}, {" word ", bold()}, {"b", {}}};
        REQUIRE(runs_to_markdown(runs) == "a **word** b");
    }

    SECTION("whitespace-only runs are never wrapped") {
        const RunList runs{{"a", {}}, {"   ", bold()}, {"b", {}}, {"\t", italic()}};
        REQUIRE(runs_to_markdown(runs) == "a   b");
    }

    SECTION("underline only as HTML when asked") {
        TextAttributes u;
        u.underline = true;
        const RunList runs{{"x", u}};
        REQUIRE(runs_to_markdown(runs) == "x");
        MarkdownOptions html;
        html.html_underline = true;
        REQUIRE(runs_to_markdown(runs, html) == "<u>x</u>");
    }
}

TEST_CASE("cleanup_markdown: normalisation steps", "[markdown]") {
    SECTION("line endings") {
        REQUIRE(cleanup_markdown("a\r\nb\rc") == "a\nb\nc");
    }

    SECTION("empty marker pairs are removed") {
        REQUIRE(cleanup_markdown("a **** b") == "a  b");
        REQUIRE(cleanup_markdown("**a****b**") == "**ab**");
        REQUIRE(cleanup_markdown("x ~~~~ y ==== z") == "x  y  z");
    }

    SECTION("a rule line is kept") {
        REQUIRE(cleanup_markdown("above\n\n****\n\nbelow") == "above\n\n****\n\nbelow");
    }

    SECTION("identical markers across spaces merge") {
        REQUIRE(cleanup_markdown("*a* *b*") == "*a b*");
        REQUIRE(cleanup_markdown("~~a~~ ~~b~~") == "~~a b~~");
    }

    SECTION("trailing whitespace and blank runs") {
        REQUIRE(cleanup_markdown("one  \t\n\n\n\ntwo") == "one\n\ntwo");
    }

    SECTION("leading newlines and trailing whitespace") {
        REQUIRE(cleanup_markdown("\n\nbody\n\n  ") == "body");
    }

    SECTION("idempotent") {
        const std::string messy = "\n**a** **b****c**  \n\n\n\n~~x~~ ~~y~~\r\n";
        const auto once = cleanup_markdown(messy);
        REQUIRE(cleanup_markdown(once) == once);
    }
}

TEST_CASE("runs_to_markdown: literal marker characters survive", "[markdown]") {
    const std::string prose = "\"What the f**** is this,\" she said. PIN: ****. Rated 5* *and* up.";
    const RunList runs{{prose, {}}};

    const auto md = runs_to_markdown(runs);
    REQUIRE(md == "\"What the f\\*\\*\\*\\* is this,\" she said. PIN: \\*\\*\\*\\*. Rated 5\\* \\*and\\* up.");
    REQUIRE(markdown_to_runs(md) == runs);

    SECTION("through RTF and back") {
        const auto decoded = decode_rich_text(markdown_to_rtf("f**** and 5* *and*"));
        REQUIRE(decoded.source == DecodeSource::Rtf);
        REQUIRE(decoded.runs == RunList{{"f**** and 5* ", {}}, {"and", italic()}});

        const auto again = runs_to_markdown(decoded.runs);
        REQUIRE(again == "f\\*\\*\\*\\* and 5\\* *and*");
        REQUIRE(markdown_to_runs(again) == decoded.runs);
    }

    SECTION("other marker characters") {
        const RunList mixed{{"a == b, ~~x, [note] _tag_ C:\\dir snake_case", {}}, {"=", bold()}};
        const auto out = runs_to_markdown(mixed);
        REQUIRE(out == "a \\=\\= b, \\~\\~x, \\[note\\] \\_tag\\_ C:\\\\dir snake_case**\\=**");
        REQUIRE(markdown_to_runs(out) == mixed);
    }

    SECTION("a leading hash is not a heading") {
        const RunList tag{{"# not a title", {}}};
        REQUIRE(runs_to_markdown(tag) == "\\# not a title");
        REQUIRE(markdown_to_runs(runs_to_markdown(tag)) == tag);
    }
}

TEST_CASE("cleanup_markdown: escaped markers are left alone", "[markdown]") {
    REQUIRE(cleanup_markdown("a \\*\\*\\*\\* b") == "a \\*\\*\\*\\* b");
    REQUIRE(cleanup_markdown("x\\* \\*y") == "x\\* \\*y");
    REQUIRE(cleanup_markdown("*a\\* *b*") == "*a\\* *b*");
}

TEST_CASE("markdown_to_runs: backslash escapes", "[markdown]") {
    REQUIRE(markdown_to_runs("\\*not italic\\*") == RunList{{"*not italic*", {}}});
    REQUIRE(markdown_to_runs("**a\\*b**") == RunList{{"a*b", bold()}});
    REQUIRE(markdown_to_runs("\\[x](y)") == RunList{{"[x](y)", {}}});
    REQUIRE(markdown_to_runs("a\\nb") == RunList{{"a\\nb", {}}});
}

TEST_CASE("strip_markdown: plain text for text output", "[markdown]") {
    REQUIRE(strip_markdown("# Title\n\n**bold** and [link](https://x.org)") == "Title\n\nbold and link");
    REQUIRE(strip_markdown("> quoted `code`") == "quoted code");
}
