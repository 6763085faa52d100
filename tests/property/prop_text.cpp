#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/utf8.hpp"
#include "text/markdown_bridge.hpp"
#include "text/rtf_reader.hpp"
#include "text/rtf_writer.hpp"
#include <algorithm>

using namespace folio;
using namespace folio::text;

namespace {

// Markdown-heavy alphabet so the cleanup steps actually fire.
rc::Gen<std::string> markdown_soup() {
    return rc::gen::container<std::string>(rc::gen::elementOf(std::string("ab *_~=#[]()\\\n\r\t")));
}

rc::Gen<char32_t> text_code_point() {
    return rc::gen::oneOf(
        rc::gen::cast<char32_t>(rc::gen::inRange<uint32_t>(0x20, 0x7F)),
        rc::gen::cast<char32_t>(rc::gen::inRange<uint32_t>(0xA0, 0x3000)),
        rc::gen::cast<char32_t>(rc::gen::inRange<uint32_t>(0x1F600, 0x1F650)),
        rc::gen::element<char32_t>(U'\n', U'\t'));
}

rc::Gen<std::string> unicode_text() {
    return rc::gen::map(rc::gen::container<std::vector<char32_t>>(text_code_point()), [](const std::vector<char32_t>& cps) {
        std::string out;
        for (char32_t cp : cps) append_utf8(out, cp);
        return out;
    });
}

rc::Gen<TextAttributes> marker_attributes() {
    return rc::gen::map(rc::gen::tuple(rc::gen::arbitrary<bool>(), rc::gen::arbitrary<bool>(),
                                       rc::gen::arbitrary<bool>(), rc::gen::arbitrary<bool>()),
                        [](const std::tuple<bool, bool, bool, bool>& flags) {
                            TextAttributes attrs;
                            attrs.bold = std::get<0>(flags);
                            attrs.italic = std::get<1>(flags);
                            attrs.strikethrough = std::get<2>(flags);
                            attrs.highlight = std::get<3>(flags);
                            return attrs;
                        });
}

} // namespace

TEST_CASE("Property: cleanup_markdown is idempotent", "[property][markdown]") {
    rc::check("cleanup(cleanup(s)) == cleanup(s)", [] {
        const auto s = *markdown_soup();
        const auto once = cleanup_markdown(s);
        RC_ASSERT(cleanup_markdown(once) == once);
    });
}

TEST_CASE("Property: cleanup_markdown output has no CR and no blank-line runs", "[property][markdown]") {
    rc::check("no CR, no three newlines, no trailing whitespace", [] {
        const auto out = cleanup_markdown(*markdown_soup());
        RC_ASSERT(out.find('\r') == std::string::npos);
        RC_ASSERT(out.find("\n\n\n") == std::string::npos);
        if (!out.empty()) {
            RC_ASSERT(out.back() != ' ');
            RC_ASSERT(out.back() != '\n');
        }
    });
}

TEST_CASE("Property: whitespace-only runs are never wrapped in markers", "[property][markdown]") {
    rc::check("runs of blanks produce no emphasis syntax", [] {
        const auto count = *rc::gen::inRange<size_t>(1, 6);
        RunList runs;
        for (size_t i = 0; i < count; ++i) {
            const auto blank = *rc::gen::nonEmpty(rc::gen::container<std::string>(rc::gen::element(' ', '\t', '\n')));
            runs.push_back({blank, *marker_attributes()});
        }
        const auto md = runs_to_markdown(runs);
        RC_ASSERT(md.find_first_of("*~=") == std::string::npos);
    });
}

TEST_CASE("Property: literal marker characters in plain runs read back unchanged", "[property][markdown]") {
    rc::check("markdown_to_runs(runs_to_markdown(s)) keeps the text of s", [] {
        auto text = *rc::gen::container<std::string>(rc::gen::elementOf(std::string("ab *_~=#[]()\\")));
        const auto md = runs_to_markdown({{text, {}}});
        while (!text.empty() && text.back() == ' ') text.pop_back();
        RC_ASSERT(plain_text(markdown_to_runs(md)) == text);
    });
}

TEST_CASE("Property: RTF writer output reads back as the same text", "[property][rtf]") {
    rc::check("plain_text(parse_rtf(write_rtf(s))) == s", [] {
        const auto text = *unicode_text();
        const auto parsed = parse_rtf(write_rtf({{text, {}}}));
        RC_ASSERT(parsed.is_ok());
        RC_ASSERT(plain_text(parsed.unwrap().runs) == text);
    });
}
