#include "text/rtf_writer.hpp"

#include "core/utf8.hpp"
#include "text/markdown_bridge.hpp"

#include <cmath>

namespace folio::text {

namespace {

void append_unicode_escape(std::string& out, char32_t unit) {
    // \u takes a signed 16-bit value; '?' is the fallback for readers without Unicode.
    const int value = unit > 0x7FFF ? static_cast<int>(unit) - 65536 : static_cast<int>(unit);
    out += "\\u";
    out += std::to_string(value);
    out += '?';
}

std::string control_words(const TextAttributes& a) {
    std::string cw;
    if (a.heading_level > 0) {
        cw += "\\fs";
        cw += std::to_string(static_cast<int>(std::lround(heading_point_size(a.heading_level) * 2)));
        cw += "\\b";
    } else if (a.bold) {
        cw += "\\b";
    }
    if (a.italic) cw += "\\i";
    if (a.underline) cw += "\\ul";
    if (a.strikethrough) cw += "\\strike\\strikec0";
    if (a.highlight) cw += "\\highlight2";
    return cw;
}

void write_segment(std::string& out, std::string_view text, const TextAttributes& a) {
    if (text.empty()) return;

    auto styled = a;
    styled.link.clear();
    const auto cw = control_words(styled);

    std::string body;
    if (cw.empty()) {
        body = escape_rtf(text);
    } else {
        body = "{" + cw + " " + escape_rtf(text) + "}";
    }

    if (a.link.empty()) {
        out += body;
        return;
    }
    out += "{\\field{\\*\\fldinst{HYPERLINK \"";
    out += escape_rtf(a.link);
    out += "\"}}{\\fldrslt ";
    out += body;
    out += "}}";
}

} // namespace

std::string escape_rtf(std::string_view utf8) {
    std::string out;
    out.reserve(utf8.size());
    size_t pos = 0;
    while (pos < utf8.size()) {
        const char32_t cp = decode_utf8(utf8, pos);
        switch (cp) {
            case '\\': out += "\\\\"; break;
            case '{': out += "\\{"; break;
            case '}': out += "\\}"; break;
            case '\t': out += "\\tab "; break;
            case '\n': out += "\\par\n"; break;
            default:
                if (cp < 0x80) {
                    out += static_cast<char>(cp);
                } else if (cp < 0x10000) {
                    append_unicode_escape(out, cp);
                } else {
                    const char32_t v = cp - 0x10000;
                    append_unicode_escape(out, 0xD800 + (v >> 10));
                    append_unicode_escape(out, 0xDC00 + (v & 0x3FF));
                }
                break;
        }
    }
    return out;
}

std::string write_rtf(const RunList& runs, const RtfWriterOptions& options) {
    const int body_half_points = static_cast<int>(std::lround(options.font_size * 2));

    std::string out;
    out += "{\\rtf1\\ansi\\ansicpg1252\\cocoartf2639\\uc1\n";
    out += "{\\fonttbl\\f0\\fswiss\\fcharset0 ";
    out += options.font_name;
    out += ";}\n";
    out += "{\\colortbl;\\red255\\green255\\blue255;\\red255\\green255\\blue0;}\n";
    out += "\\pard\\pardirnatural\\f0\\fs";
    out += std::to_string(body_half_points);
    out += " ";

    const auto lines = split_lines(runs);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "\\par\n";
        for (const auto& run : lines[i]) {
            write_segment(out, run.text, run.attrs);
        }
    }
    out += "}";
    return out;
}

std::string markdown_to_rtf(std::string_view markdown, const RtfWriterOptions& options) {
    return write_rtf(markdown_to_runs(markdown), options);
}

} // namespace folio::text
