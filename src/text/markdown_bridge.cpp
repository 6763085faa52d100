#include "text/markdown_bridge.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace folio::text {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), is_space);
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_escapable(char c) {
    switch (c) {
    case '\\':
    case '*':
    case '_':
    case '~':
    case '=':
    case '[':
    case ']':
    case '#':
        return true;
    default:
        return false;
    }
}

// Backslash-escapes every character the inline parser could read as a
// marker. '~' and '=' only form markers when doubled or when they touch a
// neighbouring span, and '_' never inside a word.
std::string escape_markdown(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        const bool first = (i == 0);
        const bool last = (i + 1 == text.size());
        bool escape = false;
        switch (c) {
        case '\\':
        case '*':
        case '[':
        case ']':
            escape = true;
            break;
        case '_':
            escape = first || last || !is_word_char(text[i - 1]) || !is_word_char(text[i + 1]);
            break;
        case '~':
        case '=':
            escape = first || last || text[i - 1] == c || text[i + 1] == c;
            break;
        default:
            break;
        }
        if (escape) out += '\\';
        out += c;
    }
    return out;
}

std::string unescape_markdown(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size() && is_escapable(text[i + 1])) ++i;
        out += text[i];
    }
    return out;
}

// Same length as `line`, with both bytes of every escape pair replaced by a
// byte that is neither a marker, a space nor a word character.
std::string mask_escapes(std::string_view line) {
    std::string out(line);
    for (size_t i = 0; i + 1 < out.size(); ++i) {
        if (line[i] == '\\' && is_escapable(line[i + 1])) {
            out[i] = '\x01';
            out[i + 1] = '\x01';
            ++i;
        }
    }
    return out;
}

// ============================================================================
// Runs -> Markdown
// ============================================================================

std::string wrap_segment(std::string_view text, const TextAttributes& a,
                         const MarkdownOptions& options, bool in_heading) {
    if (is_blank(text)) {
        return std::string(text);
    }
    size_t begin = 0;
    while (begin < text.size() && is_space(text[begin])) ++begin;
    size_t end = text.size();
    while (end > begin && is_space(text[end - 1])) --end;

    const auto lead = text.substr(0, begin);
    const auto core = text.substr(begin, end - begin);
    const auto trail = text.substr(end);

    std::string out(lead);
    if (!a.link.empty()) {
        out += '[';
        out += escape_markdown(core);
        out += "](";
        out += a.link;
        out += ')';
        out += trail;
        return out;
    }

    std::string s = escape_markdown(core);
    if (a.underline && options.html_underline) s = "<u>" + s + "</u>";
    if (a.highlight) s = "==" + s + "==";
    if (a.strikethrough) s = "~~" + s + "~~";

    const bool bold = a.bold && !in_heading;
    if (bold && a.italic) {
        s = "***" + s + "***";
    } else if (bold) {
        s = "**" + s + "**";
    } else if (a.italic) {
        s = "*" + s + "*";
    }
    out += s;
    out += trail;
    return out;
}

int line_heading_level(const RunList& line) {
    int level = 0;
    for (const auto& run : line) {
        if (is_blank(run.text)) continue;
        if (run.attrs.heading_level <= 0) return 0;
        if (level == 0) {
            level = run.attrs.heading_level;
        } else if (level != run.attrs.heading_level) {
            return 0;
        }
    }
    return std::min(level, 6);
}

// ============================================================================
// Markdown -> runs
// ============================================================================

struct Claim {
    size_t begin = 0;          // first marker byte
    size_t end = 0;            // one past the closing marker
    size_t content_begin = 0;
    size_t content_end = 0;
    TextAttributes adds;
    std::string link;
};

bool overlaps(const std::vector<Claim>& claims, size_t begin, size_t end) {
    return std::any_of(claims.begin(), claims.end(), [&](const Claim& c) {
        return begin < c.end && c.begin < end;
    });
}

size_t run_length(std::string_view s, size_t pos, char c) {
    size_t n = 0;
    while (pos + n < s.size() && s[pos + n] == c) ++n;
    return n;
}

void claim_links(std::string_view line, std::vector<Claim>& claims) {
    size_t i = 0;
    while (i < line.size()) {
        const auto open = line.find('[', i);
        if (open == std::string_view::npos) return;
        const auto close = line.find(']', open + 1);
        if (close == std::string_view::npos) return;
        if (close + 1 >= line.size() || line[close + 1] != '(' || close == open + 1) {
            i = open + 1;
            continue;
        }
        const auto paren = line.find(')', close + 2);
        if (paren == std::string_view::npos || paren == close + 2) {
            i = open + 1;
            continue;
        }
        if (overlaps(claims, open, paren + 1)) {
            i = open + 1;
            continue;
        }
        Claim c;
        c.begin = open;
        c.end = paren + 1;
        c.content_begin = open + 1;
        c.content_end = close;
        c.link = std::string(line.substr(close + 2, paren - close - 2));
        claims.push_back(std::move(c));
        i = paren + 1;
    }
}

// Claims every non-overlapping `marker content marker` span. The marker
// must be a whole run of its character; content may not start or end with
// whitespace. Underscore markers do not open or close inside words.
void claim_delimited(std::string_view line, char ch, size_t len,
                     const TextAttributes& adds, std::vector<Claim>& claims) {
    const bool intraword_guard = (ch == '_');
    size_t i = 0;
    while (i < line.size()) {
        if (line[i] != ch) {
            ++i;
            continue;
        }
        const size_t open_len = run_length(line, i, ch);
        if (open_len != len) {
            i += open_len;
            continue;
        }
        const size_t content_begin = i + len;
        if (content_begin >= line.size() || is_space(line[content_begin]) ||
            (intraword_guard && i > 0 && is_word_char(line[i - 1]))) {
            i += len;
            continue;
        }

        std::optional<size_t> close;
        size_t j = content_begin + 1;
        while (j < line.size()) {
            if (line[j] != ch) {
                ++j;
                continue;
            }
            const size_t close_len = run_length(line, j, ch);
            const bool after_ok = !intraword_guard || j + close_len >= line.size() ||
                                  !is_word_char(line[j + close_len]);
            if (close_len == len && !is_space(line[j - 1]) && after_ok) {
                close = j;
                break;
            }
            j += close_len;
        }
        if (!close) {
            i += len;
            continue;
        }
        const size_t end = *close + len;
        if (overlaps(claims, i, end)) {
            i += len;
            continue;
        }
        Claim c;
        c.begin = i;
        c.end = end;
        c.content_begin = content_begin;
        c.content_end = *close;
        c.adds = adds;
        claims.push_back(std::move(c));
        i = end;
    }
}

TextAttributes merge(TextAttributes base, const Claim& claim) {
    base.bold = base.bold || claim.adds.bold;
    base.italic = base.italic || claim.adds.italic;
    base.strikethrough = base.strikethrough || claim.adds.strikethrough;
    base.highlight = base.highlight || claim.adds.highlight;
    if (!claim.link.empty()) base.link = claim.link;
    return base;
}

void parse_inline(std::string_view line, const TextAttributes& base, RunList& out) {
    // Claims are found on the masked copy so escaped characters never pair.
    const auto masked = mask_escapes(line);
    const std::string_view scan(masked);

    std::vector<Claim> claims;
    claim_links(scan, claims);
    for (auto& c : claims) {
        c.link = std::string(line.substr(c.content_end + 2, c.end - c.content_end - 3));
    }

    TextAttributes bold_italic;
    bold_italic.bold = true;
    bold_italic.italic = true;
    TextAttributes bold;
    bold.bold = true;
    TextAttributes italic;
    italic.italic = true;
    TextAttributes strike;
    strike.strikethrough = true;
    TextAttributes highlight;
    highlight.highlight = true;

    claim_delimited(scan, '*', 3, bold_italic, claims);
    claim_delimited(scan, '_', 3, bold_italic, claims);
    claim_delimited(scan, '*', 2, bold, claims);
    claim_delimited(scan, '_', 2, bold, claims);
    claim_delimited(scan, '*', 1, italic, claims);
    claim_delimited(scan, '_', 1, italic, claims);
    claim_delimited(scan, '~', 2, strike, claims);
    claim_delimited(scan, '=', 2, highlight, claims);

    std::sort(claims.begin(), claims.end(),
              [](const Claim& a, const Claim& b) { return a.begin < b.begin; });

    size_t pos = 0;
    for (const auto& c : claims) {
        append_run(out, unescape_markdown(line.substr(pos, c.begin - pos)), base);
        append_run(out, unescape_markdown(line.substr(c.content_begin, c.content_end - c.content_begin)),
                   merge(base, c));
        pos = c.end;
    }
    append_run(out, unescape_markdown(line.substr(pos)), base);
}

int heading_prefix(std::string_view line) {
    size_t n = run_length(line, 0, '#');
    if (n < 1 || n > 3) return 0;
    if (n >= line.size() || line[n] != ' ') return 0;
    return static_cast<int>(n);
}

// ============================================================================
// Cleanup passes
// ============================================================================

std::string normalize_newlines(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r') {
            out += '\n';
            if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
        } else {
            out += s[i];
        }
    }
    return out;
}

bool is_marker_char(char c) {
    return c == '*' || c == '~' || c == '=';
}

bool is_empty_pair(char c, size_t len) {
    if (c == '*') return len == 4 || len == 6;
    return len == 4;
}

// Lines made only of marker characters are rules or setext underlines.
bool is_rule_line(std::string_view s, size_t pos) {
    const auto line_start = s.rfind('\n', pos == 0 ? 0 : pos - 1);
    const size_t begin = (line_start == std::string_view::npos || pos == 0) ? 0 : line_start + 1;
    auto line_end = s.find('\n', pos);
    if (line_end == std::string_view::npos) line_end = s.size();
    for (size_t k = begin; k < line_end; ++k) {
        if (!is_marker_char(s[k]) && s[k] != ' ' && s[k] != '\t') return false;
    }
    return true;
}

std::string remove_empty_pairs(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (c == '\\' && i + 1 < s.size()) {
            out.append(s, i, 2);
            i += 2;
            continue;
        }
        if (!is_marker_char(c)) {
            out += c;
            ++i;
            continue;
        }
        const size_t len = run_length(s, i, c);
        if (!(is_empty_pair(c, len) && !is_rule_line(s, i))) {
            out.append(s, i, len);
        }
        i += len;
    }
    return out;
}

bool mergeable_length(char c, size_t len) {
    if (c == '*') return len >= 1 && len <= 3;
    return len == 2;
}

std::string merge_across_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (c == '\\' && i + 1 < s.size()) {
            out.append(s, i, 2);
            i += 2;
            continue;
        }
        if (!is_marker_char(c)) {
            out += c;
            ++i;
            continue;
        }
        const size_t len = run_length(s, i, c);
        const bool closes = i > 0 && !is_space(s[i - 1]) && s[i - 1] != c;
        if (closes && mergeable_length(c, len)) {
            size_t k = i + len;
            while (k < s.size() && (s[k] == ' ' || s[k] == '\t')) ++k;
            if (k > i + len && run_length(s, k, c) == len) {
                const size_t after = k + len;
                if (after < s.size() && !is_space(s[after]) && s[after] != c) {
                    out.append(s, i + len, k - (i + len));
                    i = after;
                    continue;
                }
            }
        }
        out.append(s, i, len);
        i += len;
    }
    return out;
}

std::string strip_trailing_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t line_begin = 0;
    while (line_begin <= s.size()) {
        auto nl = s.find('\n', line_begin);
        const bool last = (nl == std::string::npos);
        if (last) nl = s.size();
        size_t end = nl;
        while (end > line_begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) --end;
        out.append(s, line_begin, end - line_begin);
        if (last) break;
        out += '\n';
        line_begin = nl + 1;
    }
    return out;
}

std::string collapse_blank_lines(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t newlines = 0;
    for (char c : s) {
        if (c == '\n') {
            if (++newlines > 2) continue;
        } else {
            newlines = 0;
        }
        out += c;
    }
    return out;
}

std::string trim_ends(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && s[begin] == '\n') ++begin;
    size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

} // namespace

std::string runs_to_markdown(const RunList& runs, const MarkdownOptions& options) {
    std::string out;
    const auto lines = split_lines(runs);
    for (size_t li = 0; li < lines.size(); ++li) {
        if (li > 0) out += '\n';
        const auto& line = lines[li];
        const int level = line_heading_level(line);
        if (level > 0) {
            out.append(static_cast<size_t>(level), '#');
            out += ' ';
        }
        std::string body;
        for (const auto& run : line) {
            body += wrap_segment(run.text, run.attrs, options, level > 0);
        }
        if (level > 0) {
            // Leading spaces would break the '#' prefix.
            const auto first = body.find_first_not_of(" \t");
            body = first == std::string::npos ? std::string{} : body.substr(first);
        } else if (body.starts_with('#')) {
            body.insert(body.begin(), '\\');
        }
        out += body;
    }
    return cleanup_markdown(out);
}

RunList markdown_to_runs(std::string_view markdown, const TextAttributes& base) {
    const auto normalized = normalize_newlines(markdown);
    std::string_view rest(normalized);

    RunList out;
    bool first = true;
    while (true) {
        const auto nl = rest.find('\n');
        const auto line = rest.substr(0, nl);
        if (!first) append_run(out, "\n", base);
        first = false;

        const int level = heading_prefix(line);
        if (level > 0) {
            auto attrs = base;
            attrs.heading_level = level;
            attrs.bold = true;
            parse_inline(line.substr(static_cast<size_t>(level) + 1), attrs, out);
        } else {
            parse_inline(line, base, out);
        }

        if (nl == std::string_view::npos) break;
        rest.remove_prefix(nl + 1);
    }
    return normalize_runs(std::move(out));
}

std::string cleanup_markdown(std::string_view markdown) {
    std::string current = normalize_newlines(markdown);
    while (true) {
        auto next = remove_empty_pairs(current);
        next = merge_across_spaces(next);
        next = strip_trailing_whitespace(next);
        next = collapse_blank_lines(next);
        next = trim_ends(next);
        if (next == current) return next;
        current = std::move(next);
    }
}

std::string strip_markdown(std::string_view markdown) {
    const auto runs = markdown_to_runs(markdown);
    std::string out;
    for (const auto& line : split_lines(runs)) {
        std::string text = plain_text(line);
        std::string_view view(text);
        if (view.starts_with("> ")) view.remove_prefix(2);
        std::string cleaned;
        cleaned.reserve(view.size());
        for (char c : view) {
            if (c != '`') cleaned += c;
        }
        out += cleaned;
        out += '\n';
    }
    return trim_ends(out);
}

} // namespace folio::text
