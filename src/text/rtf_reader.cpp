#include "text/rtf_reader.hpp"

#include "core/utf8.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <vector>

namespace folio::text {

namespace {

enum class Destination {
    Text,
    Skip,
    FieldInstruction,
};

struct GroupState {
    bool bold = false;
    bool italic = false;
    bool strike = false;
    bool underline = false;
    bool highlight = false;
    int font_half_points = 24;
    int uc = 1;
    Destination dest = Destination::Text;
    std::string link;
};

struct Field {
    size_t depth = 0;
    std::string instruction;
    std::string url;
};

constexpr std::array<std::string_view, 29> kSkippedDestinations = {
    "fonttbl", "colortbl", "expandedcolortbl", "stylesheet", "info",
    "pict", "shppict", "nonshppict", "object", "header", "headerl",
    "headerr", "headerf", "footer", "footerl", "footerr", "footerf",
    "listtable", "listoverridetable", "generator", "xmlnstbl", "themedata",
    "colorschememapping", "latentstyles", "datastore", "rsidtbl", "filetbl",
    "revtbl", "NeXTGraphic",
};

bool is_skipped_destination(std::string_view word) {
    for (auto d : kSkippedDestinations) {
        if (d == word) return true;
    }
    return false;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string extract_hyperlink(std::string_view instruction) {
    const auto at = instruction.find("HYPERLINK");
    if (at == std::string_view::npos) return {};
    auto rest = instruction.substr(at + 9);
    const auto q1 = rest.find('"');
    if (q1 != std::string_view::npos) {
        const auto q2 = rest.find('"', q1 + 1);
        if (q2 != std::string_view::npos) {
            return std::string(rest.substr(q1 + 1, q2 - q1 - 1));
        }
    }
    size_t b = 0;
    while (b < rest.size() && std::isspace(static_cast<unsigned char>(rest[b]))) ++b;
    size_t e = b;
    while (e < rest.size() && !std::isspace(static_cast<unsigned char>(rest[e]))) ++e;
    return std::string(rest.substr(b, e - b));
}

class RtfParser {
public:
    explicit RtfParser(std::string_view input) : in_(input) {}

    RtfDocument parse() {
        while (pos_ < in_.size()) {
            const char c = in_[pos_];
            switch (c) {
                case '{':
                    ++pos_;
                    open_group();
                    break;
                case '}':
                    ++pos_;
                    close_group();
                    break;
                case '\\':
                    ++pos_;
                    control();
                    break;
                case '\r':
                case '\n':
                case '\0':
                    ++pos_;
                    break;
                default:
                    ++pos_;
                    text_byte(static_cast<uint8_t>(c));
                    break;
            }
        }
        flush_surrogate();
        return RtfDocument{normalize_runs(std::move(runs_)), stack_.empty()};
    }

private:
    void open_group() {
        stack_.push_back(state_);
    }

    void close_group() {
        if (stack_.empty()) {
            return;
        }
        if (state_.dest == Destination::FieldInstruction && !fields_.empty()) {
            fields_.back().url = extract_hyperlink(fields_.back().instruction);
        }
        state_ = stack_.back();
        stack_.pop_back();
        while (!fields_.empty() && stack_.size() < fields_.back().depth) {
            fields_.pop_back();
        }
    }

    void control() {
        if (pos_ >= in_.size()) return;
        const char c = in_[pos_];
        if (std::isalpha(static_cast<unsigned char>(c))) {
            const size_t start = pos_;
            while (pos_ < in_.size() && std::isalpha(static_cast<unsigned char>(in_[pos_]))) ++pos_;
            const auto word = in_.substr(start, pos_ - start);

            std::optional<int> param;
            bool negative = false;
            if (pos_ < in_.size() && in_[pos_] == '-') {
                negative = true;
                ++pos_;
            }
            if (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) {
                long value = 0;
                while (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) {
                    if (value < 1000000) value = value * 10 + (in_[pos_] - '0');
                    ++pos_;
                }
                param = static_cast<int>(negative ? -value : value);
            }
            if (pos_ < in_.size() && in_[pos_] == ' ') ++pos_;
            control_word(word, param);
            return;
        }

        ++pos_;
        switch (c) {
            case '\\':
            case '{':
            case '}':
                text_byte(static_cast<uint8_t>(c));
                break;
            case '\'': {
                if (pos_ + 1 < in_.size()) {
                    const int hi = hex_value(in_[pos_]);
                    const int lo = hex_value(in_[pos_ + 1]);
                    pos_ += 2;
                    if (hi >= 0 && lo >= 0) {
                        text_char(cp1252_to_unicode(static_cast<uint8_t>(hi * 16 + lo)));
                    }
                }
                break;
            }
            case '*':
                star_pending_ = true;
                break;
            case '~':
                text_char(0x00A0);
                break;
            case '_':
                text_char(0x2011);
                break;
            case '\n':
            case '\r':
                text_char('\n');
                break;
            default:
                break;
        }
    }

    void control_word(std::string_view word, std::optional<int> param) {
        if (star_pending_) {
            star_pending_ = false;
            if (word == "fldinst" && !fields_.empty()) {
                state_.dest = Destination::FieldInstruction;
            } else {
                state_.dest = Destination::Skip;
            }
            return;
        }
        if (state_.dest == Destination::Skip) {
            return;
        }
        if (is_skipped_destination(word)) {
            state_.dest = Destination::Skip;
            return;
        }

        const bool on = !param || *param != 0;
        if (word == "field") {
            fields_.push_back(Field{stack_.size(), {}, {}});
        } else if (word == "fldinst") {
            state_.dest = fields_.empty() ? Destination::Skip : Destination::FieldInstruction;
        } else if (word == "fldrslt") {
            state_.dest = Destination::Text;
            if (!fields_.empty()) state_.link = fields_.back().url;
        } else if (state_.dest == Destination::FieldInstruction) {
            return;
        } else if (word == "b") {
            state_.bold = on;
        } else if (word == "i") {
            state_.italic = on;
        } else if (word == "strike" || word == "striked") {
            state_.strike = on;
        } else if (word == "ul" || word == "uld" || word == "uldb" || word == "ulw" || word == "uldash" ||
                   word == "ulth" || word == "ulwave") {
            state_.underline = on;
        } else if (word == "ulnone") {
            state_.underline = false;
        } else if (word == "highlight") {
            state_.highlight = param && *param > 0;
        } else if (word == "fs") {
            if (param && *param > 0) state_.font_half_points = *param;
        } else if (word == "plain") {
            state_.bold = state_.italic = state_.strike = state_.underline = state_.highlight = false;
            state_.font_half_points = 24;
        } else if (word == "par" || word == "line" || word == "sect" || word == "page" || word == "row") {
            text_char('\n');
        } else if (word == "tab" || word == "cell") {
            text_char('\t');
        } else if (word == "uc") {
            if (param && *param >= 0) state_.uc = *param;
        } else if (word == "u") {
            if (param) unicode_char(*param);
        } else if (word == "emdash") {
            text_char(0x2014);
        } else if (word == "endash") {
            text_char(0x2013);
        } else if (word == "bullet") {
            text_char(0x2022);
        } else if (word == "lquote") {
            text_char(0x2018);
        } else if (word == "rquote") {
            text_char(0x2019);
        } else if (word == "ldblquote") {
            text_char(0x201C);
        } else if (word == "rdblquote") {
            text_char(0x201D);
        } else if (word == "emspace" || word == "enspace" || word == "qmspace") {
            text_char(' ');
        }
    }

    void unicode_char(int value) {
        const auto unit = static_cast<char32_t>(value < 0 ? value + 65536 : value);
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            flush_surrogate();
            high_surrogate_ = unit;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF && high_surrogate_ != 0) {
            const char32_t cp = 0x10000 + ((high_surrogate_ - 0xD800) << 10) + (unit - 0xDC00);
            high_surrogate_ = 0;
            emit(cp);
        } else {
            emit(unit);
        }
        skip_chars_ = state_.uc;
    }

    void text_byte(uint8_t byte) {
        text_char(byte < 0x80 ? static_cast<char32_t>(byte) : cp1252_to_unicode(byte));
    }

    // A character from the input stream: may be swallowed as the fallback
    // for a preceding \u.
    void text_char(char32_t cp) {
        if (skip_chars_ > 0) {
            --skip_chars_;
            return;
        }
        switch (state_.dest) {
            case Destination::Skip:
                return;
            case Destination::FieldInstruction:
                if (!fields_.empty()) append_utf8(fields_.back().instruction, cp);
                return;
            case Destination::Text:
                flush_surrogate();
                emit(cp);
                return;
        }
    }

    void emit(char32_t cp) {
        if (state_.dest != Destination::Text) return;
        std::string utf8;
        append_utf8(utf8, cp);
        append_run(runs_, utf8, current_attrs());
    }

    void flush_surrogate() {
        if (high_surrogate_ != 0) {
            high_surrogate_ = 0;
            emit(0xFFFD);
        }
    }

    [[nodiscard]] TextAttributes current_attrs() const {
        TextAttributes a;
        a.bold = state_.bold;
        a.italic = state_.italic;
        a.strikethrough = state_.strike;
        a.underline = state_.underline;
        a.highlight = state_.highlight;
        a.link = state_.link;
        if (state_.bold) {
            if (state_.font_half_points >= 48) {
                a.heading_level = 1;
            } else if (state_.font_half_points >= 36) {
                a.heading_level = 2;
            } else if (state_.font_half_points >= 28) {
                a.heading_level = 3;
            }
        }
        return a;
    }

    std::string_view in_;
    size_t pos_ = 0;
    std::vector<GroupState> stack_;
    GroupState state_;
    std::vector<Field> fields_;
    RunList runs_;
    int skip_chars_ = 0;
    bool star_pending_ = false;
    char32_t high_surrogate_ = 0;
};

bool looks_like_rtf(std::string_view bytes) {
    size_t i = 0;
    // UTF-8 BOM and leading whitespace are tolerated.
    if (bytes.substr(0, 3) == "\xEF\xBB\xBF") i = 3;
    while (i < bytes.size() && std::isspace(static_cast<unsigned char>(bytes[i]))) ++i;
    return bytes.substr(i, 5) == "{\\rtf";
}

} // namespace

Res<RtfDocument> parse_rtf(std::string_view rtf) {
    if (!looks_like_rtf(rtf)) {
        return Res<RtfDocument>::err(make_error(ErrorCode::EncodingError, "input is not an RTF document"));
    }
    RtfParser parser(rtf);
    return Res<RtfDocument>::ok(parser.parse());
}

DecodedText decode_rich_text(std::string_view bytes) {
    DecodedText out;
    if (bytes.empty()) {
        return out;
    }

    auto parsed = parse_rtf(bytes);
    if (parsed.is_ok()) {
        auto doc = std::move(parsed).unwrap();
        out.runs = std::move(doc.runs);
        out.source = DecodeSource::Rtf;
        if (!doc.complete) {
            out.problem = "RTF ended inside an open group; content may be incomplete";
        }
        return out;
    }

    if (is_valid_utf8(bytes)) {
        out.source = DecodeSource::PlainText;
        out.runs = normalize_runs({FormattedRun{std::string(bytes), {}}});
        out.problem = "content is not RTF; read as plain UTF-8 text";
        return out;
    }

    out.source = DecodeSource::Empty;
    out.problem = "content is neither RTF nor UTF-8 text; imported empty";
    return out;
}

} // namespace folio::text
