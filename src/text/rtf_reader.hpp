#pragma once

#include "core/result.hpp"
#include "text/rich_text.hpp"

#include <string>
#include <string_view>

namespace folio::text {

struct RtfDocument {
    RunList runs;
    // False when the input ended inside an open group; runs hold what was read.
    bool complete = true;
};

/**
 * Parses an RTF byte stream into formatting runs.
 *
 * Understands \b \i \ul \strike \striked \highlight \plain \fs, paragraph
 * and tab controls, \'hh (Windows-1252), \uN with \ucN, and HYPERLINK
 * fields. Font, colour and style tables, \* destinations, pictures and
 * document info are skipped. A bold run at 14pt or more is read as a
 * heading (24pt -> 1, 18pt -> 2, 14pt -> 3).
 *
 * Fails only when the input does not start with "{\rtf".
 */
[[nodiscard]] Res<RtfDocument> parse_rtf(std::string_view rtf);

enum class DecodeSource {
    Rtf,
    PlainText,
    Empty,
};

/**
 * Result of best-effort decoding. `problem` is non-empty when something
 * was lost or guessed and the caller should record a warning.
 */
struct DecodedText {
    RunList runs;
    DecodeSource source = DecodeSource::Rtf;
    std::string problem;
};

/**
 * RTF if it parses, otherwise the bytes as UTF-8 text, otherwise nothing.
 * Never fails.
 */
[[nodiscard]] DecodedText decode_rich_text(std::string_view bytes);

} // namespace folio::text
