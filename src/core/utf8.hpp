#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace folio {

/**
 * Strict UTF-8 check: no overlongs, no surrogates, nothing above U+10FFFF.
 */
[[nodiscard]] bool is_valid_utf8(std::string_view bytes) noexcept;

/**
 * Append the UTF-8 encoding of a code point. Invalid values become U+FFFD.
 */
void append_utf8(std::string& out, char32_t cp);

/**
 * Decode one code point at `pos`, advancing it. Malformed input yields
 * U+FFFD and advances by one byte.
 */
[[nodiscard]] char32_t decode_utf8(std::string_view text, size_t& pos) noexcept;

/**
 * Windows-1252 byte to Unicode, as used by RTF \'hh escapes.
 */
[[nodiscard]] char32_t cp1252_to_unicode(uint8_t byte) noexcept;

} // namespace folio
