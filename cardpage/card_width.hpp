// card_width.hpp - Character-unit width heuristic
//
// Estimates the horizontal extent of a UTF-8 string without font metrics:
// code points above U+00FF count as one full-width unit, everything else as
// a narrow 0.53 unit. Mixed-script strings get a plausible, not exact, width.

#ifndef CARD_WIDTH_HPP
#define CARD_WIDTH_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace cardpage {

constexpr float WIDE_CHAR_WIDTH = 1.0f;
constexpr float NARROW_CHAR_WIDTH = 0.53f;

// Width of a single code point
inline float codepoint_width(uint32_t cp) {
    return cp > 0xFF ? WIDE_CHAR_WIDTH : NARROW_CHAR_WIDTH;
}

// Decode one code point at byte offset pos. Returns the number of bytes
// consumed (always >= 1 for pos < text.size()); an invalid sequence decodes
// as its first byte.
size_t decode_codepoint(std::string_view text, size_t pos, uint32_t* cp);

float estimate_width(std::string_view text);

// Byte offset of the n-th code point (text.size() when n is past the end)
size_t codepoint_offset(std::string_view text, size_t n);

} // namespace cardpage

#endif // CARD_WIDTH_HPP
