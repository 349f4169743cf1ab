// card_width.cpp - Character-unit width heuristic

#include "card_width.hpp"
#include <utf8proc.h>

namespace cardpage {

size_t decode_codepoint(std::string_view text, size_t pos, uint32_t* cp) {
    if (pos >= text.size()) {
        *cp = 0;
        return 0;
    }
    utf8proc_int32_t codepoint = -1;
    utf8proc_ssize_t bytes_read = utf8proc_iterate(
        (const utf8proc_uint8_t*)(text.data() + pos),
        (utf8proc_ssize_t)(text.size() - pos),
        &codepoint
    );
    if (bytes_read <= 0 || codepoint < 0) {
        *cp = (unsigned char)text[pos];
        return 1;
    }
    *cp = (uint32_t)codepoint;
    return (size_t)bytes_read;
}

float estimate_width(std::string_view text) {
    float width = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp;
        pos += decode_codepoint(text, pos, &cp);
        width += codepoint_width(cp);
    }
    return width;
}

size_t codepoint_offset(std::string_view text, size_t n) {
    size_t pos = 0;
    for (size_t i = 0; i < n && pos < text.size(); i++) {
        uint32_t cp;
        pos += decode_codepoint(text, pos, &cp);
    }
    return pos;
}

} // namespace cardpage
