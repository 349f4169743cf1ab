// card_unitize.cpp - Text to breakable units

#include "card_unitize.hpp"
#include "card_width.hpp"
#include "card_log.hpp"
#include <cmath>

namespace cardpage {

// ============================================================================
// Character Classes
// ============================================================================

bool is_sentence_terminal(uint32_t cp) {
    switch (cp) {
        case '.':
        case '!':
        case '?':
        case 0x3002:    // 。
        case 0xFF01:    // ！
        case 0xFF0E:    // ．
        case 0xFF1F:    // ？
            return true;
        default:
            return false;
    }
}

static bool is_space_cp(uint32_t cp) {
    switch (cp) {
        case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
        case 0x00A0:    // no-break space
        case 0x3000:    // ideographic space
            return true;
        default:
            return false;
    }
}

bool is_break_mark(uint32_t cp) {
    switch (cp) {
        case '!':
        case '?':
        case '.':
        case 0x3001:    // 、
        case 0x3002:    // 。
        case 0xFF01:    // ！
        case 0xFF0C:    // ，
        case 0xFF1A:    // ：
        case 0xFF1B:    // ；
        case 0xFF1F:    // ？
            return true;
        default:
            return is_space_cp(cp);
    }
}

std::string_view trim_text(std::string_view text) {
    size_t start = 0;
    while (start < text.size()) {
        uint32_t cp;
        size_t len = decode_codepoint(text, start, &cp);
        if (!is_space_cp(cp)) break;
        start += len;
    }
    size_t end = text.size();
    while (end > start) {
        // step back to the start of the previous code point
        size_t prev = end - 1;
        while (prev > start && ((unsigned char)text[prev] & 0xC0) == 0x80) prev--;
        uint32_t cp;
        decode_codepoint(text, prev, &cp);
        if (!is_space_cp(cp)) break;
        end = prev;
    }
    return text.substr(start, end - start);
}

// ============================================================================
// Paragraphs and Sentences
// ============================================================================

std::vector<std::string> split_paragraphs(std::string_view text) {
    std::string clean;
    clean.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\r') {
            clean += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') i++;
        } else {
            clean += text[i];
        }
    }

    std::vector<std::string> paragraphs;
    std::string_view view = trim_text(clean);
    size_t start = 0;
    while (start <= view.size()) {
        size_t nl = view.find('\n', start);
        if (nl == std::string_view::npos) nl = view.size();
        std::string_view para = trim_text(view.substr(start, nl - start));
        if (!para.empty()) {
            paragraphs.emplace_back(para);
        }
        start = nl + 1;
    }
    return paragraphs;
}

std::vector<std::string> split_sentences(std::string_view paragraph) {
    std::vector<std::string> sentences;
    size_t chunk_start = 0;
    bool seen_body = false;      // non-terminal text in the current chunk
    bool in_terminal = false;    // inside the terminal run after the body

    auto emit = [&](size_t end) {
        std::string_view chunk = trim_text(paragraph.substr(chunk_start, end - chunk_start));
        if (!chunk.empty()) sentences.emplace_back(chunk);
        chunk_start = end;
    };

    size_t pos = 0;
    while (pos < paragraph.size()) {
        uint32_t cp;
        size_t len = decode_codepoint(paragraph, pos, &cp);
        if (is_sentence_terminal(cp)) {
            if (seen_body) in_terminal = true;
        } else {
            if (in_terminal) {
                emit(pos);
                in_terminal = false;
            }
            seen_body = true;
        }
        pos += len;
    }
    emit(paragraph.size());

    if (sentences.empty()) {
        std::string_view whole = trim_text(paragraph);
        if (!whole.empty()) sentences.emplace_back(whole);
    }
    return sentences;
}

// ============================================================================
// Long Chunk Splitting
// ============================================================================

// Cut every floor(max_width) code points; each code point is at most one unit wide
static void hard_cut(std::string_view word, float max_width, std::vector<std::string>& out) {
    size_t step = max_width >= 1.0f ? (size_t)std::floor(max_width) : 1;
    size_t pos = 0;
    while (pos < word.size()) {
        size_t len = codepoint_offset(word.substr(pos), step);
        out.emplace_back(word.substr(pos, len));
        pos += len;
    }
}

static bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

static std::vector<std::string> split_words(std::string_view chunk, float max_width) {
    std::vector<std::string> result;
    std::string current;

    size_t pos = 0;
    while (pos < chunk.size()) {
        while (pos < chunk.size() && is_ascii_space(chunk[pos])) pos++;
        size_t end = pos;
        while (end < chunk.size() && !is_ascii_space(chunk[end])) end++;
        if (end == pos) break;
        std::string_view word = chunk.substr(pos, end - pos);
        pos = end;

        std::string candidate = current.empty() ? std::string(word) : current + " " + std::string(word);
        if (estimate_width(candidate) <= max_width) {
            current = std::move(candidate);
            continue;
        }
        if (!current.empty()) result.push_back(std::move(current));
        current.clear();
        if (estimate_width(word) > max_width) {
            clog_debug(unitize_log, "unitize: hard cut of %zu-byte word", word.size());
            hard_cut(word, max_width, result);
        } else {
            current = std::string(word);
        }
    }
    if (!current.empty()) result.push_back(std::move(current));
    return result;
}

static std::vector<std::string> split_by_width(std::string_view chunk, float max_width) {
    // code point table: byte offsets (with a trailing end offset) and widths
    std::vector<size_t> offsets;
    std::vector<uint32_t> cps;
    size_t pos = 0;
    while (pos < chunk.size()) {
        uint32_t cp;
        offsets.push_back(pos);
        pos += decode_codepoint(chunk, pos, &cp);
        cps.push_back(cp);
    }
    offsets.push_back(chunk.size());
    const size_t n = cps.size();

    std::vector<std::string> result;
    size_t start = 0;
    while (start < n) {
        size_t end = start;
        float width = 0;
        while (end < n && width < max_width) {
            width += codepoint_width(cps[end]);
            if (width > max_width) break;
            end++;
        }
        if (end == start) end = start + 1;  // a single code point always fits alone

        if (end < n) {
            size_t slice_len = end - start;
            size_t last_punct = 0;
            bool found = false;
            for (size_t i = end; i > start; i--) {
                if (is_break_mark(cps[i - 1])) {
                    last_punct = i - 1 - start;
                    found = true;
                    break;
                }
            }
            if (found && (float)last_punct > (float)slice_len * PUNCT_BREAK_MIN_FRACTION) {
                end = start + last_punct + 1;
            }
        }
        result.emplace_back(chunk.substr(offsets[start], offsets[end] - offsets[start]));
        start = end;
    }
    return result;
}

std::vector<std::string> split_long_chunk(std::string_view chunk, float max_width) {
    if (estimate_width(chunk) <= max_width) {
        return std::vector<std::string>{std::string(chunk)};
    }
    if (chunk.find(' ') != std::string_view::npos) {
        return split_words(chunk, max_width);
    }
    return split_by_width(chunk, max_width);
}

// ============================================================================
// Unit Stream
// ============================================================================

UnitStream::UnitStream(std::string_view text, float max_unit_width)
    : m_max_width(max_unit_width), m_paragraphs(split_paragraphs(text)) {
    clog_debug(unitize_log, "unitize: %zu bytes, %zu paragraphs, max_width=%.2f",
               text.size(), m_paragraphs.size(), max_unit_width);
}

bool UnitStream::next(Unit& out) {
    while (true) {
        if (m_piece < m_pieces.size()) {
            out = Unit::chunk(std::move(m_pieces[m_piece++]));
            return true;
        }
        if (m_sentence < m_sentences.size()) {
            m_pieces = split_long_chunk(m_sentences[m_sentence++], m_max_width);
            m_piece = 0;
            continue;
        }
        if (m_paragraph >= m_paragraphs.size()) {
            return false;
        }
        if (m_paragraph > 0 && !m_break_sent) {
            m_break_sent = true;
            out = Unit::paragraph_break();
            return true;
        }
        m_sentences = split_sentences(m_paragraphs[m_paragraph++]);
        m_sentence = 0;
        m_break_sent = false;
    }
}

std::vector<Unit> unitize(std::string_view text, float max_unit_width) {
    std::vector<Unit> units;
    UnitStream stream(text, max_unit_width);
    Unit unit;
    while (stream.next(unit)) {
        units.push_back(std::move(unit));
    }
    return units;
}

} // namespace cardpage
