// card_unitize.hpp - Text to breakable units
//
// Text is cut into paragraphs, paragraphs into sentence-like chunks, and
// chunks wider than the unit budget into word-packed or punctuation-aware
// pieces. The paginator packs units greedily, so every unit is a legal page
// break position and no unit is wider than the budget.

#ifndef CARD_UNITIZE_HPP
#define CARD_UNITIZE_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cardpage {

enum class UnitKind : uint8_t {
    Chunk,              // Breakable text
    ParagraphBreak,     // Between two paragraphs, never first or last
};

struct Unit {
    UnitKind kind;
    std::string text;

    static Unit chunk(std::string text) { return Unit{UnitKind::Chunk, std::move(text)}; }
    static Unit paragraph_break() { return Unit{UnitKind::ParagraphBreak, std::string()}; }

    bool is_break() const { return kind == UnitKind::ParagraphBreak; }
    bool operator==(const Unit& o) const { return kind == o.kind && text == o.text; }
};

// Fraction of a slice a punctuation break must lie past to be preferred
constexpr float PUNCT_BREAK_MIN_FRACTION = 0.4f;

// ============================================================================
// Building Blocks
// ============================================================================

bool is_sentence_terminal(uint32_t cp);
bool is_break_mark(uint32_t cp);
std::string_view trim_text(std::string_view text);

// Normalize line endings, trim, split on newline runs; empty paragraphs dropped
std::vector<std::string> split_paragraphs(std::string_view text);

// Runs of non-terminal characters followed by their terminal punctuation
std::vector<std::string> split_sentences(std::string_view paragraph);

// Cut a chunk into pieces no wider than max_width (see card_unitize.cpp)
std::vector<std::string> split_long_chunk(std::string_view chunk, float max_width);

// ============================================================================
// Unit Stream
// ============================================================================

// Lazily produces the unit sequence of a text span. Paragraphs are located
// up front; sentences and sub-pieces are produced on demand.
class UnitStream {
public:
    UnitStream(std::string_view text, float max_unit_width);

    // Fetch the next unit; false at the end of the text
    bool next(Unit& out);

private:
    float m_max_width;
    std::vector<std::string> m_paragraphs;
    size_t m_paragraph = 0;
    bool m_break_sent = false;
    std::vector<std::string> m_sentences;
    size_t m_sentence = 0;
    std::vector<std::string> m_pieces;
    size_t m_piece = 0;
};

std::vector<Unit> unitize(std::string_view text, float max_unit_width);

} // namespace cardpage

#endif // CARD_UNITIZE_HPP
