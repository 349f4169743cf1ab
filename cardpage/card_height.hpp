// card_height.hpp - Rendered height estimation
//
// Heights are estimated from the width heuristic and fixed pixel constants,
// never from a font engine, so page boundaries stay stable across
// platforms. All heights are whole pixels.

#ifndef CARD_HEIGHT_HPP
#define CARD_HEIGHT_HPP

#include "card_types.hpp"
#include <string_view>
#include <vector>

namespace cardpage {

// ============================================================================
// Constants
// ============================================================================

constexpr int LINE_HEIGHT = 21;             // One wrapped text line
constexpr int PARAGRAPH_GAP = 8;            // Between paragraphs and text blocks
constexpr int MEDIA_GAP = 10;               // Between two consecutive images
constexpr int GLYPH_EM = 16;                // Nominal full-width glyph advance
constexpr int UNKNOWN_IMAGE_HEIGHT = 100;   // Image whose size is not known yet
constexpr int MAX_IMAGE_HEIGHT = 100000;    // Display height cap for extreme aspect ratios

// Full-width characters per rendered line
int chars_per_line(float content_width);

// Height of a text block: '\n' separates paragraphs, empty ones are ignored.
// The language is accepted for future per-language line metrics.
int text_block_height(std::string_view text, float content_width, Lang lang);

// Display height of an image scaled to container_width, at most
// MAX_IMAGE_HEIGHT; dims may be null
int image_full_height(const ImageSize* dims, float container_width);

// Chrome plus the stacked height of all items
int page_content_height(const std::vector<PageItem>& items,
                        const PaginationConstraints& constraints, Lang lang);

} // namespace cardpage

#endif // CARD_HEIGHT_HPP
