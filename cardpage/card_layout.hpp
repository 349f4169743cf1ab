// card_layout.hpp - Card geometry and constraint derivation
//
// The card renderer draws a fixed header, content box and footer inside a
// preview of fixed width; the aspect ratio fixes the card height. This is
// where the pagination constraints for a given display setup come from.

#ifndef CARD_LAYOUT_HPP
#define CARD_LAYOUT_HPP

#include "card_types.hpp"
#include <cstdint>

namespace cardpage {

enum class AspectRatio : uint8_t {
    Portrait3x4,    // "3:4"
    Story9x16,      // "9:16"
};

struct CardLayout {
    int preview_width;          // Card width in CSS pixels
    int content_inset;          // Horizontal padding around the content box
    int chrome_top;             // Header (avatar, name, handle)
    int chrome_content_margin;  // Space above and below the content box
    int chrome_footer;          // Timestamp and engagement row
    int min_card_height;        // Shortest card an exporter should produce

    static CardLayout defaults() {
        CardLayout l = {};
        l.preview_width = 360;
        l.content_inset = 28;
        l.chrome_top = 52;
        l.chrome_content_margin = 14 + 16;
        l.chrome_footer = 74;
        l.min_card_height = 180;
        return l;
    }

    float content_width() const { return (float)(preview_width - content_inset); }
    int fixed_chrome() const { return chrome_top + chrome_content_margin + chrome_footer; }
};

// Parse "3:4" / "9:16"; false on anything else
bool parse_aspect_ratio(const char* text, AspectRatio* out);
const char* aspect_ratio_name(AspectRatio ratio);

// Parse "zh" / "en"; false on anything else
bool parse_lang(const char* text, Lang* out);

// Card height for the aspect ratio at the layout's preview width
int card_height(const CardLayout& layout, AspectRatio ratio);

// Character budget of a whole card's content box
int estimate_max_chars(const CardLayout& layout, AspectRatio ratio, Lang lang);

PaginationConstraints derive_constraints(const CardLayout& layout, AspectRatio ratio, Lang lang);

// Height the renderer should give a page's card: the estimated content
// height, at least min_card_height, at most max_page_height.
int card_display_height(const Page& page, const PaginationConstraints& constraints,
                        const CardLayout& layout, Lang lang);

} // namespace cardpage

#endif // CARD_LAYOUT_HPP
