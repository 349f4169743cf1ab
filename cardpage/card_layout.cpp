// card_layout.cpp - Card geometry and constraint derivation

#include "card_layout.hpp"
#include "card_height.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace cardpage {

static void ratio_terms(AspectRatio ratio, int* w, int* h) {
    switch (ratio) {
        case AspectRatio::Story9x16:
            *w = 9; *h = 16;
            break;
        case AspectRatio::Portrait3x4:
        default:
            *w = 3; *h = 4;
            break;
    }
}

bool parse_aspect_ratio(const char* text, AspectRatio* out) {
    if (!text) return false;
    if (strcmp(text, "3:4") == 0) {
        *out = AspectRatio::Portrait3x4;
        return true;
    }
    if (strcmp(text, "9:16") == 0) {
        *out = AspectRatio::Story9x16;
        return true;
    }
    return false;
}

const char* aspect_ratio_name(AspectRatio ratio) {
    return ratio == AspectRatio::Story9x16 ? "9:16" : "3:4";
}

bool parse_lang(const char* text, Lang* out) {
    if (!text) return false;
    if (strcmp(text, "zh") == 0) {
        *out = Lang::Zh;
        return true;
    }
    if (strcmp(text, "en") == 0) {
        *out = Lang::En;
        return true;
    }
    return false;
}

int card_height(const CardLayout& layout, AspectRatio ratio) {
    int w, h;
    ratio_terms(ratio, &w, &h);
    return (int)std::lround((double)layout.preview_width * h / w);
}

int estimate_max_chars(const CardLayout& layout, AspectRatio ratio, Lang lang) {
    (void)lang;
    int content_height = card_height(layout, ratio) - layout.fixed_chrome();
    int lines = std::max(3, content_height / LINE_HEIGHT);
    return lines * chars_per_line(layout.content_width());
}

PaginationConstraints derive_constraints(const CardLayout& layout, AspectRatio ratio, Lang lang) {
    PaginationConstraints c = {};
    c.content_width = layout.content_width();
    c.max_chars_per_line = (float)estimate_max_chars(layout, ratio, lang);
    c.max_page_height = card_height(layout, ratio);
    c.fixed_chrome = layout.fixed_chrome();
    return c;
}

int card_display_height(const Page& page, const PaginationConstraints& constraints,
                        const CardLayout& layout, Lang lang) {
    int content_h = page_content_height(page.items, constraints, lang);
    int target = std::max(layout.min_card_height, content_h);
    return std::min(target, constraints.max_page_height);
}

} // namespace cardpage
