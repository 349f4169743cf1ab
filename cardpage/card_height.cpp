// card_height.cpp - Rendered height estimation

#include "card_height.hpp"
#include "card_width.hpp"
#include <algorithm>
#include <cmath>

namespace cardpage {

int chars_per_line(float content_width) {
    int chars = (int)std::floor(content_width / GLYPH_EM);
    return std::max(1, chars);
}

int text_block_height(std::string_view text, float content_width, Lang lang) {
    (void)lang;
    const int per_line = chars_per_line(content_width);

    int total_lines = 0;
    int paragraphs = 0;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) nl = text.size();
        std::string_view para = text.substr(start, nl - start);
        if (!para.empty()) {
            float width = estimate_width(para);
            total_lines += std::max(1, (int)std::ceil(width / per_line));
            paragraphs++;
        }
        start = nl + 1;
    }
    return total_lines * LINE_HEIGHT + std::max(0, paragraphs - 1) * PARAGRAPH_GAP;
}

int image_full_height(const ImageSize* dims, float container_width) {
    if (!dims || !(dims->width > 0) || !(dims->height > 0) ||
        !std::isfinite(dims->width) || !std::isfinite(dims->height)) {
        return UNKNOWN_IMAGE_HEIGHT;
    }
    double height = std::ceil((double)container_width * dims->height / dims->width);
    if (!(height <= MAX_IMAGE_HEIGHT)) return MAX_IMAGE_HEIGHT;
    return (int)height;
}

int page_content_height(const std::vector<PageItem>& items,
                        const PaginationConstraints& constraints, Lang lang) {
    int content = 0;
    bool prev_was_media = false;
    for (const PageItem& item : items) {
        if (item.is_text()) {
            if (content > 0) content += PARAGRAPH_GAP;
            content += text_block_height(item.value, constraints.content_width, lang);
            prev_was_media = false;
        } else {
            if (prev_was_media) content += MEDIA_GAP;
            content += item.display_height();
            prev_was_media = true;
        }
    }
    return constraints.fixed_chrome + content;
}

} // namespace cardpage
