// card_types.hpp - Shared data model for card pagination
//
// Segments come out of the segmenter, pages come out of the paginator and
// are handed to the external card renderer/exporter unchanged.

#ifndef CARD_TYPES_HPP
#define CARD_TYPES_HPP

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cardpage {

// Display language. Only line-height constants could depend on it; they
// are currently language independent.
enum class Lang : uint8_t {
    Zh,
    En,
};

// ============================================================================
// Content Segments
// ============================================================================

enum class SegmentKind : uint8_t {
    Text,
    Image,
};

struct ContentSegment {
    SegmentKind kind;
    std::string value;          // Text segments only
    int image_index;            // Image segments only, 0-based

    static ContentSegment text(std::string value) {
        return ContentSegment{SegmentKind::Text, std::move(value), -1};
    }
    static ContentSegment image(int index) {
        return ContentSegment{SegmentKind::Image, std::string(), index};
    }

    bool operator==(const ContentSegment& o) const {
        return kind == o.kind && value == o.value && image_index == o.image_index;
    }
};

// ============================================================================
// Image Dimensions
// ============================================================================

// Natural pixel size of a decoded image
struct ImageSize {
    float width;
    float height;
};

// Image index -> natural size. Entries appear as images finish decoding.
typedef std::map<int, ImageSize> ImageDimensions;

// ============================================================================
// Page Items
// ============================================================================

enum class ItemKind : uint8_t {
    Text,
    Image,
};

struct PageItem {
    ItemKind kind;
    std::string value;          // Text: paragraphs separated by '\n'

    // Image fields
    int image_index;
    std::string ref;            // Opaque image reference (url, path, data uri)
    int full_height;            // Displayed height of the whole image
    bool clipped;               // True when this item is a slice
    int clip_top;               // Slice offset within [0, full_height)
    int clip_height;            // Slice extent

    static PageItem text(std::string value) {
        PageItem item = {};
        item.kind = ItemKind::Text;
        item.value = std::move(value);
        item.image_index = -1;
        return item;
    }

    static PageItem image(int index, std::string ref, int full_height) {
        PageItem item = {};
        item.kind = ItemKind::Image;
        item.image_index = index;
        item.ref = std::move(ref);
        item.full_height = full_height;
        return item;
    }

    static PageItem image_slice(int index, std::string ref, int full_height,
                                int clip_top, int clip_height) {
        PageItem item = image(index, std::move(ref), full_height);
        item.clipped = true;
        item.clip_top = clip_top;
        item.clip_height = clip_height;
        return item;
    }

    bool is_text() const { return kind == ItemKind::Text; }
    bool is_image() const { return kind == ItemKind::Image; }

    // Height this item occupies on its page
    int display_height() const { return clipped ? clip_height : full_height; }
};

struct Page {
    std::vector<PageItem> items;

    bool empty() const { return items.empty(); }
};

// ============================================================================
// Pagination Constraints
// ============================================================================

struct PaginationConstraints {
    float content_width;        // Width of the card content box (px)
    float max_chars_per_line;   // Width budget for a single text unit
    int max_page_height;        // Maximum card height (px), chrome included
    int fixed_chrome;           // Header + footer + margins (px)

    int content_max_height() const { return max_page_height - fixed_chrome; }
};

} // namespace cardpage

#endif // CARD_TYPES_HPP
