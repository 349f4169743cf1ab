// card_segment.hpp - Inline image markers
//
// Content is plain text with inline "[image N]" markers (1-based index into
// the image list). The segmenter turns it into an ordered text/image
// segment stream; marker reconciliation keeps marker numbers and the image
// list mutually consistent after edits.

#ifndef CARD_SEGMENT_HPP
#define CARD_SEGMENT_HPP

#include "card_types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace cardpage {

constexpr int MAX_CARD_IMAGES = 4;

// A marker occurrence found in content
struct ImageMarker {
    size_t pos;                 // Byte offset of '['
    size_t length;              // Byte length of the whole marker
    long number;                // Marker number as written (1-based)
};

// Find all well-formed markers, valid or not, in document order
std::vector<ImageMarker> find_image_markers(std::string_view content);

// Canonical marker text "[imageN]"
std::string format_image_marker(int number);

// Split content into text and image segments. Markers outside
// [1, image_count] stay in the text as literals; empty text spans are
// omitted.
std::vector<ContentSegment> segment_content(std::string_view content, int image_count);

// ============================================================================
// Marker Reconciliation
// ============================================================================

struct MarkerReconcileResult {
    std::string content;
    std::vector<std::string> images;
    std::vector<int> source_indices;   // images[i] came from input index source_indices[i]
    bool changed;               // False when the input was already consistent
};

// Renumber surviving markers 1..k in order of appearance, drop out-of-range
// markers and rebuild the image list in marker order. Idempotent.
MarkerReconcileResult reconcile_markers(std::string_view content,
                                        const std::vector<std::string>& images);

// Re-key a dimension map after reconciliation reordered the image list
ImageDimensions remap_image_dimensions(const ImageDimensions& dims,
                                       const std::vector<int>& source_indices);

// Insert a marker for a new image at byte_pos and append the image.
// Returns false, leaving both untouched, when MAX_CARD_IMAGES is reached.
bool insert_image_marker(std::string& content, std::vector<std::string>& images,
                         size_t byte_pos, std::string ref);

} // namespace cardpage

#endif // CARD_SEGMENT_HPP
