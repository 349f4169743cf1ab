// card_segment.cpp - Inline image markers

#include "card_segment.hpp"
#include "card_log.hpp"

namespace cardpage {

static constexpr char MARKER_PREFIX[] = "[image";
static constexpr size_t MARKER_PREFIX_LEN = sizeof(MARKER_PREFIX) - 1;
static constexpr int MAX_MARKER_DIGITS = 9;

// Try to match a marker at pos: "[image", optional spaces, digits, "]"
static bool match_marker(std::string_view content, size_t pos, ImageMarker* out) {
    if (content.compare(pos, MARKER_PREFIX_LEN, MARKER_PREFIX) != 0) return false;

    size_t i = pos + MARKER_PREFIX_LEN;
    while (i < content.size() && content[i] == ' ') i++;

    size_t digits_start = i;
    long number = 0;
    while (i < content.size() && content[i] >= '0' && content[i] <= '9') {
        if (i - digits_start < MAX_MARKER_DIGITS) {
            number = number * 10 + (content[i] - '0');
        }
        i++;
    }
    size_t digit_count = i - digits_start;
    if (digit_count == 0 || i >= content.size() || content[i] != ']') return false;

    if (digit_count > MAX_MARKER_DIGITS) {
        number = -1;  // never a valid index
    }
    out->pos = pos;
    out->length = i + 1 - pos;
    out->number = number;
    return true;
}

std::vector<ImageMarker> find_image_markers(std::string_view content) {
    std::vector<ImageMarker> markers;
    size_t pos = content.find('[');
    while (pos != std::string_view::npos) {
        ImageMarker marker;
        if (match_marker(content, pos, &marker)) {
            markers.push_back(marker);
            pos = content.find('[', pos + marker.length);
        } else {
            pos = content.find('[', pos + 1);
        }
    }
    return markers;
}

std::string format_image_marker(int number) {
    return std::string(MARKER_PREFIX) + std::to_string(number) + "]";
}

static bool marker_in_range(const ImageMarker& marker, int image_count) {
    return marker.number >= 1 && marker.number <= image_count;
}

std::vector<ContentSegment> segment_content(std::string_view content, int image_count) {
    std::vector<ContentSegment> segments;
    std::string pending;
    size_t last = 0;

    for (const ImageMarker& marker : find_image_markers(content)) {
        if (!marker_in_range(marker, image_count)) {
            clog_debug(segment_log, "segment: marker #%ld out of range (%d images), kept as text",
                       marker.number, image_count);
            continue;  // stays inside the surrounding text span
        }
        pending.append(content.substr(last, marker.pos - last));
        if (!pending.empty()) {
            segments.push_back(ContentSegment::text(std::move(pending)));
            pending.clear();
        }
        segments.push_back(ContentSegment::image((int)marker.number - 1));
        last = marker.pos + marker.length;
    }
    pending.append(content.substr(last));
    if (!pending.empty()) {
        segments.push_back(ContentSegment::text(std::move(pending)));
    }

    clog_debug(segment_log, "segment: %zu bytes -> %zu segments", content.size(), segments.size());
    return segments;
}

// ============================================================================
// Marker Reconciliation
// ============================================================================

MarkerReconcileResult reconcile_markers(std::string_view content,
                                        const std::vector<std::string>& images) {
    const int image_count = (int)images.size();
    std::vector<ImageMarker> markers = find_image_markers(content);

    std::vector<std::string> new_images;
    std::vector<int> sources;
    bool renumbered = false;
    size_t valid_count = 0;
    for (const ImageMarker& marker : markers) {
        if (!marker_in_range(marker, image_count)) continue;
        new_images.push_back(images[marker.number - 1]);
        sources.push_back((int)marker.number - 1);
        valid_count++;
        if (marker.number != (long)valid_count) renumbered = true;
    }

    bool needs_sync = valid_count != markers.size() ||
                      new_images.size() != images.size() ||
                      renumbered;
    if (!needs_sync) {
        return MarkerReconcileResult{std::string(content), images, std::move(sources), false};
    }

    std::string rewritten;
    rewritten.reserve(content.size());
    size_t last = 0;
    int next_number = 1;
    for (const ImageMarker& marker : markers) {
        rewritten.append(content.substr(last, marker.pos - last));
        if (marker_in_range(marker, image_count)) {
            rewritten += format_image_marker(next_number++);
        }
        last = marker.pos + marker.length;
    }
    rewritten.append(content.substr(last));

    clog_debug(segment_log, "reconcile: %zu markers (%zu valid), images %d -> %zu",
               markers.size(), valid_count, image_count, new_images.size());
    return MarkerReconcileResult{std::move(rewritten), std::move(new_images), std::move(sources), true};
}

ImageDimensions remap_image_dimensions(const ImageDimensions& dims,
                                       const std::vector<int>& source_indices) {
    ImageDimensions remapped;
    for (size_t i = 0; i < source_indices.size(); i++) {
        auto found = dims.find(source_indices[i]);
        if (found != dims.end()) {
            remapped[(int)i] = found->second;
        }
    }
    return remapped;
}

bool insert_image_marker(std::string& content, std::vector<std::string>& images,
                         size_t byte_pos, std::string ref) {
    if ((int)images.size() >= MAX_CARD_IMAGES) {
        clog_warn(segment_log, "insert_image_marker: image limit %d reached", MAX_CARD_IMAGES);
        return false;
    }
    if (byte_pos > content.size()) byte_pos = content.size();
    // never split a UTF-8 sequence
    while (byte_pos > 0 && byte_pos < content.size() &&
           ((unsigned char)content[byte_pos] & 0xC0) == 0x80) {
        byte_pos--;
    }
    content.insert(byte_pos, format_image_marker((int)images.size() + 1));
    images.push_back(std::move(ref));
    return true;
}

} // namespace cardpage
