// card_paginate.hpp - Greedy card pagination
//
// Packs the segmented, unitized content stream into pages whose estimated
// height stays within the card. Text is placed unit by unit, images whole
// or in vertical slices that tile the image across consecutive pages.
//
// The pass is a fold: PaginationState is threaded by value through the
// place_* steps, so there is no shared cursor and every step is pure.

#ifndef CARD_PAGINATE_HPP
#define CARD_PAGINATE_HPP

#include "card_types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace cardpage {

// Minimum width budget for force-subdividing a unit that overflows an
// empty page, unless the page itself holds less text
constexpr int MIN_FORCED_SPLIT_WIDTH = 20;

// ============================================================================
// Pagination Context and State
// ============================================================================

// Read-only inputs of one pagination run
struct PaginationContext {
    const std::vector<std::string>* images;
    const ImageDimensions* dims;
    PaginationConstraints constraints;
    Lang lang;

    int estimate(const std::vector<PageItem>& items) const;
};

// Accumulator threaded through the fold
struct PaginationState {
    std::vector<Page> pages;        // Completed pages
    Page current;                   // Page being filled
    bool paragraph_pending = false; // Next text unit starts a new paragraph
};

// Push the current page if it holds anything
PaginationState flush_page(PaginationState state);

// Place one text unit, merging it into the trailing text item when it fits
PaginationState place_text_unit(PaginationState state, const std::string& unit,
                                 const PaginationContext& ctx);

PaginationState place_paragraph_break(PaginationState state);

// Place an image whole, or slice it across as many pages as it needs
PaginationState place_image(PaginationState state, int image_index,
                            const PaginationContext& ctx);

// Flush and return the page list; never empty
std::vector<Page> finish_pages(PaginationState state);

// ============================================================================
// Main API
// ============================================================================

std::vector<Page> paginate(std::string_view content,
                           const std::vector<std::string>& images,
                           const ImageDimensions& dims,
                           const PaginationConstraints& constraints,
                           Lang lang = Lang::Zh);

// ============================================================================
// Debugging
// ============================================================================

void dump_pages(const std::vector<Page>& pages, const PaginationConstraints& constraints,
                Lang lang);

} // namespace cardpage

#endif // CARD_PAGINATE_HPP
