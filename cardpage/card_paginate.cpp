// card_paginate.cpp - Greedy card pagination

#include "card_paginate.hpp"
#include "card_height.hpp"
#include "card_segment.hpp"
#include "card_unitize.hpp"
#include "card_log.hpp"
#include <algorithm>
#include <cmath>

namespace cardpage {

int PaginationContext::estimate(const std::vector<PageItem>& items) const {
    return page_content_height(items, constraints, lang);
}

// ============================================================================
// Fold Steps
// ============================================================================

PaginationState flush_page(PaginationState state) {
    if (!state.current.empty()) {
        clog_debug(paginate_log, "paginate: flush page %zu with %zu items",
                   state.pages.size() + 1, state.current.items.size());
        state.pages.push_back(std::move(state.current));
        state.current = Page();
    }
    state.paragraph_pending = false;
    return state;
}

// Items of the current page with unit merged into the trailing text item
static std::vector<PageItem> merge_text(const PaginationState& state, const std::string& unit) {
    std::vector<PageItem> items = state.current.items;
    if (!items.empty() && items.back().is_text()) {
        PageItem& last = items.back();
        last.value += state.paragraph_pending ? '\n' : ' ';
        last.value += unit;
    } else {
        items.push_back(PageItem::text(unit));
    }
    return items;
}

// Unit too tall for an empty page: cut it at half the unit budget, but no
// wider than the text an empty page holds, and place the pieces as separate
// text items, flushing as pages fill
static PaginationState place_forced_pieces(PaginationState state, const std::string& unit,
                                           const PaginationContext& ctx) {
    const int max_height = ctx.constraints.max_page_height;
    float budget = std::max((float)MIN_FORCED_SPLIT_WIDTH,
                            std::floor(ctx.constraints.max_chars_per_line / 2));
    int page_lines = std::max(1, ctx.constraints.content_max_height() / LINE_HEIGHT);
    budget = std::min(budget, (float)(page_lines * chars_per_line(ctx.constraints.content_width)));
    std::vector<std::string> pieces = split_long_chunk(unit, budget);
    clog_debug(paginate_log, "paginate: forced split of %zu-byte unit into %zu pieces (budget %.1f)",
               unit.size(), pieces.size(), budget);

    for (std::string& piece : pieces) {
        std::vector<PageItem> next = state.current.items;
        next.push_back(PageItem::text(piece));
        if (ctx.estimate(next) > max_height && !state.current.empty()) {
            state = flush_page(std::move(state));
            state.current.items.push_back(PageItem::text(std::move(piece)));
        } else {
            state.current.items = std::move(next);
        }
    }
    if (ctx.estimate(state.current.items) > max_height) {
        clog_warn(paginate_log, "paginate: text piece exceeds page height %d on its own", max_height);
    }
    state.paragraph_pending = false;
    return state;
}

PaginationState place_text_unit(PaginationState state, const std::string& unit,
                                 const PaginationContext& ctx) {
    if (unit.empty()) return state;
    const int max_height = ctx.constraints.max_page_height;

    std::vector<PageItem> candidate = merge_text(state, unit);
    if (ctx.estimate(candidate) <= max_height) {
        state.current.items = std::move(candidate);
        state.paragraph_pending = false;
        return state;
    }

    if (!state.current.empty()) {
        state = flush_page(std::move(state));
    }
    std::vector<PageItem> alone;
    alone.push_back(PageItem::text(unit));
    if (ctx.estimate(alone) <= max_height) {
        state.current.items = std::move(alone);
        state.paragraph_pending = false;
        return state;
    }
    return place_forced_pieces(std::move(state), unit, ctx);
}

PaginationState place_paragraph_break(PaginationState state) {
    // only meaningful when text precedes it on the same page
    if (!state.current.empty() && state.current.items.back().is_text()) {
        state.paragraph_pending = true;
    }
    return state;
}

PaginationState place_image(PaginationState state, int image_index,
                            const PaginationContext& ctx) {
    const std::string& ref = (*ctx.images)[image_index];
    auto found = ctx.dims->find(image_index);
    const ImageSize* dims = found != ctx.dims->end() ? &found->second : nullptr;
    const int full_height = image_full_height(dims, ctx.constraints.content_width);
    const int content_max = ctx.constraints.content_max_height();

    if (!dims) {
        clog_debug(paginate_log, "paginate: image %d has no dimensions, using %d px",
                   image_index, full_height);
    }
    state.paragraph_pending = false;

    if (full_height <= 0 || content_max <= 0) {
        // nothing to slice against: the image gets a page of its own
        if (content_max <= 0) {
            clog_warn(paginate_log, "paginate: chrome %d leaves no content box in page height %d",
                      ctx.constraints.fixed_chrome, ctx.constraints.max_page_height);
            state = flush_page(std::move(state));
        }
        state.current.items.push_back(PageItem::image(image_index, ref, full_height));
        return state;
    }

    int remaining = full_height;
    int clip_top = 0;
    while (remaining > 0) {
        int available = content_max;
        if (!state.current.empty()) {
            // probe with an empty image to account for the media gap
            std::vector<PageItem> probe = state.current.items;
            probe.push_back(PageItem::image(image_index, ref, 0));
            available = content_max - (ctx.estimate(probe) - ctx.constraints.fixed_chrome);
            if (available <= 0) {
                state = flush_page(std::move(state));
                continue;
            }
        }

        int slice = std::min(available, remaining);
        if (slice == full_height) {
            state.current.items.push_back(PageItem::image(image_index, ref, full_height));
        } else {
            state.current.items.push_back(
                PageItem::image_slice(image_index, ref, full_height, clip_top, slice));
            clog_debug(paginate_log, "paginate: image %d slice [%d, %d) of %d",
                       image_index, clip_top, clip_top + slice, full_height);
        }
        clip_top += slice;
        remaining -= slice;
        if (remaining > 0) {
            state = flush_page(std::move(state));
        }
    }
    return state;
}

std::vector<Page> finish_pages(PaginationState state) {
    state = flush_page(std::move(state));
    if (state.pages.empty()) {
        state.pages.push_back(Page());
    }
    return std::move(state.pages);
}

// ============================================================================
// Main API
// ============================================================================

std::vector<Page> paginate(std::string_view content,
                           const std::vector<std::string>& images,
                           const ImageDimensions& dims,
                           const PaginationConstraints& constraints,
                           Lang lang) {
    clog_debug(paginate_log, "paginate: %zu bytes, %zu images, width=%.1f max_chars=%.1f height=%d chrome=%d",
               content.size(), images.size(), constraints.content_width,
               constraints.max_chars_per_line, constraints.max_page_height,
               constraints.fixed_chrome);

    PaginationContext ctx = {&images, &dims, constraints, lang};
    PaginationState state;

    for (const ContentSegment& seg : segment_content(content, (int)images.size())) {
        if (seg.kind == SegmentKind::Image) {
            state = place_image(std::move(state), seg.image_index, ctx);
            continue;
        }
        UnitStream units(seg.value, constraints.max_chars_per_line);
        Unit unit;
        while (units.next(unit)) {
            if (unit.is_break()) {
                state = place_paragraph_break(std::move(state));
            } else {
                state = place_text_unit(std::move(state), unit.text, ctx);
            }
        }
    }

    std::vector<Page> pages = finish_pages(std::move(state));
    clog_debug(paginate_log, "paginate: produced %zu pages", pages.size());
    return pages;
}

// ============================================================================
// Debugging
// ============================================================================

void dump_pages(const std::vector<Page>& pages, const PaginationConstraints& constraints,
                Lang lang) {
    log_category_t* log = paginate_log;
    if (!log_level_enabled(log, LOG_LEVEL_DEBUG)) return;

    for (size_t p = 0; p < pages.size(); p++) {
        const Page& page = pages[p];
        clog_debug(log, "page %zu: %zu items, est height %d / %d", p + 1, page.items.size(),
                   page_content_height(page.items, constraints, lang), constraints.max_page_height);
        for (const PageItem& item : page.items) {
            if (item.is_text()) {
                clog_debug(log, "  text (%zu bytes, %d px)", item.value.size(),
                           text_block_height(item.value, constraints.content_width, lang));
            } else if (item.clipped) {
                clog_debug(log, "  image #%d slice [%d, %d) of %d", item.image_index,
                           item.clip_top, item.clip_top + item.clip_height, item.full_height);
            } else {
                clog_debug(log, "  image #%d full %d px", item.image_index, item.full_height);
            }
        }
    }
}

} // namespace cardpage
