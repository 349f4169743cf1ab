// card_log.cpp - Logging categories of the pagination engine

#include "card_log.hpp"

log_category_t* segment_log = NULL;
log_category_t* unitize_log = NULL;
log_category_t* paginate_log = NULL;

void init_cardpage_logging(void) {
    segment_log = log_get_category("cardpage.segment");
    unitize_log = log_get_category("cardpage.unitize");
    paginate_log = log_get_category("cardpage.paginate");

    if (!segment_log || !unitize_log || !paginate_log) {
        log_warn("Failed to initialize cardpage logging categories");
    }
}
