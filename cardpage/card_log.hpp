// card_log.hpp - Logging categories of the pagination engine

#ifndef CARD_LOG_HPP
#define CARD_LOG_HPP

#include "../lib/log.h"

// NULL until init_cardpage_logging(); a NULL category logs nothing
extern log_category_t* segment_log;
extern log_category_t* unitize_log;
extern log_category_t* paginate_log;

// Resolve the categories once, after log.conf has been applied. Call again
// after log_fini()/log_init().
void init_cardpage_logging(void);

#endif // CARD_LOG_HPP
