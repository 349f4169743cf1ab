// card_json.hpp - Page list as JSON for the card renderer and exporter

#ifndef CARD_JSON_HPP
#define CARD_JSON_HPP

#include "card_layout.hpp"
#include "card_types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace cardpage {

// Append str as a quoted, escaped JSON string
void append_json_string(std::string& buf, std::string_view str);

// {"pages":[{"height":H,"items":[...]}, ...]}; height is the card display
// height from card_display_height()
std::string format_pages_json(const std::vector<Page>& pages,
                              const PaginationConstraints& constraints,
                              const CardLayout& layout, Lang lang);

} // namespace cardpage

#endif // CARD_JSON_HPP
