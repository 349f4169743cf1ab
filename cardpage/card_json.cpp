// card_json.cpp - Page list as JSON for the card renderer and exporter

#include "card_json.hpp"
#include <cstdio>

namespace cardpage {

void append_json_string(std::string& buf, std::string_view str) {
    buf += '"';
    for (char c : str) {
        switch (c) {
            case '"': buf += "\\\""; break;
            case '\\': buf += "\\\\"; break;
            case '\n': buf += "\\n"; break;
            case '\r': buf += "\\r"; break;
            case '\t': buf += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) {
                    char esc[8];
                    snprintf(esc, sizeof(esc), "\\u%04x", (unsigned char)c);
                    buf += esc;
                } else {
                    buf += c;
                }
                break;
        }
    }
    buf += '"';
}

static void append_item_json(std::string& buf, const PageItem& item) {
    if (item.is_text()) {
        buf += "{\"type\":\"text\",\"value\":";
        append_json_string(buf, item.value);
        buf += '}';
        return;
    }
    buf += "{\"type\":\"image\",\"index\":";
    buf += std::to_string(item.image_index);
    buf += ",\"ref\":";
    append_json_string(buf, item.ref);
    buf += ",\"fullHeight\":";
    buf += std::to_string(item.full_height);
    if (item.clipped) {
        buf += ",\"clipTop\":";
        buf += std::to_string(item.clip_top);
        buf += ",\"clipHeight\":";
        buf += std::to_string(item.clip_height);
    }
    buf += '}';
}

std::string format_pages_json(const std::vector<Page>& pages,
                              const PaginationConstraints& constraints,
                              const CardLayout& layout, Lang lang) {
    std::string buf = "{\"pages\":[";
    for (size_t p = 0; p < pages.size(); p++) {
        if (p > 0) buf += ',';
        buf += "\n  {\"height\":";
        buf += std::to_string(card_display_height(pages[p], constraints, layout, lang));
        buf += ",\"items\":[";
        const std::vector<PageItem>& items = pages[p].items;
        for (size_t i = 0; i < items.size(); i++) {
            if (i > 0) buf += ',';
            buf += "\n    ";
            append_item_json(buf, items[i]);
        }
        buf += "]}";
    }
    buf += "\n]}\n";
    return buf;
}

} // namespace cardpage
