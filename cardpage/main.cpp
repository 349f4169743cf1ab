// main.cpp - cardpage command line
//
//   cardpage <content.txt> [options]
//
// Reads post content with inline [image N] markers, paginates it into
// cards and prints the page list as JSON.

#include "card_json.hpp"
#include "card_layout.hpp"
#include "card_log.hpp"
#include "card_paginate.hpp"
#include "card_segment.hpp"
#include "../lib/log.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <string>
#include <vector>

using namespace cardpage;

struct ImageArg {
    std::string ref;
    bool has_size;
    ImageSize size;
};

struct PaginateOptions {
    const char* input_file;
    const char* output_file;
    AspectRatio ratio;
    Lang lang;
    int preview_width;
    std::vector<ImageArg> images;
    bool debug;
};

static void print_usage(void) {
    fprintf(stderr,
        "Usage: cardpage <content.txt> [options]\n"
        "  -o, --output FILE         write JSON to FILE instead of stdout\n"
        "  -r, --ratio 3:4|9:16      card aspect ratio (default 3:4)\n"
        "  -w, --preview-width N     card width in px (default 360)\n"
        "  -l, --lang zh|en          display language (default zh)\n"
        "  -i, --image REF[:WxH]     image reference with optional natural size,\n"
        "                            repeat in marker order\n"
        "  --debug                   debug logging\n");
}

// "REF:800x600" -> ref + size; a suffix that is not WxH belongs to the ref
static ImageArg parse_image_arg(const char* arg) {
    ImageArg image;
    image.ref = arg;
    image.has_size = false;
    image.size = ImageSize{0, 0};

    const char* colon = strrchr(arg, ':');
    if (!colon) return image;
    int w = 0, h = 0;
    char tail = 0;
    if (sscanf(colon + 1, "%dx%d%c", &w, &h, &tail) == 2 && w > 0 && h > 0) {
        image.ref.assign(arg, colon - arg);
        image.has_size = true;
        image.size = ImageSize{(float)w, (float)h};
    }
    return image;
}

static bool parse_paginate_args(int argc, char** argv, PaginateOptions* opts) {
    opts->input_file = nullptr;
    opts->output_file = nullptr;
    opts->ratio = AspectRatio::Portrait3x4;
    opts->lang = Lang::Zh;
    opts->preview_width = CardLayout::defaults().preview_width;
    opts->debug = false;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (!has_value) {
                log_error("Error: -o requires an argument");
                return false;
            }
            opts->output_file = argv[++i];
        }
        else if (strcmp(arg, "-r") == 0 || strcmp(arg, "--ratio") == 0) {
            if (!has_value || !parse_aspect_ratio(argv[++i], &opts->ratio)) {
                log_error("Error: -r/--ratio requires 3:4 or 9:16");
                return false;
            }
        }
        else if (strcmp(arg, "-w") == 0 || strcmp(arg, "--preview-width") == 0) {
            if (!has_value) {
                log_error("Error: -w/--preview-width requires an argument");
                return false;
            }
            opts->preview_width = atoi(argv[++i]);
            if (opts->preview_width <= 0) {
                log_error("Error: invalid preview width '%s'", argv[i]);
                return false;
            }
        }
        else if (strcmp(arg, "-l") == 0 || strcmp(arg, "--lang") == 0) {
            if (!has_value || !parse_lang(argv[++i], &opts->lang)) {
                log_error("Error: -l/--lang requires zh or en");
                return false;
            }
        }
        else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--image") == 0) {
            if (!has_value) {
                log_error("Error: -i/--image requires an argument");
                return false;
            }
            opts->images.push_back(parse_image_arg(argv[++i]));
        }
        else if (strcmp(arg, "--debug") == 0) {
            opts->debug = true;
        }
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            return false;
        }
        else if (arg[0] != '-' && !opts->input_file) {
            opts->input_file = arg;
        }
        else {
            log_error("Error: unknown option '%s'", arg);
            return false;
        }
    }

    if (!opts->input_file) {
        log_error("Error: input file required");
        return false;
    }
    return true;
}

static bool read_text_file(const char* path, std::string* out) {
    FILE* file = strcmp(path, "-") == 0 ? stdin : fopen(path, "rb");
    if (!file) {
        log_error("Failed to open %s", path);
        return false;
    }
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), file)) > 0) {
        out->append(buf, n);
    }
    bool ok = !ferror(file);
    if (file != stdin) fclose(file);
    if (!ok) log_error("Failed to read %s", path);
    return ok;
}

static bool write_output(const char* path, const std::string& text) {
    FILE* file = path ? fopen(path, "wb") : stdout;
    if (!file) {
        log_error("Failed to open %s for writing", path);
        return false;
    }
    bool ok = fwrite(text.data(), 1, text.size(), file) == text.size();
    if (path) {
        ok = fclose(file) == 0 && ok;
    } else {
        fflush(file);
    }
    if (!ok) log_error("Failed to write %s", path ? path : "stdout");
    return ok;
}

int main(int argc, char** argv) {
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init(nullptr);

    PaginateOptions opts;
    if (!parse_paginate_args(argc, argv, &opts)) {
        print_usage();
        log_fini();
        return 1;
    }
    if (opts.debug) {
        log_parse_config_string(
            "* = debug\n"
            "cardpage.segment = debug\n"
            "cardpage.unitize = debug\n"
            "cardpage.paginate = debug\n");
    }
    init_cardpage_logging();

    std::string content;
    if (!read_text_file(opts.input_file, &content)) {
        log_fini();
        return 1;
    }

    std::vector<std::string> refs;
    ImageDimensions dims;
    for (size_t i = 0; i < opts.images.size(); i++) {
        refs.push_back(opts.images[i].ref);
        if (opts.images[i].has_size) dims[(int)i] = opts.images[i].size;
    }

    MarkerReconcileResult synced = reconcile_markers(content, refs);
    if (synced.changed) {
        log_info("markers renumbered: %zu -> %zu images", refs.size(), synced.images.size());
        dims = remap_image_dimensions(dims, synced.source_indices);
    }

    CardLayout layout = CardLayout::defaults();
    layout.preview_width = opts.preview_width;
    PaginationConstraints constraints = derive_constraints(layout, opts.ratio, opts.lang);

    log_debug("cardpage: input=%s ratio=%s preview_width=%d images=%zu",
              opts.input_file, aspect_ratio_name(opts.ratio), layout.preview_width,
              synced.images.size());

    std::vector<Page> pages = paginate(synced.content, synced.images, dims, constraints, opts.lang);
    dump_pages(pages, constraints, opts.lang);

    bool ok = write_output(opts.output_file,
                           format_pages_json(pages, constraints, layout, opts.lang));
    log_fini();
    return ok ? 0 : 1;
}
