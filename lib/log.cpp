#include "log.h"
#include <string.h>
#include <stdlib.h>
#include <ctype.h>
#include <time.h>

static log_category_t categories[LOG_MAX_CATEGORIES];
static int category_count = 0;
static FILE* opened_files[LOG_MAX_CATEGORIES];
static int opened_file_count = 0;
static int timestamps_enabled = 0;
static int colors_enabled = 0;

log_category_t *log_default_category = NULL;

static void init_category(log_category_t* cat, const char* name, int level, FILE* output) {
    strncpy(cat->name, name, sizeof(cat->name) - 1);
    cat->name[sizeof(cat->name) - 1] = '\0';
    cat->level = level;
    cat->output = output;
    cat->enabled = 1;
}

// lazily set up the default category so logging works before log_init()
static log_category_t* ensure_default(void) {
    if (!log_default_category) {
        init_category(&categories[0], "default", LOG_LEVEL_WARN, stderr);
        category_count = 1;
        log_default_category = &categories[0];
    }
    return log_default_category;
}

static FILE* open_output(const char* target) {
    if (strcmp(target, "stdout") == 0) return stdout;
    if (strcmp(target, "stderr") == 0) return stderr;
    FILE* file = fopen(target, "a");
    if (file && opened_file_count < LOG_MAX_CATEGORIES) {
        opened_files[opened_file_count++] = file;
    }
    return file;
}

int log_init(const char *config) {
    ensure_default();
    if (config && *config) {
        return log_parse_config_string(config);
    }
    return LOG_OK;
}

void log_fini(void) {
    for (int i = 0; i < opened_file_count; i++) {
        fclose(opened_files[i]);
    }
    opened_file_count = 0;
    category_count = 0;
    log_default_category = NULL;
    timestamps_enabled = 0;
    colors_enabled = 0;
}

log_category_t* log_get_category(const char *cname) {
    log_category_t* def = ensure_default();
    if (!cname || !*cname || strcmp(cname, "*") == 0 || strcmp(cname, "default") == 0) {
        return def;
    }
    for (int i = 0; i < category_count; i++) {
        if (strcmp(categories[i].name, cname) == 0) return &categories[i];
    }
    if (category_count >= LOG_MAX_CATEGORIES) {
        return NULL;
    }
    log_category_t* cat = &categories[category_count++];
    init_category(cat, cname, def->level, def->output);
    return cat;
}

const char* log_level_to_string(int level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return "DEBUG";
        case LOG_LEVEL_INFO: return "INFO";
        case LOG_LEVEL_NOTICE: return "NOTICE";
        case LOG_LEVEL_WARN: return "WARN";
        case LOG_LEVEL_ERROR: return "ERROR";
        case LOG_LEVEL_FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

int log_level_from_string(const char *name) {
    if (!name) return -1;
    char upper[16];
    size_t n = 0;
    for (; name[n] && n < sizeof(upper) - 1; n++) {
        upper[n] = (char)toupper((unsigned char)name[n]);
    }
    upper[n] = '\0';
    if (strcmp(upper, "DEBUG") == 0) return LOG_LEVEL_DEBUG;
    if (strcmp(upper, "INFO") == 0) return LOG_LEVEL_INFO;
    if (strcmp(upper, "NOTICE") == 0) return LOG_LEVEL_NOTICE;
    if (strcmp(upper, "WARN") == 0 || strcmp(upper, "WARNING") == 0) return LOG_LEVEL_WARN;
    if (strcmp(upper, "ERROR") == 0) return LOG_LEVEL_ERROR;
    if (strcmp(upper, "FATAL") == 0) return LOG_LEVEL_FATAL;
    if (strcmp(upper, "OFF") == 0) return LOG_LEVEL_FATAL + 1;
    return -1;
}

static const char* level_color(int level) {
    if (level >= LOG_LEVEL_ERROR) return "\033[31m";
    if (level >= LOG_LEVEL_WARN) return "\033[33m";
    if (level >= LOG_LEVEL_INFO) return "\033[32m";
    return "\033[90m";
}

int log_level_enabled(log_category_t *category, const int level) {
    if (!category || !category->enabled || !category->output) return 0;
    return level >= category->level;
}

void log_set_level(log_category_t *category, int level) {
    if (category) category->level = level;
}

void log_set_output(log_category_t *category, FILE *output) {
    if (category) category->output = output;
}

void log_enable_timestamps(int enable) { timestamps_enabled = enable; }

void log_enable_colors(int enable) { colors_enabled = enable; }

int clog_vlog(log_category_t *category, int level, const char *format, va_list args) {
    if (!log_level_enabled(category, level)) return LOG_OK;

    char buf[1024];
    char* c = buf;
    const char* const end = buf + sizeof(buf);

    if (timestamps_enabled) {
        time_t now = time(NULL);
        struct tm tm_now;
        localtime_r(&now, &tm_now);
        c += strftime(c, end - c, "[%H:%M:%S] ", &tm_now);
    }
    int len = snprintf(c, end - c, "%s%-6s%s ",
                       colors_enabled ? level_color(level) : "",
                       log_level_to_string(level),
                       colors_enabled ? "\033[0m" : "");
    if (len > 0) c += (len < end - c) ? len : end - c - 1;
    if (category != log_default_category) {
        len = snprintf(c, end - c, "[%s] ", category->name);
        if (len > 0) c += (len < end - c) ? len : end - c - 1;
    }
    vsnprintf(c, end - c, format, args);

    if (fprintf(category->output, "%s\n", buf) < 0) {
        return LOG_WRITE_FAIL;
    }
    fflush(category->output);
    return LOG_OK;
}

#define DEFINE_CLOG(fn, level)                                          \
    int fn(log_category_t *category, const char *format, ...) {         \
        va_list args;                                                   \
        va_start(args, format);                                         \
        int rc = clog_vlog(category, level, format, args);              \
        va_end(args);                                                   \
        return rc;                                                      \
    }

#define DEFINE_LOG(fn, level)                                           \
    int fn(const char *format, ...) {                                   \
        va_list args;                                                   \
        va_start(args, format);                                         \
        int rc = clog_vlog(ensure_default(), level, format, args);      \
        va_end(args);                                                   \
        return rc;                                                      \
    }

DEFINE_CLOG(clog_error, LOG_LEVEL_ERROR)
DEFINE_CLOG(clog_warn, LOG_LEVEL_WARN)
DEFINE_CLOG(clog_info, LOG_LEVEL_INFO)
DEFINE_CLOG(clog_debug, LOG_LEVEL_DEBUG)

DEFINE_LOG(log_fatal, LOG_LEVEL_FATAL)
DEFINE_LOG(log_error, LOG_LEVEL_ERROR)
DEFINE_LOG(log_warn, LOG_LEVEL_WARN)
DEFINE_LOG(log_notice, LOG_LEVEL_NOTICE)
DEFINE_LOG(log_info, LOG_LEVEL_INFO)
DEFINE_LOG(log_debug, LOG_LEVEL_DEBUG)

// === Configuration ===

static char* trim(char* s) {
    while (isspace((unsigned char)*s)) s++;
    char* e = s + strlen(s);
    while (e > s && isspace((unsigned char)e[-1])) e--;
    *e = '\0';
    return s;
}

static int parse_switch(const char* value) {
    return strcmp(value, "on") == 0 || strcmp(value, "true") == 0 || strcmp(value, "1") == 0;
}

static int parse_config_line(char* line) {
    char* hash = strchr(line, '#');
    if (hash) *hash = '\0';
    char* text = trim(line);
    if (!*text) return LOG_OK;

    char* eq = strchr(text, '=');
    if (!eq) return LOG_WRONG_FORMAT;
    *eq = '\0';
    char* key = trim(text);
    char* value = trim(eq + 1);

    if (strcmp(key, "timestamps") == 0) {
        log_enable_timestamps(parse_switch(value));
        return LOG_OK;
    }
    if (strcmp(key, "colors") == 0) {
        log_enable_colors(parse_switch(value));
        return LOG_OK;
    }

    char* output = NULL;
    char* comma = strchr(value, ',');
    if (comma) {
        *comma = '\0';
        output = trim(comma + 1);
        value = trim(value);
    }
    int level = log_level_from_string(value);
    if (level < 0) return LOG_WRONG_FORMAT;

    log_category_t* cat = log_get_category(key);
    if (!cat) return LOG_CATEGORY_NOT_FOUND;
    cat->level = level;
    if (output && *output) {
        FILE* file = open_output(output);
        if (!file) return LOG_INIT_FAIL;
        cat->output = file;
    }
    return LOG_OK;
}

int log_parse_config_string(const char *config) {
    if (!config) return LOG_OK;
    ensure_default();
    size_t len = strlen(config);
    char* copy = (char*)malloc(len + 1);
    if (!copy) return LOG_INIT_FAIL;
    memcpy(copy, config, len + 1);

    int rc = LOG_OK;
    char* line = copy;
    while (line) {
        char* next = strchr(line, '\n');
        if (next) *next++ = '\0';
        int line_rc = parse_config_line(line);
        if (line_rc != LOG_OK && rc == LOG_OK) rc = line_rc;
        line = next;
    }
    free(copy);
    return rc;
}

int log_parse_config_file(const char *filename) {
    FILE* file = fopen(filename, "r");
    if (!file) return LOG_INIT_FAIL;

    size_t cap = 1024, len = 0;
    char* text = (char*)malloc(cap);
    if (!text) {
        fclose(file);
        return LOG_INIT_FAIL;
    }
    size_t n;
    while ((n = fread(text + len, 1, cap - len - 1, file)) > 0) {
        len += n;
        if (len + 1 >= cap) {
            char* grown = (char*)realloc(text, cap * 2);
            if (!grown) {
                free(text);
                fclose(file);
                return LOG_INIT_FAIL;
            }
            text = grown;
            cap *= 2;
        }
    }
    text[len] = '\0';
    fclose(file);

    int rc = log_parse_config_string(text);
    free(text);
    return rc;
}
