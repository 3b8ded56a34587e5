// log.cpp - zlog-compatible logging with named categories

#include "log.h"
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <ctype.h>
#include <time.h>
#include <pthread.h>

#define DEFAULT_CATEGORY_NAME "default"

// slot 0 is the default category; it exists before log_init so that
// logging from any thread never has to create it
static log_category_t categories[LOG_MAX_CATEGORIES] = {
    {DEFAULT_CATEGORY_NAME, LOG_LEVEL_WARN, NULL, 1},
};
static int category_count = 1;
static int timestamps_enabled = 0;
static int default_level = LOG_LEVEL_WARN;
static FILE* default_output = NULL;
// guards category lookup and creation
static pthread_mutex_t registry_mutex = PTHREAD_MUTEX_INITIALIZER;

log_category_t *log_default_category = &categories[0];

// caller holds registry_mutex
static log_category_t* create_category(const char* cname) {
    if (category_count >= LOG_MAX_CATEGORIES) return NULL;
    log_category_t* cat = &categories[category_count++];
    memset(cat, 0, sizeof(*cat));
    strncpy(cat->name, cname, sizeof(cat->name) - 1);
    cat->level = default_level;
    cat->output = default_output ? default_output : stderr;
    cat->enabled = 1;
    return cat;
}

// drops named categories and re-applies the defaults to slot 0
static void reset_categories() {
    pthread_mutex_lock(&registry_mutex);
    category_count = 1;
    log_category_t* def = &categories[0];
    def->level = default_level;
    def->output = default_output;
    def->enabled = 1;
    log_default_category = def;
    pthread_mutex_unlock(&registry_mutex);
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

int log_level_from_string(const char* name) {
    if (!name) return -1;
    if (strcasecmp(name, "debug") == 0) return LOG_LEVEL_DEBUG;
    if (strcasecmp(name, "info") == 0) return LOG_LEVEL_INFO;
    if (strcasecmp(name, "notice") == 0) return LOG_LEVEL_NOTICE;
    if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) return LOG_LEVEL_WARN;
    if (strcasecmp(name, "error") == 0) return LOG_LEVEL_ERROR;
    if (strcasecmp(name, "fatal") == 0) return LOG_LEVEL_FATAL;
    return -1;
}

log_category_t* log_get_category(const char* cname) {
    if (!cname || !cname[0]) return NULL;
    log_category_t* found = NULL;
    pthread_mutex_lock(&registry_mutex);
    for (int i = 0; i < category_count; i++) {
        if (strcmp(categories[i].name, cname) == 0) {
            found = &categories[i];
            break;
        }
    }
    if (!found) found = create_category(cname);
    pthread_mutex_unlock(&registry_mutex);
    return found;
}

int log_init(const char* config) {
    default_level = LOG_LEVEL_WARN;
    default_output = stderr;
    timestamps_enabled = 0;

    const char* env_level = getenv("FIGMARK_LOG_LEVEL");
    if (env_level && env_level[0]) {
        int level = log_level_from_string(env_level);
        if (level > 0) default_level = level;
    }

    reset_categories();

    if (config && config[0]) {
        return log_parse_config_string(config);
    }
    return LOG_OK;
}

void log_finish(void) {
    for (int i = 0; i < category_count; i++) {
        FILE* out = categories[i].output;
        if (out) fflush(out);
        if (out && out != stdout && out != stderr) {
            // the same file may be shared by several categories
            for (int j = i; j < category_count; j++) {
                if (categories[j].output == out) categories[j].output = NULL;
            }
            fclose(out);
        }
    }
    default_output = NULL;
    reset_categories();
}

int log_level_enabled(log_category_t* category, const int level) {
    if (!category || !category->enabled) return 0;
    return level >= category->level;
}

void log_set_level(log_category_t* category, int level) {
    if (category) category->level = level;
}

void log_set_output(log_category_t* category, FILE* output) {
    if (category) category->output = output;
}

void log_enable_timestamps(int enable) {
    timestamps_enabled = enable;
}

static int write_record(log_category_t* category, int level, const char* format, va_list args) {
    if (!log_level_enabled(category, level)) return LOG_OK;
    FILE* out = category->output ? category->output : stderr;

    if (timestamps_enabled) {
        char stamp[32];
        time_t now = time(NULL);
        struct tm tm_now;
        localtime_r(&now, &tm_now);
        strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);
        fprintf(out, "%s ", stamp);
    }
    if (category == &categories[0]) {
        fprintf(out, "[%s] ", log_level_to_string(level));
    } else {
        fprintf(out, "[%s] %s: ", log_level_to_string(level), category->name);
    }
    if (vfprintf(out, format, args) < 0) return LOG_WRITE_FAIL;
    fputc('\n', out);
    return LOG_OK;
}

#define DEFINE_CLOG(fn, level)                                             \
    int fn(log_category_t* category, const char* format, ...) {            \
        va_list args;                                                      \
        va_start(args, format);                                            \
        int rc = write_record(category, level, format, args);              \
        va_end(args);                                                      \
        return rc;                                                         \
    }

DEFINE_CLOG(clog_error, LOG_LEVEL_ERROR)
DEFINE_CLOG(clog_warn, LOG_LEVEL_WARN)
DEFINE_CLOG(clog_info, LOG_LEVEL_INFO)
DEFINE_CLOG(clog_debug, LOG_LEVEL_DEBUG)

int log_vwrite(int level, const char* format, va_list args) {
    return write_record(log_default_category, level, format, args);
}

#define DEFINE_LOG(fn, level)                                              \
    int fn(const char* format, ...) {                                      \
        va_list args;                                                      \
        va_start(args, format);                                            \
        int rc = log_vwrite(level, format, args);                          \
        va_end(args);                                                      \
        return rc;                                                         \
    }

DEFINE_LOG(log_fatal, LOG_LEVEL_FATAL)
DEFINE_LOG(log_error, LOG_LEVEL_ERROR)
DEFINE_LOG(log_warn, LOG_LEVEL_WARN)
DEFINE_LOG(log_notice, LOG_LEVEL_NOTICE)
DEFINE_LOG(log_info, LOG_LEVEL_INFO)
DEFINE_LOG(log_debug, LOG_LEVEL_DEBUG)

static char* trim_in_place(char* s) {
    while (isspace((unsigned char)*s)) s++;
    char* end = s + strlen(s);
    while (end > s && isspace((unsigned char)end[-1])) end--;
    *end = '\0';
    return s;
}

static FILE* open_output(const char* value) {
    if (strcmp(value, "stdout") == 0) return stdout;
    if (strcmp(value, "stderr") == 0) return stderr;
    return fopen(value, "a");
}

// apply one `[category.]key=value` entry
static int apply_config_entry(char* entry) {
    char* eq = strchr(entry, '=');
    if (!eq) return LOG_WRONG_FORMAT;
    *eq = '\0';
    char* key = trim_in_place(entry);
    char* value = trim_in_place(eq + 1);
    if (!key[0]) return LOG_WRONG_FORMAT;

    log_category_t* target = NULL;  // NULL means all categories + defaults
    char* dot = strrchr(key, '.');
    if (dot) {
        *dot = '\0';
        target = log_get_category(key);
        if (!target) return LOG_CATEGORY_NOT_FOUND;
        key = dot + 1;
    }

    if (strcmp(key, "level") == 0) {
        int level = log_level_from_string(value);
        if (level < 0) return LOG_WRONG_FORMAT;
        if (target) {
            target->level = level;
        } else {
            default_level = level;
            for (int i = 0; i < category_count; i++) categories[i].level = level;
        }
    } else if (strcmp(key, "output") == 0) {
        FILE* out = open_output(value);
        if (!out) return LOG_WRITE_FAIL;
        if (target) {
            target->output = out;
        } else {
            default_output = out;
            for (int i = 0; i < category_count; i++) categories[i].output = out;
        }
    } else if (strcmp(key, "enabled") == 0) {
        int on = (strcmp(value, "0") != 0 && strcasecmp(value, "false") != 0);
        if (target) {
            target->enabled = on;
        } else {
            for (int i = 0; i < category_count; i++) categories[i].enabled = on;
        }
    } else if (strcmp(key, "timestamps") == 0) {
        timestamps_enabled = (strcmp(value, "0") != 0 && strcasecmp(value, "false") != 0);
    } else {
        return LOG_WRONG_FORMAT;
    }
    return LOG_OK;
}

int log_parse_config_string(const char* config) {
    if (!config) return LOG_OK;

    char* copy = strdup(config);
    if (!copy) return LOG_INIT_FAIL;

    int rc = LOG_OK;
    char* saveptr = NULL;
    for (char* entry = strtok_r(copy, ";\n", &saveptr); entry;
         entry = strtok_r(NULL, ";\n", &saveptr)) {
        char* trimmed = trim_in_place(entry);
        if (!trimmed[0] || trimmed[0] == '#') continue;
        int entry_rc = apply_config_entry(trimmed);
        if (entry_rc != LOG_OK) {
            fprintf(stderr, "log: ignoring bad config entry '%s'\n", trimmed);
            rc = entry_rc;
        }
    }
    free(copy);
    return rc;
}

int log_parse_config_file(const char* filename) {
    FILE* file = fopen(filename, "r");
    if (!file) return LOG_INIT_FAIL;

    char line[512];
    int rc = LOG_OK;
    while (fgets(line, sizeof(line), file)) {
        int line_rc = log_parse_config_string(line);
        if (line_rc != LOG_OK) rc = line_rc;
    }
    fclose(file);
    return rc;
}
