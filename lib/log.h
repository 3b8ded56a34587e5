/*
 * log - leveled, categorised logging for figmark (zlog-style call names).
 *
 * Records go to a category's stream as `[LEVEL] message` for the default
 * category and `[LEVEL] category: message` for named ones. Records below
 * the category level are dropped.
 */
#ifndef FIGMARK_LOG_H
#define FIGMARK_LOG_H

#include <stdarg.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

enum {
    LOG_OK                 =  0,
    LOG_WRONG_FORMAT       = -3,
    LOG_WRITE_FAIL         = -4,
    LOG_INIT_FAIL          = -5,
    LOG_CATEGORY_NOT_FOUND = -6,
};

#define LOG_MAX_CATEGORIES 16

typedef enum {
    LOG_LEVEL_DEBUG = 20,
    LOG_LEVEL_INFO = 40,
    LOG_LEVEL_NOTICE = 60,
    LOG_LEVEL_WARN = 80,
    LOG_LEVEL_ERROR = 100,
    LOG_LEVEL_FATAL = 120
} log_level;

typedef struct log_category_s {
    char name[64];
    int level;          /* minimum level written */
    FILE *output;
    int enabled;
} log_category_t;

/* statically initialised (WARN on stderr); never NULL */
extern log_category_t *log_default_category;

/*
 * Resets every category. A NULL or empty config leaves the defaults (WARN on
 * stderr, or the level in FIGMARK_LOG_LEVEL); anything else is handed to
 * log_parse_config_string().
 */
int log_init(const char *config);
void log_finish(void);
/* looked up by name, created on first use; NULL once the table is full */
log_category_t* log_get_category(const char *cname);

int log_fatal(const char *format, ...);
int log_error(const char *format, ...);
int log_warn(const char *format, ...);
int log_notice(const char *format, ...);
int log_info(const char *format, ...);
int log_debug(const char *format, ...);
int log_vwrite(int level, const char *format, va_list args);

int clog_error(log_category_t *category, const char *format, ...);
int clog_warn(log_category_t *category, const char *format, ...);
int clog_info(log_category_t *category, const char *format, ...);
int clog_debug(log_category_t *category, const char *format, ...);

int log_level_enabled(log_category_t *category, const int level);
void log_set_level(log_category_t *category, int level);
void log_set_output(log_category_t *category, FILE *output);
void log_enable_timestamps(int enable);

const char* log_level_to_string(int level);
int log_level_from_string(const char *name);   /* -1 when unknown */

/*
 * `key=value` entries separated by ';' or newlines. Keys are level, output
 * (stdout, stderr or a file path), timestamps and enabled; a `name.` prefix
 * targets a named category, e.g. `figure.level=debug`.
 */
int log_parse_config_string(const char *config);
int log_parse_config_file(const char *filename);

#ifdef __cplusplus
}
#endif

#endif /* FIGMARK_LOG_H */
