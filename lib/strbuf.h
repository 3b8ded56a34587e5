/*
 * strbuf - growable, always NUL-terminated byte buffer.
 *
 * Appends never fail loudly: on allocation failure the buffer keeps its
 * previous contents. Callers that must know (file reads) check length.
 */
#ifndef FIGMARK_STRBUF_H
#define FIGMARK_STRBUF_H

#include <stdarg.h>
#include <stdbool.h>
#include <stddef.h>
#include <stdio.h>

typedef struct {
    char* str;
    size_t length;      /* bytes before the terminator */
    size_t capacity;    /* allocated bytes, terminator included */
} StrBuf;

/* lifetime */
StrBuf* strbuf_new();
StrBuf* strbuf_new_cap(size_t size);
StrBuf* strbuf_create(const char *str);
void strbuf_free(StrBuf *sb);

/* size management */
bool strbuf_ensure_cap(StrBuf *sb, size_t min_capacity);
void strbuf_reset(StrBuf *sb);
void strbuf_truncate(StrBuf *sb, size_t new_length);   /* no-op when new_length >= length */

/* appending */
void strbuf_append_str(StrBuf *sb, const char *str);
void strbuf_append_str_n(StrBuf *sb, const char *str, size_t n);
void strbuf_append_char(StrBuf *sb, char c);
void strbuf_append_char_n(StrBuf *sb, char c, size_t n);
void strbuf_append_int(StrBuf *sb, int value);
void strbuf_append_format(StrBuf *sb, const char *format, ...);
void strbuf_vappend_format(StrBuf *sb, const char *format, va_list args);

/* reads file to EOF; false on a read or allocation error */
bool strbuf_append_file(StrBuf *sb, FILE *file);

#endif /* FIGMARK_STRBUF_H */
