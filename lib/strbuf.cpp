#include "strbuf.h"
#include <stdlib.h>
#include <string.h>

#define STRBUF_INITIAL_CAP 32

// power of two >= n, never below the initial capacity
static size_t grow_capacity(size_t n) {
    size_t cap = STRBUF_INITIAL_CAP;
    while (cap < n) cap <<= 1;
    return cap;
}

StrBuf* strbuf_new() {
    return strbuf_new_cap(STRBUF_INITIAL_CAP);
}

StrBuf* strbuf_new_cap(size_t size) {
    StrBuf* sb = (StrBuf*)calloc(1, sizeof(StrBuf));
    if (!sb) return NULL;
    if (size < 1) size = 1;
    sb->str = (char*)malloc(size);
    if (!sb->str) {
        free(sb);
        return NULL;
    }
    sb->str[0] = '\0';
    sb->length = 0;
    sb->capacity = size;
    return sb;
}

StrBuf* strbuf_create(const char* str) {
    StrBuf* sb = strbuf_new();
    if (sb && str) strbuf_append_str(sb, str);
    return sb;
}

void strbuf_free(StrBuf* sb) {
    if (!sb) return;
    free(sb->str);
    free(sb);
}

void strbuf_reset(StrBuf* sb) {
    if (!sb) return;
    sb->length = 0;
    if (sb->str) sb->str[0] = '\0';
}

bool strbuf_ensure_cap(StrBuf* sb, size_t min_capacity) {
    if (!sb) return false;
    if (min_capacity <= sb->capacity) return true;
    size_t new_cap = grow_capacity(min_capacity);
    char* grown = (char*)realloc(sb->str, new_cap);
    if (!grown) return false;
    sb->str = grown;
    sb->capacity = new_cap;
    return true;
}

void strbuf_append_str(StrBuf* sb, const char* str) {
    if (!str) return;
    strbuf_append_str_n(sb, str, strlen(str));
}

void strbuf_append_str_n(StrBuf* sb, const char* str, size_t n) {
    if (!sb || !str || n == 0) return;
    if (!strbuf_ensure_cap(sb, sb->length + n + 1)) return;
    memcpy(sb->str + sb->length, str, n);
    sb->length += n;
    sb->str[sb->length] = '\0';
}

void strbuf_append_char(StrBuf* sb, char c) {
    if (!sb || !strbuf_ensure_cap(sb, sb->length + 2)) return;
    sb->str[sb->length++] = c;
    sb->str[sb->length] = '\0';
}

void strbuf_append_char_n(StrBuf* sb, char c, size_t n) {
    if (!sb || n == 0) return;
    if (!strbuf_ensure_cap(sb, sb->length + n + 1)) return;
    memset(sb->str + sb->length, c, n);
    sb->length += n;
    sb->str[sb->length] = '\0';
}

void strbuf_append_int(StrBuf* sb, int value) {
    strbuf_append_format(sb, "%d", value);
}

void strbuf_vappend_format(StrBuf* sb, const char* format, va_list args) {
    if (!sb || !format) return;
    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(NULL, 0, format, copy);
    va_end(copy);
    if (needed <= 0) return;
    if (!strbuf_ensure_cap(sb, sb->length + (size_t)needed + 1)) return;
    vsnprintf(sb->str + sb->length, (size_t)needed + 1, format, args);
    sb->length += (size_t)needed;
}

void strbuf_append_format(StrBuf* sb, const char* format, ...) {
    va_list args;
    va_start(args, format);
    strbuf_vappend_format(sb, format, args);
    va_end(args);
}

void strbuf_truncate(StrBuf* sb, size_t new_length) {
    if (!sb || new_length >= sb->length) return;
    sb->length = new_length;
    sb->str[new_length] = '\0';
}

bool strbuf_append_file(StrBuf* sb, FILE* file) {
    if (!sb || !file) return false;
    char chunk[4096];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        size_t before = sb->length;
        strbuf_append_str_n(sb, chunk, n);
        if (sb->length != before + n) return false;
    }
    return !ferror(file);
}
