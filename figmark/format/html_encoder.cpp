#include "html_encoder.hpp"
#include <ctype.h>
#include <string.h>

namespace figmark {

const char* HtmlEncoder::entity_for(char c, EscapeMode mode) {
    if (c == '&') return "&amp;";
    if (c == '<') return "&lt;";
    if (c == '>') return "&gt;";
    if (mode == ESCAPE_CONTENT) return nullptr;
    if (c == '"') return "&quot;";
    if (mode == ESCAPE_ATTRIBUTE && c == '\'') return "&#39;";
    return nullptr;
}

void HtmlEncoder::escape_into(StrBuf* sb, std::string_view text, EscapeMode mode) {
    if (!sb) return;
    // copy unescaped runs in one append
    size_t run = 0;
    for (size_t i = 0; i < text.size(); i++) {
        const char* entity = entity_for(text[i], mode);
        if (!entity) continue;
        if (i > run) strbuf_append_str_n(sb, text.data() + run, i - run);
        strbuf_append_str(sb, entity);
        run = i + 1;
    }
    if (run < text.size()) strbuf_append_str_n(sb, text.data() + run, text.size() - run);
}

static std::string escape_to_string(std::string_view text, EscapeMode mode) {
    StrBuf* sb = strbuf_new_cap(text.size() + text.size() / 4 + 1);
    HtmlEncoder::escape_into(sb, text, mode);
    std::string out(sb->str, sb->length);
    strbuf_free(sb);
    return out;
}

std::string HtmlEncoder::escape(std::string_view text) {
    if (!needs_escaping(text)) return std::string(text);
    return escape_to_string(text, ESCAPE_TEXT);
}

std::string HtmlEncoder::escape_attribute(std::string_view text) {
    return escape_to_string(text, ESCAPE_ATTRIBUTE);
}

bool HtmlEncoder::needs_escaping(std::string_view text) {
    for (char c : text) {
        if (entity_for(c, ESCAPE_TEXT)) return true;
    }
    return false;
}

static bool url_byte_needs_encoding(unsigned char c) {
    if (c <= 0x20 || c >= 0x7F) return true;
    return strchr("\"<>\\^`{|}", c) != nullptr;
}

std::string HtmlEncoder::normalize_url(std::string_view url) {
    static const char hex_digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(url.size());
    size_t i = 0;
    while (i < url.size()) {
        unsigned char c = (unsigned char)url[i];
        bool encode = url_byte_needs_encoding(c);
        if (c == '%') {
            // a stray percent sign is itself encoded
            encode = !(i + 2 < url.size() && isxdigit((unsigned char)url[i + 1]) &&
                       isxdigit((unsigned char)url[i + 2]));
        }
        if (encode) {
            out.push_back('%');
            out.push_back(hex_digits[c >> 4]);
            out.push_back(hex_digits[c & 0x0F]);
        } else {
            out.push_back((char)c);
        }
        i++;
    }
    return out;
}

} // namespace figmark
