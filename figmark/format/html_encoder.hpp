#ifndef FIGMARK_HTML_ENCODER_HPP
#define FIGMARK_HTML_ENCODER_HPP

#include "../../lib/strbuf.h"
#include <string>
#include <string_view>

namespace figmark {

// Which characters an escape pass replaces with entities.
//   ESCAPE_CONTENT    & < >           element content written by the formatter
//   ESCAPE_TEXT       & < > "         general purpose text
//   ESCAPE_ATTRIBUTE  & < > " '       double-quoted attribute values
enum EscapeMode {
    ESCAPE_CONTENT,
    ESCAPE_TEXT,
    ESCAPE_ATTRIBUTE,
};

class HtmlEncoder {
public:
    // entity replacing c under mode, or nullptr when c is written as-is
    static const char* entity_for(char c, EscapeMode mode);

    static void escape_into(StrBuf* sb, std::string_view text, EscapeMode mode);

    static void escape(StrBuf* sb, std::string_view text) { escape_into(sb, text, ESCAPE_TEXT); }
    static std::string escape(std::string_view text);

    static void escape_attribute(StrBuf* sb, std::string_view text) { escape_into(sb, text, ESCAPE_ATTRIBUTE); }
    static std::string escape_attribute(std::string_view text);

    /**
     * Percent-encode a link destination. Spaces, control bytes, non-ASCII
     * bytes and "<>\`^{|} become %XX; well-formed %XX sequences are kept.
     * Attribute escaping is still needed afterwards.
     */
    static std::string normalize_url(std::string_view url);

    // true when escape() would change text
    static bool needs_escaping(std::string_view text);
};

} // namespace figmark

#endif // FIGMARK_HTML_ENCODER_HPP
