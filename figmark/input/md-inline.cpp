// md-inline.cpp - inline pass of the markdown reader
#include "input-md.hpp"
#include <ctype.h>

namespace figmark {

static bool is_ascii_punct(char c) {
    return (unsigned char)c < 0x80 && ispunct((unsigned char)c);
}

static bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// `*` or `_` run waiting to be paired into emphasis
struct Delimiter {
    size_t token;       // index of the text token holding the run
    char ch;
    int length;         // characters not yet consumed by a match
    int orig_length;
    bool can_open;
    bool can_close;
    bool active;
};

class InlineParser {
public:
    explicit InlineParser(const std::string& text) : src(text), pos(0) {}

    std::vector<InlineToken> parse();

private:
    const std::string& src;
    size_t pos;
    std::string pending;
    std::vector<InlineToken> tokens;
    std::vector<Delimiter> delimiters;

    void flush_text();
    bool scan_escape();
    void scan_code_span();
    void scan_newline();
    bool scan_link(bool is_image);
    void scan_delimiter_run();
    size_t find_label_end(size_t start) const;
    size_t find_backtick_close(size_t from, size_t run) const;
    void skip_spaces(size_t* p, bool allow_newline) const;
    void process_emphasis(std::vector<std::vector<InlineToken>>* opens,
                          std::vector<std::vector<InlineToken>>* closes);
};

void InlineParser::flush_text() {
    if (pending.empty()) return;
    tokens.push_back(InlineToken::text(pending));
    pending.clear();
}

bool InlineParser::scan_escape() {
    if (pos + 1 >= src.size()) return false;
    char next = src[pos + 1];
    if (next == '\n') {
        flush_text();
        tokens.push_back(InlineToken::hardbreak());
        pos += 2;
        while (pos < src.size() && (src[pos] == ' ' || src[pos] == '\t')) pos++;
        return true;
    }
    if (is_ascii_punct(next)) {
        pending += next;
        pos += 2;
        return true;
    }
    return false;
}

// start of the closing backtick run of exactly `run` backticks, or npos
size_t InlineParser::find_backtick_close(size_t from, size_t run) const {
    size_t p = from;
    while (p < src.size()) {
        if (src[p] != '`') {
            p++;
            continue;
        }
        size_t start = p;
        while (p < src.size() && src[p] == '`') p++;
        if (p - start == run) return start;
    }
    return std::string::npos;
}

void InlineParser::scan_code_span() {
    size_t run = 0;
    while (pos + run < src.size() && src[pos + run] == '`') run++;

    size_t close = find_backtick_close(pos + run, run);
    if (close == std::string::npos) {
        pending.append(run, '`');
        pos += run;
        return;
    }

    std::string code = src.substr(pos + run, close - pos - run);
    for (char& c : code) {
        if (c == '\n') c = ' ';
    }
    bool all_spaces = code.find_first_not_of(' ') == std::string::npos;
    if (!all_spaces && code.size() >= 2 && code.front() == ' ' && code.back() == ' ') {
        code = code.substr(1, code.size() - 2);
    }
    flush_text();
    tokens.push_back(InlineToken::code(code));
    pos = close + run;
}

void InlineParser::scan_newline() {
    size_t spaces = 0;
    while (!pending.empty() && pending.back() == ' ') {
        pending.pop_back();
        spaces++;
    }
    flush_text();
    tokens.push_back(spaces >= 2 ? InlineToken::hardbreak() : InlineToken::softbreak());
    pos++;
    while (pos < src.size() && (src[pos] == ' ' || src[pos] == '\t')) pos++;
}

// index of the `]` closing a label that starts at `start`, or npos
size_t InlineParser::find_label_end(size_t start) const {
    int depth = 0;
    size_t p = start;
    while (p < src.size()) {
        char c = src[p];
        if (c == '\\' && p + 1 < src.size()) {
            p += 2;
            continue;
        }
        if (c == '`') {
            size_t run = 0;
            while (p + run < src.size() && src[p + run] == '`') run++;
            size_t close = find_backtick_close(p + run, run);
            p = close == std::string::npos ? p + run : close + run;
            continue;
        }
        if (c == '[') {
            depth++;
        } else if (c == ']') {
            if (depth == 0) return p;
            depth--;
        }
        p++;
    }
    return std::string::npos;
}

void InlineParser::skip_spaces(size_t* p, bool allow_newline) const {
    bool seen_newline = false;
    while (*p < src.size()) {
        char c = src[*p];
        if (c == ' ' || c == '\t') {
            (*p)++;
        } else if (c == '\n' && allow_newline && !seen_newline) {
            seen_newline = true;
            (*p)++;
        } else {
            break;
        }
    }
}

// inline link `[text](dest "title")` or image `![alt](src "title")`
bool InlineParser::scan_link(bool is_image) {
    size_t label_start = pos + (is_image ? 2 : 1);
    size_t label_end = find_label_end(label_start);
    if (label_end == std::string::npos) return false;

    size_t p = label_end + 1;
    if (p >= src.size() || src[p] != '(') return false;
    p++;
    skip_spaces(&p, true);

    std::string dest;
    if (p < src.size() && src[p] == '<') {
        p++;
        while (p < src.size() && src[p] != '>' && src[p] != '<' && src[p] != '\n') {
            if (src[p] == '\\' && p + 1 < src.size() && is_ascii_punct(src[p + 1])) p++;
            dest += src[p];
            p++;
        }
        if (p >= src.size() || src[p] != '>') return false;
        p++;
    } else {
        int depth = 0;
        while (p < src.size()) {
            char c = src[p];
            if (is_ws(c) || iscntrl((unsigned char)c)) break;
            if (c == '\\' && p + 1 < src.size() && is_ascii_punct(src[p + 1])) {
                dest += src[p + 1];
                p += 2;
                continue;
            }
            if (c == '(') {
                depth++;
            } else if (c == ')') {
                if (depth == 0) break;
                depth--;
            }
            dest += c;
            p++;
        }
        if (depth != 0) return false;
    }

    size_t before_space = p;
    skip_spaces(&p, true);
    std::optional<std::string> title;
    if (p < src.size() && (src[p] == '"' || src[p] == '\'' || src[p] == '(')) {
        if (p == before_space && !dest.empty()) return false;
        char close = src[p] == '(' ? ')' : src[p];
        p++;
        std::string text;
        while (p < src.size() && src[p] != close) {
            if (src[p] == '\\' && p + 1 < src.size() && is_ascii_punct(src[p + 1])) p++;
            text += src[p];
            p++;
        }
        if (p >= src.size()) return false;
        p++;
        title = text;
        skip_spaces(&p, true);
    }
    if (p >= src.size() || src[p] != ')') return false;
    p++;

    std::string label = src.substr(label_start, label_end - label_start);
    InlineParser label_parser(label);
    std::vector<InlineToken> label_tokens = label_parser.parse();

    flush_text();
    if (is_image) {
        tokens.push_back(InlineToken::image(dest, inline_plain_text(label_tokens), title));
    } else {
        tokens.push_back(InlineToken::link_open(dest, title));
        tokens.insert(tokens.end(), label_tokens.begin(), label_tokens.end());
        tokens.push_back(InlineToken(INLINE_LINK_CLOSE));
    }
    pos = p;
    return true;
}

void InlineParser::scan_delimiter_run() {
    char ch = src[pos];
    size_t start = pos;
    while (pos < src.size() && src[pos] == ch) pos++;
    int length = (int)(pos - start);

    char before = start == 0 ? '\n' : src[start - 1];
    char after = pos >= src.size() ? '\n' : src[pos];
    bool before_ws = is_ws(before), after_ws = is_ws(after);
    bool before_punct = is_ascii_punct(before), after_punct = is_ascii_punct(after);

    bool left_flanking = !after_ws && (!after_punct || before_ws || before_punct);
    bool right_flanking = !before_ws && (!before_punct || after_ws || after_punct);

    bool can_open, can_close;
    if (ch == '*') {
        can_open = left_flanking;
        can_close = right_flanking;
    } else {
        can_open = left_flanking && (!right_flanking || before_punct);
        can_close = right_flanking && (!left_flanking || after_punct);
    }

    flush_text();
    tokens.push_back(InlineToken::text(std::string(length, ch)));
    if (can_open || can_close) {
        Delimiter delim = {tokens.size() - 1, ch, length, length, can_open, can_close, true};
        delimiters.push_back(delim);
    }
}

// pair delimiter runs into em/strong; markers land beside the run's text token
void InlineParser::process_emphasis(std::vector<std::vector<InlineToken>>* opens,
                                    std::vector<std::vector<InlineToken>>* closes) {
    for (size_t c = 0; c < delimiters.size(); c++) {
        Delimiter& closer = delimiters[c];
        if (!closer.can_close || !closer.active) continue;

        while (closer.length > 0) {
            int found = -1;
            for (int j = (int)c - 1; j >= 0; j--) {
                const Delimiter& d = delimiters[j];
                if (!d.active || d.ch != closer.ch || !d.can_open || d.length == 0) continue;
                // rule of 3
                if ((d.can_close || closer.can_open) &&
                    (d.orig_length + closer.orig_length) % 3 == 0 &&
                    !(d.orig_length % 3 == 0 && closer.orig_length % 3 == 0)) {
                    continue;
                }
                found = j;
                break;
            }
            if (found < 0) break;

            Delimiter& opener = delimiters[found];
            bool strong = opener.length >= 2 && closer.length >= 2;
            int used = strong ? 2 : 1;
            opener.length -= used;
            closer.length -= used;

            std::vector<InlineToken>& open_list = (*opens)[opener.token];
            open_list.insert(open_list.begin(), InlineToken(strong ? INLINE_STRONG_OPEN : INLINE_EM_OPEN));
            (*closes)[closer.token].push_back(InlineToken(strong ? INLINE_STRONG_CLOSE : INLINE_EM_CLOSE));

            for (size_t k = found + 1; k < c; k++) delimiters[k].active = false;
        }
    }

    for (const Delimiter& d : delimiters) {
        tokens[d.token].content = std::string(d.length, d.ch);
    }
}

std::vector<InlineToken> InlineParser::parse() {
    while (pos < src.size()) {
        char c = src[pos];
        switch (c) {
        case '\\':
            if (!scan_escape()) {
                pending += c;
                pos++;
            }
            break;
        case '`':
            scan_code_span();
            break;
        case '\n':
            scan_newline();
            break;
        case '!':
            if (pos + 1 < src.size() && src[pos + 1] == '[' && scan_link(true)) break;
            pending += c;
            pos++;
            break;
        case '[':
            if (scan_link(false)) break;
            pending += c;
            pos++;
            break;
        case '*':
        case '_':
            scan_delimiter_run();
            break;
        default:
            pending += c;
            pos++;
            break;
        }
    }
    flush_text();

    std::vector<std::vector<InlineToken>> opens(tokens.size()), closes(tokens.size());
    process_emphasis(&opens, &closes);

    std::vector<InlineToken> out;
    out.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); i++) {
        out.insert(out.end(), closes[i].begin(), closes[i].end());
        InlineToken& token = tokens[i];
        if (token.kind == INLINE_TEXT) {
            if (!token.content.empty()) {
                if (!out.empty() && out.back().kind == INLINE_TEXT) {
                    out.back().content += token.content;
                } else {
                    out.push_back(std::move(token));
                }
            }
        } else {
            out.push_back(std::move(token));
        }
        out.insert(out.end(), opens[i].begin(), opens[i].end());
    }
    return out;
}

std::vector<InlineToken> parse_inlines(const std::string& text) {
    InlineParser parser(text);
    return parser.parse();
}

void parse_inline_content(Block& root) {
    if (root.kind == BLOCK_PARAGRAPH || root.kind == BLOCK_HEADING) {
        root.inlines = parse_inlines(root.content);
        return;
    }
    for (size_t i = 0; i < root.child_count(); i++) {
        parse_inline_content(*root.child_at(i));
    }
}

} // namespace figmark
