// md-block.cpp - block structure pass of the markdown reader
#include "input-md.hpp"
#include "../../lib/log.h"
#include <ctype.h>

namespace figmark {

typedef std::vector<std::string> Lines;

struct FenceInfo {
    char ch;
    int length;
    int indent;
    std::string info;
};

struct ListMarker {
    bool ordered;
    char ch;            // bullet char, or '.' / ')' for ordered lists
    int number;
    int content_offset; // column where item content starts
    bool empty;         // nothing after the marker
};

// split into lines, normalizing CR/CRLF and expanding tabs in leading indentation
static Lines split_lines(const char* source, size_t len) {
    Lines lines;
    std::string line;
    bool leading = true;
    for (size_t i = 0; i < len; i++) {
        char c = source[i];
        if (c == '\r' || c == '\n') {
            if (c == '\r' && i + 1 < len && source[i + 1] == '\n') i++;
            lines.push_back(line);
            line.clear();
            leading = true;
            continue;
        }
        if (c == '\t' && leading) {
            size_t pad = 4 - (line.size() % 4);
            line.append(pad, ' ');
            continue;
        }
        if (c != ' ') leading = false;
        line += c;
    }
    if (!line.empty()) lines.push_back(line);
    return lines;
}

static int leading_spaces(const std::string& line) {
    int count = 0;
    while (count < (int)line.size() && line[count] == ' ') count++;
    return count;
}

static bool is_blank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t') return false;
    }
    return true;
}

static std::string trim_left(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && (text[start] == ' ' || text[start] == '\t')) start++;
    return text.substr(start);
}

static std::string trim_right(const std::string& text) {
    size_t end = text.size();
    while (end > 0 && (text[end - 1] == ' ' || text[end - 1] == '\t')) end--;
    return text.substr(0, end);
}

static std::string trim(const std::string& text) {
    return trim_right(trim_left(text));
}

// remove up to n columns of leading spaces
static std::string strip_indent(const std::string& line, int n) {
    int strip = 0;
    while (strip < n && strip < (int)line.size() && line[strip] == ' ') strip++;
    return line.substr(strip);
}

// returns heading level 1-6, or 0 when the line is not an ATX heading
static int atx_heading_level(const std::string& line, std::string* content) {
    int indent = leading_spaces(line);
    if (indent > 3) return 0;
    size_t pos = indent;
    int level = 0;
    while (pos < line.size() && line[pos] == '#') { level++; pos++; }
    if (level < 1 || level > 6) return 0;
    if (pos < line.size() && line[pos] != ' ' && line[pos] != '\t') return 0;

    std::string text = trim(line.substr(pos));
    // optional closing sequence of #'s
    size_t end = text.size();
    while (end > 0 && text[end - 1] == '#') end--;
    if (end == 0) {
        text.clear();
    } else if (end < text.size() && (text[end - 1] == ' ' || text[end - 1] == '\t')) {
        text = trim_right(text.substr(0, end));
    }
    if (content) *content = text;
    return level;
}

static bool is_thematic_break(const std::string& line) {
    if (leading_spaces(line) > 3) return false;
    char marker = 0;
    int count = 0;
    for (char c : line) {
        if (c == ' ' || c == '\t') continue;
        if (c != '*' && c != '-' && c != '_') return false;
        if (!marker) marker = c;
        else if (c != marker) return false;
        count++;
    }
    return count >= 3;
}

// 1 for a `===` underline, 2 for `---`, 0 otherwise
static int setext_level(const std::string& line) {
    if (leading_spaces(line) > 3) return 0;
    std::string text = trim(line);
    if (text.empty()) return 0;
    char marker = text[0];
    if (marker != '=' && marker != '-') return 0;
    for (char c : text) {
        if (c != marker) return 0;
    }
    return marker == '=' ? 1 : 2;
}

static bool is_fence_open(const std::string& line, FenceInfo* fence) {
    int indent = leading_spaces(line);
    if (indent > 3) return false;
    size_t pos = indent;
    if (pos >= line.size() || (line[pos] != '`' && line[pos] != '~')) return false;
    char ch = line[pos];
    int length = 0;
    while (pos < line.size() && line[pos] == ch) { length++; pos++; }
    if (length < 3) return false;
    std::string info = trim(line.substr(pos));
    if (ch == '`' && info.find('`') != std::string::npos) return false;
    if (fence) {
        fence->ch = ch;
        fence->length = length;
        fence->indent = indent;
        fence->info = info;
    }
    return true;
}

static bool is_fence_close(const std::string& line, const FenceInfo& fence) {
    int indent = leading_spaces(line);
    if (indent > 3) return false;
    size_t pos = indent;
    int length = 0;
    while (pos < line.size() && line[pos] == fence.ch) { length++; pos++; }
    if (length < fence.length) return false;
    return is_blank(line.substr(pos));
}

static bool is_blockquote_start(const std::string& line) {
    int indent = leading_spaces(line);
    return indent <= 3 && indent < (int)line.size() && line[indent] == '>';
}

static std::string strip_blockquote_marker(const std::string& line) {
    size_t pos = leading_spaces(line) + 1;  // past '>'
    if (pos < line.size() && line[pos] == ' ') pos++;
    return pos < line.size() ? line.substr(pos) : std::string();
}

static bool parse_list_marker(const std::string& line, ListMarker* marker) {
    int indent = leading_spaces(line);
    if (indent > 3) return false;
    size_t pos = indent;
    if (pos >= line.size()) return false;

    ListMarker m = {false, 0, 1, 0, false};
    char c = line[pos];
    if (c == '-' || c == '+' || c == '*') {
        m.ch = c;
        pos++;
    } else if (isdigit((unsigned char)c)) {
        int number = 0, digits = 0;
        while (pos < line.size() && isdigit((unsigned char)line[pos]) && digits < 9) {
            number = number * 10 + (line[pos] - '0');
            pos++;
            digits++;
        }
        if (pos >= line.size() || (line[pos] != '.' && line[pos] != ')')) return false;
        m.ordered = true;
        m.ch = line[pos];
        m.number = number;
        pos++;
    } else {
        return false;
    }

    if (pos >= line.size()) {
        m.empty = true;
        m.content_offset = (int)pos + 1;
    } else if (line[pos] != ' ' && line[pos] != '\t') {
        return false;
    } else {
        int spaces = 0;
        while (pos + spaces < line.size() && line[pos + spaces] == ' ') spaces++;
        if (is_blank(line.substr(pos))) {
            m.empty = true;
            m.content_offset = (int)pos + 1;
        } else if (spaces >= 5 || spaces == 0) {
            // content starting with indented code keeps its extra indentation
            m.content_offset = (int)pos + 1;
        } else {
            m.content_offset = (int)pos + spaces;
        }
    }
    if (marker) *marker = m;
    return true;
}

// whether a line ends an open paragraph instead of continuing it
static bool interrupts_paragraph(const std::string& line) {
    if (is_blank(line)) return true;
    if (leading_spaces(line) >= 4) return false;
    if (is_fence_open(line, nullptr)) return true;
    if (atx_heading_level(line, nullptr)) return true;
    if (is_thematic_break(line)) return true;
    if (is_blockquote_start(line)) return true;
    ListMarker marker;
    if (parse_list_marker(line, &marker)) {
        return !marker.empty && (!marker.ordered || marker.number == 1);
    }
    return false;
}

// true when the collected lines leave a fenced code block open
static bool ends_in_open_fence(const Lines& lines) {
    bool open = false;
    FenceInfo fence;
    for (const std::string& line : lines) {
        if (open) {
            if (is_fence_close(line, fence)) open = false;
        } else if (is_fence_open(line, &fence)) {
            open = true;
        }
    }
    return open;
}

// whether the last collected line is paragraph text that a lazy line may continue
static bool accepts_lazy_line(const Lines& lines) {
    if (lines.empty()) return false;
    const std::string& last = lines.back();
    if (is_blank(last) || leading_spaces(last) >= 4) return false;
    if (atx_heading_level(last, nullptr) || is_thematic_break(last) || is_fence_open(last, nullptr)) return false;
    return !ends_in_open_fence(lines);
}

static void parse_blocks(Block* parent, const Lines& lines);

static size_t parse_paragraph(Block* parent, const Lines& lines, size_t i) {
    std::string text = trim_left(lines[i]);
    i++;
    while (i < lines.size()) {
        const std::string& line = lines[i];
        if (is_blank(line)) break;
        int level = setext_level(line);
        if (level) {
            std::unique_ptr<Block> heading(new Block(BLOCK_HEADING));
            heading->level = level;
            heading->content = trim(text);
            parent->append(std::move(heading));
            return i + 1;
        }
        if (interrupts_paragraph(line)) break;
        text += '\n';
        text += trim_left(line);
        i++;
    }

    std::unique_ptr<Block> para(new Block(BLOCK_PARAGRAPH));
    para->content = trim_right(text);
    parent->append(std::move(para));
    return i;
}

static size_t parse_fenced_code(Block* parent, const Lines& lines, size_t i, const FenceInfo& fence) {
    std::unique_ptr<Block> code(new Block(BLOCK_CODE));
    code->info = fence.info;
    i++;
    while (i < lines.size()) {
        if (is_fence_close(lines[i], fence)) {
            i++;
            break;
        }
        code->content += strip_indent(lines[i], fence.indent);
        code->content += '\n';
        i++;
    }
    parent->append(std::move(code));
    return i;
}

static size_t parse_indented_code(Block* parent, const Lines& lines, size_t i) {
    Lines body;
    while (i < lines.size() && (is_blank(lines[i]) || leading_spaces(lines[i]) >= 4)) {
        body.push_back(strip_indent(lines[i], 4));
        i++;
    }
    while (!body.empty() && is_blank(body.back())) body.pop_back();

    std::unique_ptr<Block> code(new Block(BLOCK_CODE));
    for (const std::string& line : body) {
        code->content += line;
        code->content += '\n';
    }
    parent->append(std::move(code));
    return i;
}

static size_t parse_blockquote(Block* parent, const Lines& lines, size_t i) {
    Lines inner;
    while (i < lines.size()) {
        const std::string& line = lines[i];
        if (is_blockquote_start(line)) {
            inner.push_back(strip_blockquote_marker(line));
        } else if (!is_blank(line) && !interrupts_paragraph(line) && accepts_lazy_line(inner)) {
            inner.push_back(line);
        } else {
            break;
        }
        i++;
    }

    std::unique_ptr<Block> quote(new Block(BLOCK_QUOTE));
    parse_blocks(quote.get(), inner);
    parent->append(std::move(quote));
    return i;
}

static bool same_list_type(const ListMarker& a, const ListMarker& b) {
    return a.ordered == b.ordered && a.ch == b.ch;
}

static size_t parse_list(Block* parent, const Lines& lines, size_t i) {
    ListMarker first;
    parse_list_marker(lines[i], &first);

    std::unique_ptr<Block> list(new Block(BLOCK_LIST));
    list->ordered = first.ordered;
    list->start = first.number;
    bool tight = true;

    while (i < lines.size()) {
        ListMarker marker;
        if (is_thematic_break(lines[i]) || !parse_list_marker(lines[i], &marker) ||
            !same_list_type(first, marker)) {
            break;
        }

        const std::string& head = lines[i];
        int width = marker.content_offset;
        Lines body;
        body.push_back(marker.empty ? std::string() : head.substr(width));
        i++;

        // an empty item followed by a blank line has no content
        bool closed = marker.empty && i < lines.size() && is_blank(lines[i]);
        while (!closed && i < lines.size()) {
            const std::string& line = lines[i];
            if (is_blank(line)) {
                body.push_back(std::string());
                i++;
                continue;
            }
            if (leading_spaces(line) >= width) {
                body.push_back(line.substr(width));
                i++;
                continue;
            }
            if (is_blank(body.back()) || parse_list_marker(line, nullptr)) break;
            if (!interrupts_paragraph(line) && accepts_lazy_line(body)) {
                body.push_back(trim_left(line));
                i++;
                continue;
            }
            break;
        }

        size_t trailing_blanks = 0;
        while (!body.empty() && is_blank(body.back())) {
            body.pop_back();
            trailing_blanks++;
        }
        bool inner_blank = false;
        for (const std::string& line : body) {
            if (is_blank(line)) inner_blank = true;
        }

        std::unique_ptr<Block> item(new Block(BLOCK_LIST_ITEM));
        parse_blocks(item.get(), body);
        if (inner_blank && item->child_count() > 1) tight = false;

        if (trailing_blanks > 0 && i < lines.size()) {
            ListMarker next;
            if (!is_thematic_break(lines[i]) && parse_list_marker(lines[i], &next) &&
                same_list_type(first, next)) {
                tight = false;
            }
        }
        list->append(std::move(item));
    }

    list->tight = tight;
    log_debug("md: %s list with %zu items (%s)", list->ordered ? "ordered" : "bullet",
        list->child_count(), tight ? "tight" : "loose");
    parent->append(std::move(list));
    return i;
}

static void parse_blocks(Block* parent, const Lines& lines) {
    size_t i = 0;
    while (i < lines.size()) {
        const std::string& line = lines[i];
        if (is_blank(line)) {
            i++;
            continue;
        }
        if (leading_spaces(line) >= 4) {
            i = parse_indented_code(parent, lines, i);
            continue;
        }

        FenceInfo fence;
        if (is_fence_open(line, &fence)) {
            i = parse_fenced_code(parent, lines, i, fence);
            continue;
        }

        std::string text;
        int level = atx_heading_level(line, &text);
        if (level) {
            std::unique_ptr<Block> heading(new Block(BLOCK_HEADING));
            heading->level = level;
            heading->content = text;
            parent->append(std::move(heading));
            i++;
            continue;
        }

        // before list markers: "* * *" is a rule, not a list
        if (is_thematic_break(line)) {
            parent->append(std::unique_ptr<Block>(new Block(BLOCK_THEMATIC_BREAK)));
            i++;
            continue;
        }
        if (is_blockquote_start(line)) {
            i = parse_blockquote(parent, lines, i);
            continue;
        }
        if (parse_list_marker(line, nullptr)) {
            i = parse_list(parent, lines, i);
            continue;
        }
        i = parse_paragraph(parent, lines, i);
    }
}

std::unique_ptr<Block> parse_markdown_blocks(const char* source, size_t len) {
    std::unique_ptr<Block> doc(new Block(BLOCK_DOCUMENT));
    if (!source || !len) return doc;

    Lines lines = split_lines(source, len);
    parse_blocks(doc.get(), lines);
    log_debug("md: parsed %zu lines into %zu top-level blocks", lines.size(), doc->child_count());
    return doc;
}

} // namespace figmark
