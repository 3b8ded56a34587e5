#include "doc_tree.hpp"
#include "figure/figure.hpp"
#include "../lib/log.h"

namespace figmark {

InlineToken InlineToken::text(std::string content) {
    InlineToken token(INLINE_TEXT);
    token.content = std::move(content);
    return token;
}

InlineToken InlineToken::image(std::string src, std::string alt, std::optional<std::string> title) {
    InlineToken token(INLINE_IMAGE);
    token.url = std::move(src);
    token.content = std::move(alt);
    token.title = std::move(title);
    return token;
}

InlineToken InlineToken::link_open(std::string href, std::optional<std::string> title) {
    InlineToken token(INLINE_LINK_OPEN);
    token.url = std::move(href);
    token.title = std::move(title);
    return token;
}

InlineToken InlineToken::code(std::string content) {
    InlineToken token(INLINE_CODE);
    token.content = std::move(content);
    return token;
}

bool InlineToken::is_whitespace() const {
    if (kind == INLINE_SOFTBREAK) return true;
    if (kind != INLINE_TEXT) return false;
    for (char c : content) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') return false;
    }
    return true;
}

const char* inline_kind_name(InlineKind kind) {
    switch (kind) {
        case INLINE_TEXT: return "text";
        case INLINE_SOFTBREAK: return "softbreak";
        case INLINE_HARDBREAK: return "hardbreak";
        case INLINE_IMAGE: return "image";
        case INLINE_LINK_OPEN: return "link_open";
        case INLINE_LINK_CLOSE: return "link_close";
        case INLINE_EM_OPEN: return "em_open";
        case INLINE_EM_CLOSE: return "em_close";
        case INLINE_STRONG_OPEN: return "strong_open";
        case INLINE_STRONG_CLOSE: return "strong_close";
        case INLINE_CODE: return "code_inline";
    }
    return "unknown";
}

std::string inline_plain_text(const std::vector<InlineToken>& tokens) {
    std::string out;
    for (const InlineToken& token : tokens) {
        switch (token.kind) {
            case INLINE_TEXT:
            case INLINE_CODE:
            case INLINE_IMAGE:
                out += token.content;
                break;
            case INLINE_SOFTBREAK:
            case INLINE_HARDBREAK:
                out += '\n';
                break;
            default:
                break;
        }
    }
    return out;
}

const char* block_kind_name(BlockKind kind) {
    switch (kind) {
        case BLOCK_DOCUMENT: return "document";
        case BLOCK_PARAGRAPH: return "paragraph";
        case BLOCK_HEADING: return "heading";
        case BLOCK_CODE: return "code_block";
        case BLOCK_QUOTE: return "blockquote";
        case BLOCK_LIST: return "list";
        case BLOCK_LIST_ITEM: return "list_item";
        case BLOCK_THEMATIC_BREAK: return "hr";
        case BLOCK_FIGURE: return "figure";
    }
    return "unknown";
}

Block::Block(BlockKind k) : kind(k) {}

// out of line: FigureNode is complete here
Block::~Block() = default;

Block* Block::append(std::unique_ptr<Block> child) {
    if (!child) return nullptr;
    children.push_back(std::move(child));
    return children.back().get();
}

Block* Block::child_at(size_t index) const {
    return index < children.size() ? children[index].get() : nullptr;
}

Block* Block::last_child() const {
    return children.empty() ? nullptr : children.back().get();
}

std::unique_ptr<Block> Block::replace_child(size_t index, std::unique_ptr<Block> block) {
    if (!block) {
        log_error("replace_child: null replacement for %s slot %zu", block_kind_name(kind), index);
        return nullptr;
    }
    if (index >= children.size()) {
        log_error("replace_child: index %zu out of range (%zu children)", index, children.size());
        return nullptr;
    }
    std::unique_ptr<Block> previous = std::move(children[index]);
    children[index] = std::move(block);
    return previous;
}

} // namespace figmark
