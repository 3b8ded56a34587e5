// doc_tree.hpp - markdown document tree: blocks owning inline token streams

#ifndef FIGMARK_DOC_TREE_HPP
#define FIGMARK_DOC_TREE_HPP

#include <stddef.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace figmark {

class FigureNode;

enum InlineKind {
    INLINE_TEXT,
    INLINE_SOFTBREAK,
    INLINE_HARDBREAK,
    INLINE_IMAGE,           // url = src, content = alt text
    INLINE_LINK_OPEN,       // url = href
    INLINE_LINK_CLOSE,
    INLINE_EM_OPEN,
    INLINE_EM_CLOSE,
    INLINE_STRONG_OPEN,
    INLINE_STRONG_CLOSE,
    INLINE_CODE,            // content = code span text
};

// A parsed unit of paragraph content. Produced by the inline parser and
// treated as read-only by everything downstream.
struct InlineToken {
    InlineKind kind;
    std::string content;
    std::string url;
    std::optional<std::string> title;

    explicit InlineToken(InlineKind k) : kind(k) {}

    static InlineToken text(std::string content);
    static InlineToken softbreak() { return InlineToken(INLINE_SOFTBREAK); }
    static InlineToken hardbreak() { return InlineToken(INLINE_HARDBREAK); }
    static InlineToken image(std::string src, std::string alt,
                             std::optional<std::string> title = std::nullopt);
    static InlineToken link_open(std::string href,
                                 std::optional<std::string> title = std::nullopt);
    static InlineToken code(std::string content);

    bool is_image() const { return kind == INLINE_IMAGE; }
    // soft break, or a text run made only of spaces/tabs/newlines
    bool is_whitespace() const;
};

const char* inline_kind_name(InlineKind kind);

// flattened text of a token run, as used for image alt attributes
std::string inline_plain_text(const std::vector<InlineToken>& tokens);

enum BlockKind {
    BLOCK_DOCUMENT,
    BLOCK_PARAGRAPH,
    BLOCK_HEADING,
    BLOCK_CODE,
    BLOCK_QUOTE,
    BLOCK_LIST,
    BLOCK_LIST_ITEM,
    BLOCK_THEMATIC_BREAK,
    BLOCK_FIGURE,
};

const char* block_kind_name(BlockKind kind);

/**
 * Block node of the document tree.
 *
 * Children are owned exclusively by their parent. Paragraphs and headings
 * keep their raw source in `content` until the inline pass fills `inlines`;
 * code blocks keep their literal text in `content`. A FIGURE block owns its
 * FigureNode and has no children.
 */
struct Block {
    BlockKind kind;
    int level = 0;              // heading level 1..6
    bool ordered = false;       // list
    int start = 1;              // ordered list start number
    bool tight = true;          // list: render paragraphs without <p>
    std::string info;           // fenced code info string
    std::string content;
    std::vector<InlineToken> inlines;
    std::vector<std::unique_ptr<Block>> children;
    std::unique_ptr<FigureNode> figure;

    explicit Block(BlockKind k);
    ~Block();

    Block(const Block&) = delete;
    Block& operator=(const Block&) = delete;

    Block* append(std::unique_ptr<Block> child);
    size_t child_count() const { return children.size(); }
    Block* child_at(size_t index) const;
    Block* last_child() const;

    /**
     * Replace the child at `index` in place and return the previous occupant.
     * Sibling order, the parent, and every other slot are left untouched, so
     * indices held by a traversal stay valid. Returns nullptr (and leaves the
     * tree unchanged) when index is out of range or block is null.
     */
    std::unique_ptr<Block> replace_child(size_t index, std::unique_ptr<Block> block);
};

} // namespace figmark

#endif // FIGMARK_DOC_TREE_HPP
