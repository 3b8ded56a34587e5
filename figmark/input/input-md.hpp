// input-md.hpp - markdown reader: block structure and inline tokens

#ifndef FIGMARK_INPUT_MD_HPP
#define FIGMARK_INPUT_MD_HPP

#include "../doc_tree.hpp"
#include <memory>
#include <string>
#include <vector>

namespace figmark {

/**
 * Block pass. Builds the document tree with paragraphs and headings holding
 * their raw inline source; no inline tokens yet.
 */
std::unique_ptr<Block> parse_markdown_blocks(const char* source, size_t len);

/**
 * Inline pass over one paragraph/heading source: escapes, code spans,
 * images, links, emphasis, soft and hard breaks.
 */
std::vector<InlineToken> parse_inlines(const std::string& text);

// run parse_inlines() for every paragraph and heading under root
void parse_inline_content(Block& root);

} // namespace figmark

#endif // FIGMARK_INPUT_MD_HPP
