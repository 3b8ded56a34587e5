#ifndef FIGMARK_FORMAT_H
#define FIGMARK_FORMAT_H

#include "../doc_tree.hpp"
#include "html_writer.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace figmark {

typedef std::function<void(HtmlWriter& writer, const Block& block)> BlockRenderFn;
typedef std::function<void(HtmlWriter& writer, const std::vector<InlineToken>& tokens)> InlineRenderFn;

// Block renderers registered by plugins; they take precedence over the
// built-in markup for their block kind.
struct RenderRules {
    std::map<BlockKind, BlockRenderFn> blocks;

    const BlockRenderFn* find(BlockKind kind) const;
};

// standard inline renderer: text, breaks, images, links, emphasis, code spans
void format_inlines(HtmlWriter& writer, const std::vector<InlineToken>& tokens);

// `<img src=".." alt=".." [title=".."] />`
void format_image(HtmlWriter& writer, const std::string& src, const std::string& alt,
                  const std::string* title);

void format_block(HtmlWriter& writer, const Block& block, const RenderRules* rules = nullptr);

// render a whole document tree to an HTML fragment
std::string format_html(const Block& doc, const RenderRules* rules = nullptr);

} // namespace figmark

#endif // FIGMARK_FORMAT_H
