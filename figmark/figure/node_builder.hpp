// node_builder.hpp - turn matched paragraphs into figure blocks

#ifndef FIGMARK_NODE_BUILDER_HPP
#define FIGMARK_NODE_BUILDER_HPP

#include "figure_matcher.hpp"
#include <memory>
#include <vector>

namespace figmark {

// A pending paragraph -> figure replacement at parent->children[index].
struct FigureRewrite {
    Block* parent;
    size_t index;
    std::unique_ptr<Block> figure;
};

/**
 * Wrap a match in a FIGURE block. Returns nullptr when the match carries no
 * images (FigureNode::create rejects it).
 */
std::unique_ptr<Block> build_figure_block(FigureMatch match);

/**
 * Walk the tree and build a figure block for every qualifying paragraph.
 * The tree is not modified; rewrites come back in document order.
 */
std::vector<FigureRewrite> collect_figure_rewrites(Block& root, const PluginConfig& config);

/**
 * Splice collected figures into their slots. Each rewrite overwrites exactly
 * one child slot; the replaced paragraphs are dropped.
 * @return number of slots replaced
 */
size_t apply_figure_rewrites(std::vector<FigureRewrite>& rewrites);

// collect + apply in one call; returns the number of figures created
size_t rewrite_figures(Block& root, const PluginConfig& config);

} // namespace figmark

#endif // FIGMARK_NODE_BUILDER_HPP
