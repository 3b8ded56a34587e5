#include "node_builder.hpp"
#include "../../lib/log.h"

namespace figmark {

std::unique_ptr<Block> build_figure_block(FigureMatch match) {
    std::unique_ptr<FigureNode> node = FigureNode::create(std::move(match.images), std::move(match.caption));
    if (!node) return nullptr;

    std::unique_ptr<Block> block(new Block(BLOCK_FIGURE));
    block->figure = std::move(node);
    return block;
}

static void collect_in(Block& parent, const PluginConfig& config,
                       std::vector<FigureRewrite>& out) {
    for (size_t i = 0; i < parent.children.size(); i++) {
        Block* child = parent.children[i].get();
        if (child->kind != BLOCK_PARAGRAPH) {
            collect_in(*child, config, out);
            continue;
        }
        std::optional<FigureMatch> match = match_figure(child->inlines, config);
        if (!match) continue;

        std::unique_ptr<Block> figure = build_figure_block(std::move(*match));
        if (!figure) continue;
        log_debug("figure: %s[%zu] -> figure with %zu image(s)%s", block_kind_name(parent.kind), i,
                  figure->figure->image_count(), figure->figure->has_caption() ? " and caption" : "");
        out.push_back(FigureRewrite{&parent, i, std::move(figure)});
    }
}

std::vector<FigureRewrite> collect_figure_rewrites(Block& root, const PluginConfig& config) {
    std::vector<FigureRewrite> rewrites;
    collect_in(root, config, rewrites);
    return rewrites;
}

size_t apply_figure_rewrites(std::vector<FigureRewrite>& rewrites) {
    size_t applied = 0;
    for (FigureRewrite& rewrite : rewrites) {
        if (!rewrite.parent || !rewrite.figure) continue;
        std::unique_ptr<Block> paragraph = rewrite.parent->replace_child(rewrite.index, std::move(rewrite.figure));
        if (paragraph) applied++;
    }
    rewrites.clear();
    return applied;
}

size_t rewrite_figures(Block& root, const PluginConfig& config) {
    std::vector<FigureRewrite> rewrites = collect_figure_rewrites(root, config);
    size_t count = apply_figure_rewrites(rewrites);
    if (count > 0) {
        log_debug("figure: rewrote %zu paragraph(s)", count);
    }
    return count;
}

} // namespace figmark
