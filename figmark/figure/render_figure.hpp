// render_figure.hpp - figure node to <figure> markup

#ifndef FIGMARK_RENDER_FIGURE_HPP
#define FIGMARK_RENDER_FIGURE_HPP

#include "figure.hpp"
#include "../format/format.h"

namespace figmark {

/**
 * Emit the markup for one figure:
 *
 *   <figure>
 *   <img src="a.png" alt="A" />                     one line per image, in order
 *   <a href="a.png"><img src="a.png" alt="A" /></a>  same, with config.image_link
 *   <figcaption>...</figcaption>                    only when a caption is present
 *   </figure>
 *
 * Caption content is written by render_inline; this function only owns the
 * figure/img/a/figcaption structure. Output depends on nothing but
 * (figure, config).
 */
void render_figure(HtmlWriter& writer, const FigureNode& figure, const PluginConfig& config,
                   const InlineRenderFn& render_inline);

// convenience for tests and tools: render into a fresh string with format_inlines
std::string render_figure_html(const FigureNode& figure, const PluginConfig& config);

} // namespace figmark

#endif // FIGMARK_RENDER_FIGURE_HPP
