// figure_plugin.hpp - register figure detection and rendering on a pipeline

#ifndef FIGMARK_FIGURE_PLUGIN_HPP
#define FIGMARK_FIGURE_PLUGIN_HPP

#include "figure.hpp"
#include "../pipeline.hpp"

namespace figmark {

/**
 * Install the figure plugin.
 *
 * Adds a core rule "figure" after "inline" that rewrites qualifying
 * paragraphs into FIGURE blocks, and a FIGURE render rule. The config is
 * copied; later changes to the caller's struct have no effect.
 *
 * @return ERR_OK, or the pipeline's error when the rule cannot be added
 *         (e.g. the plugin is already installed)
 */
FigmarkErrorCode figure_plugin(MarkdownPipeline& pipeline, const PluginConfig& config = PluginConfig());

} // namespace figmark

#endif // FIGMARK_FIGURE_PLUGIN_HPP
