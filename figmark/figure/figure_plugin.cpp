#include "figure_plugin.hpp"
#include "node_builder.hpp"
#include "plugin_config.hpp"
#include "render_figure.hpp"
#include "../../lib/log.h"

namespace figmark {

FigmarkErrorCode figure_plugin(MarkdownPipeline& pipeline, const PluginConfig& config) {
    PluginConfig cfg = config;

    FigmarkErrorCode rc = pipeline.push_after("inline", "figure", [cfg](CoreState& state) {
        if (!state.root) return;
        size_t count = rewrite_figures(*state.root, cfg);
        log_debug("figure: %zu paragraph(s) rewritten", count);
    });
    if (rc != ERR_OK) {
        log_error("figure plugin: failed to register core rule: %s", err_code_name(rc));
        return rc;
    }

    pipeline.set_render_rule(BLOCK_FIGURE, [cfg](HtmlWriter& writer, const Block& block) {
        if (!block.figure) {
            log_error("figure plugin: FIGURE block without a figure node");
            return;
        }
        render_figure(writer, *block.figure, cfg, format_inlines);
    });

    log_info("figure plugin installed (%s)", plugin_config_to_string(cfg).c_str());
    return ERR_OK;
}

} // namespace figmark
