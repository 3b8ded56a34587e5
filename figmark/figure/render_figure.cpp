#include "render_figure.hpp"
#include "../format/html_encoder.hpp"
#include "../../lib/log.h"
#include <assert.h>

namespace figmark {

static void render_image(HtmlWriter& writer, const ImageDescriptor& image, bool image_link) {
    const std::string* title = image.title ? &*image.title : nullptr;
    if (image_link) {
        std::string href = HtmlEncoder::normalize_url(image.source);
        writer.openTag("a");
        writer.writeAttribute("href", href.c_str());
        format_image(writer, image.source, image.alt_text, title);
        writer.closeTag("a");
    } else {
        format_image(writer, image.source, image.alt_text, title);
    }
    writer.newline();
}

void render_figure(HtmlWriter& writer, const FigureNode& figure, const PluginConfig& config,
                   const InlineRenderFn& render_inline) {
    // FigureNode::create() never hands out an image-less node
    assert(!figure.images().empty() && "figure without images reached the renderer");
    if (figure.images().empty()) {
        log_error("render_figure: figure without images, nothing rendered");
        return;
    }

    writer.openTag("figure");
    writer.newline();
    for (const ImageDescriptor& image : figure.images()) {
        render_image(writer, image, config.image_link);
    }
    if (figure.has_caption()) {
        writer.openTag("figcaption");
        if (render_inline) {
            render_inline(writer, figure.caption()->tokens);
        } else {
            format_inlines(writer, figure.caption()->tokens);
        }
        writer.closeTag("figcaption");
        writer.newline();
    }
    writer.closeTag("figure");
    writer.newline();
}

std::string render_figure_html(const FigureNode& figure, const PluginConfig& config) {
    TextHtmlWriter writer;
    render_figure(writer, figure, config, format_inlines);
    return writer.str();
}

} // namespace figmark
