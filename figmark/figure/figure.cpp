#include "figure.hpp"
#include "../figmark_error.h"
#include "../../lib/log.h"

namespace figmark {

ImageDescriptor ImageDescriptor::from_token(const InlineToken& image) {
    ImageDescriptor desc;
    desc.source = image.url;
    desc.alt_text = image.content;
    desc.title = image.title;
    return desc;
}

FigureNode::FigureNode(std::vector<ImageDescriptor> images, std::optional<CaptionSpan> caption)
    : images_(std::move(images)), caption_(std::move(caption)) {
}

std::unique_ptr<FigureNode> FigureNode::create(std::vector<ImageDescriptor> images,
                                               std::optional<CaptionSpan> caption) {
    if (images.empty()) {
        log_error("FigureNode::create: %s, figure needs at least one image",
                  err_code_message(ERR_EMPTY_COLLECTION));
        return nullptr;
    }
    if (caption && caption->empty()) {
        caption.reset();
    }
    return std::unique_ptr<FigureNode>(new FigureNode(std::move(images), std::move(caption)));
}

} // namespace figmark
