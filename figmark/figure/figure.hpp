// figure.hpp - figure node model and plugin configuration

#ifndef FIGMARK_FIGURE_HPP
#define FIGMARK_FIGURE_HPP

#include "../doc_tree.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace figmark {

// Image extracted verbatim from a matched image token.
struct ImageDescriptor {
    std::string source;
    std::string alt_text;
    std::optional<std::string> title;

    static ImageDescriptor from_token(const InlineToken& image);
};

// Trailing non-image content of a matched paragraph. Never empty once it is
// attached to a FigureNode: an empty caption is represented as no caption.
struct CaptionSpan {
    std::vector<InlineToken> tokens;

    bool empty() const { return tokens.empty(); }
};

/**
 * Structured replacement for a qualifying paragraph.
 *
 * MEMORY MODEL:
 * - owned by the FIGURE block occupying the paragraph's former slot
 * - holds deep copies of everything it needs; no references into the
 *   token stream it was built from
 *
 * The only way to obtain one is create(), which rejects an empty image list.
 */
class FigureNode {
public:
    /**
     * Build a figure node.
     *
     * @param images  ordered images, must not be empty
     * @param caption caption tokens; an empty span is stored as absent
     * @return the node, or nullptr when images is empty
     */
    static std::unique_ptr<FigureNode> create(std::vector<ImageDescriptor> images,
                                              std::optional<CaptionSpan> caption);

    const std::vector<ImageDescriptor>& images() const { return images_; }
    size_t image_count() const { return images_.size(); }
    const std::optional<CaptionSpan>& caption() const { return caption_; }
    bool has_caption() const { return caption_.has_value(); }

private:
    FigureNode(std::vector<ImageDescriptor> images, std::optional<CaptionSpan> caption);

    std::vector<ImageDescriptor> images_;
    std::optional<CaptionSpan> caption_;
};

// Options read by both the matcher and the render policy. Supplied once per
// pipeline and never mutated afterwards.
struct PluginConfig {
    bool image_link = false;        // wrap each image in a link to its own source
    bool skip_no_caption = false;   // leave caption-less image paragraphs alone
};

} // namespace figmark

#endif // FIGMARK_FIGURE_HPP
