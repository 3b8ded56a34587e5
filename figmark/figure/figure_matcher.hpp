// figure_matcher.hpp - decide whether a paragraph becomes a figure

#ifndef FIGMARK_FIGURE_MATCHER_HPP
#define FIGMARK_FIGURE_MATCHER_HPP

#include "figure.hpp"
#include <optional>
#include <vector>

namespace figmark {

// Everything the node builder needs, copied out of the paragraph.
struct FigureMatch {
    std::vector<ImageDescriptor> images;    // non-empty
    std::optional<CaptionSpan> caption;     // absent when nothing but whitespace trails
};

/**
 * Match a paragraph's inline tokens against the figure pattern.
 *
 * Returns std::nullopt when the paragraph does not start with an image, or
 * when it has no caption and config.skip_no_caption is set. Malformed images
 * (empty src or alt) are carried through as-is.
 */
std::optional<FigureMatch> match_figure(const std::vector<InlineToken>& tokens,
                                        const PluginConfig& config);

/**
 * Trim whitespace-only tokens off both ends of a caption candidate, then
 * leading blanks of the first text run and trailing blanks of the last one.
 * Returns an empty vector when nothing significant remains.
 */
std::vector<InlineToken> trim_caption_tokens(std::vector<InlineToken> tokens);

} // namespace figmark

#endif // FIGMARK_FIGURE_MATCHER_HPP
