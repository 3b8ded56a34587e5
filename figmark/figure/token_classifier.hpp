// token_classifier.hpp - split a paragraph's inline tokens into leading images and remainder

#ifndef FIGMARK_TOKEN_CLASSIFIER_HPP
#define FIGMARK_TOKEN_CLASSIFIER_HPP

#include "../doc_tree.hpp"
#include <vector>

namespace figmark {

/**
 * Result of classifying one paragraph.
 *
 *   tokens[0 .. image_begin)          leading whitespace, belongs to neither part
 *   tokens[image_begin .. image_end)  images and the breaks between them
 *   tokens[image_end .. size)         remainder (caption candidate)
 *
 * image_end always sits right after the last image, so a break that follows
 * the final image is part of the remainder.
 */
struct TokenPartition {
    size_t image_begin = 0;
    size_t image_end = 0;
    size_t image_count = 0;

    bool has_images() const { return image_count > 0; }
};

/**
 * Classify a paragraph's token stream. Pure: reads tokens, touches nothing.
 * When the first significant token is not an image the partition reports
 * zero images and image_begin == image_end.
 */
TokenPartition classify_tokens(const std::vector<InlineToken>& tokens);

} // namespace figmark

#endif // FIGMARK_TOKEN_CLASSIFIER_HPP
