#include "token_classifier.hpp"

namespace figmark {

TokenPartition classify_tokens(const std::vector<InlineToken>& tokens) {
    TokenPartition part;
    size_t count = tokens.size();

    size_t pos = 0;
    while (pos < count && tokens[pos].is_whitespace()) {
        pos++;
    }
    part.image_begin = pos;
    part.image_end = pos;
    if (pos >= count || !tokens[pos].is_image()) {
        return part;  // no leading image
    }

    // images may be separated by soft breaks or blank text, nothing else
    while (pos < count) {
        if (tokens[pos].is_image()) {
            part.image_count++;
            part.image_end = ++pos;
            continue;
        }
        size_t gap = pos;
        while (gap < count && tokens[gap].is_whitespace()) gap++;
        if (gap == pos || gap >= count || !tokens[gap].is_image()) break;
        pos = gap;
    }
    return part;
}

} // namespace figmark
