#include "figure_matcher.hpp"
#include "token_classifier.hpp"
#include "../../lib/log.h"
#include <iterator>

namespace figmark {

static bool is_blank_char(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::vector<InlineToken> trim_caption_tokens(std::vector<InlineToken> tokens) {
    size_t begin = 0;
    size_t end = tokens.size();
    while (begin < end && tokens[begin].is_whitespace()) begin++;
    while (end > begin && tokens[end - 1].is_whitespace()) end--;

    std::vector<InlineToken> trimmed(std::make_move_iterator(tokens.begin() + begin),
                                     std::make_move_iterator(tokens.begin() + end));
    if (trimmed.empty()) return trimmed;

    InlineToken& first = trimmed.front();
    if (first.kind == INLINE_TEXT) {
        size_t skip = 0;
        while (skip < first.content.size() && is_blank_char(first.content[skip])) skip++;
        first.content.erase(0, skip);
    }
    InlineToken& last = trimmed.back();
    if (last.kind == INLINE_TEXT) {
        size_t len = last.content.size();
        while (len > 0 && is_blank_char(last.content[len - 1])) len--;
        last.content.resize(len);
    }
    return trimmed;
}

std::optional<FigureMatch> match_figure(const std::vector<InlineToken>& tokens,
                                        const PluginConfig& config) {
    TokenPartition part = classify_tokens(tokens);
    if (!part.has_images()) {
        return std::nullopt;
    }

    FigureMatch match;
    match.images.reserve(part.image_count);
    for (size_t i = part.image_begin; i < part.image_end; i++) {
        if (tokens[i].is_image()) {
            match.images.push_back(ImageDescriptor::from_token(tokens[i]));
        }
    }

    std::vector<InlineToken> remainder(tokens.begin() + part.image_end, tokens.end());
    std::vector<InlineToken> caption = trim_caption_tokens(std::move(remainder));

    if (caption.empty()) {
        if (config.skip_no_caption) {
            log_debug("figure: %zu image(s) without caption, skipped", part.image_count);
            return std::nullopt;
        }
    } else {
        match.caption = CaptionSpan{std::move(caption)};
    }
    return match;
}

} // namespace figmark
