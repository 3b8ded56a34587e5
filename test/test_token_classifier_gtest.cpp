#include <gtest/gtest.h>
#include "../figmark/figure/token_classifier.hpp"

using namespace figmark;

static InlineToken img(const char* src) {
    return InlineToken::image(src, "");
}

static InlineToken text(const char* content) {
    return InlineToken::text(content);
}

TEST(TokenClassifier, EmptyParagraph) {
    std::vector<InlineToken> tokens;
    TokenPartition part = classify_tokens(tokens);
    EXPECT_FALSE(part.has_images());
    EXPECT_EQ(part.image_begin, 0u);
    EXPECT_EQ(part.image_end, 0u);
}

TEST(TokenClassifier, SingleImageWithCaption) {
    std::vector<InlineToken> tokens = {img("a.png"), InlineToken::softbreak(), text("Caption")};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_EQ(part.image_count, 1u);
    EXPECT_EQ(part.image_begin, 0u);
    EXPECT_EQ(part.image_end, 1u);
}

TEST(TokenClassifier, ImagesSeparatedBySoftBreaks) {
    std::vector<InlineToken> tokens = {
        img("a"), InlineToken::softbreak(), img("b"), InlineToken::softbreak(), img("c"),
        InlineToken::softbreak(), text("Group caption")};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_EQ(part.image_count, 3u);
    EXPECT_EQ(part.image_end, 5u);
}

TEST(TokenClassifier, ImagesSeparatedBySpaces) {
    std::vector<InlineToken> tokens = {img("a"), text(" "), img("b")};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_EQ(part.image_count, 2u);
    EXPECT_EQ(part.image_end, 3u);
}

TEST(TokenClassifier, AdjacentImages) {
    std::vector<InlineToken> tokens = {img("a"), img("b"), text("x")};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_EQ(part.image_count, 2u);
    EXPECT_EQ(part.image_end, 2u);
}

TEST(TokenClassifier, LeadingWhitespaceIsSkipped) {
    std::vector<InlineToken> tokens = {text("  "), InlineToken::softbreak(), img("a.png")};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_EQ(part.image_count, 1u);
    EXPECT_EQ(part.image_begin, 2u);
    EXPECT_EQ(part.image_end, 3u);
}

TEST(TokenClassifier, NonLeadingImageIsNoMatch) {
    std::vector<InlineToken> tokens = {text("intro "), img("a.png")};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_FALSE(part.has_images());
    EXPECT_EQ(part.image_begin, part.image_end);
}

TEST(TokenClassifier, ImageAfterTextStaysInRemainder) {
    std::vector<InlineToken> tokens = {img("a"), text(" and "), img("b")};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_EQ(part.image_count, 1u);
    EXPECT_EQ(part.image_end, 1u);
}

TEST(TokenClassifier, HardBreakEndsImageRun) {
    std::vector<InlineToken> tokens = {img("a"), InlineToken::hardbreak(), img("b")};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_EQ(part.image_count, 1u);
    EXPECT_EQ(part.image_end, 1u);
}

TEST(TokenClassifier, TrailingBreakAfterLastImageIsRemainder) {
    std::vector<InlineToken> tokens = {img("a"), InlineToken::softbreak()};
    TokenPartition part = classify_tokens(tokens);
    EXPECT_EQ(part.image_count, 1u);
    EXPECT_EQ(part.image_end, 1u);
}

TEST(TokenClassifier, LinkFirstIsNoMatch) {
    std::vector<InlineToken> tokens = {
        InlineToken::link_open("x"), img("a"), InlineToken(INLINE_LINK_CLOSE)};
    EXPECT_FALSE(classify_tokens(tokens).has_images());
}
