#include <gtest/gtest.h>
#include "../figmark/figure/figure_matcher.hpp"
#include "../lib/log.h"

using namespace figmark;

class FigureMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    PluginConfig config;
    PluginConfig skip_config() const {
        PluginConfig cfg;
        cfg.skip_no_caption = true;
        return cfg;
    }
};

TEST_F(FigureMatcherTest, SingleImageWithCaption) {
    std::vector<InlineToken> tokens = {
        InlineToken::image("a.png", "A"), InlineToken::softbreak(), InlineToken::text("Caption text")};
    std::optional<FigureMatch> match = match_figure(tokens, config);
    ASSERT_TRUE(match.has_value());
    ASSERT_EQ(match->images.size(), 1u);
    EXPECT_EQ(match->images[0].source, "a.png");
    EXPECT_EQ(match->images[0].alt_text, "A");
    ASSERT_TRUE(match->caption.has_value());
    ASSERT_EQ(match->caption->tokens.size(), 1u);
    EXPECT_EQ(match->caption->tokens[0].content, "Caption text");
}

TEST_F(FigureMatcherTest, ImageOnlyDefaultConfig) {
    std::vector<InlineToken> tokens = {InlineToken::image("a.png", "")};
    std::optional<FigureMatch> match = match_figure(tokens, config);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->images.size(), 1u);
    EXPECT_FALSE(match->caption.has_value());
}

TEST_F(FigureMatcherTest, ImageOnlySkipNoCaption) {
    std::vector<InlineToken> tokens = {InlineToken::image("a.png", "")};
    EXPECT_FALSE(match_figure(tokens, skip_config()).has_value());
}

TEST_F(FigureMatcherTest, WhitespaceRemainderIsNoCaption) {
    std::vector<InlineToken> tokens = {
        InlineToken::image("a.png", ""), InlineToken::softbreak(), InlineToken::text("   ")};
    std::optional<FigureMatch> match = match_figure(tokens, config);
    ASSERT_TRUE(match.has_value());
    EXPECT_FALSE(match->caption.has_value());
    EXPECT_FALSE(match_figure(tokens, skip_config()).has_value());
}

TEST_F(FigureMatcherTest, CaptionKeepsSkipConfigMatch) {
    std::vector<InlineToken> tokens = {InlineToken::image("a.png", ""), InlineToken::text(" Caption")};
    std::optional<FigureMatch> match = match_figure(tokens, skip_config());
    ASSERT_TRUE(match.has_value());
    ASSERT_TRUE(match->caption.has_value());
    EXPECT_EQ(match->caption->tokens[0].content, "Caption");
}

TEST_F(FigureMatcherTest, MultipleImagesInOrder) {
    std::vector<InlineToken> tokens = {
        InlineToken::image("a", ""), InlineToken::softbreak(),
        InlineToken::image("b", ""), InlineToken::softbreak(),
        InlineToken::image("c", ""), InlineToken::softbreak(),
        InlineToken::text("Group caption")};
    std::optional<FigureMatch> match = match_figure(tokens, config);
    ASSERT_TRUE(match.has_value());
    ASSERT_EQ(match->images.size(), 3u);
    EXPECT_EQ(match->images[0].source, "a");
    EXPECT_EQ(match->images[1].source, "b");
    EXPECT_EQ(match->images[2].source, "c");
    ASSERT_TRUE(match->caption.has_value());
    EXPECT_EQ(match->caption->tokens[0].content, "Group caption");
}

TEST_F(FigureMatcherTest, NonLeadingImage) {
    std::vector<InlineToken> tokens = {InlineToken::text("intro "), InlineToken::image("a.png", "")};
    EXPECT_FALSE(match_figure(tokens, config).has_value());
}

TEST_F(FigureMatcherTest, NoImages) {
    std::vector<InlineToken> tokens = {InlineToken::text("just text")};
    EXPECT_FALSE(match_figure(tokens, config).has_value());
    EXPECT_FALSE(match_figure(std::vector<InlineToken>(), config).has_value());
}

TEST_F(FigureMatcherTest, MalformedImagePassesThrough) {
    std::vector<InlineToken> tokens = {InlineToken::image("", "")};
    std::optional<FigureMatch> match = match_figure(tokens, config);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->images[0].source, "");
}

TEST_F(FigureMatcherTest, TitleIsCopied) {
    std::vector<InlineToken> tokens = {InlineToken::image("a.png", "A", std::string("T"))};
    std::optional<FigureMatch> match = match_figure(tokens, config);
    ASSERT_TRUE(match.has_value());
    ASSERT_TRUE(match->images[0].title.has_value());
    EXPECT_EQ(*match->images[0].title, "T");
}

TEST_F(FigureMatcherTest, FormattedCaptionTokensSurvive) {
    std::vector<InlineToken> tokens = {
        InlineToken::image("a.png", ""), InlineToken::softbreak(),
        InlineToken::text("About "), InlineToken(INLINE_STRONG_OPEN), InlineToken::text("Oscar"),
        InlineToken(INLINE_STRONG_CLOSE), InlineToken::text(" the kitty.")};
    std::optional<FigureMatch> match = match_figure(tokens, config);
    ASSERT_TRUE(match.has_value());
    ASSERT_TRUE(match->caption.has_value());
    ASSERT_EQ(match->caption->tokens.size(), 5u);
    EXPECT_EQ(match->caption->tokens[1].kind, INLINE_STRONG_OPEN);
}

TEST_F(FigureMatcherTest, InputIsNotModified) {
    std::vector<InlineToken> tokens = {InlineToken::image("a.png", ""), InlineToken::text("  cap  ")};
    match_figure(tokens, config);
    EXPECT_EQ(tokens[1].content, "  cap  ");
}

TEST(TrimCaptionTokens, TrimsEdges) {
    std::vector<InlineToken> tokens = {
        InlineToken::softbreak(), InlineToken::text("  a "),
        InlineToken(INLINE_EM_OPEN), InlineToken::text("b"), InlineToken(INLINE_EM_CLOSE),
        InlineToken::text(" c  "), InlineToken::text(" ")};
    std::vector<InlineToken> trimmed = trim_caption_tokens(tokens);
    ASSERT_EQ(trimmed.size(), 5u);
    EXPECT_EQ(trimmed.front().content, "a ");
    EXPECT_EQ(trimmed.back().content, " c");
}

TEST(TrimCaptionTokens, HardBreakAtEdgeIsKept) {
    std::vector<InlineToken> tokens = {
        InlineToken::softbreak(), InlineToken::hardbreak(), InlineToken::image("b.png", "b"),
        InlineToken::hardbreak()};
    std::vector<InlineToken> trimmed = trim_caption_tokens(tokens);
    ASSERT_EQ(trimmed.size(), 3u);
    EXPECT_EQ(trimmed.front().kind, INLINE_HARDBREAK);
    EXPECT_TRUE(trimmed[1].is_image());
    EXPECT_EQ(trimmed.back().kind, INLINE_HARDBREAK);
}

TEST(TrimCaptionTokens, AllWhitespaceBecomesEmpty) {
    std::vector<InlineToken> tokens = {InlineToken::softbreak(), InlineToken::text(" \t")};
    EXPECT_TRUE(trim_caption_tokens(tokens).empty());
}
