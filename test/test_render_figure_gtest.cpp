#include <gtest/gtest.h>
#include "../figmark/figure/render_figure.hpp"
#include "../lib/log.h"

using namespace figmark;

class RenderFigureTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    static ImageDescriptor image(const char* src, const char* alt) {
        ImageDescriptor desc;
        desc.source = src;
        desc.alt_text = alt;
        return desc;
    }

    static std::optional<CaptionSpan> caption(const char* text) {
        return CaptionSpan{{InlineToken::text(text)}};
    }

    static size_t count(const std::string& haystack, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos;
             pos = haystack.find(needle, pos + needle.size())) {
            n++;
        }
        return n;
    }

    PluginConfig config;
};

TEST_F(RenderFigureTest, ImageWithCaption) {
    std::unique_ptr<FigureNode> node = FigureNode::create({image("a.png", "A")}, caption("Caption text"));
    ASSERT_NE(node.get(), nullptr);
    EXPECT_EQ(render_figure_html(*node, config),
              "<figure>\n"
              "<img src=\"a.png\" alt=\"A\" />\n"
              "<figcaption>Caption text</figcaption>\n"
              "</figure>\n");
}

TEST_F(RenderFigureTest, NoCaptionElement) {
    std::unique_ptr<FigureNode> node = FigureNode::create({image("a.png", "")}, std::nullopt);
    ASSERT_NE(node.get(), nullptr);
    std::string html = render_figure_html(*node, config);
    EXPECT_EQ(html, "<figure>\n<img src=\"a.png\" alt=\"\" />\n</figure>\n");
    EXPECT_EQ(html.find("figcaption"), std::string::npos);
}

TEST_F(RenderFigureTest, ImagesInOrder) {
    std::unique_ptr<FigureNode> node = FigureNode::create(
        {image("a", ""), image("b", ""), image("c", "")}, caption("Group caption"));
    ASSERT_NE(node.get(), nullptr);
    std::string html = render_figure_html(*node, config);
    EXPECT_EQ(count(html, "<img"), 3u);
    size_t a = html.find("src=\"a\"");
    size_t b = html.find("src=\"b\"");
    size_t c = html.find("src=\"c\"");
    size_t cap = html.find("<figcaption>");
    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_LT(c, cap);
    EXPECT_EQ(count(html, "<figcaption>"), 1u);
}

TEST_F(RenderFigureTest, ImageLinkWrapsEachImage) {
    config.image_link = true;
    std::unique_ptr<FigureNode> node = FigureNode::create(
        {image("/path/to/cat.jpg", "Cat"), image("b.png", "B")}, caption("Cats"));
    ASSERT_NE(node.get(), nullptr);
    EXPECT_EQ(render_figure_html(*node, config),
              "<figure>\n"
              "<a href=\"/path/to/cat.jpg\"><img src=\"/path/to/cat.jpg\" alt=\"Cat\" /></a>\n"
              "<a href=\"b.png\"><img src=\"b.png\" alt=\"B\" /></a>\n"
              "<figcaption>Cats</figcaption>\n"
              "</figure>\n");
}

TEST_F(RenderFigureTest, TitleAndEscaping) {
    ImageDescriptor desc = image("my pic.png", "A \"quoted\" <alt>");
    desc.title = std::string("T & T");
    std::unique_ptr<FigureNode> node = FigureNode::create({desc}, caption("1 < 2"));
    ASSERT_NE(node.get(), nullptr);
    EXPECT_EQ(render_figure_html(*node, config),
              "<figure>\n"
              "<img src=\"my%20pic.png\" alt=\"A &quot;quoted&quot; &lt;alt&gt;\" title=\"T &amp; T\" />\n"
              "<figcaption>1 &lt; 2</figcaption>\n"
              "</figure>\n");
}

TEST_F(RenderFigureTest, FormattedCaption) {
    CaptionSpan span;
    span.tokens = {InlineToken::text("About "), InlineToken(INLINE_STRONG_OPEN), InlineToken::text("Oscar"),
                   InlineToken(INLINE_STRONG_CLOSE)};
    std::unique_ptr<FigureNode> node = FigureNode::create({image("a.png", "")}, span);
    ASSERT_NE(node.get(), nullptr);
    std::string html = render_figure_html(*node, config);
    EXPECT_NE(html.find("<figcaption>About <strong>Oscar</strong></figcaption>"), std::string::npos);
}

TEST_F(RenderFigureTest, CustomInlineRenderer) {
    std::unique_ptr<FigureNode> node = FigureNode::create({image("a.png", "")}, caption("ignored"));
    ASSERT_NE(node.get(), nullptr);
    TextHtmlWriter writer;
    render_figure(writer, *node, config, [](HtmlWriter& w, const std::vector<InlineToken>& tokens) {
        w.writeText(tokens.empty() ? "none" : "custom");
    });
    EXPECT_NE(writer.str().find("<figcaption>custom</figcaption>"), std::string::npos);
}

TEST_F(RenderFigureTest, DeterministicOutput) {
    std::unique_ptr<FigureNode> node = FigureNode::create({image("a.png", "A")}, caption("C"));
    ASSERT_NE(node.get(), nullptr);
    EXPECT_EQ(render_figure_html(*node, config), render_figure_html(*node, config));
}
