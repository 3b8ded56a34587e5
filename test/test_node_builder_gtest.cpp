#include <gtest/gtest.h>
#include "../figmark/figure/node_builder.hpp"
#include "../lib/log.h"

using namespace figmark;

class NodeBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    static std::unique_ptr<Block> paragraph(std::vector<InlineToken> inlines) {
        std::unique_ptr<Block> block(new Block(BLOCK_PARAGRAPH));
        block->inlines = std::move(inlines);
        return block;
    }

    static std::unique_ptr<Block> figure_paragraph(const char* src, const char* caption) {
        std::vector<InlineToken> inlines = {InlineToken::image(src, "")};
        if (caption) {
            inlines.push_back(InlineToken::softbreak());
            inlines.push_back(InlineToken::text(caption));
        }
        return paragraph(std::move(inlines));
    }

    static std::unique_ptr<Block> text_paragraph(const char* text) {
        return paragraph({InlineToken::text(text)});
    }

    PluginConfig config;
};

TEST_F(NodeBuilderTest, FigureNodeRejectsEmptyImages) {
    EXPECT_EQ(FigureNode::create({}, std::nullopt).get(), nullptr);
    EXPECT_EQ(FigureNode::create({}, CaptionSpan{{InlineToken::text("c")}}).get(), nullptr);
}

TEST_F(NodeBuilderTest, FigureNodeCollapsesEmptyCaption) {
    ImageDescriptor image;
    image.source = "a.png";
    std::unique_ptr<FigureNode> node = FigureNode::create({image}, CaptionSpan());
    ASSERT_NE(node.get(), nullptr);
    EXPECT_FALSE(node->has_caption());
    EXPECT_EQ(node->image_count(), 1u);
}

TEST_F(NodeBuilderTest, BuildFigureBlock) {
    FigureMatch match;
    ImageDescriptor image;
    image.source = "a.png";
    image.alt_text = "A";
    match.images.push_back(image);
    match.caption = CaptionSpan{{InlineToken::text("Caption")}};

    std::unique_ptr<Block> block = build_figure_block(std::move(match));
    ASSERT_NE(block.get(), nullptr);
    EXPECT_EQ(block->kind, BLOCK_FIGURE);
    ASSERT_NE(block->figure.get(), nullptr);
    EXPECT_EQ(block->figure->images()[0].alt_text, "A");
    EXPECT_TRUE(block->figure->has_caption());
    EXPECT_EQ(block->child_count(), 0u);
}

TEST_F(NodeBuilderTest, BuildFigureBlockWithoutImages) {
    EXPECT_EQ(build_figure_block(FigureMatch()).get(), nullptr);
}

TEST_F(NodeBuilderTest, CollectDoesNotMutate) {
    Block doc(BLOCK_DOCUMENT);
    doc.append(figure_paragraph("a.png", "Cap"));
    doc.append(text_paragraph("text"));
    doc.append(figure_paragraph("b.png", nullptr));

    std::vector<FigureRewrite> rewrites = collect_figure_rewrites(doc, config);
    ASSERT_EQ(rewrites.size(), 2u);
    EXPECT_EQ(rewrites[0].parent, &doc);
    EXPECT_EQ(rewrites[0].index, 0u);
    EXPECT_EQ(rewrites[1].index, 2u);
    for (size_t i = 0; i < doc.child_count(); i++) {
        EXPECT_EQ(doc.child_at(i)->kind, BLOCK_PARAGRAPH);
    }
}

TEST_F(NodeBuilderTest, ApplyReplacesSlotsInPlace) {
    Block doc(BLOCK_DOCUMENT);
    doc.append(figure_paragraph("a.png", "Cap"));
    Block* middle = doc.append(text_paragraph("text"));
    doc.append(figure_paragraph("b.png", nullptr));

    std::vector<FigureRewrite> rewrites = collect_figure_rewrites(doc, config);
    EXPECT_EQ(apply_figure_rewrites(rewrites), 2u);
    EXPECT_TRUE(rewrites.empty());

    ASSERT_EQ(doc.child_count(), 3u);
    EXPECT_EQ(doc.child_at(0)->kind, BLOCK_FIGURE);
    EXPECT_EQ(doc.child_at(1), middle);
    EXPECT_EQ(doc.child_at(2)->kind, BLOCK_FIGURE);
    EXPECT_TRUE(doc.child_at(0)->figure->has_caption());
    EXPECT_FALSE(doc.child_at(2)->figure->has_caption());
}

TEST_F(NodeBuilderTest, NestedContainersAreVisited) {
    Block doc(BLOCK_DOCUMENT);
    Block* quote = doc.append(std::unique_ptr<Block>(new Block(BLOCK_QUOTE)));
    quote->append(figure_paragraph("q.png", "In quote"));
    Block* list = doc.append(std::unique_ptr<Block>(new Block(BLOCK_LIST)));
    Block* item = list->append(std::unique_ptr<Block>(new Block(BLOCK_LIST_ITEM)));
    item->append(text_paragraph("intro"));
    item->append(figure_paragraph("l.png", nullptr));

    EXPECT_EQ(rewrite_figures(doc, config), 2u);
    EXPECT_EQ(quote->child_at(0)->kind, BLOCK_FIGURE);
    EXPECT_EQ(item->child_at(0)->kind, BLOCK_PARAGRAPH);
    EXPECT_EQ(item->child_at(1)->kind, BLOCK_FIGURE);
}

TEST_F(NodeBuilderTest, SkipNoCaptionLeavesParagraph) {
    Block doc(BLOCK_DOCUMENT);
    doc.append(figure_paragraph("a.png", nullptr));
    PluginConfig skip;
    skip.skip_no_caption = true;
    EXPECT_EQ(rewrite_figures(doc, skip), 0u);
    EXPECT_EQ(doc.child_at(0)->kind, BLOCK_PARAGRAPH);
}

TEST_F(NodeBuilderTest, RewriteIsIdempotent) {
    Block doc(BLOCK_DOCUMENT);
    doc.append(figure_paragraph("a.png", "Cap"));
    EXPECT_EQ(rewrite_figures(doc, config), 1u);
    EXPECT_EQ(rewrite_figures(doc, config), 0u);
    EXPECT_EQ(doc.child_at(0)->kind, BLOCK_FIGURE);
}

TEST_F(NodeBuilderTest, StaleRewriteIsIgnored) {
    Block doc(BLOCK_DOCUMENT);
    doc.append(figure_paragraph("a.png", "Cap"));
    std::vector<FigureRewrite> rewrites = collect_figure_rewrites(doc, config);
    ASSERT_EQ(rewrites.size(), 1u);
    rewrites[0].index = 7;
    EXPECT_EQ(apply_figure_rewrites(rewrites), 0u);
    EXPECT_EQ(doc.child_at(0)->kind, BLOCK_PARAGRAPH);
}
