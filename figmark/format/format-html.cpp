#include "format.h"
#include "html_encoder.hpp"
#include "../../lib/log.h"
#include <stdio.h>
#include <string.h>

namespace figmark {

static void format_block_in(HtmlWriter& writer, const Block& block, const RenderRules* rules, bool tight);

const BlockRenderFn* RenderRules::find(BlockKind kind) const {
    auto it = blocks.find(kind);
    return it == blocks.end() ? nullptr : &it->second;
}

void format_image(HtmlWriter& writer, const std::string& src, const std::string& alt,
                  const std::string* title) {
    std::string url = HtmlEncoder::normalize_url(src);
    writer.writeSelfClosingTag("img");
    writer.writeAttribute("src", url.c_str());
    writer.writeAttribute("alt", alt.c_str());
    if (title) {
        writer.writeAttribute("title", title->c_str());
    }
}

static void write_text(HtmlWriter& writer, const std::string& text) {
    if (!text.empty()) writer.writeText(text.c_str(), text.size());
}

void format_inlines(HtmlWriter& writer, const std::vector<InlineToken>& tokens) {
    for (const InlineToken& token : tokens) {
        switch (token.kind) {
            case INLINE_TEXT:
                write_text(writer, token.content);
                break;
            case INLINE_SOFTBREAK:
                writer.newline();
                break;
            case INLINE_HARDBREAK:
                writer.writeSelfClosingTag("br");
                writer.newline();
                break;
            case INLINE_IMAGE:
                format_image(writer, token.url, token.content, token.title ? &*token.title : nullptr);
                break;
            case INLINE_LINK_OPEN: {
                std::string href = HtmlEncoder::normalize_url(token.url);
                writer.openTag("a");
                writer.writeAttribute("href", href.c_str());
                if (token.title) writer.writeAttribute("title", token.title->c_str());
                break;
            }
            case INLINE_LINK_CLOSE:
                writer.closeTag("a");
                break;
            case INLINE_EM_OPEN:
                writer.openTag("em");
                break;
            case INLINE_EM_CLOSE:
                writer.closeTag("em");
                break;
            case INLINE_STRONG_OPEN:
                writer.openTag("strong");
                break;
            case INLINE_STRONG_CLOSE:
                writer.closeTag("strong");
                break;
            case INLINE_CODE:
                writer.openTag("code");
                write_text(writer, token.content);
                writer.closeTag("code");
                break;
        }
    }
}

static void format_children(HtmlWriter& writer, const Block& block, const RenderRules* rules, bool tight) {
    for (const auto& child : block.children) {
        format_block_in(writer, *child, rules, tight);
    }
}

static void format_code_block(HtmlWriter& writer, const Block& block) {
    // first word of the info string names the language
    std::string lang;
    size_t end = 0;
    while (end < block.info.size() && block.info[end] != ' ' && block.info[end] != '\t') end++;
    lang = block.info.substr(0, end);

    writer.openTag("pre");
    if (lang.empty()) {
        writer.openTag("code");
    } else {
        std::string cls = "language-" + lang;
        writer.openTag("code", cls.c_str());
    }
    write_text(writer, block.content);
    writer.closeTag("code");
    writer.closeTag("pre");
    writer.newline();
}

static void format_list_item(HtmlWriter& writer, const Block& item, const RenderRules* rules, bool tight) {
    writer.openTag("li");
    size_t count = item.children.size();
    for (size_t i = 0; i < count; i++) {
        const Block& child = *item.children[i];
        bool hidden = tight && child.kind == BLOCK_PARAGRAPH;
        if (!hidden && (i == 0 || (tight && item.children[i - 1]->kind == BLOCK_PARAGRAPH))) {
            writer.newline();
        }
        format_block_in(writer, child, rules, tight);
    }
    writer.closeTag("li");
    writer.newline();
}

static void format_block_in(HtmlWriter& writer, const Block& block, const RenderRules* rules, bool tight) {
    if (rules) {
        const BlockRenderFn* custom = rules->find(block.kind);
        if (custom) {
            (*custom)(writer, block);
            return;
        }
    }

    switch (block.kind) {
        case BLOCK_DOCUMENT:
            format_children(writer, block, rules, false);
            break;
        case BLOCK_PARAGRAPH:
            if (tight) {
                format_inlines(writer, block.inlines);
            } else {
                writer.openTag("p");
                format_inlines(writer, block.inlines);
                writer.closeTag("p");
                writer.newline();
            }
            break;
        case BLOCK_HEADING: {
            char tag[8];
            int level = block.level < 1 ? 1 : (block.level > 6 ? 6 : block.level);
            snprintf(tag, sizeof(tag), "h%d", level);
            writer.openTag(tag);
            format_inlines(writer, block.inlines);
            writer.closeTag(tag);
            writer.newline();
            break;
        }
        case BLOCK_CODE:
            format_code_block(writer, block);
            break;
        case BLOCK_QUOTE:
            writer.openTag("blockquote");
            writer.newline();
            format_children(writer, block, rules, false);
            writer.closeTag("blockquote");
            writer.newline();
            break;
        case BLOCK_LIST: {
            const char* tag = block.ordered ? "ol" : "ul";
            writer.openTag(tag);
            if (block.ordered && block.start != 1) {
                char start[16];
                snprintf(start, sizeof(start), "%d", block.start);
                writer.writeAttribute("start", start);
            }
            writer.newline();
            for (const auto& item : block.children) {
                format_list_item(writer, *item, rules, block.tight);
            }
            writer.closeTag(tag);
            writer.newline();
            break;
        }
        case BLOCK_LIST_ITEM:
            format_list_item(writer, block, rules, tight);
            break;
        case BLOCK_THEMATIC_BREAK:
            writer.writeSelfClosingTag("hr");
            writer.newline();
            break;
        case BLOCK_FIGURE:
            log_warn("format_html: no render rule registered for figure blocks, skipped");
            break;
    }
}

void format_block(HtmlWriter& writer, const Block& block, const RenderRules* rules) {
    format_block_in(writer, block, rules, false);
}

std::string format_html(const Block& doc, const RenderRules* rules) {
    TextHtmlWriter writer;
    format_block(writer, doc, rules);
    return writer.str();
}

} // namespace figmark
