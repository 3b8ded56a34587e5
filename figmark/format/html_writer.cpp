#include "html_writer.hpp"
#include "html_encoder.hpp"
#include "../../lib/log.h"
#include <string.h>

namespace figmark {

TextHtmlWriter::TextHtmlWriter() : out_(strbuf_new()), pending_(PENDING_NONE) {}

TextHtmlWriter::~TextHtmlWriter() {
    strbuf_free(out_);
}

void TextHtmlWriter::beginStartTag(const char* tag, PendingTag kind) {
    finishStartTag();
    strbuf_append_char(out_, '<');
    strbuf_append_str(out_, tag);
    pending_ = kind;
}

void TextHtmlWriter::finishStartTag() {
    switch (pending_) {
    case PENDING_ELEMENT: strbuf_append_char(out_, '>'); break;
    case PENDING_VOID:    strbuf_append_str(out_, " />"); break;
    case PENDING_NONE:    return;
    }
    pending_ = PENDING_NONE;
}

// removes the innermost element named tag (or the innermost element at all
// when tag is empty) from the open list
bool TextHtmlWriter::popElement(const char* tag, std::string* closed) {
    if (!tag || !*tag) {
        if (open_elements_.empty()) return false;
        *closed = open_elements_.back();
        open_elements_.pop_back();
        return true;
    }
    *closed = tag;
    for (size_t i = open_elements_.size(); i > 0; i--) {
        if (open_elements_[i - 1] == tag) {
            open_elements_.erase(open_elements_.begin() + (i - 1));
            return true;
        }
    }
    return false;
}

void TextHtmlWriter::openTag(const char* tag, const char* classes) {
    if (!tag) return;
    beginStartTag(tag, PENDING_ELEMENT);
    open_elements_.emplace_back(tag);
    if (classes && *classes) writeAttribute("class", classes);
}

void TextHtmlWriter::closeTag(const char* tag) {
    finishStartTag();
    std::string name;
    if (!popElement(tag, &name)) {
        if (name.empty()) {
            log_warn("html writer: close requested with no open element");
            return;
        }
        log_warn("html writer: </%s> closes an element that was never opened", name.c_str());
    }
    strbuf_append_format(out_, "</%s>", name.c_str());
}

void TextHtmlWriter::writeSelfClosingTag(const char* tag) {
    if (tag) beginStartTag(tag, PENDING_VOID);
}

void TextHtmlWriter::writeAttribute(const char* name, const char* value) {
    if (!name || pending_ == PENDING_NONE) return;
    strbuf_append_char(out_, ' ');
    strbuf_append_str(out_, name);
    if (!value) return;
    strbuf_append_str(out_, "=\"");
    HtmlEncoder::escape_into(out_, value, ESCAPE_ATTRIBUTE);
    strbuf_append_char(out_, '"');
}

void TextHtmlWriter::writeText(const char* text, size_t len) {
    if (!text) return;
    finishStartTag();
    HtmlEncoder::escape_into(out_, std::string_view(text, len ? len : strlen(text)), ESCAPE_CONTENT);
}

void TextHtmlWriter::writeRawHtml(const char* html) {
    if (!html) return;
    finishStartTag();
    strbuf_append_str(out_, html);
}

void TextHtmlWriter::newline() {
    finishStartTag();
    strbuf_append_char(out_, '\n');
}

bool TextHtmlWriter::isTagOpen(const char* tag) const {
    if (!tag) return false;
    for (const std::string& name : open_elements_) {
        if (name == tag) return true;
    }
    return false;
}

const char* TextHtmlWriter::getHtml() {
    finishStartTag();
    return out_->str;
}

size_t TextHtmlWriter::length() {
    finishStartTag();
    return out_->length;
}

std::string TextHtmlWriter::str() {
    finishStartTag();
    return std::string(out_->str, out_->length);
}

} // namespace figmark
