#ifndef FIGMARK_HTML_WRITER_HPP
#define FIGMARK_HTML_WRITER_HPP

#include "../../lib/strbuf.h"
#include <string>
#include <vector>

namespace figmark {

// Output sink for the block and figure renderers.
//
// A start tag stays open after openTag()/writeSelfClosingTag() so that
// writeAttribute() can add to it; anything else written finishes it.
class HtmlWriter {
public:
    virtual ~HtmlWriter() = default;

    virtual void openTag(const char* tag, const char* classes = nullptr) = 0;
    // nullptr or "" closes the innermost open element
    virtual void closeTag(const char* tag) = 0;
    virtual void writeSelfClosingTag(const char* tag) = 0;
    virtual void writeAttribute(const char* name, const char* value) = 0;

    // len 0 means NUL-terminated
    virtual void writeText(const char* text, size_t len = 0) = 0;
    virtual void writeRawHtml(const char* html) = 0;
    virtual void newline() = 0;

    virtual bool isTagOpen(const char* tag) const = 0;

    virtual const char* getHtml() = 0;
    virtual size_t length() = 0;
};

// HtmlWriter producing XHTML-style markup in a StrBuf.
class TextHtmlWriter : public HtmlWriter {
public:
    TextHtmlWriter();
    ~TextHtmlWriter() override;

    TextHtmlWriter(const TextHtmlWriter&) = delete;
    TextHtmlWriter& operator=(const TextHtmlWriter&) = delete;

    void openTag(const char* tag, const char* classes = nullptr) override;
    void closeTag(const char* tag) override;
    void writeSelfClosingTag(const char* tag) override;
    void writeAttribute(const char* name, const char* value) override;
    void writeText(const char* text, size_t len = 0) override;
    void writeRawHtml(const char* html) override;
    void newline() override;
    bool isTagOpen(const char* tag) const override;

    const char* getHtml() override;
    size_t length() override;

    std::string str();
    int openTagCount() const { return (int)open_elements_.size(); }

private:
    enum PendingTag { PENDING_NONE, PENDING_ELEMENT, PENDING_VOID };

    void beginStartTag(const char* tag, PendingTag kind);
    void finishStartTag();
    bool popElement(const char* tag, std::string* closed);

    StrBuf* out_;
    PendingTag pending_;
    std::vector<std::string> open_elements_;
};

} // namespace figmark

#endif // FIGMARK_HTML_WRITER_HPP
