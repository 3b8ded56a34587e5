#include "pipeline.hpp"
#include "input/input-md.hpp"
#include "../lib/log.h"
#include <string.h>

namespace figmark {

MarkdownPipeline::MarkdownPipeline() {
    rules_.push_back({"block", [](CoreState& state) {
        state.root = parse_markdown_blocks(state.src.c_str(), state.src.size());
    }, true});
    rules_.push_back({"inline", [](CoreState& state) {
        if (state.root) parse_inline_content(*state.root);
    }, true});
}

int MarkdownPipeline::find_rule(const char* name) const {
    if (!name) return -1;
    for (size_t i = 0; i < rules_.size(); i++) {
        if (rules_[i].name == name) return (int)i;
    }
    return -1;
}

FigmarkErrorCode MarkdownPipeline::check_new_rule(const char* name, const CoreRuleFn& fn) const {
    if (!name || !*name || !fn) {
        log_error("pipeline: rule needs a name and a function");
        return ERR_NULL_REFERENCE;
    }
    if (find_rule(name) >= 0) {
        log_error("pipeline: rule '%s' already registered", name);
        return ERR_DUPLICATE_DEFINITION;
    }
    return ERR_OK;
}

FigmarkErrorCode MarkdownPipeline::push(const char* name, CoreRuleFn fn) {
    FigmarkErrorCode rc = check_new_rule(name, fn);
    if (rc != ERR_OK) return rc;
    rules_.push_back({name, std::move(fn), true});
    log_debug("pipeline: pushed rule '%s'", name);
    return ERR_OK;
}

FigmarkErrorCode MarkdownPipeline::push_after(const char* anchor, const char* name, CoreRuleFn fn) {
    int index = find_rule(anchor);
    if (index < 0) {
        log_error("pipeline: anchor rule '%s' not found", anchor ? anchor : "(null)");
        return ERR_KEY_NOT_FOUND;
    }
    FigmarkErrorCode rc = check_new_rule(name, fn);
    if (rc != ERR_OK) return rc;
    rules_.insert(rules_.begin() + index + 1, CoreRule{name, std::move(fn), true});
    log_debug("pipeline: inserted rule '%s' after '%s'", name, anchor);
    return ERR_OK;
}

FigmarkErrorCode MarkdownPipeline::disable(const char* name) {
    int index = find_rule(name);
    if (index < 0) {
        log_error("pipeline: cannot disable unknown rule '%s'", name ? name : "(null)");
        return ERR_KEY_NOT_FOUND;
    }
    rules_[index].enabled = false;
    return ERR_OK;
}

bool MarkdownPipeline::has_rule(const char* name) const {
    return find_rule(name) >= 0;
}

std::vector<std::string> MarkdownPipeline::rule_names() const {
    std::vector<std::string> names;
    for (const CoreRule& rule : rules_) {
        if (rule.enabled) names.push_back(rule.name);
    }
    return names;
}

void MarkdownPipeline::set_render_rule(BlockKind kind, BlockRenderFn fn) {
    if (!fn) {
        render_rules_.blocks.erase(kind);
        return;
    }
    render_rules_.blocks[kind] = std::move(fn);
}

std::unique_ptr<Block> MarkdownPipeline::parse(const char* source, size_t len) const {
    CoreState state;
    if (source) state.src.assign(source, len);
    for (const CoreRule& rule : rules_) {
        if (!rule.enabled) continue;
        rule.fn(state);
    }
    if (!state.root) {
        // "block" disabled: hand back an empty document
        state.root.reset(new Block(BLOCK_DOCUMENT));
    }
    return std::move(state.root);
}

std::unique_ptr<Block> MarkdownPipeline::parse(const std::string& source) const {
    return parse(source.c_str(), source.size());
}

std::string MarkdownPipeline::render(const Block& doc) const {
    return format_html(doc, &render_rules_);
}

std::string MarkdownPipeline::render_markdown(const std::string& source) const {
    std::unique_ptr<Block> doc = parse(source);
    return render(*doc);
}

} // namespace figmark
