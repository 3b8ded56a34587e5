// pipeline.hpp - ordered core rules over a document tree plus render rules

#ifndef FIGMARK_PIPELINE_HPP
#define FIGMARK_PIPELINE_HPP

#include "doc_tree.hpp"
#include "figmark_error.h"
#include "format/format.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace figmark {

// State threaded through the core rules of one parse.
struct CoreState {
    std::string src;
    std::unique_ptr<Block> root;
};

typedef std::function<void(CoreState& state)> CoreRuleFn;

/**
 * MarkdownPipeline - the host parser a plugin hooks into.
 *
 * A parse runs every enabled core rule in order over a fresh CoreState.
 * The built-in chain is "block" (block structure) then "inline" (inline
 * tokens for paragraphs and headings). Plugins add rules with push() or
 * push_after() and override block markup with set_render_rule().
 *
 * Rules and render rules are fixed once parsing starts; parse() and
 * render() do not mutate the pipeline.
 */
class MarkdownPipeline {
public:
    MarkdownPipeline();

    // append a rule at the end of the chain
    FigmarkErrorCode push(const char* name, CoreRuleFn fn);

    /**
     * Insert a rule directly after `anchor`.
     * @return ERR_KEY_NOT_FOUND when anchor is unknown,
     *         ERR_DUPLICATE_DEFINITION when name is already taken
     */
    FigmarkErrorCode push_after(const char* anchor, const char* name, CoreRuleFn fn);

    FigmarkErrorCode disable(const char* name);
    bool has_rule(const char* name) const;
    // names of enabled rules in execution order
    std::vector<std::string> rule_names() const;

    void set_render_rule(BlockKind kind, BlockRenderFn fn);
    const RenderRules& render_rules() const { return render_rules_; }

    std::unique_ptr<Block> parse(const char* source, size_t len) const;
    std::unique_ptr<Block> parse(const std::string& source) const;
    std::string render(const Block& doc) const;

    // parse + render
    std::string render_markdown(const std::string& source) const;

private:
    struct CoreRule {
        std::string name;
        CoreRuleFn fn;
        bool enabled;
    };

    int find_rule(const char* name) const;
    FigmarkErrorCode check_new_rule(const char* name, const CoreRuleFn& fn) const;

    std::vector<CoreRule> rules_;
    RenderRules render_rules_;
};

} // namespace figmark

#endif // FIGMARK_PIPELINE_HPP
