//
// Template Engine for apigen
//
// A small templating language compiled to an explicit AST and evaluated
// against a typed JSON context.
//
// SYNTAX:
//   {{name}}                  simple interpolation
//   {{a.b.c}}                 property path interpolation
//   {{#if flag}}...{{/if}}    conditional block (no else branch)
//   {{#each list}}...{{/each}} iteration block
//
// SEMANTICS:
//   - Unresolved names and paths are left verbatim in the output.
//   - A missing or non-list `#each` operand removes the block entirely.
//   - Inside `#each` the context is the outer context overlaid by the
//     element's own properties, plus a `this` alias for the element.
//   - Unterminated blocks and malformed tokens are literal text.
//   - Whitespace is preserved exactly as authored.
//

#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace apigen::tmpl {

/// Typed rendering context (null, bool, number, string, list, map)
using context = nlohmann::ordered_json;

// ============================================================================
// Errors
// ============================================================================

class template_not_found_error : public std::runtime_error {
public:
    explicit template_not_found_error(const std::string& name)
        : std::runtime_error("Template '" + name + "' not found"), name_(name) {}

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::string name_;
};

// ============================================================================
// Template AST
// ============================================================================

namespace ast {
    struct node;

    /// Literal text copied to the output
    struct text_node {
        std::string text;
    };

    /// {{name}}
    struct variable_node {
        std::string name;
        std::string raw;  ///< Original token, emitted when unresolved
    };

    /// {{a.b.c}}
    struct path_node {
        std::vector<std::string> segments;
        std::string raw;
    };

    /// {{#if flag}}...{{/if}}
    struct if_node {
        std::string flag;
        std::vector<node> body;
    };

    /// {{#each list}}...{{/each}}
    struct each_node {
        std::string list;
        std::vector<node> body;
    };

    using node_variant = std::variant<
        text_node,
        variable_node,
        path_node,
        if_node,
        each_node
    >;

    struct node {
        node_variant value;
    };

    struct document {
        std::vector<node> nodes;
    };
} // namespace ast

/// Parse template text. Never fails: anything that is not a well-formed
/// token or a terminated block becomes literal text.
[[nodiscard]] ast::document parse_template(const std::string& text);

/// Evaluate a parsed template against a context
[[nodiscard]] std::string evaluate(const ast::document& doc, const context& ctx);

/// JavaScript-style truthiness: null, false, 0 and "" are falsy; lists and
/// maps are always truthy.
[[nodiscard]] bool is_truthy(const context& value);

// ============================================================================
// Template Engine
// ============================================================================

/**
 * Named template table.
 *
 * The table is explicit state owned by the caller: build it once at
 * startup (usually via with_builtin_templates()) and share it read-only.
 * Registration while another thread renders must be synchronized by the
 * caller.
 *
 * Example usage:
 *   auto engine = TemplateEngine::with_builtin_templates();
 *   context ctx = {{"modelName", "User"}};
 *   std::string code = engine.render("express-controller", ctx);
 */
class TemplateEngine {
public:
    TemplateEngine() = default;

    /// Engine preloaded with the built-in artifact templates
    [[nodiscard]] static TemplateEngine with_builtin_templates();

    /// Register or replace a template. The text is parsed immediately.
    void add_template(const std::string& name, const std::string& text);

    [[nodiscard]] bool has_template(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> template_names() const;

    /// Source text of a registered template
    /// @throws template_not_found_error
    [[nodiscard]] const std::string& template_source(const std::string& name) const;

    /// Render a registered template
    /// @throws template_not_found_error for unregistered names
    [[nodiscard]] std::string render(const std::string& name, const context& ctx) const;

    /// Render ad-hoc template text without registering it
    [[nodiscard]] static std::string render_text(const std::string& text, const context& ctx);

private:
    struct compiled_template {
        std::string source;
        ast::document document;
    };

    const compiled_template& lookup(const std::string& name) const;

    std::map<std::string, compiled_template> templates_;
};

/// Install the built-in templates into an engine
void register_builtin_templates(TemplateEngine& engine);

} // namespace apigen::tmpl
