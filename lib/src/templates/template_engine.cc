//
// Template evaluation and the named template table
//

#include <apigen/template_engine.hh>

#include <cmath>
#include <cstdint>
#include <optional>

namespace apigen::tmpl {

namespace {
    const context* lookup_name(const context& ctx, const std::string& name) {
        if (!ctx.is_object()) {
            return nullptr;
        }
        auto it = ctx.find(name);
        return it != ctx.end() ? &*it : nullptr;
    }

    bool is_index(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (c < '0' || c > '9') return false;
        }
        return true;
    }

    const context* lookup_path(const context& ctx, const std::vector<std::string>& segments) {
        const context* current = &ctx;
        for (const auto& seg : segments) {
            if (current->is_object()) {
                current = lookup_name(*current, seg);
            } else if (current->is_array() && is_index(seg)) {
                size_t index = std::stoul(seg);
                current = index < current->size() ? &(*current)[index] : nullptr;
            } else {
                current = nullptr;
            }
            if (!current) {
                return nullptr;
            }
        }
        return current;
    }

    /// Text of a scalar value; lists, maps and null have no text form
    std::optional<std::string> scalar_text(const context& value) {
        switch (value.type()) {
            case context::value_t::string:
                return value.get_ref<const std::string&>();
            case context::value_t::boolean:
                return value.get<bool>() ? "true" : "false";
            case context::value_t::number_integer:
                return std::to_string(value.get<std::int64_t>());
            case context::value_t::number_unsigned:
                return std::to_string(value.get<std::uint64_t>());
            case context::value_t::number_float: {
                double d = value.get<double>();
                if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e15) {
                    return std::to_string(static_cast<long long>(d));
                }
                return value.dump();
            }
            default:
                return std::nullopt;
        }
    }

    class evaluator {
    public:
        explicit evaluator(std::string& out) : out_(out) {}

        void run(const std::vector<ast::node>& nodes, const context& ctx) {
            for (const auto& n : nodes) {
                std::visit([&](const auto& node) { eval(node, ctx); }, n.value);
            }
        }

    private:
        void eval(const ast::text_node& node, const context&) {
            out_ += node.text;
        }

        void eval(const ast::variable_node& node, const context& ctx) {
            emit(lookup_name(ctx, node.name), node.raw);
        }

        void eval(const ast::path_node& node, const context& ctx) {
            emit(lookup_path(ctx, node.segments), node.raw);
        }

        void eval(const ast::if_node& node, const context& ctx) {
            const context* flag = lookup_name(ctx, node.flag);
            if (flag && is_truthy(*flag)) {
                run(node.body, ctx);
            }
        }

        void eval(const ast::each_node& node, const context& ctx) {
            const context* list = lookup_name(ctx, node.list);
            if (!list || !list->is_array()) {
                return;
            }
            for (const auto& element : *list) {
                context item = ctx.is_object() ? ctx : context::object();
                if (element.is_object()) {
                    for (auto it = element.begin(); it != element.end(); ++it) {
                        item[it.key()] = it.value();
                    }
                }
                item["this"] = element;
                run(node.body, item);
            }
        }

        void emit(const context* value, const std::string& raw) {
            if (value) {
                if (auto text = scalar_text(*value)) {
                    out_ += *text;
                    return;
                }
            }
            out_ += raw;
        }

        std::string& out_;
    };
} // anonymous namespace

// ============================================================================
// Evaluation
// ============================================================================

bool is_truthy(const context& value) {
    switch (value.type()) {
        case context::value_t::null:
        case context::value_t::discarded:
            return false;
        case context::value_t::boolean:
            return value.get<bool>();
        case context::value_t::number_integer:
            return value.get<std::int64_t>() != 0;
        case context::value_t::number_unsigned:
            return value.get<std::uint64_t>() != 0;
        case context::value_t::number_float: {
            double d = value.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case context::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;  // arrays, objects, binary
    }
}

std::string evaluate(const ast::document& doc, const context& ctx) {
    std::string out;
    evaluator(out).run(doc.nodes, ctx);
    return out;
}

// ============================================================================
// TemplateEngine
// ============================================================================

TemplateEngine TemplateEngine::with_builtin_templates() {
    TemplateEngine engine;
    register_builtin_templates(engine);
    return engine;
}

void TemplateEngine::add_template(const std::string& name, const std::string& text) {
    templates_[name] = compiled_template{text, parse_template(text)};
}

bool TemplateEngine::has_template(const std::string& name) const {
    return templates_.count(name) > 0;
}

std::vector<std::string> TemplateEngine::template_names() const {
    std::vector<std::string> names;
    names.reserve(templates_.size());
    for (const auto& [name, tpl] : templates_) {
        names.push_back(name);
    }
    return names;
}

const TemplateEngine::compiled_template& TemplateEngine::lookup(const std::string& name) const {
    auto it = templates_.find(name);
    if (it == templates_.end()) {
        throw template_not_found_error(name);
    }
    return it->second;
}

const std::string& TemplateEngine::template_source(const std::string& name) const {
    return lookup(name).source;
}

std::string TemplateEngine::render(const std::string& name, const context& ctx) const {
    return evaluate(lookup(name).document, ctx);
}

std::string TemplateEngine::render_text(const std::string& text, const context& ctx) {
    return evaluate(parse_template(text), ctx);
}

} // namespace apigen::tmpl
