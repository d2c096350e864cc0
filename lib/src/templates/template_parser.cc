//
// Template parser
//
// Single left-to-right scan over "{{ ... }}" tokens with an explicit stack
// of open blocks. Closing tags that do not match the innermost open block
// are literal text; blocks still open at the end are unwound back into
// literal text (their opening tag followed by their body).
//

#include <apigen/template_engine.hh>

#include <cctype>
#include <string_view>

namespace apigen::tmpl {

namespace {
    enum class frame_kind { root, if_block, each_block };

    struct frame {
        frame_kind kind = frame_kind::root;
        std::string operand;
        std::string open_raw;
        std::vector<ast::node> body;
    };

    bool is_word_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    bool is_identifier(std::string_view s) {
        if (s.empty()) {
            return false;
        }
        for (char c : s) {
            if (!is_word_char(c)) {
                return false;
            }
        }
        return true;
    }

    /// Split "a.b.c" into segments; empty result if any segment is not an identifier
    std::vector<std::string> split_path(std::string_view s) {
        std::vector<std::string> segments;
        size_t start = 0;
        while (true) {
            size_t dot = s.find('.', start);
            std::string_view seg = s.substr(start, dot == std::string_view::npos ? s.npos : dot - start);
            if (!is_identifier(seg)) {
                return {};
            }
            segments.emplace_back(seg);
            if (dot == std::string_view::npos) {
                break;
            }
            start = dot + 1;
        }
        return segments;
    }

    /// Match "<keyword><ws>+<identifier>"; returns the identifier or empty
    std::string block_operand(std::string_view inner, std::string_view keyword) {
        if (inner.substr(0, keyword.size()) != keyword) {
            return {};
        }
        std::string_view rest = inner.substr(keyword.size());
        size_t ws = 0;
        while (ws < rest.size() && std::isspace(static_cast<unsigned char>(rest[ws]))) {
            ++ws;
        }
        if (ws == 0) {
            return {};
        }
        rest = rest.substr(ws);
        return is_identifier(rest) ? std::string(rest) : std::string();
    }

    void append_text(std::vector<ast::node>& nodes, std::string_view text) {
        if (text.empty()) {
            return;
        }
        if (!nodes.empty()) {
            if (auto* prev = std::get_if<ast::text_node>(&nodes.back().value)) {
                prev->text.append(text);
                return;
            }
        }
        nodes.push_back(ast::node{ast::text_node{std::string(text)}});
    }

    void append_node(std::vector<ast::node>& nodes, ast::node&& n) {
        if (auto* text = std::get_if<ast::text_node>(&n.value)) {
            append_text(nodes, text->text);
            return;
        }
        nodes.push_back(std::move(n));
    }

    class template_parser {
    public:
        explicit template_parser(const std::string& text) : text_(text) {
            stack_.emplace_back();
        }

        ast::document run() {
            size_t pos = 0;
            while (pos < text_.size()) {
                size_t open = text_.find("{{", pos);
                if (open == std::string::npos) {
                    append_text(top(), std::string_view(text_).substr(pos));
                    break;
                }
                append_text(top(), std::string_view(text_).substr(pos, open - pos));

                size_t close = text_.find("}}", open + 2);
                if (close == std::string::npos) {
                    append_text(top(), std::string_view(text_).substr(open));
                    break;
                }

                std::string_view raw = std::string_view(text_).substr(open, close + 2 - open);
                std::string_view inner = raw.substr(2, raw.size() - 4);
                handle_token(raw, inner);
                pos = close + 2;
            }

            unwind_open_blocks();
            return ast::document{std::move(stack_.front().body)};
        }

    private:
        std::vector<ast::node>& top() { return stack_.back().body; }

        void handle_token(std::string_view raw, std::string_view inner) {
            if (!inner.empty() && inner[0] == '#') {
                if (auto flag = block_operand(inner, "#if"); !flag.empty()) {
                    open_block(frame_kind::if_block, flag, raw);
                    return;
                }
                if (auto list = block_operand(inner, "#each"); !list.empty()) {
                    open_block(frame_kind::each_block, list, raw);
                    return;
                }
            } else if (inner == "/if") {
                if (close_block(frame_kind::if_block)) return;
            } else if (inner == "/each") {
                if (close_block(frame_kind::each_block)) return;
            } else if (is_identifier(inner)) {
                top().push_back(ast::node{ast::variable_node{std::string(inner), std::string(raw)}});
                return;
            } else if (inner.find('.') != std::string_view::npos) {
                auto segments = split_path(inner);
                if (!segments.empty()) {
                    top().push_back(ast::node{ast::path_node{std::move(segments), std::string(raw)}});
                    return;
                }
            }

            append_text(top(), raw);
        }

        void open_block(frame_kind kind, const std::string& operand, std::string_view raw) {
            frame f;
            f.kind = kind;
            f.operand = operand;
            f.open_raw = std::string(raw);
            stack_.push_back(std::move(f));
        }

        bool close_block(frame_kind kind) {
            if (stack_.size() < 2 || stack_.back().kind != kind) {
                return false;
            }
            frame f = std::move(stack_.back());
            stack_.pop_back();

            if (kind == frame_kind::if_block) {
                top().push_back(ast::node{ast::if_node{std::move(f.operand), std::move(f.body)}});
            } else {
                top().push_back(ast::node{ast::each_node{std::move(f.operand), std::move(f.body)}});
            }
            return true;
        }

        void unwind_open_blocks() {
            while (stack_.size() > 1) {
                frame f = std::move(stack_.back());
                stack_.pop_back();

                append_text(top(), f.open_raw);
                for (auto& n : f.body) {
                    append_node(top(), std::move(n));
                }
            }
        }

        const std::string& text_;
        std::vector<frame> stack_;
    };
} // anonymous namespace

ast::document parse_template(const std::string& text) {
    return template_parser(text).run();
}

} // namespace apigen::tmpl
