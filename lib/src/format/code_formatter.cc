//
// Code Formatter Implementation
//

#include <apigen/format.hh>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace apigen::format {

namespace {
    // ========================================================================
    // Line helpers
    // ========================================================================

    std::string normalize_line_endings(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\r') {
                out += '\n';
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
            } else {
                out += text[i];
            }
        }
        return out;
    }

    std::vector<std::string> split_lines(const std::string& text) {
        std::vector<std::string> lines;
        std::string current;
        for (char c : text) {
            if (c == '\n') {
                lines.push_back(std::move(current));
                current.clear();
            } else {
                current += c;
            }
        }
        lines.push_back(std::move(current));
        return lines;
    }

    std::string rtrim(const std::string& s) {
        size_t end = s.find_last_not_of(" \t\f\v");
        return end == std::string::npos ? std::string() : s.substr(0, end + 1);
    }

    std::string ltrim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\f\v");
        return start == std::string::npos ? std::string() : s.substr(start);
    }

    std::string trim(const std::string& s) {
        return ltrim(rtrim(s));
    }

    std::string to_upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    /// Join lines, drop leading blank lines, fold runs of blank lines into
    /// one and end with exactly one newline
    std::string assemble(const std::vector<std::string>& lines) {
        std::string out;
        bool previous_blank = false;
        bool started = false;
        for (const auto& line : lines) {
            const bool blank = line.empty();
            if (blank && (!started || previous_blank)) {
                continue;
            }
            started = true;
            previous_blank = blank;
            out += line;
            out += '\n';
        }
        while (out.size() > 1 && out[out.size() - 1] == '\n' && out[out.size() - 2] == '\n') {
            out.pop_back();
        }
        if (out.empty()) {
            out = "\n";
        }
        return out;
    }

    // ========================================================================
    // Script scanner
    // ========================================================================

    /// State carried across lines while scanning TypeScript/JavaScript
    struct scan_state {
        bool in_template = false;
        bool in_block_comment = false;
    };

    /// Visit every bracket on the line that is code (outside strings,
    /// template literals and comments).
    template<typename Visitor>
    void scan_brackets(const std::string& line, scan_state& state, Visitor&& visit) {
        for (size_t i = 0; i < line.size(); ++i) {
            const char c = line[i];
            if (state.in_block_comment) {
                if (c == '*' && i + 1 < line.size() && line[i + 1] == '/') {
                    state.in_block_comment = false;
                    ++i;
                }
                continue;
            }
            if (state.in_template) {
                if (c == '\\') {
                    ++i;
                } else if (c == '`') {
                    state.in_template = false;
                }
                continue;
            }
            if (c == '/' && i + 1 < line.size()) {
                if (line[i + 1] == '/') {
                    return;
                }
                if (line[i + 1] == '*') {
                    state.in_block_comment = true;
                    ++i;
                    continue;
                }
            }
            if (c == '\'' || c == '"') {
                for (++i; i < line.size() && line[i] != c; ++i) {
                    if (line[i] == '\\') {
                        ++i;
                    }
                }
                continue;
            }
            if (c == '`') {
                state.in_template = true;
                continue;
            }
            if (c == '{' || c == '(' || c == '[' || c == '}' || c == ')' || c == ']') {
                visit(c);
            }
        }
    }

    bool is_opener(char c) { return c == '{' || c == '(' || c == '['; }

    std::string repeat(const std::string& unit, size_t count) {
        std::string out;
        for (size_t i = 0; i < count; ++i) {
            out += unit;
        }
        return out;
    }

    // ========================================================================
    // SQL helpers
    // ========================================================================

    constexpr std::array<const char*, 14> SQL_KEYWORDS = {
        "CREATE", "TABLE", "INSERT", "SELECT", "FROM", "WHERE", "AND",
        "OR", "ORDER", "BY", "GROUP", "HAVING", "LIMIT", "OFFSET"
    };

    template<size_t N>
    bool contains(const std::array<const char*, N>& words, const std::string& word) {
        return std::any_of(words.begin(), words.end(), [&word](const char* w) { return word == w; });
    }

    constexpr std::array<const char*, 7> SQL_STATEMENT_STARTERS = {
        "CREATE", "INSERT", "SELECT", "UPDATE", "DELETE", "DROP", "ALTER"
    };
    constexpr std::array<const char*, 6> SQL_CLAUSES = {
        "FROM", "WHERE", "ORDER", "GROUP", "HAVING", "LIMIT"
    };
    constexpr std::array<const char*, 9> SQL_COMMANDS = {
        "CREATE", "INSERT", "SELECT", "UPDATE", "DELETE", "DROP", "ALTER", "GRANT", "REVOKE"
    };

    bool is_word_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    /// Uppercase the listed keywords outside quotes and line comments
    std::string uppercase_keywords(const std::string& line) {
        std::string out;
        size_t i = 0;
        while (i < line.size()) {
            const char c = line[i];
            if (c == '\'' || c == '"' || c == '`') {
                size_t end = line.find(c, i + 1);
                end = end == std::string::npos ? line.size() : end + 1;
                out += line.substr(i, end - i);
                i = end;
            } else if (c == '-' && i + 1 < line.size() && line[i + 1] == '-') {
                out += line.substr(i);
                break;
            } else if (is_word_char(c)) {
                size_t end = i;
                while (end < line.size() && is_word_char(line[end])) {
                    ++end;
                }
                std::string word = line.substr(i, end - i);
                const std::string upper = to_upper(word);
                out += contains(SQL_KEYWORDS, upper) ? upper : word;
                i = end;
            } else {
                out += c;
                ++i;
            }
        }
        return out;
    }

    std::string first_word(const std::string& text) {
        size_t end = 0;
        while (end < text.size() && is_word_char(text[end])) {
            ++end;
        }
        return to_upper(text.substr(0, end));
    }

    size_t count_dollar_quotes(const std::string& line) {
        size_t count = 0;
        for (size_t pos = line.find("$$"); pos != std::string::npos; pos = line.find("$$", pos + 2)) {
            ++count;
        }
        return count;
    }

    /// Statements split at ';', with comments removed and dollar-quoted
    /// bodies kept intact
    std::vector<std::string> sql_statements(const std::string& code) {
        std::vector<std::string> statements;
        std::string current;
        bool in_dollar = false;
        bool in_quote = false;
        for (size_t i = 0; i < code.size(); ++i) {
            const char c = code[i];
            if (!in_quote && c == '$' && i + 1 < code.size() && code[i + 1] == '$') {
                in_dollar = !in_dollar;
                current += "$$";
                ++i;
                continue;
            }
            if (in_dollar) {
                current += c;
                continue;
            }
            if (c == '\'') {
                in_quote = !in_quote;
                current += c;
                continue;
            }
            if (!in_quote && c == '-' && i + 1 < code.size() && code[i + 1] == '-') {
                while (i < code.size() && code[i] != '\n') {
                    ++i;
                }
                current += '\n';
                continue;
            }
            if (!in_quote && c == '/' && i + 1 < code.size() && code[i + 1] == '*') {
                size_t end = code.find("*/", i + 2);
                i = end == std::string::npos ? code.size() : end + 1;
                current += ' ';
                continue;
            }
            if (!in_quote && c == ';') {
                statements.push_back(trim(current));
                current.clear();
                continue;
            }
            current += c;
        }
        statements.push_back(trim(current));
        statements.erase(std::remove_if(statements.begin(), statements.end(),
                                        [](const std::string& s) {
                                            return s.find_first_not_of(" \t\r\n") == std::string::npos;
                                        }),
                         statements.end());
        return statements;
    }

    bool is_script(const std::string& language) {
        return language == "typescript" || language == "javascript";
    }
}

// ============================================================================
// Options
// ============================================================================

std::string format_options::indent_unit() const {
    if (use_tabs) {
        return "\t";
    }
    return std::string(static_cast<size_t>(std::max(0, indent_size)), ' ');
}

// ============================================================================
// TypeScript / JavaScript
// ============================================================================

std::string format_script(const std::string& code, const format_options& options) {
    const std::string unit = options.indent_unit();
    const auto lines = split_lines(normalize_line_endings(code));

    // Open brackets with the line that opened them; a line opening several
    // brackets adds a single indentation level
    std::vector<std::pair<char, size_t>> open;
    scan_state state;
    std::vector<std::string> out;
    out.reserve(lines.size());

    auto levels = [](const std::vector<std::pair<char, size_t>>& stack, size_t count) {
        size_t distinct = 0;
        for (size_t i = 0; i < count; ++i) {
            if (i == 0 || stack[i].second != stack[i - 1].second) {
                ++distinct;
            }
        }
        return distinct;
    };

    for (size_t n = 0; n < lines.size(); ++n) {
        const std::string& raw = lines[n];

        if (state.in_template) {
            // Inside a multi-line template literal the text is data
            out.push_back(rtrim(raw));
        } else {
            const std::string text = trim(raw);
            if (text.empty()) {
                out.emplace_back();
            } else if (state.in_block_comment) {
                const std::string prefix = text[0] == '*' ? " " : "";
                out.push_back(repeat(unit, levels(open, open.size())) + prefix + text);
            } else {
                size_t leading = 0;
                while (leading < text.size() && !is_opener(text[leading]) &&
                       (text[leading] == '}' || text[leading] == ')' || text[leading] == ']')) {
                    ++leading;
                }
                const size_t kept = open.size() - std::min(leading, open.size());
                size_t level = levels(open, kept);
                if (text[0] == '.' && text.compare(0, 3, "...") != 0) {
                    ++level;
                }
                out.push_back(repeat(unit, level) + text);
            }
        }

        scan_brackets(raw, state, [&open, n](char c) {
            if (is_opener(c)) {
                open.emplace_back(c, n);
            } else if (!open.empty()) {
                open.pop_back();
            }
        });
    }
    return assemble(out);
}

// ============================================================================
// JSON
// ============================================================================

std::string format_json(const std::string& code, const format_options& options) {
    try {
        const auto doc = nlohmann::ordered_json::parse(code);
        if (options.use_tabs) {
            return doc.dump(1, '\t') + "\n";
        }
        return doc.dump(std::max(0, options.indent_size)) + "\n";
    } catch (const nlohmann::json::parse_error&) {
        return code;
    }
}

// ============================================================================
// SQL
// ============================================================================

std::string format_sql(const std::string& code) {
    std::vector<std::string> out;
    bool in_dollar = false;

    for (const auto& raw : split_lines(normalize_line_endings(code))) {
        const std::string text = trim(raw);
        const bool toggles = count_dollar_quotes(raw) % 2 == 1;

        if (in_dollar && !toggles) {
            // Function bodies keep their own layout
            out.push_back(rtrim(raw));
            continue;
        }
        if (toggles) {
            in_dollar = !in_dollar;
        }
        if (text.empty()) {
            out.emplace_back();
            continue;
        }
        if (text.compare(0, 2, "--") == 0) {
            out.push_back(text);
            continue;
        }

        const std::string line = uppercase_keywords(text);
        const std::string word = first_word(line);
        std::string indent = "  ";
        if (contains(SQL_STATEMENT_STARTERS, word)) {
            indent.clear();
        } else if (contains(SQL_CLAUSES, word)) {
            indent = "  ";
        } else if (word == "AND" || word == "OR") {
            indent = "    ";
        }
        out.push_back(indent + line);
    }
    return assemble(out);
}

// ============================================================================
// Markdown
// ============================================================================

std::string format_markdown(const std::string& code) {
    std::vector<std::string> out;
    bool in_fence = false;

    for (const auto& raw : split_lines(normalize_line_endings(code))) {
        std::string line = rtrim(raw);
        if (ltrim(line).compare(0, 3, "```") == 0) {
            in_fence = !in_fence;
            out.push_back(line);
            continue;
        }
        if (!in_fence && !line.empty() && line[0] == '#') {
            size_t hashes = line.find_first_not_of('#');
            if (hashes != std::string::npos && hashes <= 6) {
                const std::string title = ltrim(line.substr(hashes));
                line = line.substr(0, hashes) + " " + title;
            }
        }
        out.push_back(line);
    }
    return assemble(out);
}

// ============================================================================
// Dispatch
// ============================================================================

ir::generated_file format_file(const ir::generated_file& file, const format_options& options) {
    ir::generated_file formatted = file;
    if (is_script(file.language)) {
        formatted.content = format_script(file.content, options);
    } else if (file.language == "json") {
        formatted.content = format_json(file.content, options);
    } else if (file.language == "sql") {
        formatted.content = format_sql(file.content);
    } else if (file.language == "markdown") {
        formatted.content = format_markdown(file.content);
    }
    return formatted;
}

std::vector<ir::generated_file> format_files(const std::vector<ir::generated_file>& files,
                                             const format_options& options) {
    std::vector<ir::generated_file> formatted;
    formatted.reserve(files.size());
    for (const auto& file : files) {
        formatted.push_back(format_file(file, options));
    }
    return formatted;
}

// ============================================================================
// Validation
// ============================================================================

code_validation validate_code(const ir::generated_file& file) {
    code_validation result;

    if (is_script(file.language)) {
        int braces = 0;
        int parens = 0;
        int brackets = 0;
        scan_state state;
        for (const auto& line : split_lines(normalize_line_endings(file.content))) {
            scan_brackets(line, state, [&](char c) {
                switch (c) {
                    case '{': ++braces; break;
                    case '}': --braces; break;
                    case '(': ++parens; break;
                    case ')': --parens; break;
                    case '[': ++brackets; break;
                    case ']': --brackets; break;
                    default: break;
                }
            });
        }
        if (braces != 0) {
            result.errors.emplace_back("Mismatched braces");
        }
        if (parens != 0) {
            result.errors.emplace_back("Mismatched parentheses");
        }
        if (brackets != 0) {
            result.errors.emplace_back("Mismatched brackets");
        }
    } else if (file.language == "json") {
        try {
            (void)nlohmann::json::parse(file.content);
        } catch (const nlohmann::json::parse_error& e) {
            result.errors.emplace_back(std::string("Invalid JSON: ") + e.what());
        }
    } else if (file.language == "sql") {
        for (const auto& statement : sql_statements(file.content)) {
            if (!contains(SQL_COMMANDS, first_word(statement))) {
                result.errors.push_back("Invalid SQL statement: " + statement.substr(0, 50) + "...");
            }
        }
    }

    result.is_valid = result.errors.empty();
    return result;
}

} // namespace apigen::format
