//
// Naming conventions for generated artifacts
//

#include <apigen/codegen/naming.hh>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace apigen::codegen {

namespace {
    bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
    bool is_lower_or_digit(char c) {
        return std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c));
    }

    // Reserved by PostgreSQL or MySQL; sorted for binary search
    constexpr std::array<std::string_view, 62> SQL_RESERVED = {
        "all", "alter", "and", "any", "as", "asc", "between", "both", "by", "case",
        "check", "column", "constraint", "create", "cross", "current_date", "current_time",
        "current_user", "default", "delete", "desc", "distinct", "drop", "else", "end",
        "exists", "false", "for", "foreign", "from", "grant", "group", "groups", "having",
        "in", "index", "insert", "interval", "into", "is", "join", "key", "like", "limit",
        "not", "null", "offset", "on", "or", "order", "primary", "range", "rank",
        "references", "select", "table", "then", "to", "true", "union", "user", "where"
    };
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string lower_first(const std::string& s) {
    if (s.empty()) return s;
    std::string out = s;
    out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    return out;
}

std::string upper_first(const std::string& s) {
    if (s.empty()) return s;
    std::string out = s;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

std::string snake_case(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 4);
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (is_upper(c)) {
            bool after_word = i > 0 && is_lower_or_digit(s[i - 1]);
            bool acronym_end = i > 0 && is_upper(s[i - 1]) && i + 1 < s.size() &&
                               std::islower(static_cast<unsigned char>(s[i + 1]));
            if (after_word || acronym_end) {
                out += '_';
            }
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            out += c;
        }
    }
    return out;
}

bool is_sql_reserved(const std::string& word) {
    return std::binary_search(SQL_RESERVED.begin(), SQL_RESERVED.end(), std::string_view(to_lower(word)));
}

std::string column_name(const std::string& field_name, ir::database_engine db) {
    std::string column = snake_case(field_name);
    if (!is_sql_reserved(column)) {
        return column;
    }
    const char quote = db == ir::database_engine::mysql ? '`' : '"';
    return quote + column + quote;
}

std::string table_name(const ir::model& m) {
    if (m.metadata.table_name && !m.metadata.table_name->empty()) {
        return *m.metadata.table_name;
    }
    return to_lower(m.name) + "s";
}

std::string route_segment(const ir::model& m) {
    return to_lower(m.name);
}

std::string js_string(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        switch (c) {
            case '\'': out += "\\'"; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default:   out += c;
        }
    }
    return out + "'";
}

std::string sql_string(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += '\'';
        out += c;
    }
    return out + "'";
}

std::string single_line(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += (c == '\n' || c == '\r') ? ' ' : c;
    }
    return out;
}

} // namespace apigen::codegen
