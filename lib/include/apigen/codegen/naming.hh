//
// Naming conventions for generated artifacts
//

#pragma once

#include <apigen/ir.hh>

#include <string>

namespace apigen::codegen {

[[nodiscard]] std::string to_lower(const std::string& s);

/// "BlogPost" -> "blogPost"
[[nodiscard]] std::string lower_first(const std::string& s);

/// "admin" -> "Admin"
[[nodiscard]] std::string upper_first(const std::string& s);

/// "lastLoginAt" -> "last_login_at"
[[nodiscard]] std::string snake_case(const std::string& s);

[[nodiscard]] bool is_sql_reserved(const std::string& word);

/// Column for a field: snake_case, wrapped in the engine's identifier
/// quotes (backticks for MySQL) when the name is a reserved word
[[nodiscard]] std::string column_name(const std::string& field_name, ir::database_engine db);

/// Table override from the metadata, else the lower-cased name plus "s"
[[nodiscard]] std::string table_name(const ir::model& m);

/// Route segment and schema file stem: the lower-cased model name
[[nodiscard]] std::string route_segment(const ir::model& m);

/// Single-quoted JavaScript string literal
[[nodiscard]] std::string js_string(const std::string& s);

/// Single-quoted SQL string literal
[[nodiscard]] std::string sql_string(const std::string& s);

/// Collapse line breaks so the text fits on a single comment line
[[nodiscard]] std::string single_line(const std::string& s);

} // namespace apigen::codegen
