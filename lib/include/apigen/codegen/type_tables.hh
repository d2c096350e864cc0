//
// Field type mapping tables
//
// One declarative row per field type. Every artifact that depends on the
// declared type of a field (records, schemas, validators, tests, API
// description) reads its spelling from here.
//

#pragma once

#include <apigen/ir.hh>

#include <string>

namespace apigen::codegen {

struct field_type_info {
    ir::field_type type;
    const char* ts_type;          ///< TypeScript type
    const char* postgres_column;  ///< PostgreSQL column type
    const char* mysql_column;     ///< MySQL column type
    const char* validator;        ///< express-validator check, without the leading dot
    const char* test_literal;     ///< JavaScript literal used in generated tests
    const char* openapi_type;     ///< OpenAPI schema type
    const char* openapi_format;   ///< OpenAPI format, or nullptr
};

/// Row for a field type (every enumerator has exactly one row)
[[nodiscard]] const field_type_info& type_info(ir::field_type type);

[[nodiscard]] std::string ts_type(ir::field_type type);

/// Column type for a relational engine. MongoDB has no column types and
/// yields an empty string.
[[nodiscard]] std::string column_type(ir::field_type type, ir::database_engine db);

[[nodiscard]] std::string test_literal(ir::field_type type);

/// True for types stored and validated as numbers
[[nodiscard]] bool is_numeric_type(ir::field_type type);

/// True for types stored as text (string-like validators apply)
[[nodiscard]] bool is_textual_type(ir::field_type type);

} // namespace apigen::codegen
