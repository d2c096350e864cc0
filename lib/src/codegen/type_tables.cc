//
// Field type mapping tables
//

#include <apigen/codegen/type_tables.hh>

#include <array>

namespace apigen::codegen {

namespace {
    using ir::field_type;

    // Order follows the enumerator order of ir::field_type
    constexpr std::array<field_type_info, 12> TYPE_TABLE = {{
        {field_type::string,   "string",  "VARCHAR(255)",             "VARCHAR(255)",  "isString()",   "'test string'",                            "string",  nullptr},
        {field_type::text,     "string",  "TEXT",                     "TEXT",          "isString()",   "'test text content'",                      "string",  nullptr},
        {field_type::number,   "number",  "NUMERIC",                  "DOUBLE",        "isNumeric()",  "42",                                       "number",  nullptr},
        {field_type::integer,  "number",  "INTEGER",                  "INT",           "isInt()",      "42",                                       "integer", nullptr},
        {field_type::floating, "number",  "REAL",                     "FLOAT",         "isFloat()",    "42.5",                                     "number",  "float"},
        {field_type::decimal,  "number",  "DECIMAL",                  "DECIMAL(10,2)", "isDecimal()",  "42.99",                                    "number",  "double"},
        {field_type::boolean,  "boolean", "BOOLEAN",                  "BOOLEAN",       "isBoolean()",  "true",                                     "boolean", nullptr},
        {field_type::date,     "Date",    "TIMESTAMP WITH TIME ZONE", "DATETIME",      "isISO8601()",  "'2024-01-01T00:00:00.000Z'",               "string",  "date-time"},
        {field_type::email,    "string",  "VARCHAR(255)",             "VARCHAR(255)",  "isEmail()",    "'test@example.com'",                       "string",  "email"},
        {field_type::url,      "string",  "TEXT",                     "TEXT",          "isURL()",      "'https://example.com'",                    "string",  "uri"},
        {field_type::uuid,     "string",  "UUID",                     "CHAR(36)",      "isUUID()",     "'123e4567-e89b-12d3-a456-426614174000'",   "string",  "uuid"},
        {field_type::json,     "any",     "JSONB",                    "JSON",          "isObject()",   "{ key: 'value' }",                         "object",  nullptr},
    }};
}

const field_type_info& type_info(ir::field_type type) {
    return TYPE_TABLE[static_cast<size_t>(type)];
}

std::string ts_type(ir::field_type type) {
    return type_info(type).ts_type;
}

std::string column_type(ir::field_type type, ir::database_engine db) {
    switch (db) {
        case ir::database_engine::postgresql: return type_info(type).postgres_column;
        case ir::database_engine::mysql:      return type_info(type).mysql_column;
        case ir::database_engine::mongodb:    return {};
    }
    return {};
}

std::string test_literal(ir::field_type type) {
    return type_info(type).test_literal;
}

bool is_numeric_type(ir::field_type type) {
    switch (type) {
        case field_type::number:
        case field_type::integer:
        case field_type::floating:
        case field_type::decimal:
            return true;
        default:
            return false;
    }
}

bool is_textual_type(ir::field_type type) {
    switch (type) {
        case field_type::string:
        case field_type::text:
        case field_type::email:
        case field_type::url:
        case field_type::uuid:
            return true;
        default:
            return false;
    }
}

} // namespace apigen::codegen
