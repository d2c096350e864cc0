//
// IR helpers: enum spellings and lookups
//

#include <apigen/ir.hh>

#include <algorithm>
#include <utility>

namespace apigen::ir {

namespace {

template<typename Enum>
using spelling_table = std::vector<std::pair<Enum, const char*>>;

const spelling_table<field_type>& field_type_spellings() {
    static const spelling_table<field_type> table = {
        {field_type::string,   "string"},
        {field_type::text,     "text"},
        {field_type::number,   "number"},
        {field_type::integer,  "integer"},
        {field_type::floating, "float"},
        {field_type::decimal,  "decimal"},
        {field_type::boolean,  "boolean"},
        {field_type::date,     "date"},
        {field_type::email,    "email"},
        {field_type::url,      "url"},
        {field_type::uuid,     "uuid"},
        {field_type::json,     "json"},
    };
    return table;
}

const spelling_table<validation_rule_kind>& rule_kind_spellings() {
    static const spelling_table<validation_rule_kind> table = {
        {validation_rule_kind::min_length, "minLength"},
        {validation_rule_kind::max_length, "maxLength"},
        {validation_rule_kind::min,        "min"},
        {validation_rule_kind::max,        "max"},
        {validation_rule_kind::pattern,    "pattern"},
        {validation_rule_kind::custom,     "custom"},
    };
    return table;
}

const spelling_table<relationship_kind>& relationship_spellings() {
    static const spelling_table<relationship_kind> table = {
        {relationship_kind::one_to_one,   "oneToOne"},
        {relationship_kind::one_to_many,  "oneToMany"},
        {relationship_kind::many_to_many, "manyToMany"},
    };
    return table;
}

const spelling_table<framework>& framework_spellings() {
    static const spelling_table<framework> table = {
        {framework::express, "express"},
        {framework::fastify, "fastify"},
        {framework::koa,     "koa"},
    };
    return table;
}

const spelling_table<database_engine>& database_spellings() {
    static const spelling_table<database_engine> table = {
        {database_engine::postgresql, "postgresql"},
        {database_engine::mysql,      "mysql"},
        {database_engine::mongodb,    "mongodb"},
    };
    return table;
}

const spelling_table<auth_strategy>& auth_spellings() {
    static const spelling_table<auth_strategy> table = {
        {auth_strategy::none,    "none"},
        {auth_strategy::jwt,     "jwt"},
        {auth_strategy::session, "session"},
        {auth_strategy::oauth,   "oauth"},
    };
    return table;
}

const spelling_table<source_language>& language_spellings() {
    static const spelling_table<source_language> table = {
        {source_language::typescript, "typescript"},
        {source_language::javascript, "javascript"},
    };
    return table;
}

template<typename Enum>
std::string spell(const spelling_table<Enum>& table, Enum value) {
    for (const auto& [e, name] : table) {
        if (e == value) {
            return name;
        }
    }
    return "unknown";
}

template<typename Enum>
std::vector<std::string> names_of(const spelling_table<Enum>& table) {
    std::vector<std::string> names;
    names.reserve(table.size());
    for (const auto& entry : table) {
        names.emplace_back(entry.second);
    }
    return names;
}

template<typename Enum>
Enum parse(const spelling_table<Enum>& table, const char* option, std::string_view text) {
    for (const auto& [e, name] : table) {
        if (text == name) {
            return e;
        }
    }
    throw unsupported_option_error(option, std::string(text), names_of(table));
}

} // anonymous namespace

// ============================================================================
// unsupported_option_error
// ============================================================================

unsupported_option_error::unsupported_option_error(const std::string& option,
                                                   const std::string& value,
                                                   const std::vector<std::string>& accepted)
    : std::invalid_argument(build_message(option, value, accepted))
    , option_(option)
    , value_(value)
{
}

std::string unsupported_option_error::build_message(const std::string& option,
                                                    const std::string& value,
                                                    const std::vector<std::string>& accepted) {
    std::string msg = "Unsupported " + option + ": '" + value + "'";
    if (!accepted.empty()) {
        msg += " (supported: ";
        for (size_t i = 0; i < accepted.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += accepted[i];
        }
        msg += ")";
    }
    return msg;
}

// ============================================================================
// Lookups
// ============================================================================

const validation_rule* field::find_rule(validation_rule_kind kind) const {
    auto it = std::find_if(validation.begin(), validation.end(),
        [kind](const validation_rule& r) { return r.kind == kind; });
    return it != validation.end() ? &*it : nullptr;
}

const field* model::find_field(std::string_view field_name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
        [field_name](const field& f) { return f.name == field_name; });
    return it != fields.end() ? &*it : nullptr;
}

std::vector<std::string> auth_config::role_names() const {
    std::vector<std::string> names;
    names.reserve(roles.size());
    for (const auto& r : roles) {
        names.push_back(r.name);
    }
    return names;
}

const generated_file* generated_project::find_file(std::string_view path) const {
    auto it = std::find_if(files.begin(), files.end(),
        [path](const generated_file& f) { return f.path == path; });
    return it != files.end() ? &*it : nullptr;
}

// ============================================================================
// to_string
// ============================================================================

std::string to_string(field_type type)            { return spell(field_type_spellings(), type); }
std::string to_string(validation_rule_kind kind)  { return spell(rule_kind_spellings(), kind); }
std::string to_string(relationship_kind kind)     { return spell(relationship_spellings(), kind); }
std::string to_string(framework fw)               { return spell(framework_spellings(), fw); }
std::string to_string(database_engine db)         { return spell(database_spellings(), db); }
std::string to_string(auth_strategy auth)         { return spell(auth_spellings(), auth); }
std::string to_string(source_language lang)       { return spell(language_spellings(), lang); }

std::string to_string(artifact_kind kind) {
    switch (kind) {
        case artifact_kind::source:        return "source";
        case artifact_kind::config:        return "config";
        case artifact_kind::documentation: return "documentation";
        case artifact_kind::test:          return "test";
    }
    return "unknown";
}

std::string to_string(http_method method) {
    switch (method) {
        case http_method::get:    return "GET";
        case http_method::post:   return "POST";
        case http_method::put:    return "PUT";
        case http_method::patch:  return "PATCH";
        case http_method::del:    return "DELETE";
    }
    return "GET";
}

std::string to_string(endpoint_operation op) {
    switch (op) {
        case endpoint_operation::create:       return "create";
        case endpoint_operation::read:         return "read";
        case endpoint_operation::update:       return "update";
        case endpoint_operation::remove:       return "delete";
        case endpoint_operation::list:         return "list";
        case endpoint_operation::login:        return "login";
        case endpoint_operation::registration: return "register";
    }
    return "unknown";
}

// ============================================================================
// parse_*
// ============================================================================

field_type parse_field_type(std::string_view text) {
    return parse(field_type_spellings(), "field type", text);
}

validation_rule_kind parse_validation_rule_kind(std::string_view text) {
    return parse(rule_kind_spellings(), "validation rule", text);
}

relationship_kind parse_relationship_kind(std::string_view text) {
    return parse(relationship_spellings(), "relationship type", text);
}

framework parse_framework(std::string_view text) {
    return parse(framework_spellings(), "framework", text);
}

database_engine parse_database_engine(std::string_view text) {
    return parse(database_spellings(), "database", text);
}

auth_strategy parse_auth_strategy(std::string_view text) {
    return parse(auth_spellings(), "authentication", text);
}

source_language parse_source_language(std::string_view text) {
    return parse(language_spellings(), "language", text);
}

std::vector<std::string> framework_names()       { return names_of(framework_spellings()); }
std::vector<std::string> database_engine_names() { return names_of(database_spellings()); }
std::vector<std::string> auth_strategy_names()   { return names_of(auth_spellings()); }
std::vector<std::string> source_language_names() { return names_of(language_spellings()); }

} // namespace apigen::ir
