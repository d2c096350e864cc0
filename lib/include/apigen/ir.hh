//
// Intermediate Representation (IR) for apigen
//
// Language-agnostic description of a modeled data domain plus the
// generation preferences. The IR is the single source of truth for the
// validator, the code generation service and the packaging service.
//

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace apigen::ir {

// ============================================================================
// Errors
// ============================================================================

/**
 * Thrown when an option or enum spelling is not supported.
 *
 * Raised while decoding input (unknown enum spelling) and by the code
 * generation service before any artifact is produced (option value the
 * selected renderer cannot honor).
 */
class unsupported_option_error : public std::invalid_argument {
public:
    unsupported_option_error(const std::string& option,
                             const std::string& value,
                             const std::vector<std::string>& accepted);

    [[nodiscard]] const std::string& option() const { return option_; }
    [[nodiscard]] const std::string& value() const { return value_; }

private:
    std::string option_;
    std::string value_;

    static std::string build_message(const std::string& option,
                                     const std::string& value,
                                     const std::vector<std::string>& accepted);
};

// ============================================================================
// Fields
// ============================================================================

enum class field_type {
    string, text,
    number, integer, floating, decimal,
    boolean,
    date,
    email, url, uuid,
    json
};

enum class validation_rule_kind {
    min_length,
    max_length,
    min,
    max,
    pattern,
    custom
};

/// A declared validation rule. The value is numeric for bounds and a
/// string for patterns and custom rules.
struct validation_rule {
    validation_rule_kind kind = validation_rule_kind::custom;
    std::variant<std::string, double> value;
    std::optional<std::string> message;

    [[nodiscard]] bool is_numeric() const {
        return std::holds_alternative<double>(value);
    }
    [[nodiscard]] double number() const { return std::get<double>(value); }
    [[nodiscard]] const std::string& text() const { return std::get<std::string>(value); }
};

struct field {
    std::string id;
    std::string name;
    field_type type = field_type::string;
    bool required = false;
    bool unique = false;
    std::optional<std::string> default_value;  ///< Literal text of the default
    std::vector<validation_rule> validation;
    std::optional<std::string> description;

    /// First rule of the given kind, if declared
    [[nodiscard]] const validation_rule* find_rule(validation_rule_kind kind) const;
};

// ============================================================================
// Relationships and Models
// ============================================================================

enum class relationship_kind {
    one_to_one,
    one_to_many,
    many_to_many
};

struct relationship {
    std::string id;
    relationship_kind kind = relationship_kind::one_to_many;
    std::string source_model;
    std::string target_model;
    std::string source_field;
    std::string target_field;
    bool cascade_delete = false;
};

struct model_metadata {
    std::optional<std::string> table_name;
    bool timestamps = true;
    bool soft_delete = false;
    std::optional<std::string> description;
    bool requires_auth = true;
    std::vector<std::string> allowed_roles;
};

struct model {
    std::string id;
    std::string name;
    std::vector<field> fields;
    std::vector<relationship> relationships;
    model_metadata metadata;

    [[nodiscard]] const field* find_field(std::string_view field_name) const;
};

// ============================================================================
// Generation Options
// ============================================================================

enum class framework { express, fastify, koa };

enum class database_engine { postgresql, mysql, mongodb };

enum class auth_strategy { none, jwt, session, oauth };

enum class source_language { typescript, javascript };

struct generation_options {
    framework target_framework = framework::express;
    database_engine database = database_engine::postgresql;
    auth_strategy authentication = auth_strategy::jwt;
    source_language language = source_language::typescript;
    bool include_tests = true;
    bool include_documentation = true;

    [[nodiscard]] bool is_relational() const {
        return database == database_engine::postgresql || database == database_engine::mysql;
    }
    [[nodiscard]] bool has_auth() const { return authentication != auth_strategy::none; }
    [[nodiscard]] bool is_typescript() const { return language == source_language::typescript; }
};

// ============================================================================
// Generated Output
// ============================================================================

enum class artifact_kind { source, config, documentation, test };

/// One generated output file. `path` is relative and uses '/' separators.
struct generated_file {
    std::string path;
    std::string content;
    artifact_kind kind = artifact_kind::source;
    std::string language;  ///< Content-language tag ("typescript", "sql", ...); may be empty
};

enum class http_method { get, post, put, patch, del };

enum class endpoint_operation { create, read, update, remove, list, login, registration };

/// Derived description of one HTTP operation
struct endpoint {
    std::string id;
    std::string path;
    http_method method = http_method::get;
    std::string model_name;
    endpoint_operation operation = endpoint_operation::read;
    bool authenticated = false;
    std::vector<std::string> roles;
    std::string description;
};

struct role {
    std::string name;
    std::vector<std::string> permissions;
};

struct auth_config {
    auth_strategy type = auth_strategy::none;
    std::vector<role> roles;
    std::vector<std::string> protected_routes;

    [[nodiscard]] std::vector<std::string> role_names() const;
};

struct generated_project {
    std::string id;
    std::string name;
    std::vector<model> models;
    std::vector<endpoint> endpoints;
    auth_config auth;
    std::vector<generated_file> files;
    nlohmann::ordered_json api_description;
    generation_options options;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    [[nodiscard]] const generated_file* find_file(std::string_view path) const;
};

// ============================================================================
// Enum Spellings
// ============================================================================
//
// Spellings follow the external JSON format ("oneToMany", "postgresql", ...).
// Every parse_* function throws unsupported_option_error on unknown input.

[[nodiscard]] std::string to_string(field_type type);
[[nodiscard]] std::string to_string(validation_rule_kind kind);
[[nodiscard]] std::string to_string(relationship_kind kind);
[[nodiscard]] std::string to_string(framework fw);
[[nodiscard]] std::string to_string(database_engine db);
[[nodiscard]] std::string to_string(auth_strategy auth);
[[nodiscard]] std::string to_string(source_language lang);
[[nodiscard]] std::string to_string(artifact_kind kind);
[[nodiscard]] std::string to_string(http_method method);
[[nodiscard]] std::string to_string(endpoint_operation op);

[[nodiscard]] field_type parse_field_type(std::string_view text);
[[nodiscard]] validation_rule_kind parse_validation_rule_kind(std::string_view text);
[[nodiscard]] relationship_kind parse_relationship_kind(std::string_view text);
[[nodiscard]] framework parse_framework(std::string_view text);
[[nodiscard]] database_engine parse_database_engine(std::string_view text);
[[nodiscard]] auth_strategy parse_auth_strategy(std::string_view text);
[[nodiscard]] source_language parse_source_language(std::string_view text);

/// Accepted spellings, in declaration order (for help output and errors)
[[nodiscard]] std::vector<std::string> framework_names();
[[nodiscard]] std::vector<std::string> database_engine_names();
[[nodiscard]] std::vector<std::string> auth_strategy_names();
[[nodiscard]] std::vector<std::string> source_language_names();

} // namespace apigen::ir
