//
// API Description (OpenAPI 3.0) Generation
//

#include <apigen/codegen.hh>
#include <apigen/codegen/naming.hh>
#include <apigen/codegen/type_tables.hh>

#include <fkYAML/node.hpp>

#include <cstdint>
#include <map>
#include <sstream>

namespace apigen::codegen {

using nlohmann::ordered_json;

namespace {
    // Field names supplied by the record itself
    bool is_reserved_field(const std::string& name) {
        return name == "id" || name == "createdAt" || name == "updatedAt";
    }

    std::string schema_ref(const std::string& name) {
        return "#/components/schemas/" + name;
    }

    ordered_json ref_schema(const std::string& name) {
        return ordered_json{{"$ref", schema_ref(name)}};
    }

    /// Default literal as a typed JSON value where the field type allows it
    ordered_json default_value(const ir::field& f) {
        const std::string& text = *f.default_value;
        if (f.type == ir::field_type::boolean && (text == "true" || text == "false")) {
            return text == "true";
        }
        if (is_numeric_type(f.type) || f.type == ir::field_type::json) {
            auto parsed = ordered_json::parse(text, nullptr, false);
            if (!parsed.is_discarded()) {
                return parsed;
            }
        }
        return text;
    }

    ordered_json field_schema(const ir::field& f) {
        const auto& info = type_info(f.type);
        ordered_json schema = {{"type", info.openapi_type}};
        if (info.openapi_format) {
            schema["format"] = info.openapi_format;
        }
        if (f.description) {
            schema["description"] = *f.description;
        }
        if (f.default_value) {
            schema["default"] = default_value(f);
        }

        for (const auto& rule : f.validation) {
            switch (rule.kind) {
                case ir::validation_rule_kind::min_length:
                    if (rule.is_numeric()) schema["minLength"] = static_cast<std::int64_t>(rule.number());
                    break;
                case ir::validation_rule_kind::max_length:
                    if (rule.is_numeric()) schema["maxLength"] = static_cast<std::int64_t>(rule.number());
                    break;
                case ir::validation_rule_kind::min:
                    if (rule.is_numeric()) schema["minimum"] = rule.number();
                    break;
                case ir::validation_rule_kind::max:
                    if (rule.is_numeric()) schema["maximum"] = rule.number();
                    break;
                case ir::validation_rule_kind::pattern:
                    if (!rule.is_numeric()) schema["pattern"] = rule.text();
                    break;
                case ir::validation_rule_kind::custom:
                    break;
            }
        }
        return schema;
    }

    ordered_json record_schema(const ir::model& m) {
        ordered_json properties = ordered_json::object();
        ordered_json required = ordered_json::array({"id"});

        properties["id"] = {{"type", "string"}, {"format", "uuid"}};
        for (const auto& f : m.fields) {
            if (is_reserved_field(f.name)) continue;
            properties[f.name] = field_schema(f);
            if (f.required) required.push_back(f.name);
        }
        properties["createdAt"] = {{"type", "string"}, {"format", "date-time"}};
        properties["updatedAt"] = {{"type", "string"}, {"format", "date-time"}};
        required.push_back("createdAt");
        required.push_back("updatedAt");

        ordered_json schema = {{"type", "object"}};
        if (m.metadata.description) {
            schema["description"] = *m.metadata.description;
        }
        schema["properties"] = std::move(properties);
        schema["required"] = std::move(required);
        return schema;
    }

    ordered_json input_schema(const ir::model& m, bool with_required) {
        ordered_json properties = ordered_json::object();
        ordered_json required = ordered_json::array();
        for (const auto& f : m.fields) {
            if (is_reserved_field(f.name)) continue;
            properties[f.name] = field_schema(f);
            if (with_required && f.required) required.push_back(f.name);
        }
        ordered_json schema = {{"type", "object"}, {"properties", std::move(properties)}};
        if (!required.empty()) {
            schema["required"] = std::move(required);
        }
        return schema;
    }

    ordered_json envelope_schema(ordered_json data) {
        return ordered_json{
            {"type", "object"},
            {"properties", {
                {"success", {{"type", "boolean"}}},
                {"data", std::move(data)}
            }}
        };
    }

    void add_shared_schemas(ordered_json& schemas, const ir::auth_config& auth) {
        schemas["PaginationInfo"] = {
            {"type", "object"},
            {"properties", {
                {"page", {{"type", "integer"}}},
                {"limit", {{"type", "integer"}}},
                {"total", {{"type", "integer"}}},
                {"pages", {{"type", "integer"}}}
            }}
        };
        schemas["ErrorResponse"] = {
            {"type", "object"},
            {"properties", {
                {"success", {{"type", "boolean"}, {"example", false}}},
                {"message", {{"type", "string"}}},
                {"errors", {{"type", "array"}, {"items", {{"type", "object"}}}}}
            }}
        };

        if (auth.type == ir::auth_strategy::none) {
            return;
        }

        schemas["LoginRequest"] = {
            {"type", "object"},
            {"properties", {
                {"email", {{"type", "string"}, {"format", "email"}}},
                {"password", {{"type", "string"}, {"minLength", 8}}}
            }},
            {"required", {"email", "password"}}
        };
        schemas["RegisterRequest"] = {
            {"type", "object"},
            {"properties", {
                {"email", {{"type", "string"}, {"format", "email"}}},
                {"password", {{"type", "string"}, {"minLength", 8}}},
                {"name", {{"type", "string"}}},
                {"role", {{"type", "string"}, {"enum", auth.role_names()}}}
            }},
            {"required", {"email", "password", "name"}}
        };

        ordered_json user = {
            {"type", "object"},
            {"properties", {
                {"id", {{"type", "string"}, {"format", "uuid"}}},
                {"email", {{"type", "string"}, {"format", "email"}}},
                {"name", {{"type", "string"}}},
                {"role", {{"type", "string"}}}
            }}
        };
        ordered_json data = {{"type", "object"}, {"properties", {{"user", std::move(user)}}}};
        if (auth.type == ir::auth_strategy::jwt) {
            data["properties"]["token"] = {{"type", "string"}};
        }
        ordered_json response = envelope_schema(std::move(data));
        response["properties"]["message"] = {{"type", "string"}};
        schemas["AuthResponse"] = std::move(response);
    }

    ordered_json json_response(const std::string& description, const std::string& schema) {
        return ordered_json{
            {"description", description},
            {"content", {{"application/json", {{"schema", ref_schema(schema)}}}}}
        };
    }

    ordered_json error_response(const std::string& description) {
        return json_response(description, "ErrorResponse");
    }

    /// "/user/:id" -> "/user/{id}"
    std::string openapi_path(const std::string& path) {
        std::string out;
        size_t i = 0;
        while (i < path.size()) {
            if (path[i] == ':') {
                size_t end = path.find('/', i);
                if (end == std::string::npos) end = path.size();
                out += "{" + path.substr(i + 1, end - i - 1) + "}";
                i = end;
            } else {
                out += path[i++];
            }
        }
        return out;
    }

    std::string operation_id(const ir::endpoint& ep) {
        switch (ep.operation) {
            case ir::endpoint_operation::login:        return "login";
            case ir::endpoint_operation::registration: return "register";
            default:
                return ir::to_string(ep.operation) + ep.model_name;
        }
    }

    std::string security_scheme_name(ir::auth_strategy strategy) {
        return strategy == ir::auth_strategy::session ? "sessionAuth" : "bearerAuth";
    }

    ordered_json operation_object(const ir::endpoint& ep, const ir::auth_config& auth) {
        ordered_json op = {
            {"summary", ep.description},
            {"operationId", operation_id(ep)},
            {"tags", ordered_json::array({ep.model_name})}
        };

        if (ep.authenticated) {
            op["security"] = ordered_json::array({{{security_scheme_name(auth.type), ordered_json::array()}}});
        }

        ordered_json parameters = ordered_json::array();
        if (ep.path.find(":id") != std::string::npos) {
            parameters.push_back({
                {"name", "id"},
                {"in", "path"},
                {"required", true},
                {"schema", {{"type", "string"}, {"format", "uuid"}}}
            });
        }
        if (ep.operation == ir::endpoint_operation::list) {
            parameters.push_back({
                {"name", "page"},
                {"in", "query"},
                {"schema", {{"type", "integer"}, {"minimum", 1}, {"default", 1}}}
            });
            parameters.push_back({
                {"name", "limit"},
                {"in", "query"},
                {"schema", {{"type", "integer"}, {"minimum", 1}, {"maximum", 100}, {"default", 10}}}
            });
        }
        if (!parameters.empty()) {
            op["parameters"] = std::move(parameters);
        }

        auto request_body = [](const std::string& schema) {
            return ordered_json{
                {"required", true},
                {"content", {{"application/json", {{"schema", ref_schema(schema)}}}}}
            };
        };

        const std::string& name = ep.model_name;
        ordered_json responses = ordered_json::object();
        switch (ep.operation) {
            case ir::endpoint_operation::create:
                op["requestBody"] = request_body("Create" + name + "Request");
                responses["201"] = json_response(name + " created", name + "Response");
                responses["400"] = error_response("Validation error");
                break;
            case ir::endpoint_operation::read:
                responses["200"] = json_response(name + " found", name + "Response");
                responses["404"] = error_response(name + " not found");
                break;
            case ir::endpoint_operation::update:
                op["requestBody"] = request_body("Update" + name + "Request");
                responses["200"] = json_response(name + " updated", name + "Response");
                responses["400"] = error_response("Validation error");
                responses["404"] = error_response(name + " not found");
                break;
            case ir::endpoint_operation::remove:
                responses["204"] = {{"description", name + " deleted"}};
                responses["404"] = error_response(name + " not found");
                break;
            case ir::endpoint_operation::list:
                responses["200"] = json_response("Paginated " + name + " list", name + "ListResponse");
                break;
            case ir::endpoint_operation::login:
                op["requestBody"] = request_body("LoginRequest");
                responses["200"] = json_response("Authenticated", "AuthResponse");
                responses["400"] = error_response("Validation error");
                responses["401"] = error_response("Invalid credentials");
                break;
            case ir::endpoint_operation::registration:
                op["requestBody"] = request_body("RegisterRequest");
                responses["201"] = json_response("Account created", "AuthResponse");
                responses["400"] = error_response("Validation error");
                responses["409"] = error_response("Email already registered");
                break;
        }
        if (ep.authenticated) {
            responses["401"] = error_response("Authentication required");
            responses["403"] = error_response("Insufficient permissions");
        }
        responses["500"] = error_response("Internal server error");
        op["responses"] = std::move(responses);
        return op;
    }
}

// ============================================================================
// Documents
// ============================================================================

ordered_json minimal_api_description(const std::string& title) {
    return ordered_json{
        {"openapi", "3.0.0"},
        {"info", {{"title", title}, {"version", "1.0.0"}}},
        {"servers", ordered_json::array()},
        {"paths", ordered_json::object()},
        {"components", {
            {"schemas", ordered_json::object()},
            {"securitySchemes", ordered_json::object()}
        }}
    };
}

ordered_json build_api_description(const std::vector<ir::model>& models,
                                   const std::vector<ir::endpoint>& endpoints,
                                   const ir::auth_config& auth) {
    ordered_json doc = {
        {"openapi", "3.0.0"},
        {"info", {
            {"title", "Generated API"},
            {"version", "1.0.0"},
            {"description", "REST API with CRUD endpoints for every data model"}
        }},
        {"servers", ordered_json::array({
            {{"url", "http://localhost:3000"}, {"description", "Development server"}},
            {{"url", "https://api.example.com"}, {"description", "Production server"}}
        })}
    };

    ordered_json tags = ordered_json::array();
    for (const auto& m : models) {
        tags.push_back({{"name", m.name},
                        {"description", m.metadata.description.value_or(m.name + " management")}});
    }
    if (auth.type != ir::auth_strategy::none && !models.empty()) {
        tags.push_back({{"name", "Auth"}, {"description", "Authentication"}});
    }
    doc["tags"] = std::move(tags);

    ordered_json paths = ordered_json::object();
    for (const auto& ep : endpoints) {
        std::string method = to_lower(ir::to_string(ep.method));
        paths[openapi_path(ep.path)][method] = operation_object(ep, auth);
    }
    doc["paths"] = std::move(paths);

    ordered_json schemas = ordered_json::object();
    for (const auto& m : models) {
        schemas[m.name] = record_schema(m);
        schemas["Create" + m.name + "Request"] = input_schema(m, true);
        schemas["Update" + m.name + "Request"] = input_schema(m, false);
        schemas[m.name + "Response"] = envelope_schema(ref_schema(m.name));

        ordered_json list = envelope_schema({{"type", "array"}, {"items", ref_schema(m.name)}});
        list["properties"]["pagination"] = ref_schema("PaginationInfo");
        schemas[m.name + "ListResponse"] = std::move(list);
    }
    add_shared_schemas(schemas, auth);

    ordered_json security = ordered_json::object();
    if (auth.type == ir::auth_strategy::jwt) {
        security["bearerAuth"] = {{"type", "http"}, {"scheme", "bearer"}, {"bearerFormat", "JWT"}};
    } else if (auth.type == ir::auth_strategy::session) {
        security["sessionAuth"] = {{"type", "apiKey"}, {"in", "cookie"}, {"name", "sessionId"}};
    }

    doc["components"] = {{"schemas", std::move(schemas)}, {"securitySchemes", std::move(security)}};
    return doc;
}

// ============================================================================
// YAML Rendering
// ============================================================================

namespace {
    fkyaml::node to_yaml(const ordered_json& value) {
        switch (value.type()) {
            case ordered_json::value_t::object: {
                fkyaml::node mapping = fkyaml::node::mapping();
                for (const auto& [key, child] : value.items()) {
                    mapping[key] = to_yaml(child);
                }
                return mapping;
            }
            case ordered_json::value_t::array: {
                fkyaml::node::sequence_type items;
                for (const auto& child : value) {
                    items.push_back(to_yaml(child));
                }
                return fkyaml::node::sequence(std::move(items));
            }
            case ordered_json::value_t::string:
                return fkyaml::node(value.get<std::string>());
            case ordered_json::value_t::boolean:
                return fkyaml::node(value.get<bool>());
            case ordered_json::value_t::number_integer:
            case ordered_json::value_t::number_unsigned:
                return fkyaml::node(value.get<std::int64_t>());
            case ordered_json::value_t::number_float:
                return fkyaml::node(value.get<double>());
            default:
                return fkyaml::node();
        }
    }
}

std::string api_description_yaml(const ordered_json& description) {
    std::string text = fkyaml::node::serialize(to_yaml(description));
    if (text.empty() || text.back() != '\n') {
        text += '\n';
    }
    return text;
}

// ============================================================================
// Markdown Reference
// ============================================================================

std::string api_reference_markdown(const std::vector<ir::model>& models,
                                   const std::vector<ir::endpoint>& endpoints,
                                   const ir::auth_config& auth) {
    std::ostringstream out;
    out << "# API Reference\n\n";
    out << "Base URL: `http://localhost:3000`\n\n";
    out << "All responses are JSON objects with a `success` flag. Successful responses carry the\n"
           "result in `data`; failures carry a `message` and, for validation failures, `errors`.\n\n";

    out << "## Authentication\n\n";
    switch (auth.type) {
        case ir::auth_strategy::none:
            out << "Authentication is disabled; every endpoint is public.\n\n";
            break;
        case ir::auth_strategy::jwt:
            out << "Obtain a token from `POST /auth/login` and send it as `Authorization: Bearer <token>`.\n\n";
            break;
        case ir::auth_strategy::session:
            out << "`POST /auth/login` starts a session; the session cookie authenticates later requests.\n\n";
            break;
        case ir::auth_strategy::oauth:
            out << "OAuth authentication.\n\n";
            break;
    }
    if (auth.type != ir::auth_strategy::none) {
        out << "| Role | Permissions |\n|------|-------------|\n";
        for (const auto& r : auth.roles) {
            out << "| " << r.name << " | ";
            for (size_t i = 0; i < r.permissions.size(); ++i) {
                out << (i > 0 ? ", " : "") << r.permissions[i];
            }
            out << " |\n";
        }
        out << "\n";
    }

    std::map<std::string, std::vector<const ir::endpoint*>> by_model;
    for (const auto& ep : endpoints) {
        by_model[ep.model_name].push_back(&ep);
    }

    auto write_endpoints = [&out](const std::vector<const ir::endpoint*>& list) {
        out << "| Method | Path | Description | Auth |\n|--------|------|-------------|------|\n";
        for (const auto* ep : list) {
            out << "| " << ir::to_string(ep->method) << " | `" << ep->path << "` | "
                << ep->description << " | ";
            if (!ep->authenticated) {
                out << "public";
            } else {
                for (size_t i = 0; i < ep->roles.size(); ++i) {
                    out << (i > 0 ? ", " : "") << ep->roles[i];
                }
            }
            out << " |\n";
        }
        out << "\n";
    };

    for (const auto& m : models) {
        out << "## " << m.name << "\n\n";
        if (m.metadata.description) {
            out << single_line(*m.metadata.description) << "\n\n";
        }
        if (!m.fields.empty()) {
            out << "| Field | Type | Required | Unique |\n|-------|------|----------|--------|\n";
            for (const auto& f : m.fields) {
                out << "| " << f.name << " | " << ir::to_string(f.type) << " | "
                    << (f.required ? "yes" : "no") << " | " << (f.unique ? "yes" : "no") << " |\n";
            }
            out << "\n";
        }
        write_endpoints(by_model[m.name]);
    }

    if (!by_model["Auth"].empty()) {
        out << "## Auth\n\n";
        write_endpoints(by_model["Auth"]);
    }

    std::string text = out.str();
    while (text.size() > 1 && text[text.size() - 1] == '\n' && text[text.size() - 2] == '\n') {
        text.pop_back();
    }
    return text;
}

} // namespace apigen::codegen
