//
// Express Renderer - artifact ordering and account entity
//

#include <apigen/codegen/express/express_renderer.hh>
#include <apigen/codegen/express/express_helpers.hh>
#include <apigen/codegen/naming.hh>

#include <algorithm>

namespace apigen::codegen {

namespace {
    ir::field make_field(const std::string& name, ir::field_type type, bool required,
                         bool unique = false) {
        ir::field f;
        f.id = "account_" + snake_case(name);
        f.name = name;
        f.type = type;
        f.required = required;
        f.unique = unique;
        return f;
    }

    ir::generated_file source_file(const GenerationContext& ctx, const std::string& stem,
                                   std::string content, ir::artifact_kind kind = ir::artifact_kind::source) {
        return {ctx.source_path(stem), std::move(content), kind, ctx.language_tag()};
    }
}

// ============================================================================
// BackendRenderer Interface
// ============================================================================

RendererMetadata ExpressRenderer::get_metadata() const {
    RendererMetadata meta;
    meta.framework = "express";
    meta.description = "Express 4 REST service";
    meta.databases = {ir::database_engine::postgresql, ir::database_engine::mysql,
                      ir::database_engine::mongodb};
    meta.auth_strategies = {ir::auth_strategy::none, ir::auth_strategy::jwt,
                            ir::auth_strategy::session};
    meta.languages = {ir::source_language::typescript, ir::source_language::javascript};
    return meta;
}

std::vector<std::string> ExpressRenderer::required_templates(const ir::generation_options& options) const {
    std::vector<std::string> names;
    if (options.is_typescript()) {
        names = {"record-interface", "express-controller"};
    } else {
        names = {"record-typedef", "express-controller-js"};
    }
    if (options.database == ir::database_engine::postgresql) {
        names.push_back("postgresql-schema");
    } else if (options.database == ir::database_engine::mysql) {
        names.push_back("mysql-schema");
    }
    return names;
}

std::vector<ir::generated_file> ExpressRenderer::render_project(const GenerationContext& ctx) const {
    std::vector<ir::generated_file> files;
    const bool ts = ctx.options.is_typescript();

    // Scaffold
    files.push_back({"package.json", package_json(ctx), ir::artifact_kind::config, "json"});
    if (ts) {
        files.push_back({"tsconfig.json", tsconfig_json(), ir::artifact_kind::config, "json"});
    }
    files.push_back({".env.example", env_example(ctx), ir::artifact_kind::config, ""});
    files.push_back({"README.md", readme(ctx), ir::artifact_kind::documentation, "markdown"});

    // Records and schemas
    for (const auto& m : ctx.models) {
        files.push_back(source_file(ctx, "src/models/" + m.name, record_definition(ctx, m)));
        if (ctx.options.is_relational()) {
            files.push_back({"src/schemas/" + route_segment(m) + ".sql", table_schema(ctx, m),
                             ir::artifact_kind::source, "sql"});
        }
    }
    if (ctx.options.is_relational()) {
        std::string relationships = relationship_schema(ctx);
        if (!relationships.empty()) {
            files.push_back({"src/schemas/relationships.sql", std::move(relationships),
                             ir::artifact_kind::source, "sql"});
        }
    }
    files.push_back(source_file(ctx, "src/database/connection", database_connection(ctx)));

    if (ctx.serves_auth()) {
        render_auth(ctx, files);
    }

    // CRUD layer
    for (const auto& m : ctx.models) {
        const express::model_names names(m);
        files.push_back(source_file(ctx, "src/controllers/" + names.controller, controller(ctx, m)));
        files.push_back(source_file(ctx, "src/services/" + names.service, service(ctx, m)));
        files.push_back(source_file(ctx, "src/repositories/" + names.repository, repository(ctx, m, false)));
        files.push_back(source_file(ctx, "src/routes/" + names.route, routes(ctx, m)));
        files.push_back(source_file(ctx, "src/validation/" + m.name + "Validation", validation(ctx, m)));
        if (ctx.options.include_tests) {
            files.push_back(source_file(ctx, "src/tests/" + names.controller + ".test",
                                        controller_test(ctx, m), ir::artifact_kind::test));
        }
    }

    // Shared middleware and entry point
    files.push_back(source_file(ctx, "src/middleware/cors", cors_middleware(ctx)));
    files.push_back(source_file(ctx, "src/middleware/logging", logging_middleware(ctx)));
    files.push_back(source_file(ctx, "src/middleware/validation", validation_middleware(ctx)));
    files.push_back(source_file(ctx, "src/app", application(ctx)));

    return files;
}

// ============================================================================
// Account Entity
// ============================================================================

std::string ExpressRenderer::account_entity_name(const std::vector<ir::model>& models) {
    auto taken = [&](const std::string& candidate) {
        const std::string lowered = to_lower(candidate);
        return std::any_of(models.begin(), models.end(), [&](const ir::model& m) {
            return to_lower(m.name) == lowered || table_name(m) == lowered + "s";
        });
    };

    for (const char* candidate : {"User", "Account", "AuthAccount"}) {
        if (!taken(candidate)) {
            return candidate;
        }
    }
    for (int suffix = 2;; ++suffix) {
        std::string candidate = "AuthAccount" + std::to_string(suffix);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

std::vector<std::string> ExpressRenderer::reserved_model_names(const ir::generation_options& options) const {
    std::vector<std::string> names;
    if (options.has_auth()) {
        // AuthController, AuthService, AuthValidation and routes/auth
        names.emplace_back("Auth");
    }
    if (options.is_relational()) {
        // schemas/relationships.sql
        names.emplace_back("Relationships");
    }
    return names;
}

ir::model ExpressRenderer::account_model(const GenerationContext& ctx) {
    ir::model account;
    account.name = account_entity_name(ctx.models);
    account.id = to_lower(account.name);
    account.metadata.description = "Accounts that can sign in to the API";
    account.metadata.requires_auth = false;

    auto email = make_field("email", ir::field_type::email, true, true);
    auto password = make_field("password", ir::field_type::string, true);
    password.validation.push_back({ir::validation_rule_kind::min_length, 8.0, std::nullopt});
    auto name = make_field("name", ir::field_type::string, true);

    const auto roles = ctx.auth.role_names();
    auto role = make_field("role", ir::field_type::string, true);
    if (std::find(roles.begin(), roles.end(), "user") != roles.end()) {
        role.default_value = "user";
    } else if (!roles.empty()) {
        role.default_value = roles.front();
    }

    auto is_active = make_field("isActive", ir::field_type::boolean, false);
    is_active.default_value = "true";
    auto email_verified = make_field("emailVerified", ir::field_type::boolean, false);
    email_verified.default_value = "false";
    auto last_login = make_field("lastLoginAt", ir::field_type::date, false);

    account.fields = {std::move(email), std::move(password), std::move(name), std::move(role),
                      std::move(is_active), std::move(email_verified), std::move(last_login)};
    return account;
}

} // namespace apigen::codegen
