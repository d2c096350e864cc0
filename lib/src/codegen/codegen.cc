//
// Code Generation Service
//
// Resolves the renderer for the requested framework, derives endpoints
// and the auth configuration, lets the renderer emit the framework
// artifacts and appends the API documentation.
//

#include <apigen/codegen.hh>
#include <apigen/codegen/naming.hh>
#include <apigen/renderer_registry.hh>
#include <apigen/template_engine.hh>

#include <cstdio>
#include <random>
#include <set>

namespace apigen::codegen {

namespace {
    ir::endpoint make_endpoint(const ir::model& m,
                               ir::endpoint_operation op,
                               ir::http_method method,
                               const std::string& path,
                               const std::string& description) {
        ir::endpoint ep;
        ep.id = to_lower(m.name) + "_" + ir::to_string(op);
        ep.path = path;
        ep.method = method;
        ep.model_name = m.name;
        ep.operation = op;
        ep.description = description;
        return ep;
    }
}

// ============================================================================
// Derivation
// ============================================================================

ir::auth_config default_auth_config(ir::auth_strategy strategy) {
    ir::auth_config auth;
    auth.type = strategy;
    auth.roles.push_back({"admin", {"create", "read", "update", "delete"}});
    auth.roles.push_back({"user", {"read"}});
    return auth;
}

std::vector<ir::endpoint> derive_crud_endpoints(const ir::model& m,
                                                const ir::generation_options& options,
                                                const ir::auth_config& auth) {
    const std::string base = "/" + to_lower(m.name);
    const std::string item = base + "/:id";
    const bool guarded = m.metadata.requires_auth && options.has_auth();

    std::vector<ir::endpoint> endpoints;
    endpoints.reserve(5);

    auto create = make_endpoint(m, ir::endpoint_operation::create, ir::http_method::post, base,
                                "Create a new " + m.name);
    auto read = make_endpoint(m, ir::endpoint_operation::read, ir::http_method::get, item,
                              "Get " + m.name + " by ID");
    auto update = make_endpoint(m, ir::endpoint_operation::update, ir::http_method::put, item,
                                "Update " + m.name);
    auto remove = make_endpoint(m, ir::endpoint_operation::remove, ir::http_method::del, item,
                                "Delete " + m.name);
    auto list = make_endpoint(m, ir::endpoint_operation::list, ir::http_method::get, base,
                              "List all " + m.name + " records");

    if (guarded) {
        create.authenticated = true;
        create.roles = auth.role_names();
        update.authenticated = true;
        update.roles = auth.role_names();
        remove.authenticated = true;
        remove.roles = {"admin"};
    }

    endpoints.push_back(std::move(create));
    endpoints.push_back(std::move(read));
    endpoints.push_back(std::move(update));
    endpoints.push_back(std::move(remove));
    endpoints.push_back(std::move(list));
    return endpoints;
}

std::vector<ir::endpoint> derive_endpoints(const std::vector<ir::model>& models,
                                           const ir::generation_options& options,
                                           const ir::auth_config& auth) {
    std::vector<ir::endpoint> endpoints;
    endpoints.reserve(models.size() * 5 + 2);

    for (const auto& m : models) {
        auto crud = derive_crud_endpoints(m, options, auth);
        endpoints.insert(endpoints.end(), crud.begin(), crud.end());
    }

    if (options.has_auth() && !models.empty()) {
        ir::endpoint login;
        login.id = "auth_login";
        login.path = "/auth/login";
        login.method = ir::http_method::post;
        login.model_name = "Auth";
        login.operation = ir::endpoint_operation::login;
        login.description = "Authenticate with email and password";
        endpoints.push_back(std::move(login));

        ir::endpoint registration;
        registration.id = "auth_register";
        registration.path = "/auth/register";
        registration.method = ir::http_method::post;
        registration.model_name = "Auth";
        registration.operation = ir::endpoint_operation::registration;
        registration.description = "Register a new account";
        endpoints.push_back(std::move(registration));
    }

    return endpoints;
}

std::vector<std::string> protected_routes(const std::vector<ir::endpoint>& endpoints) {
    std::vector<std::string> routes;
    for (const auto& ep : endpoints) {
        if (ep.authenticated) {
            routes.push_back(ir::to_string(ep.method) + " " + ep.path);
        }
    }
    return routes;
}

// ============================================================================
// Identity
// ============================================================================

std::string make_project_name(std::chrono::system_clock::time_point when) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count();
    return "generated-api-" + std::to_string(millis);
}

std::string make_project_id() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::uniform_int_distribution<unsigned> byte_dist(0, 255);

    unsigned char bytes[16];
    for (auto& b : bytes) {
        b = static_cast<unsigned char>(byte_dist(engine));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string out;
    out.reserve(36);
    char hex[3];
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        std::snprintf(hex, sizeof(hex), "%02x", bytes[i]);
        out += hex;
    }
    return out;
}

// ============================================================================
// Project Generation
// ============================================================================

ir::generated_project generate_project(const std::vector<ir::model>& models,
                                       const ir::generation_options& options) {
    const auto registry = RendererRegistry::with_builtin_renderers();
    const auto templates = tmpl::TemplateEngine::with_builtin_templates();
    return generate_project(models, options, registry, templates);
}

ir::generated_project generate_project(const std::vector<ir::model>& models,
                                       const ir::generation_options& options,
                                       const RendererRegistry& registry,
                                       const tmpl::TemplateEngine& templates) {
    // Option checks come first: nothing is derived for a rejected request
    const BackendRenderer& renderer = registry.require_renderer(options.target_framework);
    renderer.check_options(options);
    renderer.check_models(models, options);

    for (const auto& name : renderer.required_templates(options)) {
        if (!templates.has_template(name)) {
            throw codegen_error("Template '" + name + "' required by the " +
                                ir::to_string(options.target_framework) +
                                " renderer is not registered");
        }
    }

    ir::generated_project project;
    project.created_at = std::chrono::system_clock::now();
    project.updated_at = project.created_at;
    project.id = make_project_id();
    project.name = make_project_name(project.created_at);
    project.models = models;
    project.options = options;
    project.auth = default_auth_config(options.authentication);
    project.endpoints = derive_endpoints(project.models, options, project.auth);
    project.auth.protected_routes = protected_routes(project.endpoints);

    const GenerationContext ctx{project.models, project.options, project.endpoints,
                                project.auth, templates};
    project.files = renderer.render_project(ctx);

    if (options.include_documentation) {
        project.api_description = build_api_description(project.models, project.endpoints, project.auth);

        project.files.push_back({"docs/openapi.json", project.api_description.dump(2) + "\n",
                                 ir::artifact_kind::documentation, "json"});
        project.files.push_back({"docs/openapi.yaml", api_description_yaml(project.api_description),
                                 ir::artifact_kind::documentation, "yaml"});
        project.files.push_back({"docs/API.md",
                                 api_reference_markdown(project.models, project.endpoints, project.auth),
                                 ir::artifact_kind::documentation, "markdown"});
    } else {
        project.api_description = minimal_api_description(project.name);
    }

    std::set<std::string> paths;
    for (const auto& f : project.files) {
        if (!paths.insert(f.path).second) {
            throw codegen_error("Two artifacts were generated at '" + f.path + "'");
        }
    }

    return project;
}

} // namespace apigen::codegen
