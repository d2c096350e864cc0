#pragma once

#include <apigen/ir.hh>

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace apigen::tmpl {
    class TemplateEngine;
}

namespace apigen::codegen {

class RendererRegistry;

/// Code generation error
class codegen_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// ============================================================================
// Project Generation
// ============================================================================

/**
 * Generate the complete backend project for a validated model set.
 *
 * Uses the built-in renderer registry and template library. Models are
 * assumed to have passed validation::validate(); they are not re-checked.
 *
 * @throws ir::unsupported_option_error if the framework or an option value
 *         cannot be honored, or a model takes a name the renderer reserves
 *         (nothing is emitted in that case)
 * @throws codegen_error if two artifacts end up at the same path
 */
[[nodiscard]] ir::generated_project generate_project(const std::vector<ir::model>& models,
                                                     const ir::generation_options& options);

/**
 * Generate with an explicit renderer registry and template engine.
 *
 * @throws ir::unsupported_option_error as above
 * @throws codegen_error if the engine lacks a template the renderer needs,
 *         or if two artifacts end up at the same path
 */
[[nodiscard]] ir::generated_project generate_project(const std::vector<ir::model>& models,
                                                     const ir::generation_options& options,
                                                     const RendererRegistry& registry,
                                                     const tmpl::TemplateEngine& templates);

// ============================================================================
// Derivation Helpers
// ============================================================================

/// Default roles (admin: create/read/update/delete, user: read) for a strategy
[[nodiscard]] ir::auth_config default_auth_config(ir::auth_strategy strategy);

/// The five CRUD endpoints of one model: create, read, update, delete, list
[[nodiscard]] std::vector<ir::endpoint> derive_crud_endpoints(const ir::model& m,
                                                              const ir::generation_options& options,
                                                              const ir::auth_config& auth);

/// CRUD endpoints of every model in input order, then login and register
/// when authentication is enabled
[[nodiscard]] std::vector<ir::endpoint> derive_endpoints(const std::vector<ir::model>& models,
                                                         const ir::generation_options& options,
                                                         const ir::auth_config& auth);

/// "METHOD /path" of every authenticated endpoint
[[nodiscard]] std::vector<std::string> protected_routes(const std::vector<ir::endpoint>& endpoints);

/// "generated-api-<epoch milliseconds>"
[[nodiscard]] std::string make_project_name(std::chrono::system_clock::time_point when);

/// Random RFC 4122 version 4 identifier
[[nodiscard]] std::string make_project_id();

// ============================================================================
// API Description
// ============================================================================

/// Minimal OpenAPI scaffold used when documentation is disabled
[[nodiscard]] nlohmann::ordered_json minimal_api_description(const std::string& title);

/// Full OpenAPI 3.0 document: schemas per model, a path item per
/// endpoint and the security scheme of the auth strategy
[[nodiscard]] nlohmann::ordered_json build_api_description(const std::vector<ir::model>& models,
                                                           const std::vector<ir::endpoint>& endpoints,
                                                           const ir::auth_config& auth);

/// The same document rendered as YAML
[[nodiscard]] std::string api_description_yaml(const nlohmann::ordered_json& description);

/// Human-readable endpoint reference (markdown)
[[nodiscard]] std::string api_reference_markdown(const std::vector<ir::model>& models,
                                                 const std::vector<ir::endpoint>& endpoints,
                                                 const ir::auth_config& auth);

} // namespace apigen::codegen
