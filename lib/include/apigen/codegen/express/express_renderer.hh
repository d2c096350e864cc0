#pragma once

#include <string>
#include <vector>
#include <apigen/base_renderer.hh>

namespace apigen::codegen {

// ============================================================================
// Express Project Renderer
// ============================================================================

/**
 * Renders a complete Express service project.
 *
 * Implements the BackendRenderer interface for Express 4 with either
 * TypeScript or CommonJS JavaScript output. Persistence targets
 * PostgreSQL (pg), MySQL (mysql2) or MongoDB (official driver).
 *
 * Artifacts are emitted in a fixed order: project scaffold, records and
 * schemas, database connection, authentication, the per-model CRUD
 * layer, shared middleware and finally the application entry point.
 *
 * Example usage:
 *   ExpressRenderer renderer;
 *   renderer.check_options(options);
 *   auto files = renderer.render_project(ctx);
 */
class ExpressRenderer : public BackendRenderer {
public:
    ExpressRenderer() = default;
    ~ExpressRenderer() override = default;

    // ========================================================================
    // BackendRenderer Interface Implementation
    // ========================================================================

    [[nodiscard]] RendererMetadata get_metadata() const override;

    [[nodiscard]] std::vector<std::string> required_templates(
        const ir::generation_options& options) const override;

    [[nodiscard]] std::vector<ir::generated_file> render_project(
        const GenerationContext& ctx) const override;

    [[nodiscard]] std::vector<std::string> reserved_model_names(
        const ir::generation_options& options) const override;

    // ========================================================================
    // Account Entity
    // ========================================================================

    /**
     * Name of the entity behind authentication.
     *
     * The first of "User", "Account", "AuthAccount", "AuthAccount2", ...
     * that no domain model uses, either as its name (ignoring case) or
     * through its table, so both sets of artifacts can coexist.
     */
    [[nodiscard]] static std::string account_entity_name(const std::vector<ir::model>& models);

    /// Account model persisted by the authentication artifacts
    [[nodiscard]] static ir::model account_model(const GenerationContext& ctx);

private:
    // ========================================================================
    // Project Scaffold (express_scaffold.cc)
    // ========================================================================

    std::string package_json(const GenerationContext& ctx) const;
    std::string tsconfig_json() const;
    std::string env_example(const GenerationContext& ctx) const;
    std::string readme(const GenerationContext& ctx) const;
    std::string database_connection(const GenerationContext& ctx) const;

    // ========================================================================
    // Records and Schemas (express_models.cc)
    // ========================================================================

    std::string record_definition(const GenerationContext& ctx, const ir::model& m) const;
    std::string table_schema(const GenerationContext& ctx, const ir::model& m) const;

    /// Foreign keys and junction tables; empty when no relationship resolves
    std::string relationship_schema(const GenerationContext& ctx) const;

    // ========================================================================
    // CRUD Layer (express_crud.cc)
    // ========================================================================

    std::string controller(const GenerationContext& ctx, const ir::model& m) const;
    std::string service(const GenerationContext& ctx, const ir::model& m) const;

    /// Repository; the account repository adds email lookup and login tracking
    std::string repository(const GenerationContext& ctx, const ir::model& m,
                           bool account_queries) const;

    std::string routes(const GenerationContext& ctx, const ir::model& m) const;
    std::string validation(const GenerationContext& ctx, const ir::model& m) const;

    // ========================================================================
    // Authentication (express_auth.cc)
    // ========================================================================

    void render_auth(const GenerationContext& ctx, std::vector<ir::generated_file>& files) const;

    std::string account_record(const GenerationContext& ctx, const ir::model& account) const;
    std::string auth_service(const GenerationContext& ctx, const ir::model& account) const;
    std::string auth_controller(const GenerationContext& ctx, const ir::model& account) const;
    std::string auth_middleware(const GenerationContext& ctx) const;
    std::string authorize_middleware(const GenerationContext& ctx) const;
    std::string auth_routes(const GenerationContext& ctx) const;
    std::string auth_validation(const GenerationContext& ctx) const;

    // ========================================================================
    // Middleware and Application (express_app.cc)
    // ========================================================================

    std::string cors_middleware(const GenerationContext& ctx) const;
    std::string logging_middleware(const GenerationContext& ctx) const;
    std::string validation_middleware(const GenerationContext& ctx) const;
    std::string application(const GenerationContext& ctx) const;

    // ========================================================================
    // Tests (express_tests.cc)
    // ========================================================================

    std::string controller_test(const GenerationContext& ctx, const ir::model& m) const;
};

} // namespace apigen::codegen
