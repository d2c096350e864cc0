#pragma once

#include <apigen/ir.hh>
#include <apigen/template_engine.hh>

#include <string>
#include <vector>

namespace apigen::codegen {

// ============================================================================
// Generation Context
// ============================================================================

/**
 * Everything a backend renderer reads while emitting one project.
 *
 * The context only borrows: the models, options, derived endpoints, auth
 * configuration and the template table all outlive the render call.
 */
struct GenerationContext {
    const std::vector<ir::model>& models;
    const ir::generation_options& options;
    const std::vector<ir::endpoint>& endpoints;
    const ir::auth_config& auth;
    const tmpl::TemplateEngine& templates;

    /// Source file extension without the dot ("ts" or "js")
    [[nodiscard]] std::string ext() const {
        return options.is_typescript() ? "ts" : "js";
    }

    /// Content-language tag of generated sources
    [[nodiscard]] std::string language_tag() const {
        return options.is_typescript() ? "typescript" : "javascript";
    }

    /// Auth routes exist only when there is at least one model to protect
    [[nodiscard]] bool serves_auth() const {
        return options.has_auth() && !models.empty();
    }

    /// "src/models/User" -> "src/models/User.ts"
    [[nodiscard]] std::string source_path(const std::string& stem) const {
        return stem + "." + ext();
    }
};

// ============================================================================
// Renderer Metadata
// ============================================================================

/// Capabilities of a backend renderer
struct RendererMetadata {
    std::string framework;                           ///< Framework name ("express")
    std::string description;
    std::vector<ir::database_engine> databases;      ///< Supported database engines
    std::vector<ir::auth_strategy> auth_strategies;  ///< Supported authentication strategies
    std::vector<ir::source_language> languages;      ///< Supported output languages
};

// ============================================================================
// Abstract Backend Renderer
// ============================================================================

/// Abstract base class for framework-specific project renderers
///
/// Each target framework implements this interface to turn validated
/// models plus options into the framework's artifact set.
///
/// **Example Usage:**
/// \code
///   auto registry = RendererRegistry::with_builtin_renderers();
///   const auto& renderer = registry.require_renderer(options.target_framework);
///   renderer.check_options(options);
///   auto files = renderer.render_project(ctx);
/// \endcode
class BackendRenderer {
public:
    virtual ~BackendRenderer() = default;

    /// Get renderer metadata
    [[nodiscard]] virtual RendererMetadata get_metadata() const = 0;

    /// Names of the templates the renderer reads for the given options
    [[nodiscard]] virtual std::vector<std::string> required_templates(
        const ir::generation_options& options) const = 0;

    /// Emit every framework artifact, in a stable order
    [[nodiscard]] virtual std::vector<ir::generated_file> render_project(
        const GenerationContext& ctx) const = 0;

    /// Model names whose artifacts would collide with the renderer's own
    [[nodiscard]] virtual std::vector<std::string> reserved_model_names(
        const ir::generation_options& /*options*/) const {
        return {};
    }

    /// Reject options outside the renderer's capabilities
    /// @throws ir::unsupported_option_error naming the rejected option
    void check_options(const ir::generation_options& options) const;

    /// Reject models named after a reserved name, ignoring case
    /// @throws ir::unsupported_option_error naming the model
    void check_models(const std::vector<ir::model>& models,
                      const ir::generation_options& options) const;
};

} // namespace apigen::codegen
