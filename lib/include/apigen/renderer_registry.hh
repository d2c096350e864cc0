#pragma once

#include <apigen/base_renderer.hh>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace apigen::codegen {

// ============================================================================
// Renderer Registry
// ============================================================================

/**
 * Registry of framework-specific backend renderers.
 *
 * The registry is an ordinary object: build it once at startup (usually
 * via with_builtin_renderers()) and pass it to generate_project(). It is
 * read-only while projects are generated.
 *
 * **Usage Example:**
 * \code
 *   auto registry = RendererRegistry::with_builtin_renderers();
 *
 *   for (const auto& name : registry.get_available_frameworks()) {
 *       std::cout << name << "\n";
 *   }
 *
 *   const auto& renderer = registry.require_renderer(ir::framework::express);
 * \endcode
 */
class RendererRegistry {
public:
    RendererRegistry() = default;

    RendererRegistry(const RendererRegistry&) = delete;
    RendererRegistry& operator=(const RendererRegistry&) = delete;
    RendererRegistry(RendererRegistry&&) = default;
    RendererRegistry& operator=(RendererRegistry&&) = default;

    /// Registry holding every renderer shipped with apigen
    [[nodiscard]] static RendererRegistry with_builtin_renderers();

    /**
     * Register a renderer for a framework.
     *
     * @note Framework names are stored in lowercase for case-insensitive lookup
     * @note An existing registration for the same name is replaced
     */
    void register_renderer(const std::string& framework_name,
                           std::unique_ptr<BackendRenderer> renderer);

    /// Look up a renderer (case-insensitive); nullptr if none is registered
    [[nodiscard]] const BackendRenderer* get_renderer(const std::string& framework_name) const;

    [[nodiscard]] bool has_renderer(const std::string& framework_name) const;

    /// Renderer for a framework
    /// @throws ir::unsupported_option_error listing the available frameworks
    [[nodiscard]] const BackendRenderer& require_renderer(ir::framework fw) const;

    /// Registered framework names (lowercase, sorted)
    [[nodiscard]] std::vector<std::string> get_available_frameworks() const;

private:
    static std::string normalize_framework_name(const std::string& name);

    std::map<std::string, std::unique_ptr<BackendRenderer>> renderers_;
};

} // namespace apigen::codegen
