//
// Renderer Registry Implementation
//

#include <apigen/renderer_registry.hh>
#include <apigen/codegen/express/express_renderer.hh>
#include <algorithm>
#include <cctype>

namespace apigen::codegen {
    // ============================================================================
    // Construction
    // ============================================================================

    RendererRegistry RendererRegistry::with_builtin_renderers() {
        RendererRegistry registry;
        registry.register_renderer("express", std::make_unique<ExpressRenderer>());
        return registry;
    }

    // ============================================================================
    // Renderer Registration & Lookup
    // ============================================================================

    void RendererRegistry::register_renderer(const std::string& framework_name,
                                             std::unique_ptr<BackendRenderer> renderer) {
        if (renderer) {
            renderers_[normalize_framework_name(framework_name)] = std::move(renderer);
        }
    }

    const BackendRenderer* RendererRegistry::get_renderer(const std::string& framework_name) const {
        auto it = renderers_.find(normalize_framework_name(framework_name));
        return (it != renderers_.end()) ? it->second.get() : nullptr;
    }

    bool RendererRegistry::has_renderer(const std::string& framework_name) const {
        return renderers_.find(normalize_framework_name(framework_name)) != renderers_.end();
    }

    const BackendRenderer& RendererRegistry::require_renderer(ir::framework fw) const {
        const std::string name = ir::to_string(fw);
        const BackendRenderer* renderer = get_renderer(name);
        if (!renderer) {
            throw ir::unsupported_option_error("framework", name, get_available_frameworks());
        }
        return *renderer;
    }

    std::vector<std::string> RendererRegistry::get_available_frameworks() const {
        std::vector<std::string> frameworks;
        frameworks.reserve(renderers_.size());

        for (const auto& [name, _] : renderers_) {
            frameworks.push_back(name);
        }

        return frameworks;
    }

    // ============================================================================
    // Private Helpers
    // ============================================================================

    std::string RendererRegistry::normalize_framework_name(const std::string& name) {
        std::string normalized = name;
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return normalized;
    }
} // namespace apigen::codegen
