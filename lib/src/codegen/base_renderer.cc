//
// Backend renderer base: option checks shared by the renderers
//

#include <apigen/base_renderer.hh>
#include <apigen/codegen/naming.hh>

#include <algorithm>

namespace apigen::codegen {

namespace {
    template<typename Enum>
    void require_supported(const char* option, Enum value, const std::vector<Enum>& supported) {
        if (std::find(supported.begin(), supported.end(), value) != supported.end()) {
            return;
        }
        std::vector<std::string> accepted;
        accepted.reserve(supported.size());
        for (Enum e : supported) {
            accepted.push_back(ir::to_string(e));
        }
        throw ir::unsupported_option_error(option, ir::to_string(value), accepted);
    }
}

void BackendRenderer::check_options(const ir::generation_options& options) const {
    const RendererMetadata meta = get_metadata();
    require_supported("database", options.database, meta.databases);
    require_supported("authentication", options.authentication, meta.auth_strategies);
    require_supported("language", options.language, meta.languages);
}

void BackendRenderer::check_models(const std::vector<ir::model>& models,
                                   const ir::generation_options& options) const {
    const auto reserved = reserved_model_names(options);
    for (const auto& m : models) {
        for (const auto& name : reserved) {
            if (to_lower(m.name) == to_lower(name)) {
                throw ir::unsupported_option_error(
                    "model name (reserved for generated " + ir::to_string(options.target_framework) + " files)",
                    m.name, {});
            }
        }
    }
}

} // namespace apigen::codegen
