//
// Model Loader for apigen
//
// Reads a project description (models plus generation options) from JSON
// or YAML. Both formats use the camelCase keys of the external data model:
//
//   models:
//     - name: User
//       fields:
//         - { name: email, type: email, required: true, unique: true }
//       relationships: []
//       metadata: { requiresAuth: true }
//   options:
//     database: postgresql
//     authentication: jwt
//
// A document that is a bare list is read as the model list. YAML input is
// converted to the JSON document model first, so both formats share one
// decoder.
//

#pragma once

#include "ir.hh"

#include <nlohmann/json.hpp>
#include <fkYAML/node.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace apigen::loader {

/// Failure to read or decode a description; the message names the origin
/// and the location inside the document
class model_load_error : public std::runtime_error {
public:
    model_load_error(const std::string& origin, const std::string& message)
        : std::runtime_error(origin + ": " + message), origin_(origin) {}

    [[nodiscard]] const std::string& origin() const { return origin_; }

private:
    std::string origin_;
};

struct project_description {
    std::vector<ir::model> models;
    ir::generation_options options;
};

/// Dispatch on the extension: .yaml/.yml read as YAML, anything else as JSON
[[nodiscard]] project_description load_file(const std::string& path);

[[nodiscard]] project_description parse_json(const std::string& text,
                                             const std::string& origin = "<input>");
[[nodiscard]] project_description parse_yaml(const std::string& text,
                                             const std::string& origin = "<input>");

/// Decode an already parsed document. Unknown enum spellings throw
/// ir::unsupported_option_error; structural problems throw model_load_error.
[[nodiscard]] project_description decode(const nlohmann::ordered_json& doc,
                                         const std::string& origin = "<input>");

[[nodiscard]] nlohmann::ordered_json yaml_to_json(const fkyaml::node& node);

} // namespace apigen::loader
