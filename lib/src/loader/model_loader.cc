//
// Model Loader Implementation
//

#include <apigen/loader.hh>

#include <fstream>
#include <sstream>

namespace apigen::loader {

using nlohmann::ordered_json;

namespace {
    /// Decoding cursor: the document origin plus the location of the node
    class reader {
    public:
        reader(const std::string& origin, std::string location)
            : origin_(origin), location_(std::move(location)) {}

        [[noreturn]] void fail(const std::string& message) const {
            throw model_load_error(origin_, (location_.empty() ? "" : location_ + ": ") + message);
        }

        reader child(const std::string& key) const {
            return {origin_, location_.empty() ? key : location_ + "." + key};
        }

        reader element(size_t index) const {
            return {origin_, location_ + "[" + std::to_string(index) + "]"};
        }

        const ordered_json& require_object(const ordered_json& node) const {
            if (!node.is_object()) {
                fail("expected a mapping");
            }
            return node;
        }

        const ordered_json& require_array(const ordered_json& node) const {
            if (!node.is_array()) {
                fail("expected a list");
            }
            return node;
        }

        std::string string_of(const ordered_json& obj, const char* key, bool required) const {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) {
                if (required) {
                    fail(std::string("missing '") + key + "'");
                }
                return {};
            }
            if (!it->is_string()) {
                child(key).fail("expected a string");
            }
            return it->get<std::string>();
        }

        std::optional<std::string> optional_string(const ordered_json& obj, const char* key) const {
            if (!obj.contains(key) || obj.at(key).is_null()) {
                return std::nullopt;
            }
            return string_of(obj, key, true);
        }

        bool bool_of(const ordered_json& obj, const char* key, bool fallback) const {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) {
                return fallback;
            }
            if (!it->is_boolean()) {
                child(key).fail("expected true or false");
            }
            return it->get<bool>();
        }

    private:
        const std::string& origin_;
        std::string location_;
    };

    /// Literal text of a declared default
    std::optional<std::string> default_literal(const ordered_json& value) {
        if (value.is_null()) {
            return std::nullopt;
        }
        if (value.is_string()) {
            return value.get<std::string>();
        }
        return value.dump();
    }

    ir::validation_rule decode_rule(const ordered_json& node, const reader& at) {
        at.require_object(node);
        ir::validation_rule rule;
        rule.kind = ir::parse_validation_rule_kind(at.string_of(node, "type", true));

        auto value = node.find("value");
        if (value == node.end() || value->is_null()) {
            at.fail("missing 'value'");
        }
        if (value->is_number()) {
            rule.value = value->get<double>();
        } else if (value->is_string()) {
            rule.value = value->get<std::string>();
        } else {
            at.child("value").fail("expected a string or a number");
        }
        rule.message = at.optional_string(node, "message");
        return rule;
    }

    ir::field decode_field(const ordered_json& node, const reader& at, const std::string& model_name) {
        at.require_object(node);
        ir::field f;
        f.name = at.string_of(node, "name", true);
        f.id = at.string_of(node, "id", false);
        if (f.id.empty()) {
            f.id = model_name + "." + f.name;
        }
        f.type = ir::parse_field_type(at.string_of(node, "type", true));
        f.required = at.bool_of(node, "required", false);
        f.unique = at.bool_of(node, "unique", false);
        if (auto it = node.find("defaultValue"); it != node.end()) {
            f.default_value = default_literal(*it);
        }
        f.description = at.optional_string(node, "description");

        if (auto it = node.find("validation"); it != node.end() && !it->is_null()) {
            const reader rules = at.child("validation");
            rules.require_array(*it);
            for (size_t i = 0; i < it->size(); ++i) {
                f.validation.push_back(decode_rule((*it)[i], rules.element(i)));
            }
        }
        return f;
    }

    ir::relationship decode_relationship(const ordered_json& node, const reader& at) {
        at.require_object(node);
        ir::relationship r;
        r.id = at.string_of(node, "id", false);
        r.kind = ir::parse_relationship_kind(at.string_of(node, "type", true));
        r.source_model = at.string_of(node, "sourceModel", false);
        r.target_model = at.string_of(node, "targetModel", false);
        r.source_field = at.string_of(node, "sourceField", false);
        r.target_field = at.string_of(node, "targetField", false);
        r.cascade_delete = at.bool_of(node, "cascadeDelete", false);
        return r;
    }

    ir::model_metadata decode_metadata(const ordered_json& node, const reader& at) {
        at.require_object(node);
        ir::model_metadata meta;
        meta.table_name = at.optional_string(node, "tableName");
        meta.timestamps = at.bool_of(node, "timestamps", true);
        meta.soft_delete = at.bool_of(node, "softDelete", false);
        meta.description = at.optional_string(node, "description");
        meta.requires_auth = at.bool_of(node, "requiresAuth", true);
        if (auto it = node.find("allowedRoles"); it != node.end() && !it->is_null()) {
            const reader roles = at.child("allowedRoles");
            roles.require_array(*it);
            for (size_t i = 0; i < it->size(); ++i) {
                if (!(*it)[i].is_string()) {
                    roles.element(i).fail("expected a string");
                }
                meta.allowed_roles.push_back((*it)[i].get<std::string>());
            }
        }
        return meta;
    }

    ir::model decode_model(const ordered_json& node, const reader& at) {
        at.require_object(node);
        ir::model m;
        m.name = at.string_of(node, "name", true);
        m.id = at.string_of(node, "id", false);
        if (m.id.empty()) {
            m.id = m.name;
        }

        if (auto it = node.find("fields"); it != node.end() && !it->is_null()) {
            const reader fields = at.child("fields");
            fields.require_array(*it);
            for (size_t i = 0; i < it->size(); ++i) {
                m.fields.push_back(decode_field((*it)[i], fields.element(i), m.name));
            }
        }
        if (auto it = node.find("relationships"); it != node.end() && !it->is_null()) {
            const reader rels = at.child("relationships");
            rels.require_array(*it);
            for (size_t i = 0; i < it->size(); ++i) {
                ir::relationship r = decode_relationship((*it)[i], rels.element(i));
                if (r.source_model.empty()) {
                    r.source_model = m.name;
                }
                m.relationships.push_back(std::move(r));
            }
        }
        if (auto it = node.find("metadata"); it != node.end() && !it->is_null()) {
            m.metadata = decode_metadata(*it, at.child("metadata"));
        }
        return m;
    }

    ir::generation_options decode_options(const ordered_json& node, const reader& at) {
        at.require_object(node);
        ir::generation_options opts;
        if (auto s = at.optional_string(node, "framework")) {
            opts.target_framework = ir::parse_framework(*s);
        }
        if (auto s = at.optional_string(node, "database")) {
            opts.database = ir::parse_database_engine(*s);
        }
        if (auto s = at.optional_string(node, "authentication")) {
            opts.authentication = ir::parse_auth_strategy(*s);
        }
        if (auto s = at.optional_string(node, "language")) {
            opts.language = ir::parse_source_language(*s);
        }
        opts.include_tests = at.bool_of(node, "includeTests", opts.include_tests);
        opts.include_documentation = at.bool_of(node, "includeDocumentation", opts.include_documentation);
        return opts;
    }

    bool has_yaml_extension(const std::string& path) {
        auto ends_with = [&path](const std::string& suffix) {
            return path.size() >= suffix.size() &&
                   path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
        };
        return ends_with(".yaml") || ends_with(".yml");
    }
}

// ============================================================================
// Decoding
// ============================================================================

project_description decode(const ordered_json& doc, const std::string& origin) {
    const reader root(origin, "");
    project_description result;

    const ordered_json* models = nullptr;
    if (doc.is_array()) {
        models = &doc;
    } else {
        root.require_object(doc);
        if (auto it = doc.find("models"); it != doc.end() && !it->is_null()) {
            models = &*it;
        }
        auto opts = doc.find("options");
        if (opts == doc.end()) {
            opts = doc.find("generationOptions");
        }
        if (opts != doc.end() && !opts->is_null()) {
            result.options = decode_options(*opts, root.child(opts.key()));
        }
    }

    if (models) {
        const reader at = root.child("models");
        at.require_array(*models);
        for (size_t i = 0; i < models->size(); ++i) {
            result.models.push_back(decode_model((*models)[i], at.element(i)));
        }
    }
    return result;
}

ordered_json yaml_to_json(const fkyaml::node& node) {
    if (node.is_mapping()) {
        ordered_json obj = ordered_json::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            const auto& key = it.key();
            std::string name = key.is_string() ? key.get_value<std::string>() : fkyaml::node::serialize(key);
            obj[name] = yaml_to_json(*it);
        }
        return obj;
    }
    if (node.is_sequence()) {
        ordered_json arr = ordered_json::array();
        for (size_t i = 0; i < node.size(); ++i) {
            arr.push_back(yaml_to_json(node[i]));
        }
        return arr;
    }
    if (node.is_boolean()) {
        return node.get_value<bool>();
    }
    if (node.is_integer()) {
        return node.get_value<std::int64_t>();
    }
    if (node.is_float_number()) {
        return node.get_value<double>();
    }
    if (node.is_string()) {
        return node.get_value<std::string>();
    }
    return nullptr;
}

// ============================================================================
// Entry points
// ============================================================================

project_description parse_json(const std::string& text, const std::string& origin) {
    ordered_json doc;
    try {
        doc = ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw model_load_error(origin, std::string("invalid JSON: ") + e.what());
    }
    return decode(doc, origin);
}

project_description parse_yaml(const std::string& text, const std::string& origin) {
    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(text);
    } catch (const fkyaml::exception& e) {
        throw model_load_error(origin, std::string("invalid YAML: ") + e.what());
    }
    return decode(yaml_to_json(root), origin);
}

project_description load_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw model_load_error(path, "cannot open file");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw model_load_error(path, "read failed");
    }

    if (has_yaml_extension(path)) {
        return parse_yaml(buffer.str(), path);
    }
    return parse_json(buffer.str(), path);
}

} // namespace apigen::loader
