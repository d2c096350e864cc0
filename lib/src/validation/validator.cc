//
// Model validation rules
//
// Each rule appends findings to the shared result. Rules never stop at the
// first finding; the caller receives the complete picture in one pass.
//

#include <apigen/validation.hh>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>
#include <set>

namespace apigen::validation {

namespace {
    constexpr size_t MAX_NAME_LENGTH = 100;

    // Helper: add error finding
    void add_error(validation_result& result,
                   const char* code,
                   const std::string& field,
                   const std::string& message) {
        result.errors.push_back(finding{field, message, code});
    }

    // Helper: add warning finding
    void add_warning(validation_result& result,
                     const char* code,
                     const std::string& field,
                     const std::string& message) {
        result.warnings.push_back(finding{field, message, code});
    }

    std::string model_path(size_t index) {
        return "models[" + std::to_string(index) + "]";
    }

    std::string field_path(size_t model_index, size_t field_index) {
        return model_path(model_index) + ".fields[" + std::to_string(field_index) + "]";
    }

    std::string relationship_path(size_t model_index, size_t rel_index) {
        return model_path(model_index) + ".relationships[" + std::to_string(rel_index) + "]";
    }

    std::string to_lower(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    // ========================================================================
    // Schema conformance
    // ========================================================================

    void check_name(validation_result& result,
                    const std::string& path,
                    const std::string& name,
                    const char* what) {
        if (name.empty()) {
            add_error(result, codes::SCHEMA_VALIDATION_ERROR, path,
                      std::string(what) + " name is required");
        } else if (name.size() > MAX_NAME_LENGTH) {
            add_error(result, codes::SCHEMA_VALIDATION_ERROR, path,
                      std::string(what) + " name must be at most " +
                      std::to_string(MAX_NAME_LENGTH) + " characters");
        }
    }

    void check_rules(validation_result& result,
                     const std::string& path,
                     const ir::field& f) {
        using ir::validation_rule_kind;

        for (size_t i = 0; i < f.validation.size(); ++i) {
            const auto& rule = f.validation[i];
            const std::string rule_path = path + ".validation[" + std::to_string(i) + "].value";

            switch (rule.kind) {
                case validation_rule_kind::min_length:
                case validation_rule_kind::max_length:
                    if (!rule.is_numeric()) {
                        add_error(result, codes::SCHEMA_VALIDATION_ERROR, rule_path,
                                  ir::to_string(rule.kind) + " requires a numeric value");
                    } else if (rule.number() < 0) {
                        add_error(result, codes::SCHEMA_VALIDATION_ERROR, rule_path,
                                  ir::to_string(rule.kind) + " must not be negative");
                    } else if (!std::isfinite(rule.number()) || std::floor(rule.number()) != rule.number()) {
                        add_error(result, codes::SCHEMA_VALIDATION_ERROR, rule_path,
                                  ir::to_string(rule.kind) + " must be a whole number");
                    }
                    break;

                case validation_rule_kind::min:
                case validation_rule_kind::max:
                    if (!rule.is_numeric()) {
                        add_error(result, codes::SCHEMA_VALIDATION_ERROR, rule_path,
                                  ir::to_string(rule.kind) + " requires a numeric value");
                    }
                    break;

                case validation_rule_kind::pattern:
                    if (rule.is_numeric()) {
                        add_error(result, codes::SCHEMA_VALIDATION_ERROR, rule_path,
                                  "pattern requires a regular expression string");
                    } else {
                        try {
                            std::regex re(rule.text(), std::regex::ECMAScript);
                        } catch (const std::regex_error& e) {
                            add_error(result, codes::SCHEMA_VALIDATION_ERROR, rule_path,
                                      "Invalid pattern '" + rule.text() + "': " + e.what());
                        }
                    }
                    break;

                case validation_rule_kind::custom:
                    break;
            }
        }

        // Bounds must describe a non-empty range
        auto bounds_conflict = [&](validation_rule_kind lo_kind, validation_rule_kind hi_kind) {
            const auto* lo = f.find_rule(lo_kind);
            const auto* hi = f.find_rule(hi_kind);
            if (lo && hi && lo->is_numeric() && hi->is_numeric() && lo->number() > hi->number()) {
                add_error(result, codes::SCHEMA_VALIDATION_ERROR, path + ".validation",
                          ir::to_string(lo_kind) + " is greater than " + ir::to_string(hi_kind));
            }
        };
        bounds_conflict(validation_rule_kind::min_length, validation_rule_kind::max_length);
        bounds_conflict(validation_rule_kind::min, validation_rule_kind::max);
    }

    // ========================================================================
    // Per-model rules
    // ========================================================================

    void check_model(validation_result& result, const ir::model& m, size_t index) {
        const std::string path = model_path(index);

        check_name(result, path + ".name", m.name, "Model");

        if (!m.name.empty() && !is_pascal_case(m.name)) {
            add_warning(result, codes::NAMING_CONVENTION_WARNING, path + ".name",
                        "Model name '" + m.name +
                        "' should start with uppercase letter and use PascalCase");
        }

        if (m.fields.empty()) {
            add_warning(result, codes::EMPTY_MODEL_WARNING, path + ".fields",
                        "Model '" + m.name + "' has no fields");
        }

        std::set<std::string> seen;
        bool has_identifier = false;

        for (size_t i = 0; i < m.fields.size(); ++i) {
            const auto& f = m.fields[i];
            const std::string fpath = field_path(index, i);

            check_name(result, fpath + ".name", f.name, "Field");

            if (!f.name.empty() && !seen.insert(f.name).second) {
                add_error(result, codes::DUPLICATE_FIELD_NAME, fpath + ".name",
                          "Duplicate field name: " + f.name);
            }

            if (!f.name.empty() && !is_camel_case(f.name)) {
                add_warning(result, codes::FIELD_NAMING_CONVENTION_WARNING, fpath + ".name",
                            "Field name '" + f.name +
                            "' should start with lowercase letter and use camelCase");
            }

            check_rules(result, fpath, f);

            if (f.name == "id" || f.type == ir::field_type::uuid || f.unique) {
                has_identifier = true;
            }
        }

        if (!m.fields.empty() && !has_identifier) {
            add_warning(result, codes::NO_PRIMARY_KEY_WARNING, path + ".fields",
                        "Model '" + m.name + "' has no id, uuid or unique field");
        }
    }

    void check_unique_model_names(validation_result& result,
                                  const std::vector<ir::model>& models) {
        std::map<std::string, size_t> first_seen;

        for (size_t i = 0; i < models.size(); ++i) {
            if (models[i].name.empty()) {
                continue;
            }
            auto [it, inserted] = first_seen.emplace(to_lower(models[i].name), i);
            if (!inserted) {
                add_error(result, codes::DUPLICATE_MODEL_NAME, model_path(i) + ".name",
                          "Duplicate model name: " + models[i].name +
                          " (conflicts with " + models[it->second].name + ")");
            }
        }
    }

    // ========================================================================
    // Relationship rules
    // ========================================================================

    void check_relationships(validation_result& result,
                             const std::vector<ir::model>& models) {
        auto find_model = [&](const std::string& name) -> const ir::model* {
            auto it = std::find_if(models.begin(), models.end(),
                [&](const ir::model& m) { return m.name == name; });
            return it != models.end() ? &*it : nullptr;
        };

        for (size_t i = 0; i < models.size(); ++i) {
            const auto& m = models[i];

            for (size_t k = 0; k < m.relationships.size(); ++k) {
                const auto& rel = m.relationships[k];
                const std::string path = relationship_path(i, k);

                auto require = [&](const std::string& value, const char* attribute) {
                    if (value.empty()) {
                        add_error(result, codes::SCHEMA_VALIDATION_ERROR, path + "." + attribute,
                                  std::string("Relationship ") + attribute + " is required");
                    }
                };
                require(rel.source_model, "sourceModel");
                require(rel.target_model, "targetModel");
                require(rel.source_field, "sourceField");
                require(rel.target_field, "targetField");

                if (rel.target_model.empty()) {
                    continue;
                }

                if (!rel.source_field.empty() && !m.find_field(rel.source_field)) {
                    add_error(result, codes::SOURCE_FIELD_NOT_FOUND, path + ".sourceField",
                              "Source field '" + rel.source_field +
                              "' does not exist in model '" + m.name + "'");
                }

                const ir::model* target = find_model(rel.target_model);
                if (!target) {
                    add_error(result, codes::TARGET_MODEL_NOT_FOUND, path + ".targetModel",
                              "Target model '" + rel.target_model + "' does not exist");
                    continue;
                }

                if (!rel.target_field.empty() && !target->find_field(rel.target_field)) {
                    add_error(result, codes::TARGET_FIELD_NOT_FOUND, path + ".targetField",
                              "Target field '" + rel.target_field +
                              "' does not exist in model '" + rel.target_model + "'");
                }
            }
        }
    }
} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

std::string finding::format() const {
    std::string out = field.empty() ? message : field + ": " + message;
    if (!code.empty()) {
        out += " [" + code + "]";
    }
    return out;
}

std::vector<finding> validation_result::find_by_code(const std::string& code) const {
    std::vector<finding> out;
    auto matches = [&](const finding& f) { return f.code == code; };
    std::copy_if(errors.begin(), errors.end(), std::back_inserter(out), matches);
    std::copy_if(warnings.begin(), warnings.end(), std::back_inserter(out), matches);
    return out;
}

bool is_pascal_case(const std::string& name) {
    static const std::regex pattern("^[A-Z][a-zA-Z0-9]*$");
    return std::regex_match(name, pattern);
}

bool is_camel_case(const std::string& name) {
    static const std::regex pattern("^[a-z][a-zA-Z0-9]*$");
    return std::regex_match(name, pattern);
}

validation_result validate(const std::vector<ir::model>& models) {
    validation_result result;

    for (size_t i = 0; i < models.size(); ++i) {
        check_model(result, models[i], i);
    }

    check_unique_model_names(result, models);
    check_relationships(result, models);

    result.circular_references = detect_cycles(models);
    result.is_valid = result.errors.empty();

    return result;
}

} // namespace apigen::validation
