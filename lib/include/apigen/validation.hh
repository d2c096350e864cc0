//
// Model Validation for apigen
//
// Gate in front of code generation. All rules run to completion and every
// finding is collected; nothing short-circuits.
//
// RULES:
//   - Schema conformance      (error)
//   - Unique model names      (error, case-insensitive)
//   - Unique field names      (error, per model)
//   - Relationship endpoints  (error, per offending relationship)
//   - Naming conventions      (warning)
//   - Empty models            (warning)
//   - Missing identifier      (warning)
//   - Circular references     (reported separately, never blocking)
//
// USAGE EXAMPLE:
//   auto result = validation::validate(models);
//   if (!result.is_valid) {
//       for (const auto& e : result.errors) {
//           std::cerr << e.format() << "\n";
//       }
//       return 1;
//   }
//

#pragma once

#include "ir.hh"

#include <string>
#include <vector>

namespace apigen::validation {

// ============================================================================
// Finding Codes
// ============================================================================

/// Codes attached to every finding, stable for callers that map them to
/// client-facing errors.
namespace codes {
    // === Errors ===
    constexpr const char* SCHEMA_VALIDATION_ERROR = "SCHEMA_VALIDATION_ERROR";  ///< Malformed entity
    constexpr const char* DUPLICATE_MODEL_NAME = "DUPLICATE_MODEL_NAME";        ///< Two models share a name (ignoring case)
    constexpr const char* DUPLICATE_FIELD_NAME = "DUPLICATE_FIELD_NAME";        ///< Two fields of one model share a name
    constexpr const char* TARGET_MODEL_NOT_FOUND = "TARGET_MODEL_NOT_FOUND";    ///< Relationship points at an unknown model
    constexpr const char* SOURCE_FIELD_NOT_FOUND = "SOURCE_FIELD_NOT_FOUND";    ///< Relationship source field missing
    constexpr const char* TARGET_FIELD_NOT_FOUND = "TARGET_FIELD_NOT_FOUND";    ///< Relationship target field missing

    // === Warnings ===
    constexpr const char* NAMING_CONVENTION_WARNING = "NAMING_CONVENTION_WARNING";              ///< Model not PascalCase
    constexpr const char* FIELD_NAMING_CONVENTION_WARNING = "FIELD_NAMING_CONVENTION_WARNING";  ///< Field not camelCase
    constexpr const char* EMPTY_MODEL_WARNING = "EMPTY_MODEL_WARNING";                          ///< Model has no fields
    constexpr const char* NO_PRIMARY_KEY_WARNING = "NO_PRIMARY_KEY_WARNING";                    ///< No id/uuid/unique field

    // === Cycles ===
    constexpr const char* CIRCULAR_REFERENCE = "CIRCULAR_REFERENCE";            ///< Model graph contains a cycle
}

// ============================================================================
// Findings
// ============================================================================

/// A single validation finding.
///
/// `field` locates the offending attribute with an index path such as
/// `models[1].relationships[0].targetModel`.
struct finding {
    std::string field;
    std::string message;
    std::string code;

    /// Format as "field: message [code]"
    [[nodiscard]] std::string format() const;
};

/// A detected cycle in the model graph. `path` lists the models in visit
/// order and ends with the starting model again.
struct circular_reference {
    std::vector<std::string> path;

    /// Format as "A -> B -> A"
    [[nodiscard]] std::string format() const;
};

struct validation_result {
    bool is_valid = true;
    std::vector<finding> errors;
    std::vector<finding> warnings;
    std::vector<circular_reference> circular_references;

    [[nodiscard]] bool has_warnings() const { return !warnings.empty(); }
    [[nodiscard]] bool has_cycles() const { return !circular_references.empty(); }
    [[nodiscard]] size_t error_count() const { return errors.size(); }
    [[nodiscard]] size_t warning_count() const { return warnings.size(); }

    /// Findings with the given code (errors and warnings)
    [[nodiscard]] std::vector<finding> find_by_code(const std::string& code) const;
};

// ============================================================================
// Entry Points
// ============================================================================

/// Run every rule over the model set and aggregate the findings.
/// Never throws on malformed input; malformed input produces findings.
[[nodiscard]] validation_result validate(const std::vector<ir::model>& models);

/// Cycle detection alone. Relationships with a missing target model add no
/// edge. Each distinct cycle is reported once, starting from the earliest
/// model (in input order) on the cycle.
[[nodiscard]] std::vector<circular_reference> detect_cycles(const std::vector<ir::model>& models);

/// Naming convention predicates (exposed for tests and the CLI)
[[nodiscard]] bool is_pascal_case(const std::string& name);
[[nodiscard]] bool is_camel_case(const std::string& name);

} // namespace apigen::validation
