//
// Code Formatter for apigen
//
// Best-effort normalization of generated artifacts plus a shallow
// structural check. Dispatch is on the content-language tag of the file:
//
//   typescript/javascript  re-indent by nesting, collapse blank runs
//   json                   parse and pretty-print
//   sql                    uppercase keywords, clause indentation
//   markdown               heading spacing, collapse blank runs
//   anything else          unchanged
//
// Formatting never fails: content that cannot be understood is returned
// as it came in.
//

#pragma once

#include "ir.hh"

#include <string>
#include <vector>

namespace apigen::format {

struct format_options {
    int indent_size = 2;
    bool use_tabs = false;

    /// One indentation step ("  " or "\t")
    [[nodiscard]] std::string indent_unit() const;
};

/// Result of validate_code(); errors are human readable
struct code_validation {
    bool is_valid = true;
    std::vector<std::string> errors;
};

/// Formatted copy of the file; path, kind and language are preserved
[[nodiscard]] ir::generated_file format_file(const ir::generated_file& file,
                                             const format_options& options = {});

[[nodiscard]] std::vector<ir::generated_file> format_files(const std::vector<ir::generated_file>& files,
                                                           const format_options& options = {});

/**
 * Shallow structural validation.
 *
 * typescript/javascript: balanced braces, parentheses and brackets
 * (string literals and comments are skipped).
 * json: strict parse.
 * sql: every statement starts with a known command keyword.
 * Other tags are always valid.
 */
[[nodiscard]] code_validation validate_code(const ir::generated_file& file);

// ============================================================================
// Per-language entry points
// ============================================================================

[[nodiscard]] std::string format_script(const std::string& code, const format_options& options);
[[nodiscard]] std::string format_json(const std::string& code, const format_options& options);
[[nodiscard]] std::string format_sql(const std::string& code);
[[nodiscard]] std::string format_markdown(const std::string& code);

} // namespace apigen::format
