#pragma once

#include <apigen/ir.hh>
#include <apigen/packaging.hh>

#include <filesystem>
#include <optional>
#include <string>

namespace apigen::driver {

/// What the driver does after parsing the command line
enum class DriverAction {
    Generate,       // Normal generation (default)
    Help,           // -h, --help
    Version,        // --version
    ListFormats,    // --list-formats
    ListTemplates   // --list-templates
};

enum class ColorChoice {
    Auto,
    Always,
    Never
};

/// Generator options (driver configuration only)
struct GeneratorOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::filesystem::path input_file;
    std::filesystem::path output_path;               // Archive file, or directory with --emit-dir
    bool emit_dir = false;                           // --emit-dir

    // ========================================================================
    // Packaging
    // ========================================================================

    packaging::archive_format format = packaging::archive_format::zip;
    packaging::template_tier tier = packaging::template_tier::basic;
    bool format_code = true;                         // --no-format clears

    // ========================================================================
    // Generation overrides (applied over the description file)
    // ========================================================================

    std::optional<ir::framework> framework;
    std::optional<ir::database_engine> database;
    std::optional<ir::auth_strategy> authentication;
    std::optional<ir::source_language> language;
    bool no_tests = false;                           // --no-tests
    bool no_docs = false;                            // --no-docs

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool warnings_as_errors = false;                 // -Werror
    bool suppress_all_warnings = false;              // -w
    bool verbose = false;                            // -v, --verbose
    bool debug = false;                              // --debug (implies verbose)
    bool quiet = false;                              // -q, --quiet
    ColorChoice color = ColorChoice::Auto;           // --color=

    DriverAction action = DriverAction::Generate;

    /// Description options with the command-line overrides applied
    [[nodiscard]] ir::generation_options apply_to(ir::generation_options options) const;

    /// Export options derived from the packaging flags
    [[nodiscard]] packaging::export_options export_options() const;
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments and
/// ir::unsupported_option_error on unknown option values
GeneratorOptions parse_command_line(int argc, const char* const* argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

/// Print available archive formats
void print_formats();

/// Print available template tiers
void print_templates();

}  // namespace apigen::driver
