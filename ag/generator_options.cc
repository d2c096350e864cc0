#include "generator_options.hh"

#include <cstring>
#include <iostream>
#include <stdexcept>

namespace apigen::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Value of "--name=value" or "--name value"; empty name match returns nullopt
static std::optional<std::string> take_value(const char* name, int argc, const char* const* argv, int& i) {
    const char* arg = argv[i];
    const size_t len = std::strlen(name);
    if (std::strncmp(arg, name, len) != 0) {
        return std::nullopt;
    }
    if (arg[len] == '=') {
        std::string value = arg + len + 1;
        if (value.empty()) {
            throw std::runtime_error(std::string("Option ") + name + " requires argument");
        }
        return value;
    }
    if (arg[len] != '\0') {
        return std::nullopt;
    }
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string("Option ") + name + " requires argument");
    }
    return std::string(argv[++i]);
}

static ColorChoice parse_color(const std::string& value) {
    if (value == "auto") return ColorChoice::Auto;
    if (value == "always") return ColorChoice::Always;
    if (value == "never") return ColorChoice::Never;
    throw ir::unsupported_option_error("color", value, {"auto", "always", "never"});
}

// ============================================================================
// GeneratorOptions
// ============================================================================

ir::generation_options GeneratorOptions::apply_to(ir::generation_options options) const {
    if (framework) options.target_framework = *framework;
    if (database) options.database = *database;
    if (authentication) options.authentication = *authentication;
    if (language) options.language = *language;
    if (no_tests) options.include_tests = false;
    if (no_docs) options.include_documentation = false;
    return options;
}

packaging::export_options GeneratorOptions::export_options() const {
    packaging::export_options opts;
    opts.format = format;
    opts.tier = tier;
    opts.include_tests = !no_tests;
    opts.include_documentation = !no_docs;
    return opts;
}

// ============================================================================
// Main Parser
// ============================================================================

GeneratorOptions parse_command_line(int argc, const char* const* argv) {
    GeneratorOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Informational actions stop parsing
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            opts.action = DriverAction::Help;
            return opts;
        }
        if (std::strcmp(arg, "--version") == 0) {
            opts.action = DriverAction::Version;
            return opts;
        }
        if (std::strcmp(arg, "--list-formats") == 0) {
            opts.action = DriverAction::ListFormats;
            return opts;
        }
        if (std::strcmp(arg, "--list-templates") == 0) {
            opts.action = DriverAction::ListTemplates;
            return opts;
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }
        if (std::strcmp(arg, "--debug") == 0) {
            opts.verbose = true;
            opts.debug = true;
            continue;
        }
        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }
        if (auto value = take_value("--color", argc, argv, i)) {
            opts.color = parse_color(*value);
            continue;
        }

        // Output path
        if (starts_with(arg, "-o")) {
            std::string value = get_option_value(arg, "-o");
            if (value.empty() && i + 1 < argc) {
                value = argv[++i];
            }
            if (value.empty()) {
                throw std::runtime_error("Option -o requires argument");
            }
            opts.output_path = value;
            continue;
        }

        // Packaging
        if (auto value = take_value("--format", argc, argv, i)) {
            opts.format = packaging::parse_archive_format(*value);
            continue;
        }
        if (auto value = take_value("--template", argc, argv, i)) {
            opts.tier = packaging::parse_template_tier(*value);
            continue;
        }
        if (std::strcmp(arg, "--emit-dir") == 0) {
            opts.emit_dir = true;
            continue;
        }
        if (std::strcmp(arg, "--no-format") == 0) {
            opts.format_code = false;
            continue;
        }

        // Generation overrides
        if (auto value = take_value("--framework", argc, argv, i)) {
            opts.framework = ir::parse_framework(*value);
            continue;
        }
        if (auto value = take_value("--database", argc, argv, i)) {
            opts.database = ir::parse_database_engine(*value);
            continue;
        }
        if (auto value = take_value("--auth", argc, argv, i)) {
            opts.authentication = ir::parse_auth_strategy(*value);
            continue;
        }
        if (auto value = take_value("--language", argc, argv, i)) {
            opts.language = ir::parse_source_language(*value);
            continue;
        }
        if (std::strcmp(arg, "--no-tests") == 0) {
            opts.no_tests = true;
            continue;
        }
        if (std::strcmp(arg, "--no-docs") == 0) {
            opts.no_docs = true;
            continue;
        }

        // Warning options
        if (std::strcmp(arg, "-Werror") == 0) {
            opts.warnings_as_errors = true;
            continue;
        }
        if (std::strcmp(arg, "-w") == 0) {
            opts.suppress_all_warnings = true;
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        if (!opts.input_file.empty()) {
            throw std::runtime_error(std::string("Only one input file is accepted: ") + arg);
        }
        opts.input_file = arg;
    }

    // Validation
    if (opts.input_file.empty()) {
        throw std::runtime_error("No input file specified");
    }

    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <models.json|models.yaml>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  --list-formats          List archive formats\n";
    std::cout << "  --list-templates        List template tiers\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o <path>               Archive file (default: <project>.zip in the current directory)\n";
    std::cout << "  --format <zip|tar>      Archive format (default: zip)\n";
    std::cout << "  --template <tier>       basic, advanced or enterprise (default: basic)\n";
    std::cout << "  --emit-dir              Write the file tree to -o instead of an archive\n";
    std::cout << "  --no-format             Skip formatting of generated files\n";
    std::cout << "\n";

    std::cout << "Generation (overrides the description file):\n";
    std::cout << "  --framework <name>      express\n";
    std::cout << "  --database <name>       postgresql, mysql or mongodb\n";
    std::cout << "  --auth <name>           none, jwt or session\n";
    std::cout << "  --language <name>       typescript or javascript\n";
    std::cout << "  --no-tests              Leave out the generated test suite\n";
    std::cout << "  --no-docs               Leave out the API documentation\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  --debug                 Verbose output plus resolved options\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Werror                 Treat validation warnings as errors\n";
    std::cout << "  --color=<when>          auto, always or never\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " models.json\n";
    std::cout << "  " << program_name << " --format tar --template enterprise -o api.tar.gz models.yaml\n";
    std::cout << "  " << program_name << " --emit-dir -o out --auth session --language javascript models.json\n";
}

void print_version() {
    std::cout << "apigen v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void print_formats() {
    const auto& caps = packaging::supported_export_formats();
    std::cout << "Available archive formats:\n\n";
    for (const auto& f : caps.formats) {
        std::cout << "  " << packaging::to_string(f.format) << " (" << f.name << ")\n";
        std::cout << "    Extension: " << f.extension << "\n";
        std::cout << "    Media type: " << f.media_type << "\n";
    }
}

void print_templates() {
    const auto& caps = packaging::supported_export_formats();
    std::cout << "Available template tiers:\n\n";
    for (auto tier : caps.tiers) {
        std::cout << "  " << packaging::to_string(tier) << "\n";
    }
}

}  // namespace apigen::driver
