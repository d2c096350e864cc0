//
// Command-line parsing for the apigen driver
//

#include <doctest/doctest.h>
#include "generator_options.hh"

#include <vector>

using namespace apigen;
using namespace apigen::driver;

namespace {
    GeneratorOptions parse(std::vector<const char*> args) {
        args.insert(args.begin(), "apigen");
        return parse_command_line(static_cast<int>(args.size()), args.data());
    }
}

TEST_SUITE("Command line") {

TEST_CASE("Defaults") {
    const auto opts = parse({"models.json"});
    CHECK(opts.action == DriverAction::Generate);
    CHECK(opts.input_file == "models.json");
    CHECK(opts.output_path.empty());
    CHECK_FALSE(opts.emit_dir);
    CHECK(opts.format == packaging::archive_format::zip);
    CHECK(opts.tier == packaging::template_tier::basic);
    CHECK(opts.format_code);
    CHECK_FALSE(opts.framework.has_value());
    CHECK(opts.color == ColorChoice::Auto);
}

TEST_CASE("Informational actions stop parsing") {
    CHECK(parse({"--help"}).action == DriverAction::Help);
    CHECK(parse({"-h", "--bogus"}).action == DriverAction::Help);
    CHECK(parse({"--version"}).action == DriverAction::Version);
    CHECK(parse({"--list-formats"}).action == DriverAction::ListFormats);
    CHECK(parse({"--list-templates"}).action == DriverAction::ListTemplates);
}

TEST_CASE("Output and packaging flags") {
    SUBCASE("Separate values") {
        const auto opts = parse({"-o", "api.tar.gz", "--format", "tar", "--template", "enterprise", "m.yaml"});
        CHECK(opts.output_path == "api.tar.gz");
        CHECK(opts.format == packaging::archive_format::tar);
        CHECK(opts.tier == packaging::template_tier::enterprise);
        CHECK(opts.input_file == "m.yaml");
    }

    SUBCASE("Attached values") {
        const auto opts = parse({"-oout", "--format=zip", "--template=advanced", "--emit-dir", "--no-format", "m.json"});
        CHECK(opts.output_path == "out");
        CHECK(opts.emit_dir);
        CHECK_FALSE(opts.format_code);
        CHECK(opts.tier == packaging::template_tier::advanced);
    }
}

TEST_CASE("Generation overrides") {
    const auto opts = parse({"--database=mysql", "--auth", "session", "--language=javascript",
                             "--framework", "express", "--no-tests", "--no-docs", "m.json"});

    ir::generation_options base;
    const auto applied = opts.apply_to(base);
    CHECK(applied.database == ir::database_engine::mysql);
    CHECK(applied.authentication == ir::auth_strategy::session);
    CHECK(applied.language == ir::source_language::javascript);
    CHECK(applied.target_framework == ir::framework::express);
    CHECK_FALSE(applied.include_tests);
    CHECK_FALSE(applied.include_documentation);

    const auto exported = opts.export_options();
    CHECK_FALSE(exported.include_tests);
    CHECK_FALSE(exported.include_documentation);

    SUBCASE("Unset overrides keep the description values") {
        ir::generation_options described;
        described.database = ir::database_engine::mongodb;
        described.include_tests = false;
        const auto kept = parse({"m.json"}).apply_to(described);
        CHECK(kept.database == ir::database_engine::mongodb);
        CHECK_FALSE(kept.include_tests);
        CHECK(kept.include_documentation);
    }
}

TEST_CASE("Diagnostic flags") {
    const auto opts = parse({"-Werror", "-w", "-v", "--color=never", "m.json"});
    CHECK(opts.warnings_as_errors);
    CHECK(opts.suppress_all_warnings);
    CHECK(opts.verbose);
    CHECK(opts.color == ColorChoice::Never);
    CHECK(parse({"-q", "m.json"}).quiet);

    const auto debug = parse({"--debug", "m.json"});
    CHECK(debug.debug);
    CHECK(debug.verbose);
}

TEST_CASE("Invalid command lines") {
    CHECK_THROWS_WITH_AS((void)parse({}), "No input file specified", std::runtime_error);
    CHECK_THROWS_WITH_AS((void)parse({"--frobnicate", "m.json"}), "Unknown option: --frobnicate", std::runtime_error);
    CHECK_THROWS_WITH_AS((void)parse({"a.json", "b.json"}), "Only one input file is accepted: b.json",
                         std::runtime_error);
    CHECK_THROWS_WITH_AS((void)parse({"-q", "-v", "m.json"}), "Cannot specify both -q/--quiet and -v/--verbose",
                         std::runtime_error);
    CHECK_THROWS_WITH_AS((void)parse({"m.json", "--format"}), "Option --format requires argument",
                         std::runtime_error);
    CHECK_THROWS_WITH_AS((void)parse({"m.json", "-o"}), "Option -o requires argument", std::runtime_error);

    CHECK_THROWS_AS((void)parse({"--format", "rar", "m.json"}), ir::unsupported_option_error);
    CHECK_THROWS_AS((void)parse({"--database=oracle", "m.json"}), ir::unsupported_option_error);
    CHECK_THROWS_AS((void)parse({"--color=sometimes", "m.json"}), ir::unsupported_option_error);
}

} // TEST_SUITE Command line
