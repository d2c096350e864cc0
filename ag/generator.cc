#include "generator.hh"

#include <apigen/archive.hh>
#include <apigen/format.hh>

#include <fstream>

namespace apigen::driver {

Generator::Generator(const GeneratorOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Generator::run() {
    try {
        logger_.info("Generating from: " + options_.input_file.string());

        // Stage 1: Load description
        loader::project_description description = load();

        // Stage 2: Validation
        if (!run_validation(description.models)) {
            return 1;
        }

        // Stage 3: Generation
        ir::generated_project project = generate(description);

        // Stage 4: Packaging
        write_output(project);

        logger_.success("Generation successful");
        return 0;

    } catch (const loader::model_load_error& e) {
        logger_.error(std::string("Load error: ") + e.what());
        return 1;
    } catch (const ir::unsupported_option_error& e) {
        logger_.error(std::string("Unsupported option: ") + e.what());
        return 1;
    } catch (const codegen::codegen_error& e) {
        logger_.error(std::string("Code generation error: ") + e.what());
        return 1;
    } catch (const archive::archive_error& e) {
        logger_.error(std::string("Archive error: ") + e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        logger_.error(std::string("File system error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

loader::project_description Generator::load() {
    logger_.verbose("Loading: " + options_.input_file.string());

    auto description = loader::load_file(options_.input_file.string());
    description.options = options_.apply_to(description.options);

    logger_.verbose("Loaded " + std::to_string(description.models.size()) + " model(s)");
    for (const auto& m : description.models) {
        logger_.bullet(m.name + " (" + std::to_string(m.fields.size()) + " field(s), " +
                       std::to_string(m.relationships.size()) + " relationship(s))",
                       LogLevel::Verbose);
    }
    logger_.debug("framework=" + ir::to_string(description.options.target_framework) +
                  " database=" + ir::to_string(description.options.database) +
                  " auth=" + ir::to_string(description.options.authentication) +
                  " language=" + ir::to_string(description.options.language));
    return description;
}

bool Generator::run_validation(const std::vector<ir::model>& models) {
    logger_.verbose("Validating models...");

    auto result = validation::validate(models);
    print_diagnostics(result);

    if (!result.is_valid) {
        return false;
    }
    if (options_.warnings_as_errors && result.has_warnings()) {
        logger_.error("Warnings treated as errors (-Werror)");
        return false;
    }
    return true;
}

ir::generated_project Generator::generate(const loader::project_description& description) {
    logger_.verbose("Generating project for framework: " +
                    ir::to_string(description.options.target_framework));

    auto project = codegen::generate_project(description.models, description.options);

    logger_.verbose("Generated " + std::to_string(project.files.size()) + " file(s), " +
                    std::to_string(project.endpoints.size()) + " endpoint(s)");

    if (options_.format_code) {
        logger_.verbose("Formatting generated files...");
        project.files = format::format_files(project.files);

        for (const auto& file : project.files) {
            auto check = format::validate_code(file);
            for (const auto& message : check.errors) {
                if (!options_.suppress_all_warnings) {
                    logger_.warning(file.path + ": " + message);
                }
            }
        }
    }
    return project;
}

void Generator::write_output(const ir::generated_project& project) {
    auto export_opts = options_.export_options();
    logger_.verbose("Packaging with template tier: " + packaging::to_string(export_opts.tier));

    auto pkg = packaging::create_project_package(project, export_opts);
    logger_.debug("package id " + pkg.id);

    if (options_.emit_dir) {
        write_tree(pkg);
    } else {
        write_archive(pkg);
    }
}

// ============================================================================
// Output Writing
// ============================================================================

void Generator::write_archive(const packaging::project_package& pkg) {
    auto bytes = packaging::create_archive(pkg, options_.format);

    std::filesystem::path target = options_.output_path;
    if (target.empty()) {
        target = packaging::archive_file_name(pkg, options_.format);
    }

    write_file(target, std::string(bytes.begin(), bytes.end()));
    logger_.success("Wrote " + target.string() + " (" + std::to_string(bytes.size()) + " bytes)");
}

void Generator::write_tree(const packaging::project_package& pkg) {
    std::filesystem::path root = options_.output_path;
    if (root.empty()) {
        root = pkg.name;
    }

    write_file(root / "project.json", pkg.metadata.to_json().dump(2));
    write_file(root / "SETUP.md", pkg.setup_instructions);
    for (const auto& file : pkg.files) {
        write_file(root / file.path, file.content);
    }
    logger_.success("Wrote " + std::to_string(pkg.files.size() + 2) + " file(s) to " + root.string());
}

void Generator::write_file(const std::filesystem::path& path, const std::string& content) {
    logger_.verbose("Writing: " + path.string());

    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }

    ofs << content;

    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

// ============================================================================
// Diagnostics
// ============================================================================

void Generator::print_diagnostics(const validation::validation_result& result) {
    for (const auto& e : result.errors) {
        logger_.error(e.format());
    }
    if (!options_.suppress_all_warnings) {
        for (const auto& w : result.warnings) {
            logger_.warning(w.format());
        }
        for (const auto& cycle : result.circular_references) {
            logger_.warning("circular reference: " + cycle.format());
        }
    }

    if (result.error_count() > 0) {
        logger_.error("Total errors: " + std::to_string(result.error_count()));
    }
    if (result.has_warnings() && !options_.suppress_all_warnings) {
        logger_.warning("Total warnings: " + std::to_string(result.warning_count()));
    }
}

}  // namespace apigen::driver
