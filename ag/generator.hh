#pragma once

#include "generator_options.hh"
#include "logger.hh"

#include <apigen/codegen.hh>
#include <apigen/loader.hh>
#include <apigen/packaging.hh>
#include <apigen/validation.hh>

namespace apigen::driver {

/// Main generator driver
class Generator {
public:
    explicit Generator(const GeneratorOptions& options, Logger& logger);

    /// Generate and package the project described by the input file
    /// Returns 0 on success, non-zero on error
    int run();

private:
    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Stage 1: Read models and options from the description file
    loader::project_description load();

    /// Stage 2: Validate the models
    /// Returns true when generation may proceed
    bool run_validation(const std::vector<ir::model>& models);

    /// Stage 3: Generate (and format) the project files
    ir::generated_project generate(const loader::project_description& description);

    /// Stage 4: Package and write the archive or the file tree
    void write_output(const ir::generated_project& project);

    // ========================================================================
    // Output Writing
    // ========================================================================

    void write_archive(const packaging::project_package& pkg);
    void write_tree(const packaging::project_package& pkg);
    void write_file(const std::filesystem::path& path, const std::string& content);

    void print_diagnostics(const validation::validation_result& result);

    // ========================================================================
    // State
    // ========================================================================

    const GeneratorOptions& options_;
    Logger& logger_;
};

}  // namespace apigen::driver
