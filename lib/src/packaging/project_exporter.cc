//
// Project packaging and archive assembly
//

#include <apigen/packaging.hh>
#include <apigen/codegen.hh>

#include <algorithm>
#include <iterator>

namespace apigen::packaging {

using nlohmann::ordered_json;

namespace {
    struct option_spelling {
        const char* name;
        int value;
    };

    constexpr option_spelling FORMAT_NAMES[] = {
        {"zip", static_cast<int>(archive_format::zip)},
        {"tar", static_cast<int>(archive_format::tar)},
    };

    constexpr option_spelling TIER_NAMES[] = {
        {"basic", static_cast<int>(template_tier::basic)},
        {"advanced", static_cast<int>(template_tier::advanced)},
        {"enterprise", static_cast<int>(template_tier::enterprise)},
    };

    template<size_t N>
    int parse_spelling(const option_spelling (&table)[N], const char* option, std::string_view text) {
        for (const auto& row : table) {
            if (text == row.name) {
                return row.value;
            }
        }
        std::vector<std::string> accepted;
        for (const auto& row : table) {
            accepted.emplace_back(row.name);
        }
        throw ir::unsupported_option_error(option, std::string(text), accepted);
    }

    template<size_t N>
    std::string spelling_of(const option_spelling (&table)[N], int value) {
        for (const auto& row : table) {
            if (row.value == value) {
                return row.name;
            }
        }
        return {};
    }

    /// project.json, SETUP.md, then every package file
    std::vector<archive::entry> archive_entries(const project_package& pkg) {
        std::vector<archive::entry> entries;
        entries.reserve(pkg.files.size() + 2);
        entries.push_back({"project.json", pkg.metadata.to_json().dump(2)});
        entries.push_back({"SETUP.md", pkg.setup_instructions});
        for (const auto& file : pkg.files) {
            entries.push_back({file.path, file.content});
        }
        return entries;
    }
}

// ============================================================================
// Option spellings
// ============================================================================

std::string to_string(archive_format format) {
    return spelling_of(FORMAT_NAMES, static_cast<int>(format));
}

std::string to_string(template_tier tier) {
    return spelling_of(TIER_NAMES, static_cast<int>(tier));
}

archive_format parse_archive_format(std::string_view text) {
    return static_cast<archive_format>(parse_spelling(FORMAT_NAMES, "export format", text));
}

template_tier parse_template_tier(std::string_view text) {
    return static_cast<template_tier>(parse_spelling(TIER_NAMES, "template tier", text));
}

// ============================================================================
// Metadata
// ============================================================================

ordered_json project_metadata::to_json() const {
    return {
        {"name", name},
        {"version", version},
        {"description", description},
        {"framework", framework},
        {"database", database},
        {"authentication", authentication},
        {"language", language},
        {"features", features},
        {"dependencies", dependencies},
        {"devDependencies", dev_dependencies},
        {"scripts", scripts}
    };
}

project_metadata make_metadata(const ir::generated_project& project, const export_options& options) {
    const auto& gen = project.options;
    project_metadata meta;
    meta.name = project.name;
    meta.version = "1.0.0";
    meta.description = "Generated API project with " + std::to_string(project.models.size()) +
                       " models and " + std::to_string(project.endpoints.size()) + " endpoints";
    meta.framework = ir::to_string(gen.target_framework);
    meta.database = ir::to_string(gen.database);
    meta.authentication = ir::to_string(gen.authentication);
    meta.language = ir::to_string(gen.language);

    if (const ir::generated_file* manifest = project.find_file("package.json")) {
        try {
            const auto pkg = ordered_json::parse(manifest->content);
            auto section = [&pkg](const char* key) {
                auto it = pkg.find(key);
                return it != pkg.end() && it->is_object() ? *it : ordered_json::object();
            };
            meta.dependencies = section("dependencies");
            meta.dev_dependencies = section("devDependencies");
            meta.scripts = section("scripts");
        } catch (const nlohmann::json::exception&) {
            // Malformed manifest: metadata keeps empty maps
        }
    }

    meta.features = {
        meta.framework + " framework",
        meta.database + " database",
        meta.authentication + " authentication",
        "RESTful API endpoints",
        "Input validation",
        "Error handling"
    };
    if (gen.include_tests) {
        meta.features.emplace_back("Test suite");
    }
    if (gen.include_documentation) {
        meta.features.emplace_back("OpenAPI documentation");
    }
    if (!project.models.empty()) {
        meta.features.push_back(std::to_string(project.models.size()) + " data models");
    }
    if (!project.endpoints.empty()) {
        meta.features.push_back(std::to_string(project.endpoints.size()) + " API endpoints");
    }

    meta.features.emplace_back("Docker support");
    if (options.tier != template_tier::basic) {
        meta.features.emplace_back("CI pipeline");
        meta.features.emplace_back("Code quality tooling");
    }
    if (options.tier == template_tier::enterprise) {
        meta.features.emplace_back("Kubernetes deployment");
        meta.features.emplace_back("Helm chart");
        meta.features.emplace_back("Prometheus monitoring");
    }
    return meta;
}

// ============================================================================
// Package
// ============================================================================

project_package create_project_package(const ir::generated_project& project, const export_options& options) {
    project_package pkg;
    pkg.id = codegen::make_project_id();
    pkg.name = project.name;
    pkg.created_at = std::chrono::system_clock::now();

    std::copy_if(project.files.begin(), project.files.end(), std::back_inserter(pkg.files),
                 [&options](const ir::generated_file& f) {
                     if (f.kind == ir::artifact_kind::test && !options.include_tests) {
                         return false;
                     }
                     return f.kind != ir::artifact_kind::documentation || options.include_documentation;
                 });

    pkg.metadata = make_metadata(project, options);
    pkg.setup_instructions = setup_instructions(project, options);

    for (auto& file : tier_files(project, options.tier)) {
        pkg.files.push_back(std::move(file));
    }
    return pkg;
}

// ============================================================================
// Archives
// ============================================================================

archive::bytes create_zip_archive(const project_package& pkg) {
    return archive::write_zip(archive_entries(pkg), pkg.created_at);
}

archive::bytes create_tar_archive(const project_package& pkg) {
    return archive::write_tar_gz(archive_entries(pkg), pkg.created_at);
}

archive::bytes create_archive(const project_package& pkg, archive_format format) {
    return format == archive_format::tar ? create_tar_archive(pkg) : create_zip_archive(pkg);
}

std::string archive_file_name(const project_package& pkg, archive_format format) {
    return pkg.name + (format == archive_format::tar ? ".tar.gz" : ".zip");
}

// ============================================================================
// Capabilities
// ============================================================================

const export_capabilities& supported_export_formats() {
    static const export_capabilities capabilities = [] {
        export_capabilities c;
        c.formats = {
            {archive_format::zip, "ZIP Archive", ".zip", "application/zip"},
            {archive_format::tar, "TAR.GZ Archive", ".tar.gz", "application/gzip"}
        };
        c.tiers = {template_tier::basic, template_tier::advanced, template_tier::enterprise};
        return c;
    }();
    return capabilities;
}

} // namespace apigen::packaging
