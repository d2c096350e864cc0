//
// Export / Packaging Service for apigen
//
// Turns a generated project into a downloadable package:
//
//   1. Filter     test and documentation artifacts per ExportOptions
//   2. Tier files deployment bundle for basic / advanced / enterprise
//   3. Metadata   manifest-derived description (project.json)
//   4. Setup      SETUP.md with install and run instructions
//
// The package serializes to zip or gzip-wrapped tar. Archives carry
// project.json, SETUP.md and every package file at its relative path.
//

#pragma once

#include "archive.hh"
#include "ir.hh"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace apigen::packaging {

// ============================================================================
// Options
// ============================================================================

enum class archive_format { zip, tar };

enum class template_tier { basic, advanced, enterprise };

[[nodiscard]] std::string to_string(archive_format format);
[[nodiscard]] std::string to_string(template_tier tier);

/// Throw ir::unsupported_option_error on unknown spellings
[[nodiscard]] archive_format parse_archive_format(std::string_view text);
[[nodiscard]] template_tier parse_template_tier(std::string_view text);

struct export_options {
    archive_format format = archive_format::zip;
    bool include_tests = true;
    bool include_documentation = true;
    template_tier tier = template_tier::basic;
};

// ============================================================================
// Package
// ============================================================================

struct project_metadata {
    std::string name;
    std::string version;
    std::string description;
    std::string framework;
    std::string database;
    std::string authentication;
    std::string language;
    std::vector<std::string> features;
    nlohmann::ordered_json dependencies = nlohmann::ordered_json::object();
    nlohmann::ordered_json dev_dependencies = nlohmann::ordered_json::object();
    nlohmann::ordered_json scripts = nlohmann::ordered_json::object();

    /// project.json document (camelCase keys)
    [[nodiscard]] nlohmann::ordered_json to_json() const;
};

struct project_package {
    std::string id;
    std::string name;
    std::vector<ir::generated_file> files;
    project_metadata metadata;
    std::string setup_instructions;
    std::chrono::system_clock::time_point created_at;
};

/// Filter, augment with tier files and describe a generated project
[[nodiscard]] project_package create_project_package(const ir::generated_project& project,
                                                     const export_options& options = {});

[[nodiscard]] archive::bytes create_zip_archive(const project_package& pkg);
[[nodiscard]] archive::bytes create_tar_archive(const project_package& pkg);

/// Archive in the requested format
[[nodiscard]] archive::bytes create_archive(const project_package& pkg, archive_format format);

/// "<project name>.zip" or "<project name>.tar.gz"
[[nodiscard]] std::string archive_file_name(const project_package& pkg, archive_format format);

// ============================================================================
// Building blocks
// ============================================================================

/// Deployment files of the tier; each tier is a superset of the previous one
[[nodiscard]] std::vector<ir::generated_file> tier_files(const ir::generated_project& project,
                                                         template_tier tier);

/// Metadata from the project and its package.json. A missing or malformed
/// manifest yields empty dependency, devDependency and script maps.
[[nodiscard]] project_metadata make_metadata(const ir::generated_project& project,
                                             const export_options& options);

[[nodiscard]] std::string setup_instructions(const ir::generated_project& project,
                                             const export_options& options);

// ============================================================================
// Capabilities
// ============================================================================

struct format_description {
    archive_format format;
    std::string name;
    std::string extension;
    std::string media_type;
};

struct export_capabilities {
    std::vector<format_description> formats;
    std::vector<template_tier> tiers;
    export_options defaults;
};

/// Static description of the archive formats, tiers and default options
[[nodiscard]] const export_capabilities& supported_export_formats();

} // namespace apigen::packaging
