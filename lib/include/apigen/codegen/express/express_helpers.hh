//
// Express Renderer Helpers
//
// Small formatting and naming utilities shared by the Express artifact
// generators:
// - Field selection (fields supplied by the record itself are skipped)
// - Column definitions for relational schemas
// - JavaScript literals for numbers and defaults
//

#pragma once

#include <apigen/ir.hh>

#include <string>
#include <vector>

namespace apigen::codegen::express {

/// Declared fields minus id, createdAt and updatedAt, in declaration order
[[nodiscard]] std::vector<const ir::field*> record_fields(const ir::model& m);

/**
 * Column definition for a relational schema.
 *
 * "email VARCHAR(255) NOT NULL UNIQUE", with the column named in
 * snake_case and the default rendered as an SQL literal.
 */
[[nodiscard]] std::string column_definition(const ir::field& f, ir::database_engine db);

/// Shortest JavaScript spelling of a number ("10", "0.5")
[[nodiscard]] std::string js_number(double value);

/// JavaScript expression for a field's declared default
[[nodiscard]] std::string js_default(const ir::field& f);

/// Model used for the generated class, variable and file names
struct model_names {
    std::string model;       ///< "BlogPost"
    std::string variable;    ///< "blogPost"
    std::string service;     ///< "BlogPostService"
    std::string repository;  ///< "BlogPostRepository"
    std::string controller;  ///< "BlogPostController"
    std::string route;       ///< "blogpost"
    std::string table;       ///< "blogposts" or the metadata override

    explicit model_names(const ir::model& m);
};

} // namespace apigen::codegen::express
