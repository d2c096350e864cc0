//
// TypeScript Code Writer - TypeScript/JavaScript module generation
//
// Extends the generic CodeWriter with module-level features:
// - Named, default and type-only imports
// - Class and method definitions with optional type annotations
// - Exports (ES module syntax for TypeScript, CommonJS for JavaScript)
//
// One writer instance emits one module. The same calls produce either
// TypeScript or plain JavaScript: annotations and type-only imports
// disappear in JavaScript, and named exports are collected into a single
// `module.exports` statement written by finish().
//

#pragma once

#include <apigen/codegen/code_writer.hh>
#include <apigen/ir.hh>

#include <string>
#include <vector>

namespace apigen::codegen {

class ClassBlock;
class FunctionBlock;

/// Method or function parameter
struct ts_param {
    std::string name;
    std::string type;           ///< TypeScript type; dropped in JavaScript
    std::string default_value;  ///< Optional default expression
};

// ============================================================================
// TsCodeWriter
// ============================================================================

class TsCodeWriter : public CodeWriter {
public:
    TsCodeWriter(std::ostream& output, ir::source_language language);

    [[nodiscard]] bool is_typescript() const {
        return language_ == ir::source_language::typescript;
    }

    // ========================================================================
    // Imports and exports
    // ========================================================================

    // import { A, B } from 'module';  |  const { A, B } = require('module');
    void write_import(const std::vector<std::string>& names, const std::string& module);

    // Type-only import (TypeScript only)
    void write_type_import(const std::vector<std::string>& names, const std::string& module);

    // import name from 'module';  |  const name = require('module');
    void write_default_import(const std::string& name, const std::string& module);

    // Declaration prefix for an exported constant: "export const x" | "const x"
    std::string export_const(const std::string& name);

    // export default name;  |  module.exports = name;
    void write_default_export(const std::string& name);

    // Close the module (writes the CommonJS export list in JavaScript)
    void finish();

    // ========================================================================
    // Blocks
    // ========================================================================

    // class Name {  |  class Name extends Base {
    ClassBlock write_class(const std::string& name, const std::string& base = "");

    FunctionBlock write_method(const std::string& name,
                               const std::vector<ts_param>& params,
                               const std::string& return_type,
                               bool is_async = false);

    // ========================================================================
    // Annotation helpers
    // ========================================================================

    // ": type" in TypeScript, "" in JavaScript
    [[nodiscard]] std::string annotate(const std::string& type) const;

    // "(a: A, b: B)" or "(a, b)"
    [[nodiscard]] std::string param_list(const std::vector<ts_param>& params) const;

    void write_comment(const std::string& comment);

private:
    ir::source_language language_;
    std::vector<std::string> named_exports_;
};

// ============================================================================
// Guards
// ============================================================================

class ClassBlock : public BlockGuard {
public:
    ClassBlock(TsCodeWriter* writer, const std::string& name, const std::string& base);

    // Field declaration: "private name: Type = init;" in TypeScript,
    // "name = init;" (or nothing without an initializer) in JavaScript
    void write_field(const std::string& visibility,
                     const std::string& name,
                     const std::string& type,
                     const std::string& initializer = "");

private:
    TsCodeWriter* ts_writer_;
};

class FunctionBlock : public BlockGuard {
public:
    FunctionBlock(TsCodeWriter* writer, const std::string& header);
};

}  // namespace apigen::codegen
