//
// Code Writer - RAII block emission for TypeScript and JavaScript
//
// Every block opener returns a guard; the guard writes the closing brace
// and restores the indentation when it goes out of scope. Chained clauses
// (`} catch (error) {`) take over the open scope from the guard they
// continue.
//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace apigen::codegen {

class IfBlock;
class TryBlock;
class CatchBlock;
class ScopeBlock;

// ============================================================================
// CodeWriter
// ============================================================================

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output);
    virtual ~CodeWriter() = default;

    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    /// Write a line at the current indentation; empty lines carry no indentation
    void write_line(const std::string& line);
    void write_blank_line();

    void indent();
    void unindent();
    [[nodiscard]] size_t indent_level() const { return indent_level_; }

    // if (<condition>) {
    IfBlock write_if(const std::string& condition);

    // try {
    TryBlock write_try();

    // <header> {  ...  }<suffix>
    ScopeBlock write_scope(const std::string& header = "", const std::string& suffix = "");

private:
    std::ostream& output_;
    size_t indent_level_ = 0;
    std::string indentation_;
};

// ============================================================================
// BlockGuard - closes one open scope
// ============================================================================

class BlockGuard {
public:
    BlockGuard(const BlockGuard&) = delete;
    BlockGuard& operator=(const BlockGuard&) = delete;
    BlockGuard(BlockGuard&& other) noexcept;
    BlockGuard& operator=(BlockGuard&& other) noexcept;

protected:
    /// Writes `opening`, indents, and remembers `closing`
    BlockGuard(CodeWriter* writer, const std::string& opening, std::string closing);

    /// Adopt a scope that is already open
    BlockGuard(CodeWriter* writer, std::string closing);

    ~BlockGuard();

    /// Give up the open scope without closing it; returns the writer
    CodeWriter* release() noexcept;

    CodeWriter* writer_;

private:
    std::string closing_;

    void close() noexcept;
};

// ============================================================================
// Guards
// ============================================================================

class IfBlock : public BlockGuard {
public:
    IfBlock(CodeWriter* writer, const std::string& condition);
};

class CatchBlock : public BlockGuard {
public:
    explicit CatchBlock(CodeWriter* writer);
};

class TryBlock : public BlockGuard {
public:
    explicit TryBlock(CodeWriter* writer);

    /// `} catch (<var_name>) {`, or `} catch {` for an empty name
    CatchBlock write_catch(const std::string& var_name = "error");
};

class ScopeBlock : public BlockGuard {
public:
    ScopeBlock(CodeWriter* writer, const std::string& header, const std::string& suffix);
};

}  // namespace apigen::codegen
