//
// Code Writer Implementation
//

#include <apigen/codegen/code_writer.hh>

#include <utility>

namespace apigen::codegen {

namespace {
    constexpr const char* INDENT_UNIT = "  ";
}

// ============================================================================
// CodeWriter
// ============================================================================

CodeWriter::CodeWriter(std::ostream& output)
    : output_(output)
{
}

void CodeWriter::write_line(const std::string& line) {
    if (!line.empty()) {
        output_ << indentation_ << line;
    }
    output_ << '\n';
}

void CodeWriter::write_blank_line() {
    output_ << '\n';
}

void CodeWriter::indent() {
    ++indent_level_;
    indentation_ += INDENT_UNIT;
}

void CodeWriter::unindent() {
    if (indent_level_ > 0) {
        --indent_level_;
        indentation_.resize(indent_level_ * std::char_traits<char>::length(INDENT_UNIT));
    }
}

IfBlock CodeWriter::write_if(const std::string& condition) {
    return IfBlock(this, condition);
}

TryBlock CodeWriter::write_try() {
    return TryBlock(this);
}

ScopeBlock CodeWriter::write_scope(const std::string& header, const std::string& suffix) {
    return ScopeBlock(this, header, suffix);
}

// ============================================================================
// BlockGuard
// ============================================================================

BlockGuard::BlockGuard(CodeWriter* writer, const std::string& opening, std::string closing)
    : writer_(writer),
      closing_(std::move(closing))
{
    writer_->write_line(opening);
    writer_->indent();
}

BlockGuard::BlockGuard(CodeWriter* writer, std::string closing)
    : writer_(writer),
      closing_(std::move(closing))
{
}

BlockGuard::~BlockGuard() {
    close();
}

BlockGuard::BlockGuard(BlockGuard&& other) noexcept
    : writer_(other.release()),
      closing_(std::move(other.closing_))
{
}

BlockGuard& BlockGuard::operator=(BlockGuard&& other) noexcept {
    if (this != &other) {
        close();
        writer_ = other.release();
        closing_ = std::move(other.closing_);
    }
    return *this;
}

CodeWriter* BlockGuard::release() noexcept {
    return std::exchange(writer_, nullptr);
}

void BlockGuard::close() noexcept {
    if (writer_) {
        writer_->unindent();
        writer_->write_line(closing_);
        writer_ = nullptr;
    }
}

// ============================================================================
// Guards
// ============================================================================

IfBlock::IfBlock(CodeWriter* writer, const std::string& condition)
    : BlockGuard(writer, "if (" + condition + ") {", "}")
{
}

CatchBlock::CatchBlock(CodeWriter* writer)
    : BlockGuard(writer, "}")
{
}

TryBlock::TryBlock(CodeWriter* writer)
    : BlockGuard(writer, "try {", "}")
{
}

CatchBlock TryBlock::write_catch(const std::string& var_name) {
    CodeWriter* writer = release();
    writer->unindent();
    writer->write_line(var_name.empty() ? "} catch {" : "} catch (" + var_name + ") {");
    writer->indent();
    return CatchBlock(writer);
}

ScopeBlock::ScopeBlock(CodeWriter* writer, const std::string& header, const std::string& suffix)
    : BlockGuard(writer, header.empty() ? "{" : header + " {", "}" + suffix)
{
}

}  // namespace apigen::codegen
