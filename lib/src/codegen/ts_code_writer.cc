//
// TypeScript Code Writer Implementation
//

#include <apigen/codegen/ts_code_writer.hh>

namespace apigen::codegen {

namespace {
    std::string join_names(const std::vector<std::string>& names) {
        std::string out;
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) out += ", ";
            out += names[i];
        }
        return out;
    }
}

// ============================================================================
// TsCodeWriter Implementation
// ============================================================================

TsCodeWriter::TsCodeWriter(std::ostream& output, ir::source_language language)
    : CodeWriter(output),
      language_(language)
{
}

void TsCodeWriter::write_import(const std::vector<std::string>& names, const std::string& module) {
    if (names.empty()) {
        return;
    }
    if (is_typescript()) {
        write_line("import { " + join_names(names) + " } from '" + module + "';");
    } else {
        write_line("const { " + join_names(names) + " } = require('" + module + "');");
    }
}

void TsCodeWriter::write_type_import(const std::vector<std::string>& names, const std::string& module) {
    if (is_typescript() && !names.empty()) {
        write_line("import { " + join_names(names) + " } from '" + module + "';");
    }
}

void TsCodeWriter::write_default_import(const std::string& name, const std::string& module) {
    if (is_typescript()) {
        write_line("import " + name + " from '" + module + "';");
    } else {
        write_line("const " + name + " = require('" + module + "');");
    }
}

std::string TsCodeWriter::export_const(const std::string& name) {
    if (is_typescript()) {
        return "export const " + name;
    }
    named_exports_.push_back(name);
    return "const " + name;
}

void TsCodeWriter::write_default_export(const std::string& name) {
    if (is_typescript()) {
        write_line("export default " + name + ";");
    } else {
        write_line("module.exports = " + name + ";");
    }
}

void TsCodeWriter::finish() {
    if (!is_typescript() && !named_exports_.empty()) {
        write_blank_line();
        write_line("module.exports = { " + join_names(named_exports_) + " };");
        named_exports_.clear();
    }
}

ClassBlock TsCodeWriter::write_class(const std::string& name, const std::string& base) {
    if (!is_typescript()) {
        named_exports_.push_back(name);
    }
    return ClassBlock(this, name, base);
}

FunctionBlock TsCodeWriter::write_method(const std::string& name,
                                         const std::vector<ts_param>& params,
                                         const std::string& return_type,
                                         bool is_async) {
    std::string header = is_async ? "async " : "";
    header += name + param_list(params);
    if (!return_type.empty()) {
        header += annotate(is_async ? "Promise<" + return_type + ">" : return_type);
    }
    return FunctionBlock(this, header);
}

std::string TsCodeWriter::annotate(const std::string& type) const {
    return is_typescript() && !type.empty() ? ": " + type : "";
}

std::string TsCodeWriter::param_list(const std::vector<ts_param>& params) const {
    std::string out = "(";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) out += ", ";
        out += params[i].name + annotate(params[i].type);
        if (!params[i].default_value.empty()) {
            out += " = " + params[i].default_value;
        }
    }
    return out + ")";
}

void TsCodeWriter::write_comment(const std::string& comment) {
    write_line("// " + comment);
}

// ============================================================================
// Guards
// ============================================================================

namespace {
    std::string class_header(const TsCodeWriter& writer, const std::string& name, const std::string& base) {
        std::string header = (writer.is_typescript() ? "export class " : "class ") + name;
        if (!base.empty()) {
            header += " extends " + base;
        }
        return header + " {";
    }
}

ClassBlock::ClassBlock(TsCodeWriter* writer, const std::string& name, const std::string& base)
    : BlockGuard(writer, class_header(*writer, name, base), "}"),
      ts_writer_(writer)
{
}

void ClassBlock::write_field(const std::string& visibility,
                             const std::string& name,
                             const std::string& type,
                             const std::string& initializer) {
    if (ts_writer_->is_typescript()) {
        std::string line = visibility + " " + name + ts_writer_->annotate(type);
        if (!initializer.empty()) {
            line += " = " + initializer;
        }
        ts_writer_->write_line(line + ";");
    } else if (!initializer.empty()) {
        ts_writer_->write_line(name + " = " + initializer + ";");
    }
}

FunctionBlock::FunctionBlock(TsCodeWriter* writer, const std::string& header)
    : BlockGuard(writer, header + " {", "}")
{
}

}  // namespace apigen::codegen
