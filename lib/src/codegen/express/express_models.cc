//
// Express Renderer - record definitions and relational schemas
//

#include <apigen/codegen/express/express_renderer.hh>
#include <apigen/codegen/express/express_helpers.hh>
#include <apigen/codegen/naming.hh>
#include <apigen/codegen/type_tables.hh>

#include <sstream>

namespace apigen::codegen {

namespace {
    std::string jsdoc_type(ir::field_type type) {
        if (type == ir::field_type::json) {
            return "{Object}";
        }
        return "{" + ts_type(type) + "}";
    }

    const ir::model* find_model(const std::vector<ir::model>& models, const std::string& name) {
        for (const auto& m : models) {
            if (m.name == name) return &m;
        }
        return nullptr;
    }

    // Column of a relationship endpoint; the implicit primary key counts as a field
    bool has_column(const ir::model& m, const std::string& field_name) {
        return field_name == "id" || m.find_field(field_name) != nullptr;
    }

    std::string key_column_type(ir::database_engine db) {
        return db == ir::database_engine::mysql ? "CHAR(36)" : "UUID";
    }

    void write_foreign_key(std::ostringstream& out,
                           const ir::model& owner, const std::string& owner_field,
                           const ir::model& referenced, const std::string& referenced_field,
                           bool cascade, ir::database_engine db) {
        const std::string table = table_name(owner);
        out << "ALTER TABLE " << table << "\n"
            << "  ADD CONSTRAINT fk_" << table << "_" << snake_case(owner_field) << "\n"
            << "  FOREIGN KEY (" << column_name(owner_field, db) << ") REFERENCES " << table_name(referenced)
            << "(" << column_name(referenced_field, db) << ")";
        if (cascade) {
            out << " ON DELETE CASCADE";
        }
        out << ";\n\n";
    }

    void write_junction_table(std::ostringstream& out, const ir::model& source,
                              const ir::model& target, ir::database_engine db) {
        const std::string source_column = snake_case(source.name) + "_id";
        std::string target_column = snake_case(target.name) + "_id";
        if (target_column == source_column) {
            target_column = "related_" + target_column;
        }
        const std::string type = key_column_type(db);

        out << "CREATE TABLE IF NOT EXISTS " << table_name(source) << "_" << table_name(target) << " (\n"
            << "  " << source_column << " " << type << " NOT NULL,\n"
            << "  " << target_column << " " << type << " NOT NULL,\n"
            << "  PRIMARY KEY (" << source_column << ", " << target_column << "),\n"
            << "  FOREIGN KEY (" << source_column << ") REFERENCES " << table_name(source)
            << "(id) ON DELETE CASCADE,\n"
            << "  FOREIGN KEY (" << target_column << ") REFERENCES " << table_name(target)
            << "(id) ON DELETE CASCADE\n"
            << ");\n\n";
    }
}

// ============================================================================
// Record Definitions
// ============================================================================

std::string ExpressRenderer::record_definition(const GenerationContext& ctx, const ir::model& m) const {
    tmpl::context data = {
        {"modelName", m.name},
        {"description", m.metadata.description ? single_line(*m.metadata.description) : ""}
    };

    tmpl::context fields = tmpl::context::array();
    tmpl::context input_fields = tmpl::context::array();
    const bool ts = ctx.options.is_typescript();

    for (const ir::field* f : express::record_fields(m)) {
        const std::string optional = f->required ? "" : "?";
        if (ts) {
            fields.push_back({
                {"name", f->name},
                {"optional", optional},
                {"tsType", ts_type(f->type)},
                {"doc", f->description ? single_line(*f->description) : ""}
            });
            input_fields.push_back({
                {"name", f->name},
                {"optional", optional},
                {"tsType", ts_type(f->type)}
            });
        } else {
            const std::string jsdoc_name = f->required ? f->name : "[" + f->name + "]";
            fields.push_back({{"jsDocType", jsdoc_type(f->type)}, {"jsDocName", jsdoc_name}});
            input_fields.push_back({
                {"name", f->name},
                {"jsDocType", jsdoc_type(f->type)},
                {"jsDocName", jsdoc_name}
            });
        }
    }
    data["fields"] = std::move(fields);
    data["inputFields"] = std::move(input_fields);

    return ctx.templates.render(ts ? "record-interface" : "record-typedef", data);
}

// ============================================================================
// Relational Schemas
// ============================================================================

std::string ExpressRenderer::table_schema(const GenerationContext& ctx, const ir::model& m) const {
    tmpl::context columns = tmpl::context::array();
    for (const ir::field* f : express::record_fields(m)) {
        columns.push_back({{"definition", express::column_definition(*f, ctx.options.database)}});
    }

    tmpl::context data = {
        {"tableName", table_name(m)},
        {"description", m.metadata.description ? single_line(*m.metadata.description) : ""},
        {"columns", std::move(columns)}
    };

    const char* name = ctx.options.database == ir::database_engine::mysql ? "mysql-schema"
                                                                         : "postgresql-schema";
    return ctx.templates.render(name, data);
}

std::string ExpressRenderer::relationship_schema(const GenerationContext& ctx) const {
    std::ostringstream body;

    for (const auto& source : ctx.models) {
        for (const auto& rel : source.relationships) {
            const ir::model* target = find_model(ctx.models, rel.target_model);
            if (!target) {
                continue;
            }

            switch (rel.kind) {
                case ir::relationship_kind::one_to_one:
                    if (has_column(source, rel.source_field) && has_column(*target, rel.target_field)) {
                        body << "-- " << source.name << " has one " << target->name << "\n";
                        write_foreign_key(body, source, rel.source_field, *target, rel.target_field,
                                          rel.cascade_delete, ctx.options.database);
                    }
                    break;
                case ir::relationship_kind::one_to_many:
                    if (has_column(source, rel.source_field) && has_column(*target, rel.target_field)) {
                        body << "-- " << source.name << " has many " << target->name << "\n";
                        write_foreign_key(body, *target, rel.target_field, source, rel.source_field,
                                          rel.cascade_delete, ctx.options.database);
                    }
                    break;
                case ir::relationship_kind::many_to_many:
                    body << "-- " << source.name << " and " << target->name << " (many to many)\n";
                    write_junction_table(body, source, *target, ctx.options.database);
                    break;
            }
        }
    }

    std::string statements = body.str();
    if (statements.empty()) {
        return {};
    }
    statements.pop_back();  // single trailing newline
    return statements;
}

} // namespace apigen::codegen
