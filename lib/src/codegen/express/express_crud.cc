//
// Express Renderer - controllers, services, repositories, routes and
// request validation
//

#include <apigen/codegen/express/express_renderer.hh>
#include <apigen/codegen/express/express_helpers.hh>
#include <apigen/codegen/naming.hh>
#include <apigen/codegen/ts_code_writer.hh>
#include <apigen/codegen/type_tables.hh>

#include <algorithm>
#include <map>
#include <sstream>

namespace apigen::codegen {

namespace {
    std::string join(const std::vector<std::string>& items, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out += sep;
            out += items[i];
        }
        return out;
    }

    std::vector<std::string> record_types(const std::string& model) {
        return {model, "Create" + model + "Request", "Update" + model + "Request"};
    }

    /// "{ a, b, c }" style object literal lines, with a trailing comma on all but the last
    void write_object_entries(TsCodeWriter& w, const std::vector<std::string>& entries) {
        for (size_t i = 0; i < entries.size(); ++i) {
            w.write_line(entries[i] + (i + 1 < entries.size() ? "," : ""));
        }
    }

    std::string row_value(const ir::field& f, ir::database_engine db) {
        const std::string access = "row." + snake_case(f.name);
        // mysql2 returns BOOLEAN columns as 0/1
        if (db == ir::database_engine::mysql && f.type == ir::field_type::boolean) {
            return f.required ? "Boolean(" + access + ")"
                              : access + " == null ? undefined : Boolean(" + access + ")";
        }
        return access;
    }

    // ========================================================================
    // Relational repositories (pg and mysql2)
    // ========================================================================

    class relational_repository {
    public:
        relational_repository(TsCodeWriter& w, const ir::model& m, ir::database_engine db)
            : w_(w), model_(m), db_(db), names_(m) {}

        void write(bool account_queries) {
            const bool ts = w_.is_typescript();
            const std::string& M = names_.model;

            if (mysql()) {
                w_.write_import({"randomUUID"}, "crypto");
            }
            w_.write_import({"query"}, "../database/connection");
            w_.write_type_import(record_types(M), "../models/" + M);
            w_.write_blank_line();

            write_column_map();
            w_.write_blank_line();

            auto cls = w_.write_class(names_.repository);
            cls.write_field("private", "tableName", "", js_string(names_.table));
            w_.write_blank_line();

            {
                auto fn = w_.write_method("create", {{"data", "Create" + M + "Request", ""}}, M, true);
                w_.write_line("const entries = this.toColumns(data);");
                if (mysql()) {
                    w_.write_line("const id = randomUUID();");
                    w_.write_line("entries.unshift(['id', id]);");
                    w_.write_line("const columns = entries.map(([column]) => column).join(', ');");
                    w_.write_line("const placeholders = entries.map(() => '?').join(', ');");
                    w_.write_line("await query(");
                    w_.indent();
                    w_.write_line("`INSERT INTO ${this.tableName} (${columns}) VALUES (${placeholders})`,");
                    w_.write_line("entries.map(([, value]) => value)");
                    w_.unindent();
                    w_.write_line(");");
                    w_.write_line("const created = await this.findById(id);");
                    w_.write_line(ts ? "return created as " + M + ";" : "return created;");
                } else {
                    {
                        auto empty = w_.write_if("entries.length === 0");
                        w_.write_line("const result = await query(`INSERT INTO ${this.tableName} DEFAULT VALUES RETURNING *`);");
                        w_.write_line("return this.mapRowToModel(result.rows[0]);");
                    }
                    w_.write_line("const columns = entries.map(([column]) => column).join(', ');");
                    w_.write_line("const placeholders = entries.map((_, index) => `$${index + 1}`).join(', ');");
                    w_.write_line("const result = await query(");
                    w_.indent();
                    w_.write_line("`INSERT INTO ${this.tableName} (${columns}) VALUES (${placeholders}) RETURNING *`,");
                    w_.write_line("entries.map(([, value]) => value)");
                    w_.unindent();
                    w_.write_line(");");
                    w_.write_line("return this.mapRowToModel(result.rows[0]);");
                }
            }
            w_.write_blank_line();

            {
                auto fn = w_.write_method("findById", {{"id", "string", ""}}, M + " | null", true);
                w_.write_line("const result = await query(`SELECT * FROM ${this.tableName} WHERE id = " +
                              placeholder(1) + "`, [id]);");
                w_.write_line("return result.rows.length > 0 ? this.mapRowToModel(result.rows[0]) : null;");
            }
            w_.write_blank_line();

            {
                auto fn = w_.write_method("findMany", {{"limit", "number", ""}, {"offset", "number", ""}},
                                          M + "[]", true);
                w_.write_line("const result = await query(");
                w_.indent();
                w_.write_line("`SELECT * FROM ${this.tableName} ORDER BY created_at DESC LIMIT " +
                              placeholder(1) + " OFFSET " + placeholder(2) + "`,");
                w_.write_line("[limit, offset]");
                w_.unindent();
                w_.write_line(");");
                w_.write_line("return result.rows.map((row) => this.mapRowToModel(row));");
            }
            w_.write_blank_line();

            {
                auto fn = w_.write_method("count", {}, "number", true);
                w_.write_line("const result = await query(`SELECT COUNT(*) AS count FROM ${this.tableName}`);");
                w_.write_line("return Number(result.rows[0].count);");
            }
            w_.write_blank_line();

            {
                auto fn = w_.write_method("update", {{"id", "string", ""}, {"data", "Update" + M + "Request", ""}},
                                          M + " | null", true);
                w_.write_line("const entries = this.toColumns(data);");
                {
                    auto empty = w_.write_if("entries.length === 0");
                    w_.write_line("return this.findById(id);");
                }
                if (mysql()) {
                    w_.write_line("const assignments = entries.map(([column]) => `${column} = ?`).join(', ');");
                    w_.write_line("await query(");
                    w_.indent();
                    w_.write_line("`UPDATE ${this.tableName} SET ${assignments} WHERE id = ?`,");
                    w_.write_line("[...entries.map(([, value]) => value), id]");
                    w_.unindent();
                    w_.write_line(");");
                    w_.write_line("return this.findById(id);");
                } else {
                    w_.write_line("const assignments = entries.map(([column], index) => `${column} = $${index + 2}`).join(', ');");
                    w_.write_line("const result = await query(");
                    w_.indent();
                    w_.write_line("`UPDATE ${this.tableName} SET ${assignments} WHERE id = $1 RETURNING *`,");
                    w_.write_line("[id, ...entries.map(([, value]) => value)]");
                    w_.unindent();
                    w_.write_line(");");
                    w_.write_line("return result.rows.length > 0 ? this.mapRowToModel(result.rows[0]) : null;");
                }
            }
            w_.write_blank_line();

            {
                auto fn = w_.write_method("delete", {{"id", "string", ""}}, "void", true);
                w_.write_line("await query(`DELETE FROM ${this.tableName} WHERE id = " + placeholder(1) +
                              "`, [id]);");
            }
            w_.write_blank_line();

            if (account_queries) {
                {
                    auto fn = w_.write_method("findByEmail", {{"email", "string", ""}}, M + " | null", true);
                    w_.write_line("const result = await query(`SELECT * FROM ${this.tableName} WHERE email = " +
                                  placeholder(1) + "`, [email]);");
                    w_.write_line("return result.rows.length > 0 ? this.mapRowToModel(result.rows[0]) : null;");
                }
                w_.write_blank_line();
                {
                    auto fn = w_.write_method("updateLastLogin", {{"id", "string", ""}}, "void", true);
                    w_.write_line("await query(`UPDATE ${this.tableName} SET last_login_at = NOW() WHERE id = " +
                                  placeholder(1) + "`, [id]);");
                }
                w_.write_blank_line();
            }

            {
                auto fn = w_.write_method(ts ? "private toColumns" : "toColumns", {{"data", "object", ""}},
                                          "Array<[string, unknown]>");
                w_.write_line("return Object.entries(data)");
                w_.indent();
                w_.write_line(".filter(([key, value]) => Object.prototype.hasOwnProperty.call(COLUMNS, key) && value !== undefined)");
                w_.write_line(std::string(".map(([key, value]) => [COLUMNS[key], toDatabaseValue(value)]") +
                              (ts ? " as [string, unknown]);" : ");"));
                w_.unindent();
            }
            w_.write_blank_line();

            {
                auto fn = w_.write_method(ts ? "private mapRowToModel" : "mapRowToModel", {{"row", "any", ""}}, M);
                std::vector<std::string> entries = {"id: row.id"};
                for (const ir::field* f : express::record_fields(model_)) {
                    entries.push_back(f->name + ": " + row_value(*f, db_));
                }
                entries.push_back("createdAt: row.created_at");
                entries.push_back("updatedAt: row.updated_at");
                w_.write_line("return {");
                w_.indent();
                write_object_entries(w_, entries);
                w_.unindent();
                w_.write_line("};");
            }
        }

    private:
        bool mysql() const { return db_ == ir::database_engine::mysql; }

        std::string placeholder(int index) const {
            return mysql() ? "?" : "$" + std::to_string(index);
        }

        void write_column_map() {
            const bool ts = w_.is_typescript();
            std::vector<std::string> entries;
            for (const ir::field* f : express::record_fields(model_)) {
                entries.push_back(f->name + ": " + js_string(column_name(f->name, db_)));
            }
            const std::string decl = std::string("const COLUMNS") + (ts ? ": Record<string, string>" : "");
            if (entries.empty()) {
                w_.write_line(decl + " = {};");
            } else {
                w_.write_line(decl + " = {");
                w_.indent();
                write_object_entries(w_, entries);
                w_.unindent();
                w_.write_line("};");
            }
            w_.write_blank_line();
            w_.write_comment("Objects are stored as JSON text; dates are passed through to the driver");
            {
                auto fn = w_.write_scope("const toDatabaseValue = " + w_.param_list({{"value", "unknown", ""}}) +
                                         w_.annotate("unknown") + " =>", ";");
                {
                    auto obj = w_.write_if("value !== null && typeof value === 'object' && !(value instanceof Date)");
                    w_.write_line("return JSON.stringify(value);");
                }
                w_.write_line("return value;");
            }
        }

        TsCodeWriter& w_;
        const ir::model& model_;
        ir::database_engine db_;
        express::model_names names_;
    };

    // ========================================================================
    // MongoDB repositories
    // ========================================================================

    void write_document_repository(TsCodeWriter& w, const ir::model& m, bool account_queries) {
        const bool ts = w.is_typescript();
        const express::model_names names(m);
        const std::string& M = names.model;
        const std::string any_cast = ts ? " as any" : "";
        const auto fields = express::record_fields(m);

        w.write_import({"randomUUID"}, "crypto");
        w.write_import({"getDb"}, "../database/connection");
        w.write_type_import(record_types(M), "../models/" + M);
        w.write_blank_line();

        std::vector<std::string> quoted;
        std::vector<std::string> defaults;
        for (const ir::field* f : fields) {
            quoted.push_back(js_string(f->name));
            if (f->default_value) {
                defaults.push_back(f->name + ": " + express::js_default(*f));
            }
        }
        w.write_line(std::string("const FIELDS") + (ts ? ": string[]" : "") + " = [" + join(quoted, ", ") + "];");
        if (defaults.empty()) {
            w.write_line(std::string("const DEFAULTS") + (ts ? ": Record<string, unknown>" : "") + " = {};");
        } else {
            w.write_line(std::string("const DEFAULTS") + (ts ? ": Record<string, unknown>" : "") + " = {");
            w.indent();
            write_object_entries(w, defaults);
            w.unindent();
            w.write_line("};");
        }
        w.write_blank_line();

        auto cls = w.write_class(names.repository);
        cls.write_field("private", "collectionName", "", js_string(names.table));
        w.write_blank_line();

        {
            auto fn = w.write_method(ts ? "private async collection" : "async collection", {}, "");
            w.write_line("const db = await getDb();");
            w.write_line("return db.collection(this.collectionName);");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method("create", {{"data", "Create" + M + "Request", ""}}, M, true);
            w.write_line("const now = new Date();");
            w.write_line("const document = { _id: randomUUID(), ...DEFAULTS, ...this.pick(data), createdAt: now, updatedAt: now };");
            w.write_line("const collection = await this.collection();");
            w.write_line("await collection.insertOne(document" + any_cast + ");");
            w.write_line("return this.mapDocumentToModel(document);");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method("findById", {{"id", "string", ""}}, M + " | null", true);
            w.write_line("const collection = await this.collection();");
            w.write_line("const document = await collection.findOne({ _id: id }" + any_cast + ");");
            w.write_line("return document ? this.mapDocumentToModel(document) : null;");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method("findMany", {{"limit", "number", ""}, {"offset", "number", ""}}, M + "[]", true);
            w.write_line("const collection = await this.collection();");
            w.write_line("const documents = await collection.find({}).sort({ createdAt: -1 }).skip(offset).limit(limit).toArray();");
            w.write_line("return documents.map((document) => this.mapDocumentToModel(document));");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method("count", {}, "number", true);
            w.write_line("const collection = await this.collection();");
            w.write_line("return collection.countDocuments();");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method("update", {{"id", "string", ""}, {"data", "Update" + M + "Request", ""}},
                                     M + " | null", true);
            w.write_line("const collection = await this.collection();");
            w.write_line("await collection.updateOne({ _id: id }" + any_cast +
                         ", { $set: { ...this.pick(data), updatedAt: new Date() } });");
            w.write_line("return this.findById(id);");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method("delete", {{"id", "string", ""}}, "void", true);
            w.write_line("const collection = await this.collection();");
            w.write_line("await collection.deleteOne({ _id: id }" + any_cast + ");");
        }
        w.write_blank_line();

        if (account_queries) {
            {
                auto fn = w.write_method("findByEmail", {{"email", "string", ""}}, M + " | null", true);
                w.write_line("const collection = await this.collection();");
                w.write_line("const document = await collection.findOne({ email });");
                w.write_line("return document ? this.mapDocumentToModel(document) : null;");
            }
            w.write_blank_line();
            {
                auto fn = w.write_method("updateLastLogin", {{"id", "string", ""}}, "void", true);
                w.write_line("const collection = await this.collection();");
                w.write_line("await collection.updateOne({ _id: id }" + any_cast +
                             ", { $set: { lastLoginAt: new Date() } });");
            }
            w.write_blank_line();
        }

        {
            auto fn = w.write_method(ts ? "private pick" : "pick", {{"data", "object", ""}}, "Record<string, unknown>");
            w.write_line("return Object.fromEntries(");
            w.indent();
            w.write_line("Object.entries(data).filter(([key, value]) => FIELDS.includes(key) && value !== undefined)");
            w.unindent();
            w.write_line(");");
        }
        w.write_blank_line();

        {
            auto fn = w.write_method(ts ? "private mapDocumentToModel" : "mapDocumentToModel",
                                     {{"document", "any", ""}}, M);
            std::vector<std::string> entries = {"id: document._id"};
            for (const ir::field* f : fields) {
                entries.push_back(f->name + ": document." + f->name);
            }
            entries.push_back("createdAt: document.createdAt");
            entries.push_back("updatedAt: document.updatedAt");
            w.write_line("return {");
            w.indent();
            write_object_entries(w, entries);
            w.unindent();
            w.write_line("};");
        }
    }

    // ========================================================================
    // Validation chains
    // ========================================================================

    struct bound_rules {
        const ir::validation_rule* lower = nullptr;
        const ir::validation_rule* upper = nullptr;

        [[nodiscard]] bool any() const { return lower || upper; }

        [[nodiscard]] std::string options() const {
            std::vector<std::string> parts;
            if (lower) parts.push_back("min: " + express::js_number(lower->number()));
            if (upper) parts.push_back("max: " + express::js_number(upper->number()));
            return "{ " + join(parts, ", ") + " }";
        }

        [[nodiscard]] std::string message_suffix() const {
            for (const auto* rule : {lower, upper}) {
                if (rule && rule->message) {
                    return ".withMessage(" + js_string(*rule->message) + ")";
                }
            }
            return "";
        }
    };

    bound_rules find_bounds(const ir::field& f, ir::validation_rule_kind low, ir::validation_rule_kind high) {
        bound_rules bounds;
        for (const auto& rule : f.validation) {
            if (!rule.is_numeric()) continue;
            if (rule.kind == low && !bounds.lower) bounds.lower = &rule;
            if (rule.kind == high && !bounds.upper) bounds.upper = &rule;
        }
        return bounds;
    }

    std::string validator_chain(const ir::field& f, bool for_update) {
        std::string chain = "body(" + js_string(f.name) + ")";
        if (f.required && !for_update) {
            chain += ".exists({ checkNull: true }).withMessage(" + js_string(f.name + " is required") + ").bail()";
        } else {
            chain += ".optional({ values: 'null' })";
        }

        const std::string base = type_info(f.type).validator;

        if (is_numeric_type(f.type)) {
            auto bounds = find_bounds(f, ir::validation_rule_kind::min, ir::validation_rule_kind::max);
            if (bounds.any()) {
                const char* check = f.type == ir::field_type::integer ? "isInt" : "isFloat";
                chain += std::string(".") + check + "(" + bounds.options() + ")" + bounds.message_suffix();
            } else {
                chain += "." + base;
            }
        } else {
            chain += "." + base;
        }

        if (is_textual_type(f.type)) {
            auto lengths = find_bounds(f, ir::validation_rule_kind::min_length, ir::validation_rule_kind::max_length);
            if (lengths.any()) {
                chain += ".isLength(" + lengths.options() + ")" + lengths.message_suffix();
            }
            for (const auto& rule : f.validation) {
                if (rule.kind == ir::validation_rule_kind::pattern && !rule.is_numeric()) {
                    chain += ".matches(new RegExp(" + js_string(rule.text()) + "))";
                    if (rule.message) {
                        chain += ".withMessage(" + js_string(*rule.message) + ")";
                    }
                }
            }
        }
        return chain;
    }

    std::string guard_middleware(ir::auth_strategy strategy) {
        return strategy == ir::auth_strategy::session ? "authenticateSession" : "authenticateToken";
    }

    /// Roles passed to authorize(); empty when every configured role may call the endpoint
    std::vector<std::string> route_roles(const ir::endpoint& ep, const ir::model& m, const ir::auth_config& auth) {
        std::vector<std::string> roles = ep.roles;
        const bool write_op = ep.operation == ir::endpoint_operation::create ||
                              ep.operation == ir::endpoint_operation::update;
        if (write_op && !m.metadata.allowed_roles.empty()) {
            roles = m.metadata.allowed_roles;
        }
        const auto all = auth.role_names();
        const bool covers_all = std::all_of(all.begin(), all.end(), [&roles](const std::string& r) {
            return std::find(roles.begin(), roles.end(), r) != roles.end();
        });
        return covers_all ? std::vector<std::string>{} : roles;
    }
}

// ============================================================================
// Controller and Service
// ============================================================================

std::string ExpressRenderer::controller(const GenerationContext& ctx, const ir::model& m) const {
    const express::model_names names(m);
    tmpl::context data = {
        {"modelName", names.model},
        {"serviceName", names.service},
        {"serviceVar", lower_first(names.service)}
    };
    return ctx.templates.render(ctx.options.is_typescript() ? "express-controller" : "express-controller-js",
                                data);
}

std::string ExpressRenderer::service(const GenerationContext& ctx, const ir::model& m) const {
    const express::model_names names(m);
    const std::string& M = names.model;
    const std::string repo = "this." + lower_first(names.repository);

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    w.write_import({names.repository}, "../repositories/" + names.repository);
    w.write_type_import(record_types(M), "../models/" + M);
    w.write_blank_line();
    {
        auto cls = w.write_class(names.service);
        if (w.is_typescript()) {
            cls.write_field("private", lower_first(names.repository), names.repository);
            w.write_blank_line();
        }
        {
            auto fn = w.write_method("constructor", {}, "");
            w.write_line(repo + " = new " + names.repository + "();");
        }
        w.write_blank_line();
        {
            auto fn = w.write_method("create", {{"data", "Create" + M + "Request", ""}}, M, true);
            w.write_line("return " + repo + ".create(data);");
        }
        w.write_blank_line();
        {
            auto fn = w.write_method("getById", {{"id", "string", ""}}, M + " | null", true);
            w.write_line("return " + repo + ".findById(id);");
        }
        w.write_blank_line();
        {
            auto fn = w.write_method("getAll", {{"page", "number", "1"}, {"limit", "number", "10"}},
                                     "{ items: " + M + "[]; total: number }", true);
            w.write_line("const offset = (page - 1) * limit;");
            w.write_line("const [items, total] = await Promise.all([");
            w.indent();
            w.write_line(repo + ".findMany(limit, offset),");
            w.write_line(repo + ".count()");
            w.unindent();
            w.write_line("]);");
            w.write_line("return { items, total };");
        }
        w.write_blank_line();
        {
            auto fn = w.write_method("update", {{"id", "string", ""}, {"data", "Update" + M + "Request", ""}},
                                     M + " | null", true);
            w.write_line("const existing = await " + repo + ".findById(id);");
            {
                auto missing = w.write_if("!existing");
                w.write_line("return null;");
            }
            w.write_line("return " + repo + ".update(id, data);");
        }
        w.write_blank_line();
        {
            auto fn = w.write_method("delete", {{"id", "string", ""}}, "boolean", true);
            w.write_line("const existing = await " + repo + ".findById(id);");
            {
                auto missing = w.write_if("!existing");
                w.write_line("return false;");
            }
            w.write_line("await " + repo + ".delete(id);");
            w.write_line("return true;");
        }
    }
    w.finish();
    return out.str();
}

// ============================================================================
// Repository
// ============================================================================

std::string ExpressRenderer::repository(const GenerationContext& ctx, const ir::model& m,
                                        bool account_queries) const {
    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    if (ctx.options.is_relational()) {
        relational_repository(w, m, ctx.options.database).write(account_queries);
    } else {
        write_document_repository(w, m, account_queries);
    }
    w.finish();
    return out.str();
}

// ============================================================================
// Routes
// ============================================================================

std::string ExpressRenderer::routes(const GenerationContext& ctx, const ir::model& m) const {
    const express::model_names names(m);
    const std::string controller_var = lower_first(names.controller);
    const std::string validator = "validate" + names.model;

    // Route middleware per operation, from the derived endpoint descriptors
    std::map<ir::endpoint_operation, std::vector<std::string>> guards;
    bool needs_guard = false;
    bool needs_authorize = false;
    for (const auto& ep : ctx.endpoints) {
        if (ep.model_name != m.name || !ep.authenticated || !ctx.options.has_auth()) {
            continue;
        }
        std::vector<std::string> chain = {guard_middleware(ctx.options.authentication)};
        needs_guard = true;
        auto roles = route_roles(ep, m, ctx.auth);
        if (!roles.empty()) {
            std::vector<std::string> quoted;
            for (const auto& r : roles) quoted.push_back(js_string(r));
            chain.push_back("authorize(" + join(quoted, ", ") + ")");
            needs_authorize = true;
        }
        guards[ep.operation] = std::move(chain);
    }

    auto handlers = [&](ir::endpoint_operation op, std::vector<std::string> tail) {
        std::vector<std::string> all = guards[op];
        all.insert(all.end(), tail.begin(), tail.end());
        return join(all, ", ");
    };

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    w.write_import({"Router"}, "express");
    w.write_import({names.controller}, "../controllers/" + names.controller);
    w.write_import({validator}, "../validation/" + names.model + "Validation");
    if (needs_guard) {
        w.write_import({guard_middleware(ctx.options.authentication)}, "../middleware/auth");
    }
    if (needs_authorize) {
        w.write_import({"authorize"}, "../middleware/authorize");
    }
    w.write_blank_line();
    w.write_line("const router = Router();");
    w.write_line("const " + controller_var + " = new " + names.controller + "();");
    w.write_blank_line();

    w.write_comment("Create " + names.model);
    w.write_line("router.post('/', " + handlers(ir::endpoint_operation::create,
                 {validator + ".create", controller_var + ".create"}) + ");");
    w.write_blank_line();
    w.write_comment("List " + names.model + " records");
    w.write_line("router.get('/', " + handlers(ir::endpoint_operation::list, {controller_var + ".getAll"}) + ");");
    w.write_blank_line();
    w.write_comment("Get " + names.model + " by ID");
    w.write_line("router.get('/:id', " + handlers(ir::endpoint_operation::read, {controller_var + ".getById"}) + ");");
    w.write_blank_line();
    w.write_comment("Update " + names.model);
    w.write_line("router.put('/:id', " + handlers(ir::endpoint_operation::update,
                 {validator + ".update", controller_var + ".update"}) + ");");
    w.write_blank_line();
    w.write_comment("Delete " + names.model);
    w.write_line("router.delete('/:id', " + handlers(ir::endpoint_operation::remove,
                 {controller_var + ".delete"}) + ");");
    w.write_blank_line();
    w.write_default_export("router");
    return out.str();
}

// ============================================================================
// Request Validation
// ============================================================================

std::string ExpressRenderer::validation(const GenerationContext& ctx, const ir::model& m) const {
    const auto fields = express::record_fields(m);

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    w.write_import({"body"}, "express-validator");
    w.write_import({"handleValidationErrors"}, "../middleware/validation");
    w.write_blank_line();

    auto write_chain_list = [&](const std::string& name, bool for_update, bool last) {
        w.write_line(name + ": [");
        w.indent();
        for (const ir::field* f : fields) {
            w.write_line(validator_chain(*f, for_update) + ",");
        }
        w.write_line("handleValidationErrors");
        w.unindent();
        w.write_line(last ? "]" : "],");
    };

    w.write_line(w.export_const("validate" + m.name) + " = {");
    w.indent();
    write_chain_list("create", false, false);
    write_chain_list("update", true, true);
    w.unindent();
    w.write_line("};");
    w.finish();
    return out.str();
}

} // namespace apigen::codegen
