//
// Express Renderer - generated controller tests (jest + supertest)
//

#include <apigen/codegen/express/express_renderer.hh>
#include <apigen/codegen/express/express_helpers.hh>
#include <apigen/codegen/naming.hh>
#include <apigen/codegen/type_tables.hh>
#include <apigen/codegen/ts_code_writer.hh>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace apigen::codegen {

namespace {
    constexpr const char* MISSING_ID = "00000000-0000-4000-8000-000000000000";

    constexpr size_t MAX_SAMPLE_LENGTH = 1024;

    /// Plain string sample that honours the declared length bounds. A
    /// minimum beyond MAX_SAMPLE_LENGTH is padded only up to that length.
    std::string bounded_text(std::string text, const ir::field& f) {
        if (const auto* max = f.find_rule(ir::validation_rule_kind::max_length); max && max->is_numeric()) {
            const double limit = std::max(0.0, std::floor(max->number()));
            if (limit < static_cast<double>(text.size())) {
                text.resize(static_cast<size_t>(limit));
            }
        }
        if (const auto* min = f.find_rule(ir::validation_rule_kind::min_length); min && min->is_numeric()) {
            const double wanted = std::min(std::ceil(min->number()), static_cast<double>(MAX_SAMPLE_LENGTH));
            if (wanted > static_cast<double>(text.size())) {
                text.append(static_cast<size_t>(wanted) - text.size(), 'x');
            }
        }
        return text;
    }

    std::string numeric_sample(const ir::field& f) {
        double value = f.type == ir::field_type::floating ? 42.5
                     : f.type == ir::field_type::decimal  ? 42.99
                                                          : 42.0;
        const auto* min = f.find_rule(ir::validation_rule_kind::min);
        const auto* max = f.find_rule(ir::validation_rule_kind::max);
        if (min && min->is_numeric() && value < min->number()) {
            value = min->number();
        }
        if (max && max->is_numeric() && value > max->number()) {
            value = max->number();
        }
        if (f.type == ir::field_type::integer) {
            value = std::ceil(value);
        }
        return express::js_number(value);
    }

    /// JavaScript expression for a valid value of the field. Unique fields
    /// get a fresh value per call through the generated unique() helper.
    std::string sample_value(const ir::field& f, bool updated) {
        switch (f.type) {
            case ir::field_type::string:
            case ir::field_type::text: {
                std::string base = f.type == ir::field_type::text ? "test text content" : "test string";
                if (updated) {
                    base = "updated " + base;
                }
                if (f.unique) {
                    return "unique(" + js_string(bounded_text(base, f)) + ")";
                }
                return js_string(bounded_text(base, f));
            }
            case ir::field_type::email:
                return f.unique ? "unique('test@example.com')" : "'test@example.com'";
            case ir::field_type::url:
                return f.unique ? "`https://example.com/${unique('page')}`" : "'https://example.com'";
            case ir::field_type::uuid:
                return "randomUUID()";
            case ir::field_type::number:
            case ir::field_type::integer:
            case ir::field_type::floating:
            case ir::field_type::decimal:
                return numeric_sample(f);
            case ir::field_type::boolean:
                return updated ? "false" : "true";
            case ir::field_type::date:
            case ir::field_type::json:
                return test_literal(f.type);
        }
        return test_literal(f.type);
    }

    /// Types whose value comes back from every engine exactly as sent
    bool round_trips(ir::field_type type) {
        return is_textual_type(type) || type == ir::field_type::boolean || type == ir::field_type::json;
    }

    void write_payload_factory(TsCodeWriter& w, const std::string& name,
                               const std::vector<const ir::field*>& fields, bool updated) {
        if (fields.empty()) {
            w.write_line("const " + name + " = () => ({});");
            return;
        }
        w.write_line("const " + name + " = () => ({");
        w.indent();
        for (size_t i = 0; i < fields.size(); ++i) {
            w.write_line(fields[i]->name + ": " + sample_value(*fields[i], updated) +
                         (i + 1 < fields.size() ? "," : ""));
        }
        w.unindent();
        w.write_line("});");
    }

    void write_field_expectations(TsCodeWriter& w, const std::vector<const ir::field*>& fields) {
        for (const ir::field* f : fields) {
            if (!round_trips(f->type)) {
                w.write_line("expect(response.body.data).toHaveProperty(" + js_string(f->name) + ");");
            } else if (f->type == ir::field_type::json) {
                w.write_line("expect(response.body.data." + f->name + ").toEqual(payload." + f->name + ");");
            } else {
                w.write_line("expect(response.body.data." + f->name + ").toBe(payload." + f->name + ");");
            }
        }
    }
}

std::string ExpressRenderer::controller_test(const GenerationContext& ctx, const ir::model& m) const {
    const express::model_names names(m);
    const std::string base = "/" + route_segment(m);
    const auto fields = express::record_fields(m);
    const bool auth = ctx.options.has_auth();
    const bool jwt = ctx.options.authentication == ir::auth_strategy::jwt;
    const bool any_required = std::any_of(fields.begin(), fields.end(),
                                          [](const ir::field* f) { return f->required; });
    const bool any_uuid = std::any_of(fields.begin(), fields.end(),
                                      [](const ir::field* f) { return f->type == ir::field_type::uuid; });

    // Delete is admin-only by default; sign in with the most privileged role
    const auto roles = ctx.auth.role_names();
    std::string test_role;
    if (!roles.empty()) {
        test_role = std::find(roles.begin(), roles.end(), "admin") != roles.end() ? "admin" : roles.front();
    }

    std::ostringstream out;
    TsCodeWriter w(out, ctx.options.language);
    const bool ts = w.is_typescript();

    w.write_default_import("request", "supertest");
    if (any_uuid) {
        w.write_import({"randomUUID"}, "crypto");
    }
    w.write_default_import("app", "../app");
    w.write_import({"closeConnection"}, "../database/connection");
    w.write_blank_line();

    auto it_block = [&](const std::string& title) {
        return w.write_scope("it(" + js_string(title) + ", async () =>", ");");
    };
    auto describe_block = [&](const std::string& title) {
        return w.write_scope("describe(" + js_string(title) + ", () =>", ");");
    };
    auto call = [&](const std::string& verb, const std::string& path) {
        return "agent." + verb + "(" + path + ").set(authHeader)";
    };

    {
        auto suite = describe_block(names.controller);
        w.write_line("const agent = request.agent(app);");
        w.write_line(std::string("let authHeader") + (ts ? ": Record<string, string>" : "") + " = {};");
        w.write_line("let sequence = 0;");
        w.write_line("const unique = (value" + w.annotate("string") + ")" + w.annotate("string") +
                     " => `${Date.now()}${++sequence}-${value}`;");
        w.write_blank_line();
        write_payload_factory(w, "validPayload", fields, false);
        write_payload_factory(w, "updatedPayload", fields, true);
        w.write_blank_line();
        {
            auto create = w.write_scope("const createRecord = async () =>", ";");
            w.write_line("const response = await " + call("post", js_string(base)) +
                         ".send(validPayload()).expect(201);");
            w.write_line("return response.body.data;");
        }
        w.write_blank_line();

        if (auth) {
            auto setup = w.write_scope("beforeAll(async () =>", ");");
            w.write_line("const credentials = {");
            w.indent();
            w.write_line("email: unique('tester@example.com'),");
            w.write_line("password: 'Password123!',");
            w.write_line("name: 'Test Account',");
            w.write_line("role: " + js_string(test_role));
            w.unindent();
            w.write_line("};");
            w.write_line("await agent.post('/auth/register').send(credentials).expect(201);");
            w.write_line(std::string(jwt ? "const response = " : "") + "await agent.post('/auth/login')"
                         ".send({ email: credentials.email, password: credentials.password }).expect(200);");
            if (jwt) {
                w.write_line("authHeader = { Authorization: `Bearer ${response.body.data.token}` };");
            }
        }
        if (auth) {
            w.write_blank_line();
        }
        {
            auto teardown = w.write_scope("afterAll(async () =>", ");");
            w.write_line("await closeConnection();");
        }
        w.write_blank_line();

        {
            auto group = describe_block("POST " + base);
            {
                auto test = it_block("creates a " + names.model);
                w.write_line("const payload = validPayload();");
                w.write_line("const response = await " + call("post", js_string(base)) +
                             ".send(payload).expect(201);");
                w.write_blank_line();
                w.write_line("expect(response.body.success).toBe(true);");
                w.write_line("expect(response.body.data).toHaveProperty('id');");
                write_field_expectations(w, fields);
            }
            if (any_required) {
                w.write_blank_line();
                auto test = it_block("rejects a payload without required fields");
                w.write_line("const response = await " + call("post", js_string(base)) + ".send({}).expect(400);");
                w.write_line("expect(response.body.success).toBe(false);");
            }
        }
        w.write_blank_line();

        {
            auto group = describe_block("GET " + base);
            auto test = it_block("lists " + names.model + " records with pagination");
            w.write_line("await createRecord();");
            w.write_line("const response = await " + call("get", js_string(base + "?page=1&limit=5")) + ".expect(200);");
            w.write_blank_line();
            w.write_line("expect(Array.isArray(response.body.data)).toBe(true);");
            w.write_line("expect(response.body.data.length).toBeGreaterThan(0);");
            w.write_line("expect(response.body.pagination).toMatchObject({ page: 1, limit: 5 });");
        }
        w.write_blank_line();

        {
            auto group = describe_block("GET " + base + "/:id");
            {
                auto test = it_block("returns an existing " + names.model);
                w.write_line("const created = await createRecord();");
                w.write_line("const response = await " + call("get", "`" + base + "/${created.id}`") + ".expect(200);");
                w.write_line("expect(response.body.data.id).toBe(created.id);");
            }
            w.write_blank_line();
            {
                auto test = it_block("returns 404 for an unknown id");
                w.write_line("await " + call("get", js_string(base + "/" + MISSING_ID)) + ".expect(404);");
            }
        }
        w.write_blank_line();

        {
            auto group = describe_block("PUT " + base + "/:id");
            {
                auto test = it_block("updates an existing " + names.model);
                w.write_line("const created = await createRecord();");
                w.write_line("const payload = updatedPayload();");
                w.write_line("const response = await " + call("put", "`" + base + "/${created.id}`") +
                             ".send(payload).expect(200);");
                w.write_blank_line();
                w.write_line("expect(response.body.data.id).toBe(created.id);");
                write_field_expectations(w, fields);
            }
            w.write_blank_line();
            {
                auto test = it_block("returns 404 for an unknown id");
                w.write_line("await " + call("put", js_string(base + "/" + MISSING_ID)) +
                             ".send(updatedPayload()).expect(404);");
            }
        }
        w.write_blank_line();

        {
            auto group = describe_block("DELETE " + base + "/:id");
            auto test = it_block("deletes an existing " + names.model);
            w.write_line("const created = await createRecord();");
            w.write_line("await " + call("delete", "`" + base + "/${created.id}`") + ".expect(204);");
            w.write_line("await " + call("get", "`" + base + "/${created.id}`") + ".expect(404);");
        }
    }
    return out.str();
}

} // namespace apigen::codegen
