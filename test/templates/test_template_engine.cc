//
// Unit tests for the template parser, evaluator and template table
//

#include <doctest/doctest.h>
#include <apigen/template_engine.hh>

using namespace apigen::tmpl;

namespace {
    std::string render(const std::string& text, const context& ctx) {
        return TemplateEngine::render_text(text, ctx);
    }
}

TEST_SUITE("Template engine") {

TEST_CASE("Interpolation") {
    context ctx = {{"modelName", "User"}, {"count", 3}, {"ratio", 2.5}, {"flag", true},
                   {"whole", 4.0}, {"meta", {{"table", "users"}}}, {"rows", {"a", "b"}}};

    SUBCASE("Simple name") {
        CHECK(render("class {{modelName}}Service", ctx) == "class UserService");
    }

    SUBCASE("Scalars") {
        CHECK(render("{{count}} {{ratio}} {{flag}} {{whole}}", ctx) == "3 2.5 true 4");
    }

    SUBCASE("Property path") {
        CHECK(render("FROM {{meta.table}}", ctx) == "FROM users");
    }

    SUBCASE("Index into a list") {
        CHECK(render("{{rows.1}}", ctx) == "b");
    }

    SUBCASE("Unresolved names stay verbatim") {
        CHECK(render("{{missing}} {{meta.nope}} {{rows.9}}", ctx) == "{{missing}} {{meta.nope}} {{rows.9}}");
    }

    SUBCASE("Non-scalar values stay verbatim") {
        CHECK(render("{{meta}}", ctx) == "{{meta}}");
    }

    SUBCASE("Whitespace is preserved") {
        CHECK(render("  {{modelName}}\n\t\n", ctx) == "  User\n\t\n");
    }
}

TEST_CASE("Conditional blocks") {
    SUBCASE("Truthy and falsy values") {
        context ctx = {{"yes", true}, {"no", false}, {"zero", 0}, {"empty", ""}, {"list", context::array()}};
        CHECK(render("{{#if yes}}A{{/if}}{{#if no}}B{{/if}}", ctx) == "A");
        CHECK(render("{{#if zero}}Z{{/if}}{{#if empty}}E{{/if}}{{#if missing}}M{{/if}}", ctx) == "");
        CHECK(render("{{#if list}}L{{/if}}", ctx) == "L");
    }

    SUBCASE("Nested blocks") {
        context ctx = {{"a", true}, {"b", true}, {"name", "x"}};
        CHECK(render("{{#if a}}[{{#if b}}{{name}}{{/if}}]{{/if}}", ctx) == "[x]");
    }
}

TEST_CASE("Iteration blocks") {
    SUBCASE("Element properties overlay the outer context") {
        context ctx = {{"table", "users"},
                       {"fields", {{{"name", "email"}, {"type", "VARCHAR(255)"}},
                                   {{"name", "age"}, {"type", "INTEGER"}}}}};
        CHECK(render("{{#each fields}}{{table}}.{{name}} {{type}};{{/each}}", ctx) ==
              "users.email VARCHAR(255);users.age INTEGER;");
    }

    SUBCASE("Scalar elements through this") {
        context ctx = {{"roles", {"admin", "user"}}};
        CHECK(render("{{#each roles}}<{{this}}>{{/each}}", ctx) == "<admin><user>");
    }

    SUBCASE("Missing or non-list operand removes the block") {
        context ctx = {{"notList", "x"}};
        CHECK(render("a{{#each missing}}X{{/each}}b{{#each notList}}Y{{/each}}c", ctx) == "abc");
    }

    SUBCASE("Empty list renders nothing") {
        context ctx = {{"items", context::array()}};
        CHECK(render("[{{#each items}}x{{/each}}]", ctx) == "[]");
    }
}

TEST_CASE("Malformed input is literal text") {
    context ctx = {{"a", true}, {"name", "n"}};

    SUBCASE("Unterminated block") {
        CHECK(render("{{#if a}}{{name}}", ctx) == "{{#if a}}n");
    }

    SUBCASE("Unterminated token") {
        CHECK(render("x {{name", ctx) == "x {{name");
    }

    SUBCASE("Mismatched closing tag") {
        CHECK(render("{{/each}}{{name}}", ctx) == "{{/each}}n");
    }

    SUBCASE("Invalid token content") {
        CHECK(render("{{ name }}{{a-b}}", ctx) == "{{ name }}{{a-b}}");
    }
}

TEST_CASE("Rendering is deterministic") {
    context ctx = {{"modelName", "Post"}, {"fields", {{{"name", "title"}}}}};
    const std::string text = "{{modelName}}:{{#each fields}}{{name}},{{/each}}";
    CHECK(render(text, ctx) == render(text, ctx));
}

TEST_CASE("Template table") {
    TemplateEngine engine;
    engine.add_template("greeting", "Hello {{name}}");

    CHECK(engine.has_template("greeting"));
    CHECK(engine.render("greeting", {{"name", "api"}}) == "Hello api");
    CHECK(engine.template_source("greeting") == "Hello {{name}}");

    SUBCASE("Replacing a template") {
        engine.add_template("greeting", "Bye {{name}}");
        CHECK(engine.render("greeting", {{"name", "api"}}) == "Bye api");
    }

    SUBCASE("Unknown name") {
        CHECK_FALSE(engine.has_template("nope"));
        CHECK_THROWS_AS((void)engine.render("nope", context::object()), template_not_found_error);
        try {
            (void)engine.template_source("nope");
            FAIL("expected template_not_found_error");
        } catch (const template_not_found_error& e) {
            CHECK(e.name() == "nope");
        }
    }
}

TEST_CASE("Built-in templates") {
    auto engine = TemplateEngine::with_builtin_templates();
    for (const char* name : {"record-interface", "record-typedef", "express-controller",
                             "express-controller-js", "postgresql-schema", "mysql-schema"}) {
        CHECK_MESSAGE(engine.has_template(name), name);
    }
}

TEST_CASE("Truthiness") {
    CHECK_FALSE(is_truthy(nullptr));
    CHECK_FALSE(is_truthy(0.0));
    CHECK(is_truthy(-1));
    CHECK(is_truthy("x"));
    CHECK(is_truthy(context::object()));
}

} // TEST_SUITE
