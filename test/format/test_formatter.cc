//
// Formatter and shallow code validation
//

#include <doctest/doctest.h>
#include <apigen/codegen.hh>
#include <apigen/format.hh>
#include "../model_fixtures.hh"

using namespace apigen;
using namespace apigen::format;

namespace {
    ir::generated_file file_of(const std::string& language, const std::string& content) {
        return {"src/file", content, ir::artifact_kind::source, language};
    }

    bool contains(const std::string& text, const std::string& needle) {
        return text.find(needle) != std::string::npos;
    }
}

TEST_SUITE("Formatter") {

TEST_CASE("Script indentation follows nesting") {
    const format_options opts;

    SUBCASE("Function body") {
        CHECK(format_script("function f() {\nreturn 1;\n}\n", opts) ==
              "function f() {\n  return 1;\n}\n");
    }

    SUBCASE("Existing indentation is replaced") {
        CHECK(format_script("if (a) {\n        b();\n    }", opts) == "if (a) {\n  b();\n}\n");
    }

    SUBCASE("Several brackets on one line add one level") {
        CHECK(format_script("foo({\na: 1,\n});", opts) == "foo({\n  a: 1,\n});\n");
    }

    SUBCASE("Chained calls are continued") {
        CHECK(format_script("promise\n.then(x)\n...rest", opts) == "promise\n  .then(x)\n...rest\n");
    }

    SUBCASE("Brackets inside strings and comments are ignored") {
        CHECK(format_script("const s = '{';\n// (\nconst t = 1;", opts) ==
              "const s = '{';\n// (\nconst t = 1;\n");
    }

    SUBCASE("Tabs") {
        format_options tabs;
        tabs.use_tabs = true;
        CHECK(format_script("class A {\nx = 1;\n}", tabs) == "class A {\n\tx = 1;\n}\n");
    }

    SUBCASE("Blank runs collapse and CRLF is normalized") {
        CHECK(format_script("\n\na();\r\n\r\n\r\n\r\nb();\r\n\r\n", opts) == "a();\n\nb();\n");
    }
}

TEST_CASE("Template literal content is kept") {
    const std::string code = "const q = `\n    SELECT {\n  `;\nx();";
    CHECK(format_script(code, {}) == "const q = `\n    SELECT {\n  `;\nx();\n");
}

TEST_CASE("JSON is pretty printed") {
    CHECK(format_json("{\"a\":1,\"b\":[1,2]}", {}) == "{\n  \"a\": 1,\n  \"b\": [\n    1,\n    2\n  ]\n}\n");

    SUBCASE("Key order is preserved") {
        CHECK(format_json("{\"z\":1,\"a\":2}", {}) == "{\n  \"z\": 1,\n  \"a\": 2\n}\n");
    }

    SUBCASE("Unparsable input comes back unchanged") {
        CHECK(format_json("{not json", {}) == "{not json");
    }
}

TEST_CASE("SQL keywords and clauses") {
    SUBCASE("Keywords are uppercased") {
        const auto out = format_sql("create table users (\nid UUID\n);");
        CHECK(out == "CREATE TABLE users (\n  id UUID\n  );\n");
    }

    SUBCASE("Clause indentation") {
        CHECK(format_sql("select *\nfrom users\nwhere a = 1\nand b = 2") ==
              "SELECT *\n  FROM users\n  WHERE a = 1\n    AND b = 2\n");
    }

    SUBCASE("Quoted text and comments are left alone") {
        CHECK(format_sql("SELECT 'from' from t") == "SELECT 'from' FROM t\n");
        CHECK(format_sql("-- select everything") == "-- select everything\n");
        CHECK(format_sql("SELECT \"order\", `group` from t") == "SELECT \"order\", `group` FROM t\n");
    }

    SUBCASE("Dollar-quoted bodies keep their layout") {
        const auto out = format_sql("CREATE FUNCTION f() RETURNS trigger AS $$\n"
                                    "    begin select 1;\n"
                                    "end;\n"
                                    "$$ LANGUAGE plpgsql;");
        CHECK(contains(out, "\n    begin select 1;\n"));
        CHECK(contains(out, "\nend;\n"));
    }
}

TEST_CASE("Markdown headings and fences") {
    const std::string md = "#Title\n\n\n\nText  \n```\n#not heading\n```\n";
    CHECK(format_markdown(md) == "# Title\n\nText\n```\n#not heading\n```\n");
    CHECK(format_markdown("####### seven") == "####### seven\n");
}

TEST_CASE("format_file dispatches on language") {
    const auto ts = format_file(file_of("typescript", "if (a) {\nb();\n}"));
    CHECK(ts.content == "if (a) {\n  b();\n}\n");
    CHECK(ts.path == "src/file");
    CHECK(ts.kind == ir::artifact_kind::source);
    CHECK(ts.language == "typescript");

    const auto yaml = format_file(file_of("yaml", "a:   1\n\n\n"));
    CHECK(yaml.content == "a:   1\n\n\n");

    const auto files = format_files({file_of("json", "[1]"), file_of("", "raw")});
    REQUIRE(files.size() == 2);
    CHECK(files[0].content == "[\n  1\n]\n");
    CHECK(files[1].content == "raw");
}

TEST_CASE("Formatting is idempotent on generated sources") {
    const auto project = codegen::generate_project({fixtures::user_model()}, ir::generation_options{});
    for (const auto& file : format_files(project.files)) {
        CHECK_MESSAGE(format_file(file).content == file.content, file.path);
    }
}

} // TEST_SUITE Formatter

TEST_SUITE("Code validation") {

TEST_CASE("Script bracket balance") {
    CHECK(validate_code(file_of("typescript", "function f() { return [1, (2)]; }")).is_valid);
    CHECK(validate_code(file_of("javascript", "const s = '{'; // (\n/* [ */")).is_valid);

    const auto braces = validate_code(file_of("typescript", "function f() {"));
    CHECK_FALSE(braces.is_valid);
    REQUIRE(braces.errors.size() == 1);
    CHECK(braces.errors[0] == "Mismatched braces");

    const auto all = validate_code(file_of("javascript", "({["));
    REQUIRE(all.errors.size() == 3);
    CHECK(all.errors[1] == "Mismatched parentheses");
    CHECK(all.errors[2] == "Mismatched brackets");
}

TEST_CASE("JSON must parse") {
    CHECK(validate_code(file_of("json", "{\"a\": [1, 2]}")).is_valid);

    const auto bad = validate_code(file_of("json", "{"));
    CHECK_FALSE(bad.is_valid);
    REQUIRE(bad.errors.size() == 1);
    CHECK(bad.errors[0].rfind("Invalid JSON: ", 0) == 0);
}

TEST_CASE("SQL statements start with a command") {
    CHECK(validate_code(file_of("sql", "-- comment\nSELECT 1;\ncreate table t (a int);")).is_valid);

    const auto bad = validate_code(file_of("sql", "CREATE TABLE a (id INT);\nfoo bar;"));
    CHECK_FALSE(bad.is_valid);
    REQUIRE(bad.errors.size() == 1);
    CHECK(bad.errors[0] == "Invalid SQL statement: foo bar...");
}

TEST_CASE("Other languages are always valid") {
    CHECK(validate_code(file_of("yaml", "{{{")).is_valid);
    CHECK(validate_code(file_of("markdown", "(")).is_valid);
}

TEST_CASE("Generated schemas and documents validate") {
    ir::generation_options opts;
    for (auto db : {ir::database_engine::postgresql, ir::database_engine::mysql}) {
        opts.database = db;
        const auto project = codegen::generate_project({fixtures::user_model()}, opts);
        for (const auto& file : project.files) {
            if (file.language == "sql" || file.language == "json") {
                const auto result = validate_code(file);
                CHECK_MESSAGE(result.is_valid, file.path);
            }
        }
    }
}

} // TEST_SUITE Code validation
