//
// Unit tests for CodeWriter, TsCodeWriter and the RAII block classes
//

#include <doctest/doctest.h>
#include <apigen/codegen/code_writer.hh>
#include <apigen/codegen/ts_code_writer.hh>
#include <sstream>
#include <string>
#include <utility>

using namespace apigen::codegen;

// ============================================================================
// CodeWriter Basic Tests
// ============================================================================

TEST_CASE("CodeWriter: lines and indentation") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Write single line") {
        writer.write_line("hello");
        CHECK(oss.str() == "hello\n");
    }

    SUBCASE("Empty line carries no indentation") {
        writer.indent();
        writer.write_line("");
        writer.write_blank_line();
        CHECK(oss.str() == "\n\n");
    }

    SUBCASE("Indent is two spaces per level") {
        writer.indent();
        writer.indent();
        writer.write_line("deep");
        writer.unindent();
        writer.write_line("shallow");
        CHECK(oss.str() == "    deep\n  shallow\n");
        CHECK(writer.indent_level() == 1);
    }

    SUBCASE("Unindent at level 0 is safe") {
        writer.unindent();
        CHECK(writer.indent_level() == 0);
        writer.write_line("x");
        CHECK(oss.str() == "x\n");
    }
}

// ============================================================================
// RAII Blocks
// ============================================================================

TEST_CASE("IfBlock") {
    std::ostringstream oss;
    CodeWriter writer(oss);
    {
        auto block = writer.write_if("!user");
        writer.write_line("return null;");
    }
    CHECK(oss.str() == "if (!user) {\n  return null;\n}\n");
    CHECK(writer.indent_level() == 0);
}

TEST_CASE("TryBlock: try and catch") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Named catch variable") {
        {
            auto t = writer.write_try();
            writer.write_line("run();");
            auto c = t.write_catch("error");
            writer.write_line("next(error);");
        }
        CHECK(oss.str() == "try {\n  run();\n} catch (error) {\n  next(error);\n}\n");
    }

    SUBCASE("Catch without binding") {
        {
            auto t = writer.write_try();
            writer.write_line("run();");
            auto c = t.write_catch("");
            writer.write_line("return false;");
        }
        CHECK(oss.str() == "try {\n  run();\n} catch {\n  return false;\n}\n");
    }

    SUBCASE("Try without catch closes itself") {
        {
            auto t = writer.write_try();
            writer.write_line("run();");
        }
        CHECK(oss.str() == "try {\n  run();\n}\n");
    }
}

TEST_CASE("ScopeBlock: header and suffix") {
    std::ostringstream oss;
    CodeWriter writer(oss);
    {
        auto scope = writer.write_scope("describe('User API', () =>", ");");
        writer.write_line("it();");
    }
    {
        auto bare = writer.write_scope();
    }
    CHECK(oss.str() == "describe('User API', () => {\n  it();\n});\n{\n}\n");
}

TEST_CASE("Nested blocks close in reverse order") {
    std::ostringstream oss;
    CodeWriter writer(oss);
    {
        auto outer = writer.write_scope("function f()");
        auto attempt = writer.write_try();
        auto cond = writer.write_if("x > 1");
        writer.write_line("return x;");
    }
    CHECK(oss.str() ==
          "function f() {\n"
          "  try {\n"
          "    if (x > 1) {\n"
          "      return x;\n"
          "    }\n"
          "  }\n"
          "}\n");
}

TEST_CASE("Moved blocks close once") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Move construction") {
        {
            auto first = writer.write_if("a");
            auto second = std::move(first);
            writer.write_line("b();");
        }
        CHECK(oss.str() == "if (a) {\n  b();\n}\n");
    }

    SUBCASE("Move assignment closes the target first") {
        {
            auto target = writer.write_scope("first");
            auto source = writer.write_scope("second");
            target = std::move(source);
        }
        CHECK(oss.str() == "first {\n  second {\n  }\n}\n");
    }
}

// ============================================================================
// TsCodeWriter
// ============================================================================

TEST_CASE("TsCodeWriter: imports") {
    std::ostringstream oss;

    SUBCASE("TypeScript uses ES module syntax") {
        TsCodeWriter writer(oss, apigen::ir::source_language::typescript);
        writer.write_import({"Request", "Response"}, "express");
        writer.write_type_import({"User"}, "../models/User");
        writer.write_default_import("express", "express");
        CHECK(oss.str() ==
              "import { Request, Response } from 'express';\n"
              "import { User } from '../models/User';\n"
              "import express from 'express';\n");
    }

    SUBCASE("JavaScript uses require and drops type imports") {
        TsCodeWriter writer(oss, apigen::ir::source_language::javascript);
        writer.write_import({"Request", "Response"}, "express");
        writer.write_type_import({"User"}, "../models/User");
        writer.write_default_import("express", "express");
        CHECK(oss.str() ==
              "const { Request, Response } = require('express');\n"
              "const express = require('express');\n");
    }

    SUBCASE("Empty import list writes nothing") {
        TsCodeWriter writer(oss, apigen::ir::source_language::typescript);
        writer.write_import({}, "express");
        CHECK(oss.str().empty());
    }
}

TEST_CASE("TsCodeWriter: exports") {
    std::ostringstream oss;

    SUBCASE("TypeScript exports inline") {
        TsCodeWriter writer(oss, apigen::ir::source_language::typescript);
        writer.write_line(writer.export_const("pool") + " = create();");
        writer.finish();
        writer.write_default_export("app");
        CHECK(oss.str() == "export const pool = create();\nexport default app;\n");
    }

    SUBCASE("JavaScript collects a module.exports list") {
        TsCodeWriter writer(oss, apigen::ir::source_language::javascript);
        writer.write_line(writer.export_const("pool") + " = create();");
        { auto cls = writer.write_class("UserService"); }
        writer.finish();
        CHECK(oss.str() ==
              "const pool = create();\n"
              "class UserService {\n"
              "}\n"
              "\n"
              "module.exports = { pool, UserService };\n");
    }
}

TEST_CASE("TsCodeWriter: classes and methods") {
    std::ostringstream oss;

    SUBCASE("TypeScript keeps annotations and fields") {
        TsCodeWriter writer(oss, apigen::ir::source_language::typescript);
        {
            auto cls = writer.write_class("UserService", "BaseService");
            cls.write_field("private", "repository", "UserRepository", "new UserRepository()");
            auto m = writer.write_method("findById", {{"id", "string", ""}}, "User | null", true);
            writer.write_line("return this.repository.findById(id);");
        }
        CHECK(oss.str() ==
              "export class UserService extends BaseService {\n"
              "  private repository: UserRepository = new UserRepository();\n"
              "  async findById(id: string): Promise<User | null> {\n"
              "    return this.repository.findById(id);\n"
              "  }\n"
              "}\n");
    }

    SUBCASE("JavaScript drops annotations") {
        TsCodeWriter writer(oss, apigen::ir::source_language::javascript);
        {
            auto cls = writer.write_class("UserService");
            cls.write_field("private", "repository", "UserRepository", "new UserRepository()");
            cls.write_field("private", "cache", "Map<string, User>");
            auto m = writer.write_method("list", {{"page", "number", "1"}}, "User[]", true);
            writer.write_line("return [];");
        }
        CHECK(oss.str() ==
              "class UserService {\n"
              "  repository = new UserRepository();\n"
              "  async list(page = 1) {\n"
              "    return [];\n"
              "  }\n"
              "}\n");
    }
}

TEST_CASE("TsCodeWriter: comments") {
    std::ostringstream oss;
    TsCodeWriter writer(oss, apigen::ir::source_language::typescript);
    writer.write_comment("Routes");
    CHECK(oss.str() == "// Routes\n");
}
