//
// Properties of generate_project over whole model sets
//

#include <doctest/doctest.h>
#include <apigen/codegen.hh>
#include <apigen/codegen/express/express_renderer.hh>
#include <apigen/renderer_registry.hh>
#include <apigen/template_engine.hh>
#include "../model_fixtures.hh"

#include <algorithm>
#include <set>
#include <sstream>

using namespace apigen;
using namespace fixtures;

namespace {
    /// Property lines of `export interface <name> { ... }`
    std::vector<std::string> interface_properties(const std::string& source, const std::string& name) {
        const std::string open = "export interface " + name + " {\n";
        auto start = source.find(open);
        if (start == std::string::npos) {
            return {};
        }
        start += open.size();
        auto end = source.find("\n}", start);
        std::istringstream body(source.substr(start, end - start));
        std::vector<std::string> props;
        std::string line;
        while (std::getline(body, line)) {
            if (line.find(':') != std::string::npos && line.find("/**") == std::string::npos) {
                props.push_back(line);
            }
        }
        return props;
    }

    /// Paths that appear more than once in the artifact list
    std::vector<std::string> repeated_paths(const std::vector<ir::generated_file>& files) {
        std::set<std::string> seen;
        std::vector<std::string> repeated;
        for (const auto& f : files) {
            if (!seen.insert(f.path).second) {
                repeated.push_back(f.path);
            }
        }
        return repeated;
    }

    model account_holder_model() {
        return make_model("Account", {
            make_field("iban", field_type::string, true, true),
            make_field("balance", field_type::decimal, true)
        });
    }

    size_t count_for_model(const std::vector<ir::endpoint>& endpoints, const std::string& model) {
        return static_cast<size_t>(std::count_if(endpoints.begin(), endpoints.end(),
            [&](const ir::endpoint& ep) { return ep.model_name == model; }));
    }

    std::vector<ir::model> blog_models() {
        auto author = make_model("Author", {make_field("name", ir::field_type::string, true),
                                            make_field("email", ir::field_type::email, true, true)});
        auto post = make_model("Post", {make_field("title", ir::field_type::string, true),
                                        make_field("body", ir::field_type::text),
                                        make_field("rating", ir::field_type::integer),
                                        make_field("authorId", ir::field_type::uuid, true)});
        return {author, post};
    }
}

TEST_SUITE("Project generation") {

TEST_CASE("Five endpoints per model plus two with authentication") {
    const auto models = blog_models();

    SUBCASE("jwt") {
        ir::generation_options opts;
        auto project = codegen::generate_project(models, opts);
        CHECK(project.endpoints.size() == models.size() * 5 + 2);
        CHECK(count_for_model(project.endpoints, "Author") == 5);
        CHECK(count_for_model(project.endpoints, "Post") == 5);
        CHECK(count_for_model(project.endpoints, "Auth") == 2);
    }

    SUBCASE("No authentication") {
        ir::generation_options opts;
        opts.authentication = ir::auth_strategy::none;
        auto project = codegen::generate_project(models, opts);
        CHECK(project.endpoints.size() == models.size() * 5);
        CHECK(project.auth.protected_routes.empty());
        for (const auto& ep : project.endpoints) {
            CHECK_FALSE(ep.authenticated);
        }
    }
}

TEST_CASE("CRUD endpoint shapes") {
    ir::generation_options opts;
    auto endpoints = codegen::derive_crud_endpoints(make_model("BlogPost"), opts,
                                                    codegen::default_auth_config(opts.authentication));
    REQUIRE(endpoints.size() == 5);

    CHECK(endpoints[0].id == "blogpost_create");
    CHECK(endpoints[0].method == ir::http_method::post);
    CHECK(endpoints[0].path == "/blogpost");
    CHECK(endpoints[0].authenticated);
    CHECK(endpoints[0].roles == std::vector<std::string>{"admin", "user"});

    CHECK(endpoints[1].operation == ir::endpoint_operation::read);
    CHECK(endpoints[1].path == "/blogpost/:id");
    CHECK_FALSE(endpoints[1].authenticated);

    CHECK(endpoints[2].method == ir::http_method::put);
    CHECK(endpoints[3].method == ir::http_method::del);
    CHECK(endpoints[3].roles == std::vector<std::string>{"admin"});
    CHECK(endpoints[4].operation == ir::endpoint_operation::list);
    CHECK_FALSE(endpoints[4].authenticated);

    SUBCASE("Public model") {
        auto open = make_model("Tag");
        open.metadata.requires_auth = false;
        auto eps = codegen::derive_crud_endpoints(open, opts, codegen::default_auth_config(opts.authentication));
        CHECK(codegen::protected_routes(eps).empty());
    }

    SUBCASE("Protected route strings") {
        auto routes = codegen::protected_routes(endpoints);
        CHECK(routes == std::vector<std::string>{"POST /blogpost", "PUT /blogpost/:id", "DELETE /blogpost/:id"});
    }
}

TEST_CASE("Record definition has N + 3 properties") {
    ir::generation_options opts;
    opts.authentication = ir::auth_strategy::none;
    auto project = codegen::generate_project(blog_models(), opts);

    const auto* post = project.find_file("src/models/Post.ts");
    REQUIRE(post != nullptr);
    auto props = interface_properties(post->content, "Post");
    REQUIRE(props.size() == 4 + 3);
    CHECK(props.front() == "  id: string;");
    CHECK(props[1] == "  title: string;");
    CHECK(props[2] == "  body?: string;");
    CHECK(props[3] == "  rating?: number;");
    CHECK(props[4] == "  authorId: string;");
    CHECK(props[5] == "  createdAt: Date;");
    CHECK(props[6] == "  updatedAt: Date;");
}

TEST_CASE("Empty model list") {
    ir::generation_options opts;
    opts.authentication = ir::auth_strategy::none;
    auto project = codegen::generate_project({}, opts);

    CHECK(project.endpoints.empty());
    CHECK(project.find_file("package.json") != nullptr);
    CHECK(project.find_file("src/app.ts") != nullptr);
    CHECK(project.find_file("src/database/connection.ts") != nullptr);
    for (const auto& f : project.files) {
        CHECK_MESSAGE(f.path.rfind("src/models/", 0) != 0, f.path);
        CHECK_MESSAGE(f.path.rfind("src/controllers/", 0) != 0, f.path);
        CHECK_MESSAGE(f.path.rfind("src/schemas/", 0) != 0, f.path);
    }

    SUBCASE("Authentication adds no endpoints without models") {
        ir::generation_options with_auth;
        auto authed = codegen::generate_project({}, with_auth);
        CHECK(authed.endpoints.empty());
        CHECK(authed.find_file("src/routes/auth.ts") == nullptr);
        CHECK(authed.find_file("src/app.ts")->content.find("/auth") == std::string::npos);
    }
}

TEST_CASE("Unsupported options fail before emission") {
    const auto models = blog_models();

    SUBCASE("Framework without a renderer") {
        ir::generation_options opts;
        opts.target_framework = ir::framework::fastify;
        CHECK_THROWS_AS((void)codegen::generate_project(models, opts), ir::unsupported_option_error);
        opts.target_framework = ir::framework::koa;
        CHECK_THROWS_AS((void)codegen::generate_project(models, opts), ir::unsupported_option_error);
    }

    SUBCASE("OAuth is not offered by the express renderer") {
        ir::generation_options opts;
        opts.authentication = ir::auth_strategy::oauth;
        try {
            (void)codegen::generate_project(models, opts);
            FAIL("expected unsupported_option_error");
        } catch (const ir::unsupported_option_error& e) {
            CHECK(e.option() == "authentication");
            CHECK(e.value() == "oauth");
        }
    }

    SUBCASE("Missing template") {
        const auto registry = codegen::RendererRegistry::with_builtin_renderers();
        tmpl::TemplateEngine empty;
        CHECK_THROWS_AS((void)codegen::generate_project(models, ir::generation_options{}, registry, empty),
                        codegen::codegen_error);
    }
}

TEST_CASE("Generation is deterministic apart from run identity") {
    ir::generation_options opts;
    auto first = codegen::generate_project(blog_models(), opts);
    auto second = codegen::generate_project(blog_models(), opts);

    CHECK(first.id != second.id);
    REQUIRE(first.files.size() == second.files.size());
    for (size_t i = 0; i < first.files.size(); ++i) {
        CHECK(first.files[i].path == second.files[i].path);
        CHECK_MESSAGE(first.files[i].content == second.files[i].content, first.files[i].path);
    }
    for (const auto& f : first.files) {
        CHECK_MESSAGE(f.content.find(first.name) == std::string::npos, f.path);
        CHECK_MESSAGE(f.content.find(first.id) == std::string::npos, f.path);
    }
}

TEST_CASE("Language selection") {
    ir::generation_options opts;
    opts.language = ir::source_language::javascript;
    auto project = codegen::generate_project(blog_models(), opts);

    CHECK(project.find_file("tsconfig.json") == nullptr);
    const auto* controller = project.find_file("src/controllers/PostController.js");
    REQUIRE(controller != nullptr);
    CHECK(controller->language == "javascript");
    CHECK(controller->content.find("require(") != std::string::npos);
    CHECK(controller->content.find("import ") == std::string::npos);
}

TEST_CASE("Documentation and test toggles") {
    ir::generation_options opts;

    SUBCASE("Enabled") {
        auto project = codegen::generate_project(blog_models(), opts);
        CHECK(project.find_file("docs/openapi.json") != nullptr);
        CHECK(project.find_file("docs/openapi.yaml") != nullptr);
        CHECK(project.find_file("docs/API.md") != nullptr);
        CHECK(project.find_file("src/tests/PostController.test.ts") != nullptr);
        CHECK(project.api_description.contains("paths"));
    }

    SUBCASE("Disabled") {
        opts.include_documentation = false;
        opts.include_tests = false;
        auto project = codegen::generate_project(blog_models(), opts);
        CHECK(project.find_file("docs/openapi.json") == nullptr);
        for (const auto& f : project.files) {
            CHECK(f.kind != ir::artifact_kind::test);
        }
        CHECK(project.api_description["info"]["title"] == project.name);
    }
}

TEST_CASE("Account entity name avoids domain models") {
    using codegen::ExpressRenderer;
    CHECK(ExpressRenderer::account_entity_name({}) == "User");
    CHECK(ExpressRenderer::account_entity_name({user_model()}) == "Account");
    CHECK(ExpressRenderer::account_entity_name({make_model("user")}) == "Account");
    CHECK(ExpressRenderer::account_entity_name({user_model(), account_holder_model()}) == "AuthAccount");
    CHECK(ExpressRenderer::account_entity_name({user_model(), make_model("ACCOUNT"), make_model("AuthAccount")}) ==
          "AuthAccount2");

    SUBCASE("Tables count as taken names") {
        auto member = make_model("Member");
        member.metadata.table_name = "users";
        CHECK(ExpressRenderer::account_entity_name({member}) == "Account");
    }

    SUBCASE("Generated files") {
        ir::generation_options opts;
        auto with_user = codegen::generate_project({user_model()}, opts);
        CHECK(with_user.find_file("src/models/Account.ts") != nullptr);
        CHECK(with_user.find_file("src/services/AuthService.ts") != nullptr);

        auto without = codegen::generate_project(blog_models(), opts);
        CHECK(without.find_file("src/models/User.ts") != nullptr);
    }

    SUBCASE("User and Account models keep their own files") {
        ir::generation_options opts;
        opts.authentication = ir::auth_strategy::jwt;
        auto project = codegen::generate_project({user_model(), account_holder_model()}, opts);

        CHECK(repeated_paths(project.files).empty());
        const auto* account = project.find_file("src/models/Account.ts");
        REQUIRE(account != nullptr);
        CHECK(account->content.find("iban") != std::string::npos);
        CHECK(project.find_file("src/models/AuthAccount.ts") != nullptr);
        CHECK(project.find_file("src/repositories/AuthAccountRepository.ts") != nullptr);
        CHECK(project.find_file("src/schemas/authaccount.sql") != nullptr);
    }
}

TEST_CASE("Reserved model names") {
    ir::generation_options opts;
    opts.authentication = ir::auth_strategy::jwt;

    SUBCASE("Auth is rejected while authentication is on") {
        CHECK_THROWS_AS((void)codegen::generate_project({user_model(), keyed_model("Auth")}, opts),
                        ir::unsupported_option_error);
        CHECK_THROWS_AS((void)codegen::generate_project({keyed_model("auth")}, opts),
                        ir::unsupported_option_error);
    }

    SUBCASE("Auth is an ordinary model without authentication") {
        opts.authentication = ir::auth_strategy::none;
        auto project = codegen::generate_project({user_model(), keyed_model("Auth")}, opts);
        CHECK(repeated_paths(project.files).empty());
        CHECK(project.find_file("src/controllers/AuthController.ts") != nullptr);
        CHECK(project.find_file("src/routes/auth.ts") != nullptr);
    }

    SUBCASE("Relationships is reserved for relational databases") {
        CHECK_THROWS_AS((void)codegen::generate_project({keyed_model("Relationships")}, opts),
                        ir::unsupported_option_error);
        opts.database = ir::database_engine::mongodb;
        CHECK_NOTHROW((void)codegen::generate_project({keyed_model("Relationships")}, opts));
    }
}

TEST_CASE("Every artifact path is unique") {
    const std::vector<std::vector<ir::model>> model_sets = {
        {},
        blog_models(),
        {user_model()},
        {user_model(), account_holder_model()},
        {keyed_model("Member"), keyed_model("AuthAccount")},
    };
    const ir::auth_strategy strategies[] = {ir::auth_strategy::none, ir::auth_strategy::jwt,
                                            ir::auth_strategy::session};
    const ir::database_engine databases[] = {ir::database_engine::postgresql, ir::database_engine::mysql,
                                             ir::database_engine::mongodb};

    for (const auto& models : model_sets) {
        for (auto strategy : strategies) {
            for (auto db : databases) {
                ir::generation_options opts;
                opts.authentication = strategy;
                opts.database = db;
                auto project = codegen::generate_project(models, opts);
                const auto repeated = repeated_paths(project.files);
                const std::string where = ir::to_string(strategy) + "/" + ir::to_string(db) + " with " +
                                          std::to_string(models.size()) + " model(s)";
                CHECK_MESSAGE(repeated.empty(), where);
            }
        }
    }
}

TEST_CASE("Test samples respect length bounds") {
    auto post = keyed_model("Post");
    auto title = make_field("title", field_type::string, true, true);
    title.validation.push_back({validation_rule_kind::max_length, 1e20, std::nullopt});
    auto code = make_field("code", field_type::string, true);
    code.validation.push_back({validation_rule_kind::max_length, 4.0, std::nullopt});
    auto body = make_field("body", field_type::text, true);
    body.validation.push_back({validation_rule_kind::min_length, 1e20, std::nullopt});
    post.fields = {post.fields[0], title, code, body};

    ir::generation_options opts;
    opts.authentication = ir::auth_strategy::none;
    auto project = codegen::generate_project({post}, opts);
    const auto* test = project.find_file("src/tests/PostController.test.ts");
    REQUIRE(test != nullptr);

    CHECK(test->content.find("title: unique('test string')") != std::string::npos);
    CHECK(test->content.find("code: 'test',") != std::string::npos);
    CHECK(test->content.find("body: 'test text content" + std::string(1024 - 17, 'x') + "'") !=
          std::string::npos);
}

TEST_CASE("Reserved words are quoted as columns") {
    auto shop = make_model("Purchase", {
        make_field("id", field_type::uuid, true, true),
        make_field("order", field_type::integer, true),
        make_field("group", field_type::string)
    });

    ir::generation_options opts;
    opts.authentication = ir::auth_strategy::none;

    SUBCASE("PostgreSQL") {
        auto project = codegen::generate_project({shop}, opts);
        const auto* schema = project.find_file("src/schemas/purchase.sql");
        REQUIRE(schema != nullptr);
        CHECK(schema->content.find("\"order\" INTEGER NOT NULL") != std::string::npos);
        CHECK(schema->content.find("\"group\" VARCHAR(255)") != std::string::npos);

        const auto* repository = project.find_file("src/repositories/PurchaseRepository.ts");
        REQUIRE(repository != nullptr);
        CHECK(repository->content.find("order: '\"order\"'") != std::string::npos);
    }

    SUBCASE("MySQL") {
        opts.database = ir::database_engine::mysql;
        auto project = codegen::generate_project({shop}, opts);
        const auto* schema = project.find_file("src/schemas/purchase.sql");
        REQUIRE(schema != nullptr);
        CHECK(schema->content.find("`order` INT NOT NULL") != std::string::npos);
    }
}

TEST_CASE("Project identity") {
    using namespace std::chrono;
    CHECK(codegen::make_project_name(system_clock::time_point(milliseconds(1700000000123))) ==
          "generated-api-1700000000123");

    const auto id = codegen::make_project_id();
    REQUIRE(id.size() == 36);
    CHECK(id[8] == '-');
    CHECK(id[14] == '4');
    CHECK(std::string("89ab").find(id[19]) != std::string::npos);
}

} // TEST_SUITE
