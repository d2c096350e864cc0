//
// End-to-end scenario: a single User model with default options
//

#include <doctest/doctest.h>
#include <apigen/archive.hh>
#include <apigen/codegen.hh>
#include <apigen/packaging.hh>
#include <apigen/validation.hh>
#include "../model_fixtures.hh"

#include <nlohmann/json.hpp>

using namespace apigen;
using namespace fixtures;

TEST_SUITE("User scenario") {

TEST_CASE("User model with default options") {
    const std::vector<ir::model> models = {user_model()};
    REQUIRE(validation::validate(models).is_valid);

    auto project = codegen::generate_project(models, ir::generation_options{});

    SUBCASE("Manifest") {
        const auto* manifest = project.find_file("package.json");
        REQUIRE(manifest != nullptr);
        auto pkg = nlohmann::json::parse(manifest->content);
        CHECK(pkg["dependencies"].contains("express"));
        CHECK(pkg["dependencies"].contains("pg"));
        CHECK(pkg["dependencies"].contains("jsonwebtoken"));
        CHECK(pkg["scripts"].contains("test"));
    }

    SUBCASE("Table schema") {
        const auto* schema = project.find_file("src/schemas/user.sql");
        REQUIRE(schema != nullptr);
        CHECK(schema->language == "sql");
        CHECK(schema->content.find("CREATE TABLE IF NOT EXISTS users (") != std::string::npos);
        CHECK(schema->content.find("name VARCHAR(255) NOT NULL") != std::string::npos);
        CHECK(schema->content.find("email VARCHAR(255) NOT NULL UNIQUE") != std::string::npos);
        CHECK(schema->content.find("id UUID PRIMARY KEY") != std::string::npos);
    }

    SUBCASE("Test suite references both fields") {
        const auto* suite = project.find_file("src/tests/UserController.test.ts");
        REQUIRE(suite != nullptr);
        CHECK(suite->kind == ir::artifact_kind::test);
        CHECK(suite->content.find("name: ") != std::string::npos);
        CHECK(suite->content.find("email: ") != std::string::npos);
        CHECK(suite->content.find("describe('POST /user'") != std::string::npos);
    }

    SUBCASE("CRUD layer") {
        for (const char* path : {"src/controllers/UserController.ts", "src/services/UserService.ts",
                                 "src/repositories/UserRepository.ts", "src/routes/user.ts",
                                 "src/validation/UserValidation.ts", "src/app.ts"}) {
            CHECK_MESSAGE(project.find_file(path) != nullptr, path);
        }
    }

    SUBCASE("Packaged archive") {
        auto pkg = packaging::create_project_package(project, packaging::export_options{});
        CHECK(has_path(pkg.files, "package.json"));
        CHECK(has_path(pkg.files, "Dockerfile"));
        auto bytes = packaging::create_zip_archive(pkg);
        REQUIRE(bytes.size() > 4);
        CHECK(bytes[0] == 'P');
        CHECK(bytes[1] == 'K');

        auto tarball = packaging::create_tar_archive(pkg);
        REQUIRE(tarball.size() > 2);
        CHECK(tarball[0] == 0x1f);
        CHECK(tarball[1] == 0x8b);
        CHECK(archive::read_tar_gz(tarball).size() == archive::read_zip(bytes).size());
    }
}

} // TEST_SUITE
