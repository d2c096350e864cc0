//
// Unit tests for IR spellings and lookups
//

#include <doctest/doctest.h>
#include <apigen/ir.hh>

#include <string>

using namespace apigen::ir;

TEST_SUITE("IR") {

TEST_CASE("Enum spellings follow the external format") {
    CHECK(to_string(field_type::floating) == "float");
    CHECK(to_string(validation_rule_kind::min_length) == "minLength");
    CHECK(to_string(relationship_kind::many_to_many) == "manyToMany");
    CHECK(to_string(http_method::del) == "DELETE");
    CHECK(to_string(endpoint_operation::remove) == "delete");
    CHECK(to_string(endpoint_operation::registration) == "register");
    CHECK(to_string(artifact_kind::documentation) == "documentation");

    CHECK(parse_field_type("email") == field_type::email);
    CHECK(parse_relationship_kind("oneToOne") == relationship_kind::one_to_one);
    CHECK(parse_database_engine("mongodb") == database_engine::mongodb);
    CHECK(parse_auth_strategy("session") == auth_strategy::session);
    CHECK(parse_source_language("javascript") == source_language::javascript);
}

TEST_CASE("Every field type spelling parses back") {
    for (auto t : {field_type::string, field_type::text, field_type::number, field_type::integer,
                   field_type::floating, field_type::decimal, field_type::boolean, field_type::date,
                   field_type::email, field_type::url, field_type::uuid, field_type::json}) {
        CHECK(parse_field_type(to_string(t)) == t);
    }
}

TEST_CASE("Unknown spellings are rejected with the accepted list") {
    SUBCASE("Field type") {
        CHECK_THROWS_AS((void)parse_field_type("varchar"), unsupported_option_error);
    }

    SUBCASE("Spelling is case sensitive") {
        CHECK_THROWS_AS((void)parse_database_engine("PostgreSQL"), unsupported_option_error);
    }

    SUBCASE("Message names option, value and alternatives") {
        try {
            (void)parse_framework("hapi");
            FAIL("expected unsupported_option_error");
        } catch (const unsupported_option_error& e) {
            CHECK(e.option() == "framework");
            CHECK(e.value() == "hapi");
            CHECK(std::string(e.what()) == "Unsupported framework: 'hapi' (supported: express, fastify, koa)");
        }
    }

    SUBCASE("Is an invalid_argument") {
        CHECK_THROWS_AS((void)parse_auth_strategy("basic"), std::invalid_argument);
    }
}

TEST_CASE("Option defaults") {
    generation_options opts;
    CHECK(opts.target_framework == framework::express);
    CHECK(opts.database == database_engine::postgresql);
    CHECK(opts.authentication == auth_strategy::jwt);
    CHECK(opts.language == source_language::typescript);
    CHECK(opts.include_tests);
    CHECK(opts.include_documentation);
    CHECK(opts.is_relational());
    CHECK(opts.has_auth());
    CHECK(opts.is_typescript());

    opts.database = database_engine::mongodb;
    opts.authentication = auth_strategy::none;
    CHECK_FALSE(opts.is_relational());
    CHECK_FALSE(opts.has_auth());
}

TEST_CASE("Lookups") {
    model m;
    m.name = "User";
    field email;
    email.name = "email";
    email.validation.push_back({validation_rule_kind::max_length, 120.0, std::nullopt});
    email.validation.push_back({validation_rule_kind::pattern, std::string("^.+@.+$"), std::string("bad")});
    m.fields.push_back(email);

    REQUIRE(m.find_field("email") != nullptr);
    CHECK(m.find_field("missing") == nullptr);

    const auto* max = m.fields[0].find_rule(validation_rule_kind::max_length);
    REQUIRE(max != nullptr);
    CHECK(max->is_numeric());
    CHECK(max->number() == doctest::Approx(120.0));

    const auto* pattern = m.fields[0].find_rule(validation_rule_kind::pattern);
    REQUIRE(pattern != nullptr);
    CHECK_FALSE(pattern->is_numeric());
    CHECK(pattern->text() == "^.+@.+$");
    CHECK(m.fields[0].find_rule(validation_rule_kind::min) == nullptr);

    auth_config auth;
    auth.roles = {{"admin", {"create"}}, {"user", {"read"}}};
    CHECK(auth.role_names() == std::vector<std::string>{"admin", "user"});
}

} // TEST_SUITE
