//
// Relationship constraints in relational schemas
//

#include <doctest/doctest.h>
#include <apigen/codegen.hh>
#include "../model_fixtures.hh"

using namespace apigen;
using namespace fixtures;

namespace {
    std::vector<ir::model> author_posts(ir::relationship_kind kind, bool cascade) {
        auto author = make_model("Author", {make_field("name", ir::field_type::string, true)});
        auto post = make_model("Post", {make_field("title", ir::field_type::string, true),
                                        make_field("authorId", ir::field_type::uuid, true)});
        auto rel = make_relationship("Author", "Post", kind, "id", "authorId");
        rel.cascade_delete = cascade;
        author.relationships.push_back(rel);
        return {author, post};
    }

    std::string relationship_sql(const std::vector<ir::model>& models, ir::database_engine db) {
        ir::generation_options opts;
        opts.database = db;
        opts.authentication = ir::auth_strategy::none;
        auto project = codegen::generate_project(models, opts);
        const auto* file = project.find_file("src/schemas/relationships.sql");
        return file ? file->content : std::string();
    }
}

TEST_SUITE("Relationships") {

TEST_CASE("One-to-many puts the foreign key on the target table") {
    auto sql = relationship_sql(author_posts(ir::relationship_kind::one_to_many, true),
                                ir::database_engine::postgresql);
    CHECK(sql.find("-- Author has many Post") != std::string::npos);
    CHECK(sql.find("ALTER TABLE posts") != std::string::npos);
    CHECK(sql.find("ADD CONSTRAINT fk_posts_author_id") != std::string::npos);
    CHECK(sql.find("FOREIGN KEY (author_id) REFERENCES authors(id) ON DELETE CASCADE;") != std::string::npos);
}

TEST_CASE("Cascade is emitted only when requested") {
    auto sql = relationship_sql(author_posts(ir::relationship_kind::one_to_many, false),
                                ir::database_engine::postgresql);
    CHECK(sql.find("REFERENCES authors(id);") != std::string::npos);
    CHECK(sql.find("ON DELETE CASCADE") == std::string::npos);
}

TEST_CASE("Many-to-many creates a junction table") {
    SUBCASE("PostgreSQL") {
        auto sql = relationship_sql(author_posts(ir::relationship_kind::many_to_many, false),
                                    ir::database_engine::postgresql);
        CHECK(sql.find("CREATE TABLE IF NOT EXISTS authors_posts (") != std::string::npos);
        CHECK(sql.find("author_id UUID NOT NULL") != std::string::npos);
        CHECK(sql.find("PRIMARY KEY (author_id, post_id)") != std::string::npos);
    }

    SUBCASE("MySQL key type") {
        auto sql = relationship_sql(author_posts(ir::relationship_kind::many_to_many, false),
                                    ir::database_engine::mysql);
        CHECK(sql.find("author_id CHAR(36) NOT NULL") != std::string::npos);
    }

    SUBCASE("Self relationship keeps column names distinct") {
        auto tag = make_model("Tag", {make_field("label", ir::field_type::string, true)});
        tag.relationships.push_back(make_relationship("Tag", "Tag", ir::relationship_kind::many_to_many));
        auto sql = relationship_sql({tag}, ir::database_engine::postgresql);
        CHECK(sql.find("PRIMARY KEY (tag_id, related_tag_id)") != std::string::npos);
    }
}

TEST_CASE("No relationship file without relationships or on MongoDB") {
    CHECK(relationship_sql({user_model()}, ir::database_engine::postgresql).empty());
    CHECK(relationship_sql(author_posts(ir::relationship_kind::one_to_many, false),
                           ir::database_engine::mongodb).empty());
}

TEST_CASE("Relationships to unknown models are skipped") {
    auto m = make_model("Post", {make_field("title", ir::field_type::string, true)});
    m.relationships.push_back(make_relationship("Post", "Ghost"));
    CHECK(relationship_sql({m}, ir::database_engine::postgresql).empty());
}

} // TEST_SUITE
