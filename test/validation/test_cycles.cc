//
// Unit tests for relationship cycle detection
//

#include <doctest/doctest.h>
#include <apigen/validation.hh>
#include "../model_fixtures.hh"

using namespace apigen;
using namespace apigen::validation;
using namespace fixtures;

namespace {
    model linked(const std::string& name, std::vector<std::string> targets) {
        auto m = keyed_model(name);
        for (const auto& t : targets) {
            m.relationships.push_back(make_relationship(name, t));
        }
        return m;
    }

    std::vector<std::string> formatted(const std::vector<circular_reference>& cycles) {
        std::vector<std::string> out;
        for (const auto& c : cycles) {
            out.push_back(c.format());
        }
        return out;
    }
}

TEST_SUITE("Cycle detection") {

TEST_CASE("Acyclic graph has no cycles") {
    auto cycles = detect_cycles({linked("A", {"B"}), linked("B", {"C"}), linked("C", {})});
    CHECK(cycles.empty());
}

TEST_CASE("Two-model cycle") {
    auto cycles = detect_cycles({linked("A", {"B"}), linked("B", {"A"})});
    REQUIRE(cycles.size() == 1);
    CHECK(cycles[0].path == std::vector<std::string>{"A", "B", "A"});
}

TEST_CASE("Self relationship") {
    auto cycles = detect_cycles({linked("Category", {"Category"})});
    REQUIRE(cycles.size() == 1);
    CHECK(cycles[0].format() == "Category -> Category");
}

TEST_CASE("Three-hop cycle") {
    auto cycles = detect_cycles({linked("A", {"B"}), linked("B", {"C"}), linked("C", {"A"})});
    CHECK(formatted(cycles) == std::vector<std::string>{"A -> B -> C -> A"});
}

TEST_CASE("Four-hop cycle is rooted at the earliest model") {
    auto cycles = detect_cycles({linked("D", {"A"}), linked("A", {"B"}), linked("B", {"C"}), linked("C", {"D"})});
    CHECK(formatted(cycles) == std::vector<std::string>{"D -> A -> B -> C -> D"});
}

TEST_CASE("Cycles sharing a prefix are both reported") {
    // A -> B -> A and A -> B -> C -> A
    auto cycles = detect_cycles({linked("A", {"B"}), linked("B", {"A", "C"}), linked("C", {"A"})});
    CHECK(formatted(cycles) == std::vector<std::string>{"A -> B -> A", "A -> B -> C -> A"});
}

TEST_CASE("Missing target adds no edge") {
    auto cycles = detect_cycles({linked("A", {"Ghost"}), linked("B", {"A"})});
    CHECK(cycles.empty());
}

TEST_CASE("Parallel relationships report a cycle once") {
    auto a = linked("A", {"B", "B"});
    auto cycles = detect_cycles({a, linked("B", {"A"})});
    CHECK(cycles.size() == 1);
}

TEST_CASE("Disjoint cycles") {
    auto cycles = detect_cycles({linked("A", {"B"}), linked("B", {"A"}),
                                 linked("C", {"D"}), linked("D", {"C"})});
    CHECK(formatted(cycles) == std::vector<std::string>{"A -> B -> A", "C -> D -> C"});
}

} // TEST_SUITE
