#include <catch2/catch_test_macros.hpp>
#include "spydirwebz/encoder.hpp"
#include "spydirwebz/z3_backend.hpp"
#include "puzzle_fixtures.hpp"
#include <algorithm>
#include <set>

using namespace spydirwebz;
using spydirwebz::testing::blank_puzzle;
using spydirwebz::testing::small_elements;

TEST_CASE("Z3Backend finds a one-hot model", "[z3]") {
    Formula f = encode(blank_puzzle());
    Z3Backend backend;
    backend.add_formula(f);
    REQUIRE(backend.name() == "z3");

    auto res = backend.check();
    REQUIRE(res.status == CheckStatus::Satisfiable);
    REQUIRE(res.assignment.size() == 27);
    REQUIRE(f.true_variables(res.assignment).size() == 1);
    REQUIRE(f.is_satisfied_by(res.assignment));
}

TEST_CASE("Z3Backend respects clue clauses", "[z3]") {
    Puzzle p = blank_puzzle();
    p.clues.push_back(AffirmativeClue{"Y", "R"});
    p.clues.push_back(NegationClue{"A", "Y"});
    p.clues.push_back(NegationClue{"B", "Y"});
    Formula f = encode(p);

    Z3Backend backend;
    backend.add_formula(f);
    auto res = backend.check();
    REQUIRE(res.status == CheckStatus::Satisfiable);
    auto selected = f.true_variables(res.assignment);
    REQUIRE(selected.size() == 1);
    REQUIRE(f.triplet(selected[0]) == Triplet{"C", "Y", "R"});
}

TEST_CASE("Z3Backend blocking is monotonic", "[z3]") {
    Formula f = encode(blank_puzzle());
    Z3Backend backend;
    backend.add_formula(f);

    std::set<size_t> seen;
    for (int i = 0; i < 10; ++i) {
        auto res = backend.check();
        REQUIRE(res.status == CheckStatus::Satisfiable);
        auto selected = f.true_variables(res.assignment);
        REQUIRE(selected.size() == 1);
        // ブロックした三つ組は二度と現れない
        REQUIRE(seen.insert(selected[0]).second);
        backend.block(res.assignment);
    }
    REQUIRE(backend.assertion_count() >= f.clauses().size() + 10);
}

TEST_CASE("Z3Backend reports the conflicting clues", "[z3]") {
    Puzzle p = blank_puzzle();
    p.clues.push_back(NegationClue{"C", "Z"});
    p.clues.push_back(AffirmativeClue{"X", "P"});
    p.clues.push_back(DataInferenceClue{"X", "D1"});
    p.clues.push_back(RelationalClue{"X", "P"});
    Formula f = encode(p);

    Z3Backend backend;
    backend.add_formula(f);
    auto res = backend.check();
    REQUIRE(res.status == CheckStatus::Unsatisfiable);

    // 片方だけなら充足可能なので、コアは必ず両方を含む
    auto core = backend.conflicting_origins();
    std::set<size_t> origins(core.begin(), core.end());
    REQUIRE(origins.count(1) == 1);
    REQUIRE(origins.count(3) == 1);
    REQUIRE(origins.count(2) == 0);
    REQUIRE(std::is_sorted(core.begin(), core.end()));
}

TEST_CASE("Z3Backend session errors", "[z3]") {
    Formula f = encode(blank_puzzle());
    Z3Backend backend;
    backend.add_formula(f);

    SECTION("blocking assignment of the wrong size") {
        REQUIRE_THROWS_AS(backend.block(Assignment(4, true)), SolverError);
    }

    SECTION("formula over a different element set") {
        ElementSet bigger = small_elements();
        bigger.assets.push_back("S");
        Formula g(bigger);
        REQUIRE_THROWS_AS(backend.add_formula(g), SolverError);
    }
}

TEST_CASE("Z3Backend timeout setting", "[z3]") {
    Formula f = encode(blank_puzzle());
    Z3Backend backend;
    backend.set_timeout(5000);
    backend.add_formula(f);
    REQUIRE(backend.check().status == CheckStatus::Satisfiable);

    backend.set_timeout(0);
    REQUIRE(backend.check().status == CheckStatus::Satisfiable);
}

TEST_CASE("z3_backend_factory creates independent sessions", "[z3]") {
    auto factory = z3_backend_factory();
    Formula f = encode(blank_puzzle());

    auto first = factory();
    auto second = factory();
    first->add_formula(f);
    second->add_formula(f);

    auto res = first->check();
    REQUIRE(res.status == CheckStatus::Satisfiable);
    first->block(res.assignment);

    // 別セッションのブロックは影響しない
    auto other = second->check();
    REQUIRE(other.status == CheckStatus::Satisfiable);
    REQUIRE(second->conflicting_origins().empty());
}
