#include <catch2/catch_test_macros.hpp>
#include "spydirwebz/puzzle.hpp"
#include "puzzle_fixtures.hpp"

using namespace spydirwebz;
using spydirwebz::testing::blank_puzzle;
using spydirwebz::testing::small_elements;
using spydirwebz::testing::valid_puzzle;

namespace {

std::string malformed_message(const Puzzle& puzzle) {
    try {
        check_puzzle(puzzle);
    } catch (const MalformedPuzzle& e) {
        return e.what();
    }
    return "";
}

}  // namespace

// ============================================================================
// Structural check
// ============================================================================

TEST_CASE("check_puzzle accepts well-formed puzzles", "[puzzle]") {
    REQUIRE_NOTHROW(check_puzzle(blank_puzzle()));
    REQUIRE_NOTHROW(check_puzzle(valid_puzzle()));
}

TEST_CASE("check_puzzle enforces list sizes", "[puzzle]") {
    SECTION("too few actors") {
        auto p = blank_puzzle();
        p.elements.actors = {"A", "B"};
        REQUIRE(malformed_message(p) == "actors: expected 3-6 items, got 2");
    }

    SECTION("too many assets") {
        auto p = blank_puzzle();
        p.elements.assets = {"P", "Q", "R", "S", "T", "U", "V"};
        REQUIRE(malformed_message(p) == "assets: expected 3-6 items, got 7");
    }

    SECTION("six is allowed") {
        auto p = blank_puzzle();
        p.elements.vectors = {"X", "Y", "Z", "U", "V", "W"};
        REQUIRE_NOTHROW(check_puzzle(p));
    }
}

TEST_CASE("check_puzzle rejects duplicates within a category", "[puzzle]") {
    auto p = blank_puzzle();
    p.elements.stolen_data = {"D1", "D2", "D1"};
    REQUIRE(malformed_message(p) == "stolen_data: duplicate item 'D1'");

    SECTION("case-sensitive") {
        auto q = blank_puzzle();
        q.elements.actors = {"A", "a", "B"};
        REQUIRE_NOTHROW(check_puzzle(q));
    }

    SECTION("across categories is allowed") {
        auto q = blank_puzzle();
        q.elements.assets = {"A", "X", "P"};
        REQUIRE_NOTHROW(check_puzzle(q));
    }
}

TEST_CASE("check_puzzle rejects empty element names", "[puzzle]") {
    auto p = blank_puzzle();
    p.elements.stolen_data = {"D1", "", "D3"};
    REQUIRE(malformed_message(p) == "stolen_data: empty item name");

    auto q = blank_puzzle();
    q.elements.vectors = {"X", "Y", ""};
    REQUIRE(malformed_message(q) == "vectors: empty item name");
}

TEST_CASE("check_puzzle rejects unknown references", "[puzzle]") {
    SECTION("clue") {
        auto p = blank_puzzle();
        p.clues.push_back(AffirmativeClue{"X", "P"});
        p.clues.push_back(NegationClue{"Z", "X"});
        REQUIRE(malformed_message(p) == "clue #2 references unknown actor 'Z'");
    }

    SECTION("data-inference datum") {
        auto p = blank_puzzle();
        p.clues.push_back(DataInferenceClue{"X", "D9"});
        REQUIRE(malformed_message(p) == "clue #1 references unknown stolen data 'D9'");
    }

    SECTION("solution") {
        auto p = blank_puzzle();
        p.solution.triplet.asset = "Vault";
        REQUIRE(malformed_message(p) == "solution references unknown asset 'Vault'");
    }

    SECTION("solution datum") {
        auto p = blank_puzzle();
        p.solution.stolen_data = "";
        REQUIRE_THROWS_AS(check_puzzle(p), MalformedPuzzle);
    }
}

// ============================================================================
// Clue text
// ============================================================================

TEST_CASE("clue_text renders each kind", "[puzzle][clue]") {
    REQUIRE(clue_text(NegationClue{"A", "X"}) == "A did not use X.");
    REQUIRE(clue_text(AffirmativeClue{"X", "P"}) == "X was used against the P.");
    REQUIRE(clue_text(RelationalClue{"X", "P"}) ==
            "The actor that used X did not access the P.");
    REQUIRE(clue_text(ConditionalClue{"A", "X", "P"}) ==
            "If A used X, then they accessed the P.");
    REQUIRE(clue_text(DataInferenceClue{"X", "D1"}) ==
            "Only attacks using X resulted in theft of D1.");
}

TEST_CASE("parse_clue_text recovers element references", "[puzzle][clue]") {
    ElementSet e;
    e.actors = {"Lazarus Group", "Fancy Bear", "APT41"};
    e.vectors = {"Phishing", "SQL Injection", "Zero-Day"};
    e.assets = {"Payroll Server", "Mail Gateway", "Domain Controller"};
    e.stolen_data = {"Credentials", "Source Code", "Customer PII"};

    SECTION("names with spaces") {
        auto clue = parse_clue_text(ClueKind::Conditional,
                                    "If Fancy Bear used SQL Injection, then they accessed the Mail Gateway.",
                                    e);
        REQUIRE(clue.has_value());
        const auto& c = std::get<ConditionalClue>(*clue);
        REQUIRE(c.actor == "Fancy Bear");
        REQUIRE(c.vector == "SQL Injection");
        REQUIRE(c.asset == "Mail Gateway");
    }

    SECTION("surrounding whitespace is ignored") {
        auto clue = parse_clue_text(ClueKind::DataInference,
                                    "  Only attacks using Zero-Day resulted in theft of Source Code.\n",
                                    e);
        REQUIRE(clue.has_value());
        REQUIRE(std::get<DataInferenceClue>(*clue).data == "Source Code");
    }

    SECTION("round trip through clue_text") {
        Clue relational = RelationalClue{"Phishing", "Domain Controller"};
        auto parsed = parse_clue_text(ClueKind::Relational, clue_text(relational), e);
        REQUIRE(parsed.has_value());
        REQUIRE(std::get<RelationalClue>(*parsed).asset == "Domain Controller");
    }

    SECTION("wrong kind does not match") {
        REQUIRE_FALSE(parse_clue_text(ClueKind::Negation,
                                      "Phishing was used against the Payroll Server.", e));
    }

    SECTION("unknown element does not match") {
        REQUIRE_FALSE(parse_clue_text(ClueKind::Negation, "Cozy Bear did not use Phishing.", e));
    }
}

TEST_CASE("Clue kind names", "[puzzle][clue]") {
    REQUIRE(kind_of(NegationClue{"A", "X"}) == ClueKind::Negation);
    REQUIRE(kind_of(DataInferenceClue{"X", "D1"}) == ClueKind::DataInference);
    REQUIRE(to_string(ClueKind::DataInference) == "data-inference");
    REQUIRE(parse_clue_kind("data-inference") == ClueKind::DataInference);
    REQUIRE(parse_clue_kind("data_inference") == ClueKind::DataInference);
    REQUIRE(parse_clue_kind("conditional") == ClueKind::Conditional);
    REQUIRE_FALSE(parse_clue_kind("Negation"));
}

TEST_CASE("Difficulty names", "[puzzle]") {
    REQUIRE(parse_difficulty("easy") == Difficulty::Easy);
    REQUIRE(parse_difficulty("medium") == Difficulty::Medium);
    REQUIRE(parse_difficulty("impossible") == Difficulty::Impossible);
    REQUIRE_FALSE(parse_difficulty("hard"));
    REQUIRE(to_string(Difficulty::Impossible) == "impossible");
}

TEST_CASE("Triplet formatting", "[puzzle]") {
    REQUIRE(to_string(Triplet{"A", "X", "P"}) == "(A, X, P)");
    REQUIRE(Triplet{"A", "X", "P"} != Triplet{"A", "X", "Q"});
    REQUIRE(small_elements().actors.size() == 3);
}
