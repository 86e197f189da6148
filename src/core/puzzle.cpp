#include "spydirwebz/puzzle.hpp"
#include "spydirwebz/overloaded.hpp"
#include <algorithm>
#include <set>

namespace spydirwebz {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

void check_category(const std::vector<std::string>& list, const char* category) {
    if (list.size() < min_elements || list.size() > max_elements) {
        throw MalformedPuzzle(std::string(category) + ": expected " +
                              std::to_string(min_elements) + "-" +
                              std::to_string(max_elements) + " items, got " +
                              std::to_string(list.size()));
    }
    std::set<std::string> seen;
    for (const auto& item : list) {
        if (item.empty()) {
            throw MalformedPuzzle(std::string(category) + ": empty item name");
        }
        if (!seen.insert(item).second) {
            throw MalformedPuzzle(std::string(category) + ": duplicate item '" + item + "'");
        }
    }
}

void require(const std::vector<std::string>& list, const std::string& value,
             const char* category, const std::string& where) {
    if (!contains(list, value)) {
        throw MalformedPuzzle(where + " references unknown " + category + " '" + value + "'");
    }
}

}  // namespace

std::string to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:       return "easy";
        case Difficulty::Medium:     return "medium";
        case Difficulty::Impossible: return "impossible";
    }
    return "easy";
}

std::optional<Difficulty> parse_difficulty(const std::string& name) {
    if (name == "easy") return Difficulty::Easy;
    if (name == "medium") return Difficulty::Medium;
    if (name == "impossible") return Difficulty::Impossible;
    return std::nullopt;
}

std::string to_string(const Triplet& triplet) {
    return "(" + triplet.actor + ", " + triplet.vector + ", " + triplet.asset + ")";
}

// ============================================================================
// Clues
// ============================================================================

ClueKind kind_of(const Clue& clue) {
    return static_cast<ClueKind>(clue.index());
}

std::string to_string(ClueKind kind) {
    switch (kind) {
        case ClueKind::Negation:      return "negation";
        case ClueKind::Affirmative:   return "affirmative";
        case ClueKind::Relational:    return "relational";
        case ClueKind::Conditional:   return "conditional";
        case ClueKind::DataInference: return "data-inference";
    }
    return "negation";
}

std::optional<ClueKind> parse_clue_kind(const std::string& name) {
    if (name == "negation") return ClueKind::Negation;
    if (name == "affirmative") return ClueKind::Affirmative;
    if (name == "relational") return ClueKind::Relational;
    if (name == "conditional") return ClueKind::Conditional;
    if (name == "data-inference" || name == "data_inference") return ClueKind::DataInference;
    return std::nullopt;
}

std::string clue_text(const Clue& clue) {
    return std::visit(overloaded{
        [](const NegationClue& c) {
            return c.actor + " did not use " + c.vector + ".";
        },
        [](const AffirmativeClue& c) {
            return c.vector + " was used against the " + c.asset + ".";
        },
        [](const RelationalClue& c) {
            return "The actor that used " + c.vector + " did not access the " + c.asset + ".";
        },
        [](const ConditionalClue& c) {
            return "If " + c.actor + " used " + c.vector + ", then they accessed the " + c.asset + ".";
        },
        [](const DataInferenceClue& c) {
            return "Only attacks using " + c.vector + " resulted in theft of " + c.data + ".";
        },
    }, clue);
}

std::optional<Clue> parse_clue_text(ClueKind kind, const std::string& text,
                                    const ElementSet& elements) {
    const std::string wanted = trim(text);
    auto matches = [&wanted](const Clue& candidate) {
        return clue_text(candidate) == wanted;
    };

    // 要素数は高々 6 なので全組み合わせを展開しても 216 通り
    switch (kind) {
        case ClueKind::Negation:
            for (const auto& a : elements.actors) {
                for (const auto& v : elements.vectors) {
                    Clue c = NegationClue{a, v};
                    if (matches(c)) return c;
                }
            }
            break;
        case ClueKind::Affirmative:
            for (const auto& v : elements.vectors) {
                for (const auto& s : elements.assets) {
                    Clue c = AffirmativeClue{v, s};
                    if (matches(c)) return c;
                }
            }
            break;
        case ClueKind::Relational:
            for (const auto& v : elements.vectors) {
                for (const auto& s : elements.assets) {
                    Clue c = RelationalClue{v, s};
                    if (matches(c)) return c;
                }
            }
            break;
        case ClueKind::Conditional:
            for (const auto& a : elements.actors) {
                for (const auto& v : elements.vectors) {
                    for (const auto& s : elements.assets) {
                        Clue c = ConditionalClue{a, v, s};
                        if (matches(c)) return c;
                    }
                }
            }
            break;
        case ClueKind::DataInference:
            for (const auto& v : elements.vectors) {
                for (const auto& d : elements.stolen_data) {
                    Clue c = DataInferenceClue{v, d};
                    if (matches(c)) return c;
                }
            }
            break;
    }
    return std::nullopt;
}

// ============================================================================
// Structural check
// ============================================================================

void check_puzzle(const Puzzle& puzzle) {
    const auto& e = puzzle.elements;
    check_category(e.actors, "actors");
    check_category(e.vectors, "vectors");
    check_category(e.assets, "assets");
    check_category(e.stolen_data, "stolen_data");

    for (size_t i = 0; i < puzzle.clues.size(); ++i) {
        const std::string where = "clue #" + std::to_string(i + 1);
        std::visit(overloaded{
            [&](const NegationClue& c) {
                require(e.actors, c.actor, "actor", where);
                require(e.vectors, c.vector, "vector", where);
            },
            [&](const AffirmativeClue& c) {
                require(e.vectors, c.vector, "vector", where);
                require(e.assets, c.asset, "asset", where);
            },
            [&](const RelationalClue& c) {
                require(e.vectors, c.vector, "vector", where);
                require(e.assets, c.asset, "asset", where);
            },
            [&](const ConditionalClue& c) {
                require(e.actors, c.actor, "actor", where);
                require(e.vectors, c.vector, "vector", where);
                require(e.assets, c.asset, "asset", where);
            },
            [&](const DataInferenceClue& c) {
                require(e.vectors, c.vector, "vector", where);
                require(e.stolen_data, c.data, "stolen data", where);
            },
        }, puzzle.clues[i]);
    }

    const auto& sol = puzzle.solution;
    require(e.actors, sol.triplet.actor, "actor", "solution");
    require(e.vectors, sol.triplet.vector, "vector", "solution");
    require(e.assets, sol.triplet.asset, "asset", "solution");
    require(e.stolen_data, sol.stolen_data, "stolen data", "solution");
}

} // namespace spydirwebz
