#include "spydirwebz/encoder.hpp"
#include <variant>

namespace spydirwebz {

namespace {

size_t require_index(std::optional<size_t> index, const char* category, const std::string& name) {
    if (!index) {
        throw MalformedPuzzle(std::string("clue references unknown ") + category + " '" + name + "'");
    }
    return *index;
}

/**
 * @brief 手がかりごとの節生成（std::visit 用）
 *
 * T(a,v,s) を三つ組指示変数とする。
 */
class ClueEncoder {
public:
    ClueEncoder(Formula& formula, size_t origin)
        : formula_(formula), origin_(origin) {}

    // Negation(A, V): 全ての s について ¬T(A,V,s)
    void operator()(const NegationClue& clue) {
        size_t a = actor(clue.actor);
        size_t v = vector(clue.vector);
        for (size_t s = 0; s < formula_.asset_count(); ++s) {
            forbid(a, v, s);
        }
    }

    // Affirmative(V, S): V は S に対して使われた
    //   全ての a と s != S について ¬T(a,V,s)
    //   かつ ∨_a T(a,V,S)
    void operator()(const AffirmativeClue& clue) {
        size_t v = vector(clue.vector);
        size_t target = asset(clue.asset);
        std::vector<Literal> used;
        for (size_t a = 0; a < formula_.actor_count(); ++a) {
            for (size_t s = 0; s < formula_.asset_count(); ++s) {
                if (s != target) {
                    forbid(a, v, s);
                }
            }
            used.push_back({formula_.var(a, v, target), true});
        }
        formula_.add_clause(std::move(used), origin_);
    }

    // Relational(V, S): 全ての a について ¬T(a,V,S)
    void operator()(const RelationalClue& clue) {
        size_t v = vector(clue.vector);
        size_t s = asset(clue.asset);
        for (size_t a = 0; a < formula_.actor_count(); ++a) {
            forbid(a, v, s);
        }
    }

    // Conditional(A, V, S): 全ての s' != S について ¬T(A,V,s')
    void operator()(const ConditionalClue& clue) {
        size_t a = actor(clue.actor);
        size_t v = vector(clue.vector);
        size_t target = asset(clue.asset);
        for (size_t s = 0; s < formula_.asset_count(); ++s) {
            if (s != target) {
                forbid(a, v, s);
            }
        }
    }

    // DataInference は解の確定後に検査する
    void operator()(const DataInferenceClue& clue) {
        vector(clue.vector);
    }

private:
    void forbid(size_t a, size_t v, size_t s) {
        formula_.add_clause({Literal{formula_.var(a, v, s), false}}, origin_);
    }

    size_t actor(const std::string& name) const {
        return require_index(formula_.actor_index(name), "actor", name);
    }

    size_t vector(const std::string& name) const {
        return require_index(formula_.vector_index(name), "vector", name);
    }

    size_t asset(const std::string& name) const {
        return require_index(formula_.asset_index(name), "asset", name);
    }

    Formula& formula_;
    size_t origin_;
};

}  // namespace

void add_exactly_one(Formula& formula) {
    const size_t n = formula.variable_count();

    // 少なくとも1つ
    std::vector<Literal> at_least_one;
    at_least_one.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        at_least_one.push_back({i, true});
    }
    formula.add_clause(std::move(at_least_one));

    // 高々1つ（ペアワイズ）
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            formula.add_clause({Literal{i, false}, Literal{j, false}});
        }
    }
}

void encode_clue(Formula& formula, const Clue& clue, size_t origin) {
    std::visit(ClueEncoder(formula, origin), clue);
}

Formula encode(const Puzzle& puzzle) {
    Formula formula(puzzle.elements);
    add_exactly_one(formula);
    for (size_t i = 0; i < puzzle.clues.size(); ++i) {
        encode_clue(formula, puzzle.clues[i], i);
    }
    return formula;
}

} // namespace spydirwebz
