#include "spydirwebz/formula.hpp"
#include <algorithm>

namespace spydirwebz {

namespace {

std::optional<size_t> index_in(const std::vector<std::string>& list, const std::string& name) {
    auto it = std::find(list.begin(), list.end(), name);
    if (it == list.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - list.begin());
}

}  // namespace

Formula::Formula(const ElementSet& elements)
    : actors_(elements.actors)
    , vectors_(elements.vectors)
    , assets_(elements.assets) {}

Triplet Formula::triplet(size_t var) const {
    size_t s = var % assets_.size();
    size_t rest = var / assets_.size();
    size_t v = rest % vectors_.size();
    size_t a = rest / vectors_.size();
    return Triplet{actors_[a], vectors_[v], assets_[s]};
}

std::optional<size_t> Formula::find(const Triplet& triplet) const {
    auto a = actor_index(triplet.actor);
    auto v = vector_index(triplet.vector);
    auto s = asset_index(triplet.asset);
    if (!a || !v || !s) {
        return std::nullopt;
    }
    return var(*a, *v, *s);
}

std::string Formula::variable_name(size_t var) const {
    size_t s = var % assets_.size();
    size_t rest = var / assets_.size();
    size_t v = rest % vectors_.size();
    size_t a = rest / vectors_.size();
    return "x_" + std::to_string(a) + "_" + std::to_string(v) + "_" + std::to_string(s);
}

std::optional<size_t> Formula::actor_index(const std::string& name) const {
    return index_in(actors_, name);
}

std::optional<size_t> Formula::vector_index(const std::string& name) const {
    return index_in(vectors_, name);
}

std::optional<size_t> Formula::asset_index(const std::string& name) const {
    return index_in(assets_, name);
}

void Formula::add_clause(std::vector<Literal> literals, size_t origin) {
    Clause clause;
    clause.literals = std::move(literals);
    clause.origin = origin;
    clauses_.push_back(std::move(clause));
}

bool Formula::is_satisfied_by(const Assignment& assignment) const {
    if (assignment.size() != variable_count()) {
        return false;
    }
    for (const auto& clause : clauses_) {
        bool satisfied = false;
        for (const auto& lit : clause.literals) {
            if (assignment[lit.var] == lit.positive) {
                satisfied = true;
                break;
            }
        }
        if (!satisfied) {
            return false;
        }
    }
    return true;
}

std::vector<size_t> Formula::true_variables(const Assignment& assignment) const {
    std::vector<size_t> result;
    for (size_t i = 0; i < assignment.size(); ++i) {
        if (assignment[i]) {
            result.push_back(i);
        }
    }
    return result;
}

Assignment Formula::one_hot(size_t var) const {
    Assignment assignment(variable_count(), false);
    assignment[var] = true;
    return assignment;
}

} // namespace spydirwebz
