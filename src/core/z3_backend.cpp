#include "spydirwebz/z3_backend.hpp"
#include <algorithm>
#include <limits>

namespace spydirwebz {

Z3Backend::Z3Backend()
    : solver_(ctx_)
    , trackers_(ctx_) {}

std::string Z3Backend::name() const {
    return "z3";
}

void Z3Backend::add_formula(const Formula& formula) {
    try {
        if (vars_.empty()) {
            vars_.reserve(formula.variable_count());
            for (size_t i = 0; i < formula.variable_count(); ++i) {
                vars_.push_back(ctx_.bool_const(formula.variable_name(i).c_str()));
            }
        } else if (vars_.size() != formula.variable_count()) {
            throw SolverError("formula has " + std::to_string(formula.variable_count()) +
                              " variables, session has " + std::to_string(vars_.size()));
        }

        for (const auto& clause : formula.clauses()) {
            if (clause.origin == structural_origin) {
                solver_.add(to_z3(clause));
            } else {
                solver_.add(z3::implies(tracker(clause.origin), to_z3(clause)));
            }
        }
    } catch (const z3::exception& e) {
        throw SolverError(std::string("z3: ") + e.msg());
    }
}

CheckResult Z3Backend::check() {
    CheckResult result;
    last_core_.clear();
    try {
        switch (solver_.check(trackers_)) {
            case z3::sat: {
                result.status = CheckStatus::Satisfiable;
                z3::model model = solver_.get_model();
                result.assignment.assign(vars_.size(), false);
                for (size_t i = 0; i < vars_.size(); ++i) {
                    // model_completion = true: モデルに現れない変数は false 扱い
                    result.assignment[i] = model.eval(vars_[i], true).is_true();
                }
                break;
            }
            case z3::unsat: {
                result.status = CheckStatus::Unsatisfiable;
                z3::expr_vector core = solver_.unsat_core();
                for (unsigned i = 0; i < core.size(); ++i) {
                    auto it = tracker_origin_.find(core[i].decl().name().str());
                    if (it != tracker_origin_.end()) {
                        last_core_.push_back(it->second);
                    }
                }
                std::sort(last_core_.begin(), last_core_.end());
                last_core_.erase(std::unique(last_core_.begin(), last_core_.end()), last_core_.end());
                break;
            }
            case z3::unknown:
                result.status = CheckStatus::Unknown;
                result.reason = solver_.reason_unknown();
                break;
        }
    } catch (const z3::exception& e) {
        throw SolverError(std::string("z3: ") + e.msg());
    }
    return result;
}

void Z3Backend::block(const Assignment& assignment) {
    if (assignment.size() != vars_.size()) {
        throw SolverError("blocking assignment has " + std::to_string(assignment.size()) +
                          " variables, session has " + std::to_string(vars_.size()));
    }
    try {
        z3::expr_vector lits(ctx_);
        for (size_t i = 0; i < vars_.size(); ++i) {
            lits.push_back(assignment[i] ? !vars_[i] : vars_[i]);
        }
        solver_.add(z3::mk_or(lits));
    } catch (const z3::exception& e) {
        throw SolverError(std::string("z3: ") + e.msg());
    }
}

std::vector<size_t> Z3Backend::conflicting_origins() const {
    return last_core_;
}

void Z3Backend::set_timeout(unsigned timeout_ms) {
    // Z3 では UINT_MAX が無制限
    solver_.set("timeout", timeout_ms > 0 ? timeout_ms : std::numeric_limits<unsigned>::max());
}

size_t Z3Backend::assertion_count() const {
    return solver_.assertions().size();
}

z3::expr Z3Backend::tracker(size_t origin) {
    auto it = origin_to_tracker_.find(origin);
    if (it != origin_to_tracker_.end()) {
        return trackers_[static_cast<int>(it->second)];
    }
    std::string name = "clue_" + std::to_string(origin);
    z3::expr t = ctx_.bool_const(name.c_str());
    origin_to_tracker_[origin] = trackers_.size();
    tracker_origin_[name] = origin;
    trackers_.push_back(t);
    return t;
}

z3::expr Z3Backend::to_z3(const Clause& clause) {
    if (clause.literals.empty()) {
        return ctx_.bool_val(false);
    }
    z3::expr_vector lits(ctx_);
    for (const auto& lit : clause.literals) {
        lits.push_back(lit.positive ? vars_[lit.var] : !vars_[lit.var]);
    }
    return z3::mk_or(lits);
}

BackendFactory z3_backend_factory() {
    return []() -> SatBackendPtr {
        return std::make_unique<Z3Backend>();
    };
}

} // namespace spydirwebz
