#include "spydirwebz/uniqueness.hpp"

namespace spydirwebz {

namespace {

size_t selected_triplet(const Formula& formula, const Assignment& assignment) {
    auto selected = formula.true_variables(assignment);
    if (selected.size() != 1) {
        throw SolverError("model selects " + std::to_string(selected.size()) +
                          " triplets, expected exactly one");
    }
    return selected.front();
}

}  // namespace

UniquenessReport prove_uniqueness(SatBackend& backend, const Formula& formula) {
    UniquenessReport report;

    auto first = backend.check();
    report.checks.push_back(first.status);
    report.check_count++;
    if (first.status == CheckStatus::Unknown) {
        report.verdict = Uniqueness::Unknown;
        report.reason = first.reason;
        return report;
    }
    if (first.status == CheckStatus::Unsatisfiable) {
        report.verdict = Uniqueness::NoSolution;
        report.conflicting_clues = backend.conflicting_origins();
        return report;
    }

    size_t c1 = selected_triplet(formula, first.assignment);
    report.witnesses.push_back(c1);

    backend.block(first.assignment);
    auto second = backend.check();
    report.checks.push_back(second.status);
    report.check_count++;
    switch (second.status) {
        case CheckStatus::Unsatisfiable:
            report.verdict = Uniqueness::Unique;
            break;
        case CheckStatus::Satisfiable: {
            size_t c2 = selected_triplet(formula, second.assignment);
            if (c2 == c1) {
                throw SolverError("blocked assignment " + formula.variable_name(c1) +
                                  " was found again");
            }
            report.witnesses.push_back(c2);
            report.verdict = Uniqueness::Multiple;
            break;
        }
        case CheckStatus::Unknown:
            report.verdict = Uniqueness::Unknown;
            report.reason = second.reason;
            break;
    }
    return report;
}

EnumerationResult enumerate_solutions(SatBackend& backend, const Formula& formula,
                                      TripletCallback callback) {
    EnumerationResult result;
    while (true) {
        auto res = backend.check();
        if (res.status == CheckStatus::Unsatisfiable) {
            result.exhausted = true;
            break;
        }
        if (res.status == CheckStatus::Unknown) {
            break;
        }
        size_t var = selected_triplet(formula, res.assignment);
        result.count++;
        if (callback && !callback(var)) {
            break;
        }
        backend.block(res.assignment);
    }
    return result;
}

} // namespace spydirwebz
