#include "spydirwebz/validator.hpp"
#include "spydirwebz/encoder.hpp"
#include "spydirwebz/z3_backend.hpp"
#include <iostream>
#include <set>

namespace spydirwebz {

namespace {

std::string quoted_clue(const Puzzle& puzzle, size_t index) {
    return "#" + std::to_string(index + 1) + " \"" + clue_text(puzzle.clues[index]) + "\"";
}

const char* status_name(CheckStatus status) {
    switch (status) {
        case CheckStatus::Satisfiable:   return "sat";
        case CheckStatus::Unsatisfiable: return "unsat";
        case CheckStatus::Unknown:       return "unknown";
    }
    return "unknown";
}

std::string describe(const Solution& sol) {
    std::string text = sol.triplet.actor + " used " + sol.triplet.vector +
                       " against the " + sol.triplet.asset;
    if (!sol.stolen_data.empty()) {
        text += " and stole " + sol.stolen_data;
    }
    return text;
}

}  // namespace

std::string to_string(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Valid:            return "valid";
        case ValidationStatus::Unsatisfiable:    return "unsatisfiable";
        case ValidationStatus::NotUnique:        return "not_unique";
        case ValidationStatus::SolutionMismatch: return "solution_mismatch";
        case ValidationStatus::Malformed:        return "malformed";
        case ValidationStatus::SolverTimeout:    return "solver_timeout";
    }
    return "malformed";
}

std::string to_string(MismatchReason reason) {
    switch (reason) {
        case MismatchReason::None:              return "none";
        case MismatchReason::Triplet:           return "triplet";
        case MismatchReason::DatumContradicted: return "datum_contradicted";
        case MismatchReason::DatumUnsupported:  return "datum_unsupported";
    }
    return "none";
}

bool ValidationResult::operator==(const ValidationResult& other) const {
    return status == other.status &&
           explanation == other.explanation &&
           solution == other.solution &&
           declared == other.declared &&
           mismatch == other.mismatch &&
           witnesses == other.witnesses &&
           conflicting_clues == other.conflicting_clues;
}

ValidationResult ValidationResult::malformed(const std::string& message) {
    ValidationResult result;
    result.status = ValidationStatus::Malformed;
    result.explanation = "Malformed puzzle: " + message;
    return result;
}

// ============================================================================
// DataInference
// ============================================================================

DataInferenceCheck check_data_inference(const Puzzle& puzzle, const std::string& true_vector) {
    DataInferenceCheck check;
    const std::string& declared = puzzle.solution.stolen_data;
    std::set<std::string> implied;

    for (size_t i = 0; i < puzzle.clues.size(); ++i) {
        const auto* clue = std::get_if<DataInferenceClue>(&puzzle.clues[i]);
        if (!clue) {
            continue;
        }
        if (clue->vector == true_vector) {
            implied.insert(clue->data);
            if (clue->data != declared) {
                check.offending_clues.push_back(i);
            }
        } else if (clue->data == declared) {
            // 宣言データは別の vector の攻撃でしか盗まれない
            check.offending_clues.push_back(i);
        }
    }

    if (implied.size() == 1) {
        check.implied_datum = *implied.begin();
    }
    if (!check.offending_clues.empty()) {
        check.verdict = MismatchReason::DatumContradicted;
    } else if (implied.empty()) {
        check.verdict = MismatchReason::DatumUnsupported;
    }
    return check;
}

// ============================================================================
// Validator
// ============================================================================

Validator::Validator()
    : factory_(z3_backend_factory()) {}

Validator::Validator(BackendFactory factory)
    : factory_(std::move(factory)) {}

SatBackendPtr Validator::open_session(const Formula& formula) {
    if (!factory_) {
        throw SolverError("no backend factory configured");
    }
    auto backend = factory_();
    if (verbose_) {
        std::cerr << "% [verbose] backend: " << backend->name() << "\n";
    }
    backend->set_timeout(timeout_ms_);
    backend->add_formula(formula);
    return backend;
}

ValidationResult Validator::validate(const Puzzle& puzzle) {
    stats_ = ValidatorStats{};
    check_puzzle(puzzle);

    Formula formula = encode(puzzle);
    stats_.variable_count = formula.variable_count();
    stats_.clause_count = formula.clauses().size();
    if (verbose_) {
        std::cerr << "% [verbose] encode: " << stats_.variable_count << " variables, "
                  << stats_.clause_count << " clauses, "
                  << puzzle.clues.size() << " clues\n";
    }

    auto backend = open_session(formula);
    auto report = prove_uniqueness(*backend, formula);
    stats_.check_count = report.check_count;
    if (verbose_) {
        for (size_t i = 0; i < report.checks.size(); ++i) {
            std::cerr << "% [verbose] check " << (i + 1) << ": "
                      << status_name(report.checks[i]) << "\n";
        }
    }

    ValidationResult result;
    switch (report.verdict) {
        case Uniqueness::NoSolution: {
            result.status = ValidationStatus::Unsatisfiable;
            result.conflicting_clues = report.conflicting_clues;
            result.explanation = "No triplet satisfies all clues: the clue set is "
                                 "over-constrained or contradictory.";
            if (!report.conflicting_clues.empty()) {
                result.explanation += " Conflicting clues:";
                for (size_t i = 0; i < report.conflicting_clues.size(); ++i) {
                    result.explanation += (i == 0 ? " " : ", ") +
                                          quoted_clue(puzzle, report.conflicting_clues[i]);
                }
                result.explanation += ".";
            }
            break;
        }
        case Uniqueness::Multiple: {
            result.status = ValidationStatus::NotUnique;
            for (size_t var : report.witnesses) {
                result.witnesses.push_back(formula.triplet(var));
            }
            result.explanation = "Puzzle is not uniquely solvable: both " +
                                 to_string(result.witnesses[0]) + " and " +
                                 to_string(result.witnesses[1]) +
                                 " satisfy every clue.";
            break;
        }
        case Uniqueness::Unknown:
            result.status = ValidationStatus::SolverTimeout;
            result.explanation = "Solver stopped before reaching a verdict (" +
                                 (report.reason.empty() ? std::string("unknown") : report.reason) +
                                 "); the result is inconclusive.";
            break;
        case Uniqueness::Unique:
            result = check_declared(puzzle, formula.triplet(report.witnesses.front()));
            break;
    }

    if (verbose_) {
        std::cerr << "% [verbose] checks=" << stats_.check_count
                  << " verdict=" << to_string(result.status) << "\n";
    }
    return result;
}

ValidationResult Validator::check_declared(const Puzzle& puzzle, const Triplet& found) {
    ValidationResult result;
    const Solution& declared = puzzle.solution;
    auto data_check = check_data_inference(puzzle, found.vector);

    Solution derived;
    derived.triplet = found;
    derived.stolen_data = data_check.implied_datum.value_or("");
    result.solution = derived;

    if (found != declared.triplet) {
        result.status = ValidationStatus::SolutionMismatch;
        result.mismatch = MismatchReason::Triplet;
        result.declared = declared;
        result.explanation = "Clues uniquely determine " + to_string(found) +
                             ", but the declared solution is " +
                             to_string(declared.triplet) + ".";
        return result;
    }

    switch (data_check.verdict) {
        case MismatchReason::DatumContradicted: {
            result.status = ValidationStatus::SolutionMismatch;
            result.mismatch = MismatchReason::DatumContradicted;
            result.declared = declared;
            result.explanation = "Declared stolen data '" + declared.stolen_data +
                                 "' contradicts clue";
            result.explanation += data_check.offending_clues.size() > 1 ? "s" : "";
            for (size_t i = 0; i < data_check.offending_clues.size(); ++i) {
                result.explanation += (i == 0 ? " " : ", ") +
                                      quoted_clue(puzzle, data_check.offending_clues[i]);
            }
            result.explanation += ".";
            return result;
        }
        case MismatchReason::DatumUnsupported:
            result.status = ValidationStatus::SolutionMismatch;
            result.mismatch = MismatchReason::DatumUnsupported;
            result.declared = declared;
            result.explanation = "No data-inference clue applies to vector '" + found.vector +
                                 "', so declared stolen data '" + declared.stolen_data +
                                 "' is not implied by the clues.";
            return result;
        case MismatchReason::None:
        case MismatchReason::Triplet:
            break;
    }

    result.status = ValidationStatus::Valid;
    result.solution = declared;
    result.explanation = "Puzzle is consistent and uniquely solvable: " +
                         describe(declared) + ".";
    return result;
}

EnumerationResult Validator::count_solutions(const Puzzle& puzzle) {
    stats_ = ValidatorStats{};
    check_puzzle(puzzle);
    Formula formula = encode(puzzle);
    stats_.variable_count = formula.variable_count();
    stats_.clause_count = formula.clauses().size();
    auto backend = open_session(formula);
    auto result = enumerate_solutions(*backend, formula);
    stats_.solution_count = result.count;
    // 途中で打ち切らない限り、最後の check は充足不能か判定不能
    stats_.check_count = result.count + 1;
    if (verbose_) {
        std::cerr << "% [verbose] enumerate: " << result.count << " solutions"
                  << (result.exhausted ? "" : " (incomplete)") << "\n";
    }
    return result;
}

} // namespace spydirwebz
