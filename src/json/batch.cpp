#include "spydirwebz/json/batch.hpp"
#include "spydirwebz/json/record.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace spydirwebz {
namespace json {

namespace {

void print_stats(std::ostream& err, const std::string& filename, const FileReport& report) {
    const auto& s = report.stats;
    err << "% Stats: file=" << filename
        << " variables=" << s.variable_count
        << " clauses=" << s.clause_count
        << " checks=" << s.check_count
        << " solutions=" << s.solution_count
        << "\n";
}

void print_text(std::ostream& out, const std::string& filename, const FileReport& report) {
    out << filename << ": " << to_string(report.result.status) << "\n";
    out << "  " << report.result.explanation << "\n";
    if (report.enumeration) {
        out << "  solutions: " << report.enumeration->count
            << (report.enumeration->exhausted ? "" : " (incomplete)") << "\n";
    }
}

}  // namespace

bool parse_unsigned(const char* text, unsigned max, unsigned& value) {
    if (text == nullptr || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(text, &end, 10);
    if (*end != '\0' || errno == ERANGE || v > max) {
        return false;
    }
    value = static_cast<unsigned>(v);
    return true;
}

FileReport validate_file(const std::string& filename, const BatchOptions& options) {
    FileReport report;
    Validator validator;
    validator.set_verbose(options.verbose);
    validator.set_timeout_ms(options.timeout_sec * 1000);

    Puzzle puzzle;
    try {
        puzzle = load_puzzle(filename);
    } catch (const MalformedPuzzle& e) {
        report.result = ValidationResult::malformed(e.what());
        return report;
    } catch (const std::runtime_error& e) {
        // ファイルが開けない、または JSON として読めない
        report.result = ValidationResult::malformed(e.what());
        return report;
    }

    report.result = validator.validate(puzzle);
    report.stats = validator.stats();

    if (options.count) {
        report.enumeration = validator.count_solutions(puzzle);
        report.stats.check_count += validator.stats().check_count;
        report.stats.solution_count = validator.stats().solution_count;
    }
    return report;
}

int run_batch(const std::vector<std::string>& filenames, const BatchOptions& options,
              std::ostream& out, std::ostream& err) {
    // 各パズルは独立しているので、ワーカーごとに Validator を持つ
    std::vector<FileReport> reports(filenames.size());
    std::vector<std::string> errors(filenames.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next++; i < filenames.size(); i = next++) {
            try {
                reports[i] = validate_file(filenames[i], options);
            } catch (const std::exception& e) {
                errors[i] = e.what();
            }
        }
    };

    size_t thread_count = std::min(static_cast<size_t>(std::max(options.workers, 1u)),
                                   filenames.size());
    if (thread_count <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        for (size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    // 入力順に出力
    bool all_valid = true;
    bool failed = false;
    for (size_t i = 0; i < filenames.size(); ++i) {
        if (!errors[i].empty()) {
            err << "Error: " << filenames[i] << ": " << errors[i] << "\n";
            failed = true;
            continue;
        }
        if (options.print_stats) {
            print_stats(err, filenames[i], reports[i]);
        }
        if (options.json) {
            write_result(out, reports[i].result, filenames.size() > 1 ? filenames[i] : "");
        } else {
            print_text(out, filenames[i], reports[i]);
        }
        if (!reports[i].result.is_valid()) {
            all_valid = false;
        }
    }

    if (failed) {
        return 1;
    }
    return all_valid ? 0 : 2;
}

} // namespace json
} // namespace spydirwebz
