#include "spydirwebz/json/batch.hpp"
#include <climits>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-j] [-s] [-v] [-c] [-t SEC] [-p N] <puzzle.json>...\n";
    std::cerr << "  -j      Print one JSON result record per puzzle\n";
    std::cerr << "  -s      Print validator statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print encoding and solver progress)\n";
    std::cerr << "  -c      Also count every triplet that satisfies the clues\n";
    std::cerr << "  -t SEC  Timeout per solver check in seconds\n";
    std::cerr << "  -p N    Validate N puzzles in parallel\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> filenames;
    spydirwebz::json::BatchOptions options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-j") == 0) {
            options.json = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            options.print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "-c") == 0) {
            options.count = true;
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            // ミリ秒に直しても unsigned に収まる範囲
            if (!spydirwebz::json::parse_unsigned(argv[++i], UINT_MAX / 1000,
                                                  options.timeout_sec)) {
                std::cerr << "Invalid timeout: " << argv[i]
                          << " (expected seconds, 0-" << UINT_MAX / 1000 << ")\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            if (!spydirwebz::json::parse_unsigned(argv[++i], 1024, options.workers) ||
                options.workers < 1) {
                std::cerr << "Invalid worker count: " << argv[i] << " (expected 1-1024)\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filenames.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (filenames.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    return spydirwebz::json::run_batch(filenames, options, std::cout, std::cerr);
}
