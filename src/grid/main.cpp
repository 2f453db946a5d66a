#include "crossfill/grid/options.hpp"
#include "crossfill/grid/structure.hpp"
#include "crossfill/solver.hpp"
#include <iostream>
#include <string>
#include <stdexcept>
#include <csignal>
#include <atomic>
#include <unistd.h>

std::atomic<bool> g_timeout_flag{false};
crossfill::Solver* g_current_solver = nullptr;

void timeout_handler(int) {
    g_timeout_flag = true;
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-t SEC] [options] <structure> <words> [output]\n";
    std::cerr << "  -s           Print solver statistics to stderr\n";
    std::cerr << "  -v           Verbose mode (print presolve/search progress)\n";
    std::cerr << "  -t SEC       Timeout in seconds (positive integer)\n";
    std::cerr << "  --no-lcv     Try words in vocabulary order instead of least-constraining first\n";
    std::cerr << "  --no-degree  Do not break MRV ties by slot degree\n";
    std::cerr << "  --no-ac      Do not re-run arc consistency after each assignment\n";
    std::cerr << "  output       Save the filled grid as an image (e.g. output.png)\n";
}

void print_stats(const crossfill::Solver& solver) {
    const auto& s = solver.stats();
    std::cerr << "Stats: nodes=" << s.node_count
              << " assignments=" << s.assignment_count
              << " fails=" << s.fail_count
              << " propagation_fails=" << s.propagation_fail_count
              << " inconsistent=" << s.inconsistent_count
              << " max_depth=" << s.max_depth
              << " revisions=" << s.propagation.revise_count
              << " removed=" << s.propagation.words_removed
              << "\n";
}

int main(int argc, char* argv[]) {
    crossfill::grid::Options options;
    try {
        options = crossfill::grid::parse_command_line(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (options.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    // Setup timeout
    if (options.timeout_sec > 0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(static_cast<unsigned int>(options.timeout_sec));
    }

    try {
        auto puzzle = crossfill::grid::load_puzzle(options.structure_file, options.words_file);

        crossfill::Solver solver;
        solver.set_verbose(options.verbose);
        solver.set_lcv_ordering(options.lcv);
        solver.set_degree_tiebreak(options.degree);
        solver.set_maintain_arc_consistency(options.arc_consistency);
        g_current_solver = &solver;
        if (g_timeout_flag) {
            solver.stop();  // 読み込み中にタイムアウト
        }

        auto assignment = solver.solve(puzzle);
        g_current_solver = nullptr;
        if (options.print_stats) {
            print_stats(solver);
        }

        if (!assignment) {
            if (solver.is_stopped()) {
                std::cout << "Timed out.\n";
                return 2;
            }
            std::cout << "No solution.\n";
            return 0;
        }

        if (options.verbose) {
            crossfill::AssignmentChecker checker(puzzle);
            for (const auto& [slot, word] : checker.to_solution(*assignment)) {
                std::cerr << "[verbose] " << slot << ": " << word << "\n";
            }
        }

        crossfill::grid::print(std::cout, puzzle, *assignment);

        if (!options.output_file.empty()) {
            crossfill::grid::save_image(puzzle, *assignment, options.output_file);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
