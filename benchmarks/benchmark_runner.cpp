#include <chrono>
#include <exception>

#include "benchmark_runner.hpp"

using namespace std;

bool run_benchmark(const string& name, const SolverFn& solver, const Puzzle& start, bool print_path,
                   ostream& out, ostream& err) {
    SolveStats stats;
    optional<vector<Puzzle>> path;
    auto t0 = chrono::steady_clock::now();
    try {
        path = solver(start, &stats);
    } catch (const std::exception& e) {
        err << "Error solving with " << name << ": " << e.what() << '\n';
        return false;
    }
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    bool found = path.has_value();
    int steps = found ? static_cast<int>(path->size()) - 1 : 0;

    out << puzzle_kind_name(start.kind()) << ", algorithm: " << name << ", time: " << ms
        << "ms, solution found: " << (found?1:0) << ", steps: " << steps
        << ", visited nodes: " << stats.visited_nodes << ", generated nodes: " << stats.generated_nodes
        << ", peak frontier: " << stats.peak_frontier << ", peak retained: " << stats.peak_retained << '\n';

    if (found && print_path) {
        for (size_t i = 0; i < path->size(); ++i) {
            out << "step " << i << ":\n" << (*path)[i].to_string() << "\n\n";
        }
    }
    return true;
}
