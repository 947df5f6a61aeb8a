#include <iostream>
#include <optional>
#include <string>

#include "puzzle_variant.hpp"
#include "puzzle_file_operations.hpp"
#include "benchmark_runner.hpp"
#include "puzzle-bfs-solver.hpp"
#include "puzzle-dfs-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file;
    string algorithm = "both";
    bool print_path = false;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--algorithm" && i + 1 < argc) { algorithm = argv[++i]; }
        else if (a == "--print-path") { print_path = true; }
        else if (a == "--help") {
            cout << "Usage: benchmark-bfs-dfs --input-file F [--algorithm bfs|dfs|both] [--print-path]\n";
            return 0;
        }
        else {
            cerr << "Unknown argument: " << a << '\n';
            return 1;
        }
    }
    if (input_file.empty()) {
        cerr << "benchmark-bfs-dfs needs --input-file\n";
        return 1;
    }
    if (algorithm != "bfs" && algorithm != "dfs" && algorithm != "both") {
        cerr << "Unknown algorithm '" << algorithm << "', expected bfs, dfs or both\n";
        return 1;
    }

    optional<Puzzle> start_state;
    try {
        start_state = read_puzzle_from_file(input_file);
    } catch (const MalformedInput& e) {
        cerr << "Error reading puzzle: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        cerr << "Error opening puzzle: " << e.what() << '\n';
        return 3;
    }

    bool ok = true;
    if (algorithm != "dfs") ok = run_benchmark("bfs", BFSPuzzleSolver<Puzzle>, *start_state, print_path, cout, cerr) && ok;
    if (algorithm != "bfs") ok = run_benchmark("dfs", DFSPuzzleSolver<Puzzle>, *start_state, print_path, cout, cerr) && ok;

    return ok ? 0 : 4;
}
