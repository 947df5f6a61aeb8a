#include <chrono>
#include <cstring>
#include <exception>
#include <optional>
#include <string>
#include <vector>
#include "puzzle_variant.hpp"
#include "puzzle_file_operations.hpp"
#include "puzzle-bfs-solver.hpp"
#include "puzzle-dfs-solver.hpp"
#include "search_api.hpp"

extern "C" {
    // Run BFS or DFS ("bfs" / "dfs") on a given puzzle file; time is in milliseconds.
    // Returns 1 if solution found, 0 otherwise, -1 on bad arguments, -2 if
    // the puzzle file cannot be loaded and -3 if the search itself fails.
    // steps counts moves, visited counts expanded states.
    int puzzle_run_instance(
        const char* input_file,
        const char* algorithm,
        double* out_time_ms,
        int* out_steps,
        int* out_visited
    ) {
        if (!input_file || !algorithm || !out_time_ms || !out_steps || !out_visited) {
            return -1;
        }
        bool use_bfs = std::strcmp(algorithm, "bfs") == 0;
        if (!use_bfs && std::strcmp(algorithm, "dfs") != 0) {
            return -1;
        }

        std::optional<Puzzle> start_state;
        try {
            start_state = read_puzzle_from_file(std::string(input_file));
        } catch (const std::exception&) {
            return -2;
        }

        auto t0 = std::chrono::steady_clock::now();
        SolveStats stats;
        std::optional<std::vector<Puzzle>> path;
        try {
            path = use_bfs ? BFSPuzzleSolver(*start_state, &stats) : DFSPuzzleSolver(*start_state, &stats);
        } catch (const std::exception&) {
            // out of memory on a search space too large for this machine
            return -3;
        }
        auto t1 = std::chrono::steady_clock::now();
        double ms = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();

        *out_time_ms = ms;
        *out_steps = path ? static_cast<int>(path->size()) - 1 : 0;
        *out_visited = stats.visited_nodes;
        return path ? 1 : 0;
    }
}
