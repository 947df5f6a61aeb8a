#include <climits>
#include <queue>
#include <random>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "generate_sample_state.hpp"

using namespace std;

static MNPuzzle solved_puzzle(int rows, int cols, int empty_cells) {
    if (rows < 1 || cols < 1 || rows > INT_MAX / cols || empty_cells < 1 || empty_cells > rows * cols) {
        throw MalformedInput("Invalid sample dimensions");
    }
    vector<int> goal = MNPuzzle::ordered_layout(rows, cols, empty_cells);
    return MNPuzzle(goal, goal, rows, cols);
}

MNPuzzle random_state_random_walk(int rows, int cols, int empty_cells, int target_depth, std::mt19937 &rng) {
    MNPuzzle temp_state = solved_puzzle(rows, cols, empty_cells);
    for (int i = 0; i < target_depth; ++i) {
        auto moves = temp_state.extensions();
        if (moves.empty()) break;
        std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
        temp_state = moves[dist(rng)];
    }
    return temp_state;
}

MNPuzzle random_state_bfs(int rows, int cols, int empty_cells, int target_depth, std::mt19937 &rng) {
    MNPuzzle start_state = solved_puzzle(rows, cols, empty_cells);

    std::queue<std::pair<MNPuzzle, int>> frontier;
    std::unordered_set<string> explored;
    frontier.push({start_state, 0});
    explored.insert(start_state.canonical_key());

    std::vector<MNPuzzle> candidates;

    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop();
        const MNPuzzle& state = current.first;
        int depth = current.second;

        if (depth > target_depth) break;

        if (depth == target_depth) {
            candidates.push_back(state);
            continue;
        }

        for (const auto &move : state.extensions()) {
            if (explored.insert(move.canonical_key()).second) {
                frontier.push({move, depth + 1});
            }
        }
    }

    if (candidates.empty()) {
        // no layout at that depth; return start as fallback
        return start_state;
    }

    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng)];
}
