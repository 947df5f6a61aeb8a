#ifndef __PUZZLE_BFS_SOLVER_HPP___
#define __PUZZLE_BFS_SOLVER_HPP___

/**
 * @file puzzle-bfs-solver.hpp
 * @brief Breadth-first search solver for any type honouring the puzzle contract.
 */

#include <algorithm>
#include <optional>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

#include "search_node.hpp"
#include "solve_stats.hpp"

/**
 * @brief Solve the puzzle using BFS.
 *
 * States are marked visited when they are enqueued, so each state is queued
 * at most once. The whole depth d is dequeued before any state at depth d+1,
 * so the returned path uses the minimum number of moves. A state whose
 * fail_fast() holds is dropped when dequeued, without being expanded.
 *
 * @param start Starting puzzle state.
 * @param stats Optional out-parameter to receive the run counters.
 * @return Sequence of states from start to a solved state, or std::nullopt
 *         if the reachable space holds no solved state.
 */
template <typename P>
std::optional<std::vector<P>> BFSPuzzleSolver(const P &start, SolveStats* stats = nullptr) {
    std::optional<std::vector<P>> path;
    SearchArena<P> nodes;
    std::queue<size_t> frontier;
    std::unordered_set<std::string> explored;
    int visited_nodes = 0;
    size_t peak_frontier = 0;

    nodes.push_back({start, NO_PARENT, 0});
    explored.insert(start.canonical_key());
    frontier.push(0);
    while (!frontier.empty()) {
        peak_frontier = std::max(peak_frontier, frontier.size());
        size_t current = frontier.front();
        frontier.pop();

        if (nodes[current].state.is_solved()) {
            path = reconstruct_path(nodes, current);
            break;
        }
        if (nodes[current].state.fail_fast()) continue;

        visited_nodes++;
        // expand before appending, push_back may move the arena
        std::vector<P> moves = nodes[current].state.extensions();
        int depth = nodes[current].depth + 1;
        for (auto &move : moves) {
            if (!explored.insert(move.canonical_key()).second) continue;
            nodes.push_back({std::move(move), current, depth});
            frontier.push(nodes.size() - 1);
        }
    }

    if (stats) {
        stats->visited_nodes = visited_nodes;
        stats->generated_nodes = static_cast<int>(nodes.size());
        stats->distinct_keys = static_cast<int>(explored.size());
        stats->peak_frontier = peak_frontier;
        // the arena only grows, and nodes are created in depth order
        stats->peak_retained = nodes.size();
        stats->max_depth = nodes.back().depth;
    }
    return path;
}

#endif // __PUZZLE_BFS_SOLVER_HPP___
