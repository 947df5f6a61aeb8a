#ifndef __PUZZLE_DFS_SOLVER_HPP___
#define __PUZZLE_DFS_SOLVER_HPP___

/**
 * @file puzzle-dfs-solver.hpp
 * @brief Depth-first search solver for any type honouring the puzzle contract.
 */

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "solve_stats.hpp"

/**
 * @brief One state on the live DFS path and the children still to try from it.
 */
template <typename P>
struct DFSFrame {
    P state;
    std::vector<P> pending;  // unvisited extensions, in extension order
    size_t next;             // index of the next pending child to enter
};

/**
 * @brief Solve the puzzle using DFS with an explicit stack of frames.
 *
 * The first extension of a state is explored to the end before its siblings.
 * States are marked visited when discovered, so no state is entered twice and
 * the search terminates on any finite space. Only the current path and the
 * untried siblings along it are kept; a frame and its states are released as
 * soon as its branch is exhausted. The returned path is the first one found
 * and is in general not the shortest.
 *
 * @param start Starting puzzle state.
 * @param stats Optional out-parameter to receive the run counters.
 * @return Sequence of states from start to a solved state, or std::nullopt
 *         if the reachable space holds no solved state.
 */
template <typename P>
std::optional<std::vector<P>> DFSPuzzleSolver(const P &start, SolveStats* stats = nullptr) {
    std::optional<std::vector<P>> path;
    std::vector<DFSFrame<P>> frames;
    std::unordered_set<std::string> explored;
    int visited_nodes = 0;
    int generated_nodes = 1;
    size_t pending_states = 0;
    size_t peak_frontier = 1;
    size_t peak_retained = 1;
    int max_depth = 0;

    explored.insert(start.canonical_key());
    frames.push_back({start, {}, 0});
    bool entered = true;
    while (!frames.empty()) {
        DFSFrame<P> &top = frames.back();
        if (entered) {
            entered = false;
            if (top.state.is_solved()) {
                path.emplace();
                path->reserve(frames.size());
                for (auto &frame : frames) path->push_back(std::move(frame.state));
                break;
            }
            if (top.state.fail_fast()) {
                frames.pop_back();
                continue;
            }

            visited_nodes++;
            for (auto &move : top.state.extensions()) {
                if (!explored.insert(move.canonical_key()).second) continue;
                top.pending.push_back(std::move(move));
            }
            generated_nodes += static_cast<int>(top.pending.size());
            pending_states += top.pending.size();
            peak_frontier = std::max(peak_frontier, pending_states);
            peak_retained = std::max(peak_retained, frames.size() + pending_states);
        }

        if (top.next == top.pending.size()) {
            // branch exhausted, drop it
            frames.pop_back();
            continue;
        }
        P child = std::move(top.pending[top.next++]);
        pending_states--;
        frames.push_back({std::move(child), {}, 0});
        max_depth = std::max(max_depth, static_cast<int>(frames.size()) - 1);
        entered = true;
    }

    if (stats) {
        stats->visited_nodes = visited_nodes;
        stats->generated_nodes = generated_nodes;
        stats->distinct_keys = static_cast<int>(explored.size());
        stats->peak_frontier = peak_frontier;
        stats->peak_retained = peak_retained;
        stats->max_depth = max_depth;
    }
    return path;
}

#endif // __PUZZLE_DFS_SOLVER_HPP___
