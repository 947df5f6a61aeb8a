#ifndef __SOLVE_STATS_HPP___
#define __SOLVE_STATS_HPP___

#include <cstddef>

/**
 * @brief Counters filled by a solver run.
 *
 * @var visited_nodes States taken off the frontier and expanded.
 * @var generated_nodes Search nodes created, root included.
 * @var distinct_keys Canonical keys in the visited set when the run ended.
 * @var peak_frontier Largest number of discovered states waiting to be
 *      entered: the queue (BFS) or the untried siblings along the path (DFS).
 * @var peak_retained Largest number of states held by the solver at once.
 *      BFS keeps every node for path reconstruction; DFS keeps the current
 *      path plus the untried siblings along it.
 * @var max_depth Deepest node reached, in moves from the start.
 */
struct SolveStats {
    int visited_nodes = 0;
    int generated_nodes = 0;
    int distinct_keys = 0;
    size_t peak_frontier = 0;
    size_t peak_retained = 0;
    int max_depth = 0;
};

#endif // __SOLVE_STATS_HPP___
