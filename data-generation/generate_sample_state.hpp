#ifndef __GENERATE_SAMPLE_STATE_HPP___
#define __GENERATE_SAMPLE_STATE_HPP___

#include <random>

#include "mn_puzzle.hpp"

/**
 * @file generate_sample_state.hpp
 * @brief Utilities to create random sliding puzzles for benchmarks and testing.
 *
 * Two sampling strategies are provided:
 * - random walk: perform `target_depth` random legal moves from the goal layout
 * - BFS sampling: collect all layouts at exact depth and pick one uniformly
 *
 * Both return a puzzle whose target is the ordered layout
 * (MNPuzzle::ordered_layout).
 */

/**
 * @brief Generate a random puzzle by performing a random walk from the solved layout.
 *
 * @param rows Board height.
 * @param cols Board width.
 * @param empty_cells Number of empty cells on the board.
 * @param target_depth Number of random moves to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @throws MalformedInput if the dimensions do not describe a valid board.
 * @return A sampled `MNPuzzle` at most `target_depth` moves from solved.
 */
MNPuzzle random_state_random_walk(int rows, int cols, int empty_cells, int target_depth, std::mt19937 &rng);

/**
 * @brief Generate a random puzzle by uniform sampling among layouts at exact BFS depth.
 *
 * The function performs a breadth-first search from the solved layout up to
 * `target_depth` and uniformly selects one of the layouts at that depth, so
 * the optimal solution length of the result is exactly `target_depth`.
 *
 * @return A sampled `MNPuzzle`. Returns the solved puzzle if no layout exists at that depth.
 */
MNPuzzle random_state_bfs(int rows, int cols, int empty_cells, int target_depth, std::mt19937 &rng);

#endif // __GENERATE_SAMPLE_STATE_HPP___
