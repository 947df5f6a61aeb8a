/**
 * @file search_node.hpp
 * @brief Search bookkeeping shared by the BFS and DFS solvers.
 */

#ifndef __SEARCH_NODE_HPP___
#define __SEARCH_NODE_HPP___

#include <algorithm>
#include <cstddef>
#include <limits>
#include <vector>

const size_t NO_PARENT = std::numeric_limits<size_t>::max();

/**
 * @brief A discovered state and the handle of the node it was reached from.
 *
 * The BFS solver keeps its nodes in a per-run arena (a vector); each refers to
 * its parent by index, so there are no back-pointers to keep alive.
 */
template <typename P>
struct SearchNode {
    P state;
    size_t parent;  // NO_PARENT for the root
    int depth;      // moves from the root
};

template <typename P>
using SearchArena = std::vector<SearchNode<P>>;

/**
 * @brief Build the state sequence from the root to the node at `terminal`.
 *
 * Follows parent handles back to the root and reverses the result.
 *
 * @param arena Nodes of one solver run.
 * @param terminal Handle of the last node of the path.
 * @return States from the initial state to `arena[terminal].state`, inclusive.
 */
template <typename P>
std::vector<P> reconstruct_path(const SearchArena<P>& arena, size_t terminal) {
    std::vector<P> path;
    path.reserve(arena[terminal].depth + 1);
    for (size_t node = terminal; node != NO_PARENT; node = arena[node].parent) {
        path.push_back(arena[node].state);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

#endif // __SEARCH_NODE_HPP___
