/**
 * @file puzzle.hpp
 * @brief Contract shared by every puzzle the search core can solve.
 *
 * A puzzle type `P` is a copyable value that never changes after
 * construction and provides:
 *
 *  - `bool is_solved() const` - the goal test.
 *  - `bool fail_fast() const` - a cheap, sound unsolvability test: `true`
 *    means no solution is reachable from this state, `false` promises nothing.
 *  - `vector<P> extensions() const` - every state one legal move away, in a
 *    deterministic order, never including the state itself.
 *  - `string canonical_key() const` - the value used for duplicate detection.
 *  - `bool operator==(const P&) const` - equality, defined as key equality.
 *  - `string to_string() const` - human readable rendering.
 *
 * Constructing a puzzle from invalid raw input throws MalformedInput, so the
 * solvers never see an inconsistent state.
 */

#ifndef __PUZZLE_HPP___
#define __PUZZLE_HPP___

#include <stdexcept>
#include <string>

/**
 * @brief Raised by puzzle constructors and the puzzle file reader on invalid input.
 */
class MalformedInput : public std::invalid_argument {
public:
    explicit MalformedInput(const std::string& what) : std::invalid_argument(what) {}
};

#endif // __PUZZLE_HPP___
