/**
 * @file puzzle_variant.hpp
 * @brief Closed set of puzzle kinds behind the common puzzle contract.
 *
 * Puzzle wraps one of the four concrete puzzles and forwards every contract
 * operation to it, so a puzzle loaded from a file can be handed to the
 * solver templates without the caller knowing its kind.
 */

#ifndef __PUZZLE_VARIANT_HPP___
#define __PUZZLE_VARIANT_HPP___

#include <string>
#include <variant>
#include <vector>

#include "mn_puzzle.hpp"
#include "peg_solitaire_puzzle.hpp"
#include "sudoku_puzzle.hpp"
#include "word_ladder_puzzle.hpp"

using namespace std;

enum class PuzzleKind {
    MN = 0,
    SUDOKU = 1,
    PEG_SOLITAIRE = 2,
    WORD_LADDER = 3,
};

/**
 * @brief Name of a puzzle kind as used in puzzle files ("mn", "sudoku", "peg", "ladder").
 */
string puzzle_kind_name(PuzzleKind kind);

class Puzzle {

private:
    variant<MNPuzzle, SudokuPuzzle, PegSolitairePuzzle, WordLadderPuzzle> value;
public:
    Puzzle(const MNPuzzle& puzzle) : value(puzzle) {}
    Puzzle(const SudokuPuzzle& puzzle) : value(puzzle) {}
    Puzzle(const PegSolitairePuzzle& puzzle) : value(puzzle) {}
    Puzzle(const WordLadderPuzzle& puzzle) : value(puzzle) {}

    PuzzleKind kind() const { return static_cast<PuzzleKind>(value.index()); }

    /**
     * @brief Access the wrapped puzzle.
     * @throws std::bad_variant_access if the puzzle is of another kind.
     */
    template <typename P>
    const P& get() const { return std::get<P>(value); }

    template <typename P>
    bool holds() const { return std::holds_alternative<P>(value); }

    bool is_solved() const;
    bool fail_fast() const;
    vector<Puzzle> extensions() const;

    /**
     * @brief Key of the wrapped puzzle prefixed with its kind name, so keys of
     * different kinds never collide.
     */
    string canonical_key() const;
    string to_string() const;

    bool operator==(const Puzzle& rhs) const;
    bool operator!=(const Puzzle& rhs) const { return !(*this == rhs); }
};

#endif // __PUZZLE_VARIANT_HPP___
