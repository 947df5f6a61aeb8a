/**
 * @file peg_solitaire_puzzle.hpp
 * @brief Peg solitaire on a rectangular grid.
 */

#ifndef __PEG_SOLITAIRE_PUZZLE_HPP___
#define __PEG_SOLITAIRE_PUZZLE_HPP___

#include <string>
#include <vector>

#include "puzzle.hpp"

using namespace std;

/**
 * @brief Snapshot of a peg solitaire board. May be solved, unsolved or
 * unsolvable.
 *
 * Cells hold `*` (peg), `.` (empty hole) or `#` (not part of the board). A
 * move jumps a peg orthogonally over an adjacent peg into an empty hole two
 * cells away and removes the jumped peg.
 *
 * Two boards that are 180 degree rotations of each other are the same state
 * for duplicate detection.
 */
class PegSolitairePuzzle {

private:
    vector<string> grid;
    int rows;
    int cols;
    void init(const vector<string>& grid);
    bool is_hole(int r, int c) const;
    bool is_peg(int r, int c) const;
    bool can_jump(int r, int c, int dr, int dc) const;
    bool is_stranded(int r, int c) const;
public:
    static constexpr char PEG = '*';
    static constexpr char EMPTY = '.';
    static constexpr char UNUSED = '#';

    /**
     * @brief Construct from one string per row.
     *
     * @throws MalformedInput on an empty grid, ragged rows or characters
     * other than '*', '.' and '#'.
     */
    explicit PegSolitairePuzzle(const vector<string>& grid);

    int get_rows() const { return rows; }
    int get_cols() const { return cols; }
    const vector<string>& get_grid() const { return grid; }
    int get_pegs() const;

    vector<PegSolitairePuzzle> extensions() const;

    /**
     * @brief True when exactly one peg is left.
     */
    bool is_solved() const;

    /**
     * @brief True for boards that can never end with a single peg: no peg at
     * all, several pegs and no jump available, or two or more pegs that the
     * board shape keeps from ever jumping or being jumped.
     */
    bool fail_fast() const;

    string canonical_key() const;
    string to_string() const;

    bool operator==(const PegSolitairePuzzle& rhs) const;
    bool operator!=(const PegSolitairePuzzle& rhs) const { return !(*this == rhs); }
};

#endif // __PEG_SOLITAIRE_PUZZLE_HPP___
