/**
 * @file mn_puzzle.hpp
 * @brief Sliding-tile puzzle on an M x N board (15-puzzle and relatives).
 *
 * This header declares the MNPuzzle class used across solvers and tools.
 */

#ifndef __MN_PUZZLE_HPP___
#define __MN_PUZZLE_HPP___

#include <string>
#include <vector>

#include "puzzle.hpp"

using namespace std;

/**
 * @brief Represents a board state for sliding puzzles (e.g. 15-puzzle).
 *
 * The class stores the current layout and the target layout in row-major
 * order, where 0 marks an empty cell. Several empty cells are allowed. It
 * exposes helpers to query tile positions and to generate legal successor
 * states.
 */
class MNPuzzle {

private:
    vector<int> tiles;
    vector<int> target;
    int rows;
    int cols;
    int empty_cells;
    void init(const vector<int>& tiles, const vector<int>& target, int rows, int cols);
    MNPuzzle with_swap(int a, int b) const;
public:
    /**
     * @brief Construct a puzzle on a rows x cols board.
     *
     * @param tiles Current layout in row-major order, 0 for empty cells.
     * @param target Goal layout in row-major order.
     * @param rows Board height.
     * @param cols Board width.
     * @throws MalformedInput on inconsistent input, or if rows x cols does
     * not fit in an int.
     */
    MNPuzzle(const vector<int>& tiles, const vector<int>& target, int rows, int cols);

    /**
     * @brief Construct a square puzzle with side length inferred from the tile count.
     *
     * @throws MalformedInput if the tile count is not a perfect square.
     */
    MNPuzzle(const vector<int>& tiles, const vector<int>& target);

    /**
     * @brief The ordered goal layout: 1, 2, ..., followed by `empty_cells` zeros.
     *
     * @throws MalformedInput if rows x cols is not a valid board size.
     */
    static vector<int> ordered_layout(int rows, int cols, int empty_cells = 1);

    int get_rows() const { return rows; }
    int get_cols() const { return cols; }
    const vector<int>& get_tiles() const { return tiles; }
    const vector<int>& get_target() const { return target; }

    /**
     * @brief Return the row index (0-based) of the cell holding the given tile value.
     *
     * @param tile Tile value (non-zero).
     * @return Row index, or -1 if the value is not on the board.
     */
    int get_tile_row(int tile) const;

    /**
     * @brief Return the column index (0-based) of the cell holding the given tile value.
     */
    int get_tile_column(int tile) const;

    /**
     * @brief Number of empty cells on the board.
     */
    int get_empty_cells() const;

    /**
     * @brief Return the linear indices of empty cell positions (in row-major order).
     *
     * @return Vector of positions (each value in 0..rows*cols-1).
     */
    vector<int> get_empty_positions() const;

    /**
     * @brief Generate all legal successor states from this state.
     *
     * Empty cells are visited in row-major order and each is swapped with
     * its up, down, left and right neighbour in turn. Swapping two empty
     * cells is not a move.
     */
    vector<MNPuzzle> extensions() const;

    bool is_solved() const;

    /**
     * @brief Parity test for boards with a single empty cell.
     *
     * Every move is a transposition with the empty cell and shifts it by one
     * cell, so the permutation parity and the parity of the empty cell's
     * Manhattan distance to its target cell flip together. A mismatch means
     * the target can never be reached.
     */
    bool fail_fast() const;

    string canonical_key() const;
    string to_string() const;

    bool operator==(const MNPuzzle& rhs) const;
    bool operator!=(const MNPuzzle& rhs) const { return !(*this == rhs); }
};

#endif // __MN_PUZZLE_HPP___
