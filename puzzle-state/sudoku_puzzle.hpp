#ifndef __SUDOKU_PUZZLE_HPP___
#define __SUDOKU_PUZZLE_HPP___

#include <string>
#include <vector>

#include "puzzle.hpp"

using namespace std;

/**
 * @brief Sudoku board of side n = b*b (4x4, 9x9, 16x16); 0 marks an empty cell.
 */
class SudokuPuzzle {

private:
    vector<int> cells;
    int side;
    int box;
    void init(const vector<int>& cells);
    vector<bool> candidates(int cell) const;
    bool has_duplicate() const;
public:
    // Symbols used for digits 1..16 in text form.
    static const string SYMBOLS;

    explicit SudokuPuzzle(const vector<int>& cells);

    /**
     * @brief Parse a board from n*n symbols: '.' or '0' for empty, then
     * "123456789ABCDEFG". Whitespace is ignored.
     *
     * @throws MalformedInput on unknown symbols or a non-square symbol count.
     */
    static SudokuPuzzle from_string(const string& text);

    int get_side() const { return side; }
    int get_cell(int row, int column) const { return cells[row * side + column]; }
    int get_empty_cells() const;

    // The first empty cell (row-major) filled with every digit its row,
    // column and box still allow, in ascending order.
    vector<SudokuPuzzle> extensions() const;
    bool is_solved() const;
    // A repeated digit in a row, column or box, or an empty cell with no
    // digit left.
    bool fail_fast() const;

    string canonical_key() const;
    string to_string() const;

    bool operator==(const SudokuPuzzle& rhs) const;
    bool operator!=(const SudokuPuzzle& rhs) const { return !(*this == rhs); }
};

#endif // __SUDOKU_PUZZLE_HPP___
