#include <cctype>
#include <string>
#include <vector>

#include "sudoku_puzzle.hpp"

using namespace std;

const string SudokuPuzzle::SYMBOLS = "123456789ABCDEFG";

void SudokuPuzzle::init(const vector<int>& cells) {
    int n = 0;
    while ((n + 1) * (n + 1) <= static_cast<int>(cells.size())) ++n;
    if (n == 0 || n * n != static_cast<int>(cells.size())) {
        throw MalformedInput("Sudoku cell count must be a positive square");
    }
    int b = 0;
    while ((b + 1) * (b + 1) <= n) ++b;
    if (b * b != n) {
        throw MalformedInput("Sudoku side " + std::to_string(n) + " is not a perfect square");
    }
    if (n > static_cast<int>(SYMBOLS.size())) {
        throw MalformedInput("Sudoku side " + std::to_string(n) + " is too large");
    }
    for (int v : cells) {
        if (v < 0 || v > n) {
            throw MalformedInput("Sudoku values must be in range [0," + std::to_string(n) + "]");
        }
    }
    this->cells = cells;
    this->side = n;
    this->box = b;
}

SudokuPuzzle::SudokuPuzzle(const vector<int>& cells) {
    init(cells);
}

SudokuPuzzle SudokuPuzzle::from_string(const string& text) {
    vector<int> cells;
    for (char ch : text) {
        if (isspace(static_cast<unsigned char>(ch))) continue;
        if (ch == '.' || ch == '0') {
            cells.push_back(0);
            continue;
        }
        size_t digit = SYMBOLS.find(static_cast<char>(toupper(static_cast<unsigned char>(ch))));
        if (digit == string::npos) {
            throw MalformedInput(string("Unknown sudoku symbol '") + ch + "'");
        }
        cells.push_back(static_cast<int>(digit) + 1);
    }
    return SudokuPuzzle(cells);
}

int SudokuPuzzle::get_empty_cells() const {
    int count = 0;
    for (int v : cells) count += v == 0;
    return count;
}

vector<bool> SudokuPuzzle::candidates(int cell) const {
    vector<bool> allowed(side + 1, true);
    int row = cell / side;
    int col = cell % side;
    int box_row = row / box * box;
    int box_col = col / box * box;
    for (int k = 0; k < side; ++k) {
        allowed[cells[row * side + k]] = false;
        allowed[cells[k * side + col]] = false;
        allowed[cells[(box_row + k / box) * side + box_col + k % box]] = false;
    }
    allowed[0] = false;
    return allowed;
}

bool SudokuPuzzle::has_duplicate() const {
    for (int unit = 0; unit < side; ++unit) {
        vector<bool> in_row(side + 1, false), in_col(side + 1, false), in_box(side + 1, false);
        int box_row = unit / box * box;
        int box_col = unit % box * box;
        for (int k = 0; k < side; ++k) {
            int r = cells[unit * side + k];
            int c = cells[k * side + unit];
            int b = cells[(box_row + k / box) * side + box_col + k % box];
            if (r && in_row[r]) return true;
            if (c && in_col[c]) return true;
            if (b && in_box[b]) return true;
            in_row[r] = true;
            in_col[c] = true;
            in_box[b] = true;
        }
    }
    return false;
}

vector<SudokuPuzzle> SudokuPuzzle::extensions() const {
    vector<SudokuPuzzle> moves;
    int cell = 0;
    while (cell < side * side && cells[cell] != 0) ++cell;
    if (cell == side * side) return moves;
    vector<bool> allowed = candidates(cell);
    for (int digit = 1; digit <= side; ++digit) {
        if (!allowed[digit]) continue;
        SudokuPuzzle next = *this;
        next.cells[cell] = digit;
        moves.push_back(next);
    }
    return moves;
}

bool SudokuPuzzle::is_solved() const {
    for (int v : cells) {
        if (v == 0) return false;
    }
    return !has_duplicate();
}

bool SudokuPuzzle::fail_fast() const {
    if (has_duplicate()) return true;
    for (int cell = 0; cell < side * side; ++cell) {
        if (cells[cell] != 0) continue;
        vector<bool> allowed = candidates(cell);
        bool any = false;
        for (int digit = 1; digit <= side && !any; ++digit) any = allowed[digit];
        if (!any) return true;
    }
    return false;
}

string SudokuPuzzle::canonical_key() const {
    string key;
    key.reserve(cells.size());
    for (int v : cells) key += v == 0 ? '.' : SYMBOLS[v - 1];
    return key;
}

string SudokuPuzzle::to_string() const {
    string text;
    for (int row = 0; row < side; ++row) {
        if (row && row % box == 0) text += '\n';
        for (int col = 0; col < side; ++col) {
            if (col && col % box == 0) text += ' ';
            int v = cells[row * side + col];
            text += v == 0 ? '.' : SYMBOLS[v - 1];
        }
        if (row + 1 < side) text += '\n';
    }
    return text;
}

bool SudokuPuzzle::operator==(const SudokuPuzzle &rhs) const {
    return cells == rhs.cells;
}
