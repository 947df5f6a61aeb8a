#include <algorithm>
#include <string>
#include <vector>

#include "peg_solitaire_puzzle.hpp"

using namespace std;

namespace {
// up, down, left, right
const int DR[4] = {-1, 1, 0, 0};
const int DC[4] = {0, 0, -1, 1};
}

void PegSolitairePuzzle::init(const vector<string>& grid) {
    if (grid.empty() || grid[0].empty()) {
        throw MalformedInput("Peg solitaire grid cannot be empty");
    }
    for (const auto& row : grid) {
        if (row.size() != grid[0].size()) {
            throw MalformedInput("Peg solitaire rows must have equal length");
        }
        for (char ch : row) {
            if (ch != PEG && ch != EMPTY && ch != UNUSED) {
                throw MalformedInput(string("Unknown peg solitaire marker '") + ch + "'");
            }
        }
    }
    this->grid = grid;
    this->rows = static_cast<int>(grid.size());
    this->cols = static_cast<int>(grid[0].size());
}

PegSolitairePuzzle::PegSolitairePuzzle(const vector<string>& grid) {
    init(grid);
}

bool PegSolitairePuzzle::is_hole(int r, int c) const {
    return r >= 0 && r < rows && c >= 0 && c < cols && grid[r][c] != UNUSED;
}

bool PegSolitairePuzzle::is_peg(int r, int c) const {
    return is_hole(r, c) && grid[r][c] == PEG;
}

bool PegSolitairePuzzle::can_jump(int r, int c, int dr, int dc) const {
    return is_peg(r, c) && is_peg(r + dr, c + dc) &&
           is_hole(r + 2 * dr, c + 2 * dc) && grid[r + 2 * dr][c + 2 * dc] == EMPTY;
}

bool PegSolitairePuzzle::is_stranded(int r, int c) const {
    for (int d = 0; d < 4; ++d) {
        if (is_hole(r + DR[d], c + DC[d]) && is_hole(r + 2 * DR[d], c + 2 * DC[d])) return false;
    }
    // can be jumped over along either axis
    if (is_hole(r - 1, c) && is_hole(r + 1, c)) return false;
    if (is_hole(r, c - 1) && is_hole(r, c + 1)) return false;
    return true;
}

int PegSolitairePuzzle::get_pegs() const {
    int pegs = 0;
    for (const auto& row : grid) pegs += static_cast<int>(count(row.begin(), row.end(), PEG));
    return pegs;
}

vector<PegSolitairePuzzle> PegSolitairePuzzle::extensions() const {
    vector<PegSolitairePuzzle> moves;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (grid[r][c] != EMPTY) continue;
            // a peg two cells away in direction d jumps back into (r, c)
            for (int d = 0; d < 4; ++d) {
                int fr = r + 2 * DR[d], fc = c + 2 * DC[d];
                if (!can_jump(fr, fc, -DR[d], -DC[d])) continue;
                PegSolitairePuzzle next = *this;
                next.grid[fr][fc] = EMPTY;
                next.grid[r + DR[d]][c + DC[d]] = EMPTY;
                next.grid[r][c] = PEG;
                moves.push_back(next);
            }
        }
    }
    return moves;
}

bool PegSolitairePuzzle::is_solved() const {
    return get_pegs() == 1;
}

bool PegSolitairePuzzle::fail_fast() const {
    int pegs = get_pegs();
    if (pegs == 0) return true;
    if (pegs == 1) return false;
    bool any_jump = false;
    int stranded = 0;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (grid[r][c] != PEG) continue;
            for (int d = 0; d < 4 && !any_jump; ++d) any_jump = can_jump(r, c, DR[d], DC[d]);
            if (is_stranded(r, c)) ++stranded;
        }
    }
    return !any_jump || stranded >= 2;
}

string PegSolitairePuzzle::canonical_key() const {
    string flat;
    for (int r = 0; r < rows; ++r) {
        if (r) flat += '/';
        flat += grid[r];
    }
    string rotated(flat.rbegin(), flat.rend());
    return std::to_string(rows) + 'x' + std::to_string(cols) + ':' + min(flat, rotated);
}

string PegSolitairePuzzle::to_string() const {
    string text;
    for (int r = 0; r < rows; ++r) {
        if (r) text += '\n';
        text += grid[r];
    }
    return text;
}

bool PegSolitairePuzzle::operator==(const PegSolitairePuzzle &rhs) const {
    return canonical_key() == rhs.canonical_key();
}
