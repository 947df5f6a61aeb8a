#include <algorithm>
#include <climits>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "mn_puzzle.hpp"

using namespace std;

void MNPuzzle::init(const vector<int>& tiles, const vector<int>& target, int rows, int cols) {
    if (rows < 1 || cols < 1) {
        throw MalformedInput("Board dimensions must be positive");
    }
    if (rows > INT_MAX / cols) {
        throw MalformedInput("Board dimensions are too large");
    }
    int num_cells = rows * cols;
    if (static_cast<int>(tiles.size()) != num_cells) {
        throw MalformedInput("Tile count does not match board size");
    }
    if (static_cast<int>(target.size()) != num_cells) {
        throw MalformedInput("Target tile count does not match board size");
    }
    int empties = 0;
    vector<bool> seen(num_cells, false);
    for (int v : tiles) {
        if (v < 0 || v >= num_cells) {
            throw MalformedInput("Tile values must be in range [0," + std::to_string(num_cells - 1) + "]");
        }
        if (v == 0) {
            ++empties;
            continue;
        }
        if (seen[v]) {
            throw MalformedInput("Duplicate tile value " + std::to_string(v));
        }
        seen[v] = true;
    }
    if (empties == 0) {
        throw MalformedInput("Board needs at least one empty cell");
    }
    vector<int> a = tiles, b = target;
    sort(a.begin(), a.end());
    sort(b.begin(), b.end());
    if (a != b) {
        throw MalformedInput("Target layout does not hold the same tiles");
    }
    this->rows = rows;
    this->cols = cols;
    this->tiles = tiles;
    this->target = target;
    this->empty_cells = empties;
}

MNPuzzle::MNPuzzle(const vector<int>& tiles, const vector<int>& target, int rows, int cols) {
    init(tiles, target, rows, cols);
}

MNPuzzle::MNPuzzle(const vector<int>& tiles, const vector<int>& target) {
    int side = 0;
    while ((side + 1) * (side + 1) <= static_cast<int>(tiles.size())) ++side;
    if (side * side != static_cast<int>(tiles.size())) {
        throw MalformedInput("Tile count is not a perfect square");
    }
    init(tiles, target, side, side);
}

vector<int> MNPuzzle::ordered_layout(int rows, int cols, int empty_cells) {
    if (rows < 1 || cols < 1 || rows > INT_MAX / cols) {
        throw MalformedInput("Invalid board dimensions");
    }
    int num_cells = rows * cols;
    vector<int> layout(num_cells, 0);
    for (int i = 0; i < num_cells - empty_cells; ++i) layout[i] = i + 1;
    return layout;
}

int MNPuzzle::get_tile_row(int tile) const {
    auto it = find(tiles.begin(), tiles.end(), tile);
    if (tile == 0 || it == tiles.end()) return -1;
    return static_cast<int>(it - tiles.begin()) / cols;
}

int MNPuzzle::get_tile_column(int tile) const {
    auto it = find(tiles.begin(), tiles.end(), tile);
    if (tile == 0 || it == tiles.end()) return -1;
    return static_cast<int>(it - tiles.begin()) % cols;
}

int MNPuzzle::get_empty_cells() const {
    return empty_cells;
}

vector<int> MNPuzzle::get_empty_positions() const {
    vector<int> empty_positions;
    for (int i = 0; i < rows * cols; ++i) {
        if (tiles[i] == 0) empty_positions.push_back(i);
    }
    return empty_positions;
}

MNPuzzle MNPuzzle::with_swap(int a, int b) const {
    MNPuzzle next = *this;
    swap(next.tiles[a], next.tiles[b]);
    return next;
}

vector<MNPuzzle> MNPuzzle::extensions() const {
    vector<MNPuzzle> moves;
    for (int empty_pos : get_empty_positions()) {
        int r = empty_pos / cols;
        int c = empty_pos % cols;
        // up, down, left, right
        const int dr[4] = {-1, 1, 0, 0};
        const int dc[4] = {0, 0, -1, 1};
        for (int d = 0; d < 4; ++d) {
            int nr = r + dr[d];
            int nc = c + dc[d];
            if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
            int neighbor_pos = nr * cols + nc;
            if (tiles[neighbor_pos] == 0) continue;
            moves.push_back(with_swap(empty_pos, neighbor_pos));
        }
    }
    return moves;
}

bool MNPuzzle::is_solved() const {
    return tiles == target;
}

bool MNPuzzle::fail_fast() const {
    if (empty_cells != 1) return false;
    int num_cells = rows * cols;
    vector<int> position_of(num_cells);
    for (int i = 0; i < num_cells; ++i) position_of[tiles[i]] = i;

    // parity of the permutation target cell -> current cell
    vector<bool> done(num_cells, false);
    int cycles = 0;
    for (int i = 0; i < num_cells; ++i) {
        if (done[i]) continue;
        ++cycles;
        for (int j = i; !done[j]; j = position_of[target[j]]) done[j] = true;
    }
    int permutation_parity = (num_cells - cycles) % 2;

    int blank = position_of[0];
    int goal_blank = static_cast<int>(find(target.begin(), target.end(), 0) - target.begin());
    int distance = abs(blank / cols - goal_blank / cols) + abs(blank % cols - goal_blank % cols);
    return permutation_parity != distance % 2;
}

string MNPuzzle::canonical_key() const {
    ostringstream out;
    out << rows << 'x' << cols << ':';
    for (int v : tiles) out << v << ',';
    out << '|';
    for (int v : target) out << v << ',';
    return out.str();
}

string MNPuzzle::to_string() const {
    int width = static_cast<int>(std::to_string(rows * cols - 1).size());
    auto render = [&](ostringstream& out, const vector<int>& layout) {
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                int v = layout[r * cols + c];
                string cell = v == 0 ? "." : std::to_string(v);
                if (c) out << ' ';
                out << string(width - cell.size(), ' ') << cell;
            }
            out << '\n';
        }
    };
    ostringstream out;
    render(out, tiles);
    out << "----->\n";
    render(out, target);
    string text = out.str();
    text.pop_back();
    return text;
}

bool MNPuzzle::operator==(const MNPuzzle &rhs) const {
    if (rows != rhs.rows || cols != rhs.cols) return false;
    return tiles == rhs.tiles && target == rhs.target;
}
