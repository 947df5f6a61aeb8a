#include <algorithm>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "puzzle_file_operations.hpp"

using namespace std;
namespace fs = std::filesystem;

// Upper bound on board cells read from a file, keeps a bad header from
// allocating gigabytes.
static const int MAX_FILE_CELLS = 1 << 20;

static int read_int(istream& in, const string& what) {
    int value;
    if (!(in >> value)) {
        throw MalformedInput("Expected " + what);
    }
    return value;
}

static string read_token(istream& in, const string& what) {
    string token;
    if (!(in >> token)) {
        throw MalformedInput("Expected " + what);
    }
    return token;
}

static void read_dimensions(istream& in, int& rows, int& cols) {
    rows = read_int(in, "row count");
    cols = read_int(in, "column count");
    if (rows < 1 || cols < 1 || rows > MAX_FILE_CELLS / cols) {
        throw MalformedInput("Invalid board dimensions " + to_string(rows) + "x" + to_string(cols));
    }
}

static Puzzle parse_mn(istream& in) {
    int rows, cols;
    read_dimensions(in, rows, cols);
    int n = rows * cols;
    vector<int> tiles(n), target(n);
    for (int i = 0; i < n; ++i) tiles[i] = read_int(in, "start tile " + to_string(i));
    for (int i = 0; i < n; ++i) target[i] = read_int(in, "target tile " + to_string(i));
    return MNPuzzle(tiles, target, rows, cols);
}

static Puzzle parse_sudoku(istream& in) {
    int side = read_int(in, "sudoku side");
    if (side < 1 || side > static_cast<int>(SudokuPuzzle::SYMBOLS.size())) {
        throw MalformedInput("Invalid sudoku side " + to_string(side));
    }
    size_t expected = static_cast<size_t>(side) * side;
    string symbols;
    while (symbols.size() < expected) {
        symbols += read_token(in, "sudoku cells");
    }
    if (symbols.size() != expected) {
        throw MalformedInput("Sudoku rows do not add up to " + to_string(expected) + " cells");
    }
    return SudokuPuzzle::from_string(symbols);
}

static Puzzle parse_peg(istream& in) {
    int rows, cols;
    read_dimensions(in, rows, cols);
    vector<string> grid;
    for (int r = 0; r < rows; ++r) {
        string row = read_token(in, "peg solitaire row " + to_string(r));
        if (static_cast<int>(row.size()) != cols) {
            throw MalformedInput("Peg solitaire row " + to_string(r) + " must have " + to_string(cols) + " cells");
        }
        grid.push_back(row);
    }
    return PegSolitairePuzzle(grid);
}

static Puzzle parse_ladder(istream& in, const fs::path& base_dir) {
    string from = read_token(in, "start word");
    string to = read_token(in, "target word");
    auto words = make_shared<unordered_set<string>>();
    string token;
    while (in >> token) {
        if (token.size() > 1 && token[0] == '@' && words->empty()) {
            *words = read_word_list((base_dir / token.substr(1)).string());
            if (in >> token) {
                throw MalformedInput("Unexpected token '" + token + "' after word list reference");
            }
            break;
        }
        words->insert(token);
    }
    return WordLadderPuzzle(from, to, WordSet(words));
}

Puzzle parse_puzzle(istream& in, const fs::path& base_dir) {
    string kind = read_token(in, "puzzle kind");
    if (kind == "ladder") {
        return parse_ladder(in, base_dir);
    }

    Puzzle puzzle = [&]() -> Puzzle {
        if (kind == "mn") return parse_mn(in);
        if (kind == "sudoku") return parse_sudoku(in);
        if (kind == "peg") return parse_peg(in);
        throw MalformedInput("Unknown puzzle kind '" + kind + "'");
    }();

    string extra;
    if (in >> extra) {
        throw MalformedInput("Unexpected trailing token '" + extra + "'");
    }
    return puzzle;
}

Puzzle read_puzzle_from_file(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open file: " + filename);
    }
    return parse_puzzle(infile, fs::path(filename).parent_path());
}

unordered_set<string> read_word_list(const string& filename) {
    ifstream infile(filename);
    if (!infile.is_open()) {
        throw runtime_error("Could not open word list: " + filename);
    }
    unordered_set<string> words;
    string word;
    while (infile >> word) words.insert(word);
    return words;
}

void write_puzzle(ostream& out, const Puzzle& puzzle) {
    out << puzzle_kind_name(puzzle.kind());
    switch (puzzle.kind()) {
        case PuzzleKind::MN: {
            const auto& mn = puzzle.get<MNPuzzle>();
            out << " " << mn.get_rows() << " " << mn.get_cols() << "\n";
            for (const auto* layout : {&mn.get_tiles(), &mn.get_target()}) {
                for (int i = 0; i < static_cast<int>(layout->size()); ++i) {
                    out << (*layout)[i] << ((i + 1) % mn.get_cols() == 0 ? "\n" : " ");
                }
            }
            break;
        }
        case PuzzleKind::SUDOKU: {
            const auto& sudoku = puzzle.get<SudokuPuzzle>();
            int side = sudoku.get_side();
            out << " " << side << "\n";
            string key = sudoku.canonical_key();
            for (int r = 0; r < side; ++r) out << key.substr(r * side, side) << "\n";
            break;
        }
        case PuzzleKind::PEG_SOLITAIRE: {
            const auto& peg = puzzle.get<PegSolitairePuzzle>();
            out << " " << peg.get_rows() << " " << peg.get_cols() << "\n";
            for (const auto& row : peg.get_grid()) out << row << "\n";
            break;
        }
        case PuzzleKind::WORD_LADDER: {
            const auto& ladder = puzzle.get<WordLadderPuzzle>();
            out << " " << ladder.get_from_word() << " " << ladder.get_to_word() << "\n";
            vector<string> words(ladder.get_words()->begin(), ladder.get_words()->end());
            sort(words.begin(), words.end());
            for (const auto& word : words) out << word << "\n";
            break;
        }
    }
}

void write_puzzle_to_file(const Puzzle& puzzle, const string& filename) {
    ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw runtime_error("Could not open file for writing: " + filename);
    }
    write_puzzle(outfile, puzzle);
}
