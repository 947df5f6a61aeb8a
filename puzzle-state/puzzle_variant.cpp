#include <string>
#include <variant>
#include <vector>

#include "puzzle_variant.hpp"

using namespace std;

string puzzle_kind_name(PuzzleKind kind) {
    switch (kind) {
        case PuzzleKind::MN:
            return "mn";
        case PuzzleKind::SUDOKU:
            return "sudoku";
        case PuzzleKind::PEG_SOLITAIRE:
            return "peg";
        case PuzzleKind::WORD_LADDER:
            return "ladder";
    }
    return "unknown";
}

bool Puzzle::is_solved() const {
    return visit([](const auto& p) { return p.is_solved(); }, value);
}

bool Puzzle::fail_fast() const {
    return visit([](const auto& p) { return p.fail_fast(); }, value);
}

vector<Puzzle> Puzzle::extensions() const {
    return visit([](const auto& p) {
        vector<Puzzle> moves;
        for (const auto& next : p.extensions()) moves.emplace_back(next);
        return moves;
    }, value);
}

string Puzzle::canonical_key() const {
    return puzzle_kind_name(kind()) + ':' + visit([](const auto& p) { return p.canonical_key(); }, value);
}

string Puzzle::to_string() const {
    return visit([](const auto& p) { return p.to_string(); }, value);
}

bool Puzzle::operator==(const Puzzle &rhs) const {
    return value == rhs.value;
}
