// Google Test for MNPuzzle::extensions
#include <gtest/gtest.h>
#include <vector>
#include <algorithm>
#include <set>

#include "mn_puzzle.hpp"

static MNPuzzle make_puzzle_from_empty_positions(const std::vector<int>& empties) {
    std::vector<int> tiles(16, 0);
    int next = 1;
    for (int i = 0; i < 16; ++i) {
        if (std::find(empties.begin(), empties.end(), i) == empties.end()) tiles[i] = next++;
    }
    return MNPuzzle(tiles, tiles, 4, 4);
}

static std::set<int> collect_swapped_empty_positions(const MNPuzzle& s) {
    auto original = s.get_empty_positions();
    auto moves = s.extensions();
    std::set<int> result;
    std::set<int> origset(original.begin(), original.end());
    for (const auto &mv : moves) {
        auto epos = mv.get_empty_positions();
        if (epos != original) {
            for (int e : epos) if (origset.find(e) == origset.end()) result.insert(e);
        }
    }
    return result;
}

TEST(AvailableMoves, SingleEmptyCorner) {
    MNPuzzle s = make_puzzle_from_empty_positions({15});

    auto found = collect_swapped_empty_positions(s);
    std::set<int> expected = {11, 14};
    EXPECT_EQ(found, expected);
    EXPECT_EQ(s.extensions().size(), 2u);
}

TEST(AvailableMoves, SingleEmptyEdge) {
    MNPuzzle s = make_puzzle_from_empty_positions({4});

    // neighbors: up(0), down(8), right(5); position 3 is on the row above
    std::set<int> expected = {0, 8, 5};
    auto found = collect_swapped_empty_positions(s);
    EXPECT_EQ(found, expected);
}

TEST(AvailableMoves, SingleEmptyMiddle) {
    MNPuzzle s = make_puzzle_from_empty_positions({5});

    // neighbors: up(1), down(9), left(4), right(6)
    std::set<int> expected = {1, 9, 4, 6};
    auto found = collect_swapped_empty_positions(s);
    EXPECT_EQ(found, expected);
}

TEST(AvailableMoves, TwoEmptyCells) {
    MNPuzzle s = make_puzzle_from_empty_positions({14, 15});

    // For empties 14 and 15, valid moves are tiles adjacent to these that are not empty:
    // 14 neighbors: 10, 13, 15 -> 15 is empty so exclude -> {10,13}
    // 15 neighbors: 11, 14 -> 14 is empty so exclude -> {11}
    static std::set<int> expected = {10, 11, 13};
    auto found = collect_swapped_empty_positions(s);
    EXPECT_EQ(found, expected);
    EXPECT_EQ(s.extensions().size(), 3u);
}

TEST(AvailableMoves, NeverContainsItselfAndIsRepeatable) {
    MNPuzzle s = make_puzzle_from_empty_positions({5});
    auto first = s.extensions();
    auto second = s.extensions();
    EXPECT_EQ(first, second);
    for (const auto &mv : first) EXPECT_NE(mv, s);
}

TEST(AvailableMoves, ParentIsUnchanged) {
    MNPuzzle s = make_puzzle_from_empty_positions({0});
    std::vector<int> before = s.get_tiles();
    auto moves = s.extensions();
    ASSERT_EQ(moves.size(), 2u);
    EXPECT_EQ(s.get_tiles(), before);
    // row-major empty cell, down before right
    EXPECT_EQ(moves[0].get_empty_positions(), std::vector<int>({4}));
    EXPECT_EQ(moves[1].get_empty_positions(), std::vector<int>({1}));
}
