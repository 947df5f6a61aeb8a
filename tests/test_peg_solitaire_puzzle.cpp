// Google Test for PegSolitairePuzzle
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "peg_solitaire_puzzle.hpp"

TEST(PegSolitaireTest, MalformedGridsThrow) {
    EXPECT_THROW(PegSolitairePuzzle(std::vector<std::string>{}), MalformedInput);
    EXPECT_THROW(PegSolitairePuzzle({"**.", "*"}), MalformedInput);
    EXPECT_THROW(PegSolitairePuzzle({"*o."}), MalformedInput);
}

TEST(PegSolitaireTest, SolvedWithOnePeg) {
    EXPECT_TRUE(PegSolitairePuzzle({"#.#", ".*.", "#.#"}).is_solved());
    EXPECT_FALSE(PegSolitairePuzzle({"**."}).is_solved());
    EXPECT_FALSE(PegSolitairePuzzle({"..."}).is_solved());
}

TEST(PegSolitaireTest, JumpRemovesPeg) {
    PegSolitairePuzzle s({"**."});
    auto moves = s.extensions();
    ASSERT_EQ(moves.size(), 1u);
    EXPECT_EQ(moves[0].get_grid(), std::vector<std::string>({"..*"}));
    EXPECT_EQ(moves[0].get_pegs(), 1);
    EXPECT_EQ(s.get_pegs(), 2);
}

TEST(PegSolitaireTest, ExtensionsInEveryDirection) {
    // the centre hole can be reached from all four sides
    PegSolitairePuzzle s({
        "##*##",
        "##*##",
        "**.**",
        "##*##",
        "##*##",
    });
    auto moves = s.extensions();
    ASSERT_EQ(moves.size(), 4u);
    EXPECT_EQ(moves[0].get_grid()[0], "##.##");  // from above
    EXPECT_EQ(moves[1].get_grid()[4], "##.##");  // from below
    EXPECT_EQ(moves[2].get_grid()[2], "..***");  // from the left
    EXPECT_EQ(moves[3].get_grid()[2], "***..");  // from the right
    for (const auto& mv : moves) EXPECT_EQ(mv.get_pegs(), 7);
}

TEST(PegSolitaireTest, FailFastWithoutJumps) {
    // four pegs around an empty centre, none can jump
    EXPECT_TRUE(PegSolitairePuzzle({"#*#", "*.*", "#*#"}).fail_fast());
    EXPECT_TRUE(PegSolitairePuzzle({"..."}).fail_fast());
    EXPECT_FALSE(PegSolitairePuzzle({"..*"}).fail_fast());
}

TEST(PegSolitaireTest, FailFastWithTwoStrandedPegs) {
    PegSolitairePuzzle s({
        "*#*",
        "###",
        "**.",
    });
    ASSERT_FALSE(s.extensions().empty());
    EXPECT_TRUE(s.fail_fast());

    // one stranded peg may still be the last one standing
    PegSolitairePuzzle t({"*#**."});
    EXPECT_FALSE(t.fail_fast());
}

TEST(PegSolitaireTest, PointSymmetricBoardsAreEqual) {
    PegSolitairePuzzle a({"*.", ".."});
    PegSolitairePuzzle rotated({"..", ".*"});
    PegSolitairePuzzle mirrored({".*", ".."});
    EXPECT_EQ(a, rotated);
    EXPECT_EQ(a.canonical_key(), rotated.canonical_key());
    EXPECT_NE(a, mirrored);
    EXPECT_NE(a.canonical_key(), mirrored.canonical_key());
    EXPECT_EQ(PegSolitairePuzzle({"**."}), PegSolitairePuzzle({".**"}));
}

TEST(PegSolitaireTest, Rendering) {
    PegSolitairePuzzle s({"#**#", "*.**", "****", "#**#"});
    EXPECT_EQ(s.to_string(), "#**#\n*.**\n****\n#**#");
}
