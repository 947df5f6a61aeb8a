// Google Test for puzzle file parsing/writing and the C search entry point
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "puzzle_file_operations.hpp"
#include "search_api.hpp"

namespace fs = std::filesystem;

namespace {

Puzzle parse(const std::string& text) {
    std::istringstream in(text);
    return parse_puzzle(in);
}

class PuzzleFileTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("puzzle_file_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string write_file(const std::string& name, const std::string& text) {
        fs::path p = dir / name;
        std::ofstream out(p);
        out << text;
        return p.string();
    }
};

}  // namespace

TEST(PuzzleFormat, ParsesSlidingPuzzle) {
    Puzzle p = parse("mn 2 2\n2 1\n3 0\n\n0 1\n2 3\n");
    ASSERT_EQ(p.kind(), PuzzleKind::MN);
    EXPECT_EQ(p.get<MNPuzzle>().get_tiles(), std::vector<int>({2, 1, 3, 0}));
    EXPECT_EQ(p.get<MNPuzzle>().get_target(), std::vector<int>({0, 1, 2, 3}));
}

TEST(PuzzleFormat, ParsesSudoku) {
    Puzzle p = parse("sudoku 4\n12.4\n34 12\n2143\n432.\n");
    ASSERT_EQ(p.kind(), PuzzleKind::SUDOKU);
    EXPECT_EQ(p.get<SudokuPuzzle>().get_empty_cells(), 2);
    EXPECT_EQ(p.canonical_key(), "sudoku:12.434122143432.");
}

TEST(PuzzleFormat, ParsesPegSolitaire) {
    Puzzle p = parse("peg 2 3\n**.\n#*.\n");
    ASSERT_TRUE(p.holds<PegSolitairePuzzle>());
    EXPECT_EQ(p.get<PegSolitairePuzzle>().get_grid(), std::vector<std::string>({"**.", "#*."}));
}

TEST(PuzzleFormat, ParsesWordLadderWithInlineWords) {
    Puzzle p = parse("ladder cat dog\ncat cot cog dog\n");
    ASSERT_EQ(p.kind(), PuzzleKind::WORD_LADDER);
    const auto& ladder = p.get<WordLadderPuzzle>();
    EXPECT_EQ(ladder.get_from_word(), "cat");
    EXPECT_EQ(ladder.get_to_word(), "dog");
    EXPECT_EQ(ladder.get_words()->size(), 4u);
}

TEST(PuzzleFormat, MalformedContentThrows) {
    EXPECT_THROW(parse(""), MalformedInput);
    EXPECT_THROW(parse("hex 3 3"), MalformedInput);
    EXPECT_THROW(parse("mn 0 3"), MalformedInput);
    EXPECT_THROW(parse("mn 2 2\n1 2 3"), MalformedInput);           // missing tiles
    EXPECT_THROW(parse("mn 1 2\n1 0\n1 0\nextra"), MalformedInput);  // trailing token
    EXPECT_THROW(parse("mn 1 2\n1 x\n1 0"), MalformedInput);
    EXPECT_THROW(parse("sudoku 4\n1234\n3412"), MalformedInput);
    EXPECT_THROW(parse("peg 1 3\n**"), MalformedInput);
    EXPECT_THROW(parse("ladder cat dogs cat dogs"), MalformedInput);
}

TEST_F(PuzzleFileTest, MissingFileThrowsRuntimeError) {
    EXPECT_THROW(read_puzzle_from_file((dir / "nope.puzzle").string()), std::runtime_error);
    std::string ladder = write_file("ladder.puzzle", "ladder cat dog\n@absent.txt\n");
    EXPECT_THROW(read_puzzle_from_file(ladder), std::runtime_error);
}

TEST_F(PuzzleFileTest, WordListResolvedNextToPuzzleFile) {
    write_file("words.txt", "cat\ncot\ncog\ndog\n");
    std::string ladder = write_file("ladder.puzzle", "ladder cat dog\n@words.txt\n");

    Puzzle p = read_puzzle_from_file(ladder);

    ASSERT_EQ(p.kind(), PuzzleKind::WORD_LADDER);
    const auto& words = *p.get<WordLadderPuzzle>().get_words();
    EXPECT_EQ(words.size(), 4u);
    EXPECT_EQ(words.count("cog"), 1u);

    std::string extra = write_file("extra.puzzle", "ladder cat dog\n@words.txt more\n");
    EXPECT_THROW(read_puzzle_from_file(extra), MalformedInput);
}

TEST_F(PuzzleFileTest, WrittenPuzzleReadsBack) {
    std::vector<Puzzle> puzzles = {
        MNPuzzle({0, 2, 3, 1, 4, 5}, {1, 2, 3, 4, 5, 0}, 2, 3),
        SudokuPuzzle::from_string("1..." "..1." ".1.." "...1"),
        PegSolitairePuzzle({"#*#", "**.", "#.#"}),
        WordLadderPuzzle("cat", "dog", {"dog", "cat", "cot", "cog"}),
    };
    for (size_t i = 0; i < puzzles.size(); ++i) {
        std::string file = (dir / ("out" + std::to_string(i) + ".puzzle")).string();
        write_puzzle_to_file(puzzles[i], file);
        Puzzle back = read_puzzle_from_file(file);
        EXPECT_EQ(back.kind(), puzzles[i].kind());
        EXPECT_EQ(back.canonical_key(), puzzles[i].canonical_key());
    }

    std::ostringstream out;
    write_puzzle(out, puzzles[3]);
    EXPECT_EQ(out.str(), "ladder cat dog\ncat\ncog\ncot\ndog\n");
}

TEST_F(PuzzleFileTest, CApiRunsBothSolvers) {
    std::string file = write_file("two_by_two.puzzle", "mn 2 2\n2 1\n3 0\n0 1\n2 3\n");
    double ms = -1.0;
    int steps = -1, visited = -1;

    EXPECT_EQ(puzzle_run_instance(file.c_str(), "bfs", &ms, &steps, &visited), 1);
    EXPECT_EQ(steps, 2);
    EXPECT_GE(ms, 0.0);
    EXPECT_GE(visited, 2);

    EXPECT_EQ(puzzle_run_instance(file.c_str(), "dfs", &ms, &steps, &visited), 1);
    EXPECT_GE(steps, 2);
}

TEST_F(PuzzleFileTest, CApiReportsNoSolution) {
    std::string file = write_file("swapped.puzzle", "mn 2 2\n1 2\n3 0\n2 1\n3 0\n");
    double ms;
    int steps = -1, visited = -1;

    EXPECT_EQ(puzzle_run_instance(file.c_str(), "bfs", &ms, &steps, &visited), 0);
    EXPECT_EQ(steps, 0);
    EXPECT_EQ(visited, 0);
}

TEST_F(PuzzleFileTest, CApiRejectsBadInput) {
    std::string file = write_file("ok.puzzle", "mn 1 2\n0 1\n1 0\n");
    std::string broken = write_file("broken.puzzle", "mn 2 2\n1 1\n3 0\n0 1\n2 3\n");
    double ms;
    int steps, visited;

    EXPECT_EQ(puzzle_run_instance(file.c_str(), "astar", &ms, &steps, &visited), -1);
    EXPECT_EQ(puzzle_run_instance(nullptr, "bfs", &ms, &steps, &visited), -1);
    EXPECT_EQ(puzzle_run_instance(file.c_str(), "bfs", nullptr, &steps, &visited), -1);
    EXPECT_EQ(puzzle_run_instance((dir / "missing.puzzle").string().c_str(), "bfs", &ms, &steps, &visited), -2);
    EXPECT_EQ(puzzle_run_instance(broken.c_str(), "dfs", &ms, &steps, &visited), -2);
    EXPECT_EQ(puzzle_run_instance(file.c_str(), "bfs", &ms, &steps, &visited), 1);
    EXPECT_EQ(steps, 1);
}
