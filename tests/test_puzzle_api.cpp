// Google Test for the C wrapper used by foreign front ends
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

#include "puzzle_api.h"

TEST(PuzzleApi, CreateCopyAndMove) {
    puzzle_game* game = nullptr;
    ASSERT_EQ(puzzle_create("easy", 42u, &game), 0);
    ASSERT_NE(game, nullptr);
    ASSERT_EQ(puzzle_side_length(game), 3);
    EXPECT_EQ(puzzle_move_count(game), 0);

    std::vector<int> cells(9, -1);
    ASSERT_EQ(puzzle_copy_board(game, cells.data(), static_cast<int>(cells.size())), 9);
    std::vector<int> sorted = cells;
    std::sort(sorted.begin(), sorted.end());
    for (int i = 0; i < 9; ++i) EXPECT_EQ(sorted[i], i);

    int row = -1, col = -1;
    ASSERT_EQ(puzzle_blank_position(game, &row, &col), 0);
    EXPECT_EQ(cells[row * 3 + col], 0);
    EXPECT_EQ(puzzle_can_move(game, row, col), 0);

    int tile_row = row > 0 ? row - 1 : row + 1;
    EXPECT_EQ(puzzle_can_move(game, tile_row, col), 1);
    EXPECT_EQ(puzzle_move(game, tile_row, col), 1);
    EXPECT_EQ(puzzle_move_count(game), 1);
    EXPECT_EQ(puzzle_move(game, -1, 0), 0);
    EXPECT_EQ(puzzle_move_count(game), 1);

    int new_row = -1, new_col = -1;
    ASSERT_EQ(puzzle_blank_position(game, &new_row, &new_col), 0);
    EXPECT_EQ(new_row, tile_row);
    EXPECT_EQ(new_col, col);

    double seconds = -1.0;
    EXPECT_EQ(puzzle_elapsed_seconds(game, &seconds), 0);
    EXPECT_GE(seconds, 0.0);
    EXPECT_GE(puzzle_is_solved(game), 0);

    puzzle_destroy(game);
}

TEST(PuzzleApi, RestartAndChangeSize) {
    puzzle_game* game = nullptr;
    ASSERT_EQ(puzzle_create("3", 1u, &game), 0);

    ASSERT_EQ(puzzle_restart(game, "expert"), 0);
    EXPECT_EQ(puzzle_side_length(game), 6);
    EXPECT_EQ(puzzle_move_count(game), 0);

    ASSERT_EQ(puzzle_restart(game, nullptr), 0);
    EXPECT_EQ(puzzle_side_length(game), 6);

    ASSERT_EQ(puzzle_restart(game, "2"), 0);
    EXPECT_EQ(puzzle_side_length(game), 2);

    EXPECT_EQ(puzzle_restart(game, "1"), -3);
    EXPECT_EQ(puzzle_side_length(game), 2);
    EXPECT_EQ(puzzle_restart(game, "17"), -3);
    EXPECT_EQ(puzzle_restart(game, "99999999999999999999"), -3);
    EXPECT_EQ(puzzle_side_length(game), 2);

    puzzle_destroy(game);
}

TEST(PuzzleApi, SideLengthLimit) {
    puzzle_game* game = nullptr;
    EXPECT_EQ(puzzle_create("17", 1u, &game), -3);
    EXPECT_EQ(game, nullptr);
    EXPECT_EQ(puzzle_create("2147483647", 1u, &game), -3);
    EXPECT_EQ(game, nullptr);

    ASSERT_EQ(puzzle_create("16", 1u, &game), 0);
    EXPECT_EQ(puzzle_side_length(game), 16);
    puzzle_destroy(game);
}

TEST(PuzzleApi, PauseRefusesMovesUntilResumed) {
    puzzle_game* game = nullptr;
    ASSERT_EQ(puzzle_create("medium", 5u, &game), 0);

    int row = -1, col = -1;
    ASSERT_EQ(puzzle_blank_position(game, &row, &col), 0);
    int tile_row = row > 0 ? row - 1 : row + 1;

    EXPECT_EQ(puzzle_is_paused(game), 0);
    ASSERT_EQ(puzzle_pause(game), 1);
    EXPECT_EQ(puzzle_pause(game), 0);
    EXPECT_EQ(puzzle_is_paused(game), 1);
    EXPECT_EQ(puzzle_move(game, tile_row, col), 0);
    EXPECT_EQ(puzzle_move_count(game), 0);

    ASSERT_EQ(puzzle_resume(game), 1);
    EXPECT_EQ(puzzle_resume(game), 0);
    EXPECT_EQ(puzzle_move(game, tile_row, col), 1);
    EXPECT_EQ(puzzle_move_count(game), 1);

    ASSERT_EQ(puzzle_pause(game), 1);
    ASSERT_EQ(puzzle_restart(game, "easy"), 0);
    EXPECT_EQ(puzzle_is_paused(game), 0);
    EXPECT_EQ(puzzle_side_length(game), 3);

    EXPECT_EQ(puzzle_pause(nullptr), -1);
    EXPECT_EQ(puzzle_resume(nullptr), -1);
    EXPECT_EQ(puzzle_is_paused(nullptr), -1);
    puzzle_destroy(game);
}

TEST(PuzzleApi, InvalidArguments) {
    puzzle_game* game = nullptr;
    EXPECT_EQ(puzzle_create(nullptr, 1u, &game), -1);
    EXPECT_EQ(puzzle_create("easy", 1u, nullptr), -1);
    EXPECT_EQ(puzzle_create("nightmare", 1u, &game), -3);
    EXPECT_EQ(game, nullptr);
    EXPECT_EQ(puzzle_create("1", 1u, &game), -3);
    EXPECT_EQ(game, nullptr);

    EXPECT_EQ(puzzle_move(nullptr, 0, 0), -1);
    EXPECT_EQ(puzzle_can_move(nullptr, 0, 0), -1);
    EXPECT_EQ(puzzle_is_solved(nullptr), -1);
    EXPECT_EQ(puzzle_side_length(nullptr), -1);
    EXPECT_EQ(puzzle_restart(nullptr, nullptr), -1);

    ASSERT_EQ(puzzle_create("medium", 9u, &game), 0);
    int cells[4];
    EXPECT_EQ(puzzle_copy_board(game, cells, 4), -2);
    EXPECT_EQ(puzzle_copy_board(game, nullptr, 16), -1);
    EXPECT_EQ(puzzle_blank_position(game, nullptr, nullptr), -1);
    EXPECT_EQ(puzzle_elapsed_seconds(game, nullptr), -1);
    puzzle_destroy(game);
}
