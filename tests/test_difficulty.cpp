// Google Test for the difficulty table
#include <gtest/gtest.h>
#include <stdexcept>

#include "difficulty.hpp"

TEST(DifficultyTest, SideLengths) {
    EXPECT_EQ(side_length_for(Difficulty::Easy), 3);
    EXPECT_EQ(side_length_for(Difficulty::Medium), 4);
    EXPECT_EQ(side_length_for(Difficulty::Hard), 5);
    EXPECT_EQ(side_length_for(Difficulty::Expert), 6);
}

TEST(DifficultyTest, TableIsOrderedBySize) {
    const auto &levels = difficulty_levels();
    ASSERT_EQ(levels.size(), 4u);
    for (size_t i = 1; i < levels.size(); ++i) {
        EXPECT_LT(levels[i - 1].side_length, levels[i].side_length);
    }
}

TEST(DifficultyTest, NamesAndKeys) {
    EXPECT_EQ(difficulty_name(Difficulty::Easy), "Easy (3x3)");
    EXPECT_EQ(difficulty_name(Difficulty::Expert), "Expert (6x6)");
    EXPECT_EQ(difficulty_key(Difficulty::Medium), "medium");
    EXPECT_EQ(difficulty_key(Difficulty::Hard), "hard");
}

TEST(DifficultyTest, ParseByKeyOrSide) {
    EXPECT_EQ(parse_difficulty("easy"), Difficulty::Easy);
    EXPECT_EQ(parse_difficulty("Hard"), Difficulty::Hard);
    EXPECT_EQ(parse_difficulty("EXPERT"), Difficulty::Expert);
    EXPECT_EQ(parse_difficulty("4"), Difficulty::Medium);
}

TEST(DifficultyTest, ParseUnknownThrows) {
    EXPECT_THROW(parse_difficulty("impossible"), std::invalid_argument);
    EXPECT_THROW(parse_difficulty("7"), std::invalid_argument);
    EXPECT_THROW(parse_difficulty(""), std::invalid_argument);
}

TEST(DifficultyTest, DifficultyForSide) {
    ASSERT_TRUE(difficulty_for_side(5).has_value());
    EXPECT_EQ(*difficulty_for_side(5), Difficulty::Hard);
    EXPECT_FALSE(difficulty_for_side(2).has_value());
    EXPECT_FALSE(difficulty_for_side(7).has_value());
}
