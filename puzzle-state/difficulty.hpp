#ifndef __DIFFICULTY_HPP___
#define __DIFFICULTY_HPP___

/**
 * @file difficulty.hpp
 * @brief Difficulty levels and their board sizes.
 */

#include <optional>
#include <string>
#include <vector>

enum class Difficulty {
    Easy,
    Medium,
    Hard,
    Expert
};

/**
 * @brief One row of the difficulty table.
 */
struct DifficultyLevel {
    Difficulty difficulty;
    const char *key;    // command-line name
    const char *label;  // display name
    int side_length;
};

/**
 * @brief The difficulty table, ordered from easiest to hardest.
 */
const std::vector<DifficultyLevel>& difficulty_levels();

/**
 * @brief Board side length for a difficulty (Easy 3, Medium 4, Hard 5, Expert 6).
 */
int side_length_for(Difficulty difficulty);

/**
 * @brief Display name, e.g. "Medium (4x4)".
 */
std::string difficulty_name(Difficulty difficulty);

/**
 * @brief Command-line key, e.g. "medium".
 */
std::string difficulty_key(Difficulty difficulty);

/**
 * @brief Difficulty whose board has the given side length, if any.
 */
std::optional<Difficulty> difficulty_for_side(int side_length);

/**
 * @brief Parse a difficulty from its key (case-insensitive) or its side length ("3".."6").
 *
 * @param text Text to parse.
 * @throws std::invalid_argument if the text names no difficulty.
 * @return Parsed difficulty.
 */
Difficulty parse_difficulty(const std::string &text);

#endif // __DIFFICULTY_HPP___
