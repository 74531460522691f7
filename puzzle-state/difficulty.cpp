#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

#include "difficulty.hpp"

const std::vector<DifficultyLevel>& difficulty_levels() {
    static const std::vector<DifficultyLevel> levels = {
        {Difficulty::Easy,   "easy",   "Easy (3x3)",   3},
        {Difficulty::Medium, "medium", "Medium (4x4)", 4},
        {Difficulty::Hard,   "hard",   "Hard (5x5)",   5},
        {Difficulty::Expert, "expert", "Expert (6x6)", 6},
    };
    return levels;
}

static const DifficultyLevel& level_for(Difficulty difficulty) {
    for (const auto &level : difficulty_levels()) {
        if (level.difficulty == difficulty) return level;
    }
    throw std::invalid_argument("Unknown difficulty value");
}

int side_length_for(Difficulty difficulty) {
    return level_for(difficulty).side_length;
}

std::string difficulty_name(Difficulty difficulty) {
    return level_for(difficulty).label;
}

std::string difficulty_key(Difficulty difficulty) {
    return level_for(difficulty).key;
}

std::optional<Difficulty> difficulty_for_side(int side_length) {
    for (const auto &level : difficulty_levels()) {
        if (level.side_length == side_length) return level.difficulty;
    }
    return std::nullopt;
}

Difficulty parse_difficulty(const std::string &text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto &level : difficulty_levels()) {
        if (lowered == level.key || lowered == std::to_string(level.side_length)) {
            return level.difficulty;
        }
    }
    throw std::invalid_argument("Unknown difficulty: " + text);
}
