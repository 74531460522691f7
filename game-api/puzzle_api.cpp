#include <chrono>
#include <exception>
#include <random>
#include <string>
#include <utility>

#include "puzzle_state.hpp"
#include "difficulty.hpp"
#include "puzzle_api.h"

struct puzzle_game {
    std::mt19937 rng;
    PuzzleState state;
};

static int side_length_from_text(const std::string& text) {
    if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
        return std::stoi(text);
    }
    return side_length_for(parse_difficulty(text));
}

extern "C" {
    int puzzle_create(const char* difficulty, unsigned int seed, puzzle_game** out_game) {
        if (!difficulty || !out_game) return -1;
        try {
            std::mt19937 rng(seed);
            PuzzleState state = PuzzleState::generate(side_length_from_text(difficulty), rng);
            *out_game = new puzzle_game{rng, std::move(state)};
            return 0;
        } catch (const std::exception&) {
            *out_game = nullptr;
            return -3;
        }
    }

    void puzzle_destroy(puzzle_game* game) {
        delete game;
    }

    int puzzle_restart(puzzle_game* game, const char* difficulty) {
        if (!game) return -1;
        try {
            if (difficulty) {
                game->state.restart(side_length_from_text(difficulty), game->rng);
            } else {
                game->state.restart(game->rng);
            }
            return 0;
        } catch (const std::exception&) {
            return -3;
        }
    }

    int puzzle_can_move(const puzzle_game* game, int row, int col) {
        if (!game) return -1;
        return game->state.can_move(row, col) ? 1 : 0;
    }

    int puzzle_move(puzzle_game* game, int row, int col) {
        if (!game) return -1;
        return game->state.move(row, col) ? 1 : 0;
    }

    int puzzle_is_solved(const puzzle_game* game) {
        if (!game) return -1;
        return game->state.is_solved() ? 1 : 0;
    }

    int puzzle_pause(puzzle_game* game) {
        if (!game) return -1;
        return game->state.pause() ? 1 : 0;
    }

    int puzzle_resume(puzzle_game* game) {
        if (!game) return -1;
        return game->state.resume() ? 1 : 0;
    }

    int puzzle_is_paused(const puzzle_game* game) {
        if (!game) return -1;
        return game->state.is_paused() ? 1 : 0;
    }

    int puzzle_side_length(const puzzle_game* game) {
        if (!game) return -1;
        return game->state.get_side_length();
    }

    int puzzle_move_count(const puzzle_game* game) {
        if (!game) return -1;
        return game->state.get_move_count();
    }

    int puzzle_blank_position(const puzzle_game* game, int* out_row, int* out_col) {
        if (!game || !out_row || !out_col) return -1;
        BlankPosition blank = game->state.get_blank_position();
        *out_row = blank.row;
        *out_col = blank.col;
        return 0;
    }

    int puzzle_copy_board(const puzzle_game* game, int* out_cells, int out_cells_len) {
        if (!game || !out_cells || out_cells_len <= 0) return -1;
        int side = game->state.get_side_length();
        if (out_cells_len < side * side) return -2;
        int i = 0;
        for (const auto &row : game->state.get_board()) {
            for (int value : row) out_cells[i++] = value;
        }
        return side * side;
    }

    int puzzle_elapsed_seconds(const puzzle_game* game, double* out_seconds) {
        if (!game || !out_seconds) return -1;
        *out_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(game->state.elapsed_time()).count();
        return 0;
    }
}
