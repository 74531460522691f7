#ifndef __GENERATE_SOLVABLE_BOARD_HPP___
#define __GENERATE_SOLVABLE_BOARD_HPP___

#include "board.hpp"
#include "solvability.hpp"
#include <algorithm>
#include <array>
#include <random>
#include <utility>

/**
 * @file generate_solvable_board.hpp
 * @brief Random puzzle boards that are guaranteed to be solvable.
 *
 * Boards are produced by walking the blank from the solved board with
 * random legal slides, then verified with the inversion-parity test and
 * repaired if the test ever disagrees.
 */

/**
 * @brief Number of random slides performed for a board of the given side.
 */
inline int shuffle_steps(int side_length) {
    return side_length * side_length * 10;
}

/**
 * @brief Walk the blank across the board with random legal slides.
 *
 * Each step shuffles the four cardinal directions and takes the first one
 * that stays inside the board, so every step moves the blank exactly once.
 *
 * @param board Board to shuffle in place.
 * @param blank Position of the blank in `board`; updated as the blank moves.
 * @param steps Number of slides to perform.
 * @param rng Random number generator to use (std::mt19937).
 */
inline void shuffle_board(Board &board, BlankPosition &blank, int steps, std::mt19937 &rng) {
    int side_length = static_cast<int>(board.size());
    std::array<std::pair<int, int>, 4> directions = {{{-1, 0}, {1, 0}, {0, -1}, {0, 1}}};
    for (int i = 0; i < steps; ++i) {
        std::shuffle(directions.begin(), directions.end(), rng);
        for (const auto &dir : directions) {
            int row = blank.row + dir.first;
            int col = blank.col + dir.second;
            if (row >= 0 && row < side_length && col >= 0 && col < side_length) {
                board[blank.row][blank.col] = board[row][col];
                board[row][col] = 0;
                blank = BlankPosition{row, col};
                break;
            }
        }
    }
}

/**
 * @brief Make a shuffled board solvable.
 *
 * Rescans the blank, runs the parity test, and on failure swaps the first
 * two tiles and rescans the blank again.
 *
 * @param board Shuffled board holding exactly one blank.
 * @param out_blank Optional out-parameter to receive the blank position.
 * @throws std::invalid_argument if the board has no blank.
 * @return The board, repaired if it was unsolvable.
 */
inline Board ensure_solvable(Board board, BlankPosition *out_blank = nullptr) {
    BlankPosition blank = find_blank(board);
    if (!check_solvability(board)) {
        make_solvable(board);
        blank = find_blank(board);
    }
    if (out_blank) {
        *out_blank = blank;
    }
    return board;
}

/**
 * @brief Generate a solvable board of the given side length.
 *
 * The function starts from the canonical solved board, shuffles it with
 * `shuffle_steps(side_length)` random slides, and passes the result through
 * `ensure_solvable`.
 *
 * @param side_length Board side length (2..MAX_SIDE_LENGTH).
 * @param rng Random number generator to use (std::mt19937).
 * @param out_blank Optional out-parameter to receive the blank position.
 * @throws std::invalid_argument if side_length is outside 2..MAX_SIDE_LENGTH.
 * @return A shuffled, solvable board.
 */
inline Board generate_solvable_board(int side_length, std::mt19937 &rng, BlankPosition *out_blank = nullptr) {
    Board board = solved_board(side_length);
    BlankPosition blank{side_length - 1, side_length - 1};
    shuffle_board(board, blank, shuffle_steps(side_length), rng);
    return ensure_solvable(board, out_blank);
}

#endif // __GENERATE_SOLVABLE_BOARD_HPP___
