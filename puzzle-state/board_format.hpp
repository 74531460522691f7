#ifndef __BOARD_FORMAT_HPP___
#define __BOARD_FORMAT_HPP___

#include <string>

#include "board.hpp"
#include "puzzle_state.hpp"

/**
 * @file board_format.hpp
 * @brief Plain-text rendering of boards and elapsed times for console hosts.
 *
 * Boards are drawn as a grid with `+----+` borders, one row per line, the
 * blank cell left empty:
 *
 *     +----+----+
 *     |  1 |  2 |
 *     +----+----+
 *     |  3 |    |
 *     +----+----+
 */

/**
 * @brief Render a board as a bordered text grid.
 *
 * @param board Board to render.
 * @return Multi-line text, terminated by a newline.
 */
std::string format_board(const Board& board);

/**
 * @brief Render an elapsed time as `MM:SS`, or `MM:SS.d` with tenths of a second.
 *
 * Negative durations (the wall clock moved backwards) are shown as 00:00.
 *
 * @param elapsed Duration to render.
 * @param with_tenths Append the tenths digit.
 * @return Formatted time.
 */
std::string format_elapsed(PuzzleClock::duration elapsed, bool with_tenths = false);

#endif // __BOARD_FORMAT_HPP___
