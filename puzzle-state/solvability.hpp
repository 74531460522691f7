#ifndef __SOLVABILITY_HPP___
#define __SOLVABILITY_HPP___

/**
 * @file solvability.hpp
 * @brief Inversion-parity solvability test for NxN sliding puzzles.
 */

#include "board.hpp"

/**
 * @brief Count inversions of the board flattened in row-major order without the blank.
 *
 * Every pair is compared (O(k^2) for k tiles).
 *
 * @param board Board to inspect.
 * @return Number of pairs i<j with value[i] > value[j].
 */
int count_inversions(const Board &board);

/**
 * @brief Decide whether the canonical solved board is reachable by legal slides.
 *
 * Odd side: solvable iff the inversion count is even.
 * Even side: solvable iff inversions + (N - blank_row) is odd.
 *
 * @param board Square board holding exactly one blank.
 * @throws std::invalid_argument if an even-sided board has no blank.
 * @return True if the board is solvable.
 */
bool check_solvability(const Board &board);

/**
 * @brief Swap the first two non-blank cells in row-major order.
 *
 * Flips inversion parity by one. The blank never moves.
 *
 * @param board Board to repair in place.
 * @return False if the board holds fewer than two tiles (nothing swapped).
 */
bool make_solvable(Board &board);

#endif // __SOLVABILITY_HPP___
