/**
 * @file board.hpp
 * @brief NxN sliding puzzle board (tile values and blank cell handling).
 *
 * This header declares the Board value type shared by the puzzle state,
 * the solvability checks and the shuffle generator.
 */

#ifndef __BOARD_HPP___
#define __BOARD_HPP___

#include <vector>

using namespace std;

/**
 * @brief Largest accepted board side length.
 */
const int MAX_SIDE_LENGTH = 16;

/**
 * @brief Tile values in row-major rows; 0 marks the blank cell.
 */
typedef vector<vector<int>> Board;

/**
 * @brief Row and column (0-based) of the blank cell.
 */
struct BlankPosition {
    int row = 0;
    int col = 0;

    bool operator==(const BlankPosition &rhs) const {
        return row == rhs.row && col == rhs.col;
    }
    bool operator!=(const BlankPosition &rhs) const {
        return !(*this == rhs);
    }
};

/**
 * @brief Build the canonical solved board: 1..N*N-1 in row-major order, blank last.
 *
 * @param side_length Board side length (2..MAX_SIDE_LENGTH).
 * @throws std::invalid_argument if side_length is outside 2..MAX_SIDE_LENGTH.
 * @return The solved board.
 */
Board solved_board(int side_length);

/**
 * @brief Check that a board is square, 2x2 to MAX_SIDE_LENGTH wide, and holds each value 0..N*N-1 once.
 *
 * @param board Board to validate.
 * @throws std::invalid_argument describing the first violation found.
 */
void validate_board(const Board &board);

/**
 * @brief Scan the board in row-major order for the blank cell.
 *
 * @param board Board to scan.
 * @throws std::invalid_argument if no cell holds 0.
 * @return Position of the first cell equal to 0.
 */
BlankPosition find_blank(const Board &board);

/**
 * @brief Flatten the board in row-major order.
 *
 * @param board Board to flatten.
 * @param skip_blank When true the blank (0) is left out.
 * @return Cell values in row-major order.
 */
vector<int> flatten_board(const Board &board, bool skip_blank = false);

#endif // __BOARD_HPP___
