#include <stdexcept>
#include <string>
#include <vector>

#include "board.hpp"

using namespace std;

Board solved_board(int side_length) {
    if (side_length < 2 || side_length > MAX_SIDE_LENGTH) {
        throw invalid_argument("side_length must be in range [2," + to_string(MAX_SIDE_LENGTH) + "], got " + to_string(side_length));
    }
    Board board(side_length, vector<int>(side_length, 0));
    for (int row = 0; row < side_length; ++row) {
        for (int col = 0; col < side_length; ++col) {
            board[row][col] = row * side_length + col + 1;
        }
    }
    board[side_length - 1][side_length - 1] = 0;
    return board;
}

void validate_board(const Board &board) {
    int side_length = static_cast<int>(board.size());
    if (side_length < 2) {
        throw invalid_argument("Board must be at least 2x2");
    }
    if (side_length > MAX_SIDE_LENGTH) {
        throw invalid_argument("Board side must be at most " + to_string(MAX_SIDE_LENGTH));
    }
    int num_cells = side_length * side_length;
    vector<bool> seen(num_cells, false);
    for (const auto &row : board) {
        if (static_cast<int>(row.size()) != side_length) {
            throw invalid_argument("Board must be square");
        }
        for (int value : row) {
            if (value < 0 || value >= num_cells) {
                throw invalid_argument("Tile values must be in range [0," + to_string(num_cells - 1) + "]");
            }
            if (seen[value]) {
                throw invalid_argument("Duplicate tile value " + to_string(value));
            }
            seen[value] = true;
        }
    }
}

BlankPosition find_blank(const Board &board) {
    for (int row = 0; row < static_cast<int>(board.size()); ++row) {
        for (int col = 0; col < static_cast<int>(board[row].size()); ++col) {
            if (board[row][col] == 0) {
                return BlankPosition{row, col};
            }
        }
    }
    throw invalid_argument("Board has no blank cell");
}

vector<int> flatten_board(const Board &board, bool skip_blank) {
    vector<int> flat;
    for (const auto &row : board) {
        for (int value : row) {
            if (skip_blank && value == 0) continue;
            flat.push_back(value);
        }
    }
    return flat;
}
