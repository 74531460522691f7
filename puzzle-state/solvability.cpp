#include <utility>
#include <vector>

#include "board.hpp"
#include "solvability.hpp"

using namespace std;

int count_inversions(const Board &board) {
    vector<int> flat = flatten_board(board, true);
    int inversions = 0;
    for (size_t i = 0; i < flat.size(); ++i) {
        for (size_t j = i + 1; j < flat.size(); ++j) {
            if (flat[i] > flat[j]) {
                inversions++;
            }
        }
    }
    return inversions;
}

bool check_solvability(const Board &board) {
    int side_length = static_cast<int>(board.size());
    int inversions = count_inversions(board);
    if (side_length % 2 == 1) {
        return inversions % 2 == 0;
    }
    int blank_from_bottom = side_length - find_blank(board).row;
    return (inversions + blank_from_bottom) % 2 == 1;
}

bool make_solvable(Board &board) {
    vector<pair<int, int>> tiles;
    for (int row = 0; row < static_cast<int>(board.size()) && tiles.size() < 2; ++row) {
        for (int col = 0; col < static_cast<int>(board[row].size()) && tiles.size() < 2; ++col) {
            if (board[row][col] != 0) tiles.push_back({row, col});
        }
    }
    if (tiles.size() < 2) {
        return false;
    }
    swap(board[tiles[0].first][tiles[0].second], board[tiles[1].first][tiles[1].second]);
    return true;
}
