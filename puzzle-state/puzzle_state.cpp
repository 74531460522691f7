#include <cstdlib>
#include <stdexcept>
#include <utility>

#include "puzzle_state.hpp"
#include "solvability.hpp"
#include "generate_solvable_board.hpp"

using namespace std;

void PuzzleState::init(const Board &board, ClockReader clock) {
    validate_board(board);
    if (!clock) {
        throw invalid_argument("Clock reader cannot be empty");
    }
    this->board = board;
    this->side_length = static_cast<int>(board.size());
    this->blank = find_blank(this->board);
    this->difficulty = difficulty_for_side(this->side_length);
    this->clock = std::move(clock);
    this->move_count = 0;
    this->start_time = this->clock();
    this->paused_at.reset();
    this->solved_at.reset();
    if (is_solved()) {
        this->solved_at = this->start_time;
    }
}

PuzzleState::PuzzleState(const Board &board, ClockReader clock) {
    init(board, std::move(clock));
}

PuzzleState PuzzleState::generate(Difficulty difficulty, mt19937 &rng, ClockReader clock) {
    PuzzleState state = generate(side_length_for(difficulty), rng, std::move(clock));
    state.difficulty = difficulty;
    return state;
}

PuzzleState PuzzleState::generate(int side_length, mt19937 &rng, ClockReader clock) {
    return PuzzleState(generate_solvable_board(side_length, rng), std::move(clock));
}

void PuzzleState::restart(mt19937 &rng) {
    restart(side_length, rng);
}

void PuzzleState::restart(int new_side_length, mt19937 &rng) {
    init(generate_solvable_board(new_side_length, rng), clock);
}

void PuzzleState::change_difficulty(Difficulty new_difficulty, mt19937 &rng) {
    restart(side_length_for(new_difficulty), rng);
    difficulty = new_difficulty;
}

bool PuzzleState::can_move(int row, int col) const {
    if (row < 0 || row >= side_length || col < 0 || col >= side_length) {
        return false;
    }
    if (board[row][col] == 0) {
        return false;
    }
    int row_diff = abs(row - blank.row);
    int col_diff = abs(col - blank.col);
    return (row_diff == 1 && col_diff == 0) || (row_diff == 0 && col_diff == 1);
}

bool PuzzleState::move(int row, int col) {
    if (paused_at || solved_at || !can_move(row, col)) {
        return false;
    }
    board[blank.row][blank.col] = board[row][col];
    board[row][col] = 0;
    blank = BlankPosition{row, col};
    move_count++;
    if (is_solved()) {
        solved_at = clock();
    }
    return true;
}

bool PuzzleState::pause() {
    if (paused_at || solved_at) {
        return false;
    }
    paused_at = clock();
    return true;
}

bool PuzzleState::resume() {
    if (!paused_at) {
        return false;
    }
    start_time += clock() - *paused_at;
    paused_at.reset();
    return true;
}

bool PuzzleState::is_paused() const {
    return paused_at.has_value();
}

bool PuzzleState::is_solved() const {
    for (int row = 0; row < side_length; ++row) {
        for (int col = 0; col < side_length; ++col) {
            if (row == side_length - 1 && col == side_length - 1) {
                return board[row][col] == 0;
            }
            if (board[row][col] != row * side_length + col + 1) {
                return false;
            }
        }
    }
    return true;
}

GamePhase PuzzleState::get_phase() const {
    if (solved_at) return GamePhase::Solved;
    if (paused_at) return GamePhase::Paused;
    return GamePhase::InProgress;
}

PuzzleClock::duration PuzzleState::elapsed_time() const {
    if (solved_at) return *solved_at - start_time;
    if (paused_at) return *paused_at - start_time;
    return clock() - start_time;
}

const Board& PuzzleState::get_board() const {
    return board;
}

int PuzzleState::get_tile(int row, int col) const {
    return board.at(row).at(col);
}

BlankPosition PuzzleState::get_blank_position() const {
    return blank;
}

int PuzzleState::get_move_count() const {
    return move_count;
}

int PuzzleState::get_side_length() const {
    return side_length;
}

optional<Difficulty> PuzzleState::get_difficulty() const {
    return difficulty;
}

PuzzleClock::time_point PuzzleState::get_start_time() const {
    return start_time;
}
