/**
 * @file puzzle_state.hpp
 * @brief Sliding puzzle game state (board, blank cell, moves and timing).
 *
 * This header declares the PuzzleState class driven by the game hosts.
 */

#ifndef __PUZZLE_STATE_HPP___
#define __PUZZLE_STATE_HPP___

#include <chrono>
#include <functional>
#include <optional>
#include <random>

#include "board.hpp"
#include "difficulty.hpp"

using namespace std;

typedef chrono::system_clock PuzzleClock;

/**
 * @brief Source of the current wall-clock time. Defaults to PuzzleClock::now.
 */
typedef function<PuzzleClock::time_point()> ClockReader;

enum class GamePhase {
    InProgress,
    Paused,
    Solved
};

/**
 * @brief A puzzle being played: the board, its blank cell and the player's statistics.
 *
 * The blank position is cached and updated together with every board change.
 * Illegal moves are rejected by returning false; they never throw.
 * Elapsed time is always clock() - start_time; resuming shifts start_time
 * forward by the paused span, and the clock stops once a move solves the board.
 */
class PuzzleState {

private:
    Board board;
    BlankPosition blank;
    int side_length = 0;
    int move_count = 0;
    optional<Difficulty> difficulty;
    ClockReader clock;
    PuzzleClock::time_point start_time;
    optional<PuzzleClock::time_point> paused_at;
    optional<PuzzleClock::time_point> solved_at;

    void init(const Board &board, ClockReader clock);
public:
    /**
     * @brief Start a game from an explicit board.
     *
     * @param board Square board holding each value 0..N*N-1 exactly once.
     * @param clock Clock used for the start time and elapsed time.
     * @throws std::invalid_argument on a malformed board.
     */
    explicit PuzzleState(const Board &board, ClockReader clock = PuzzleClock::now);
    ~PuzzleState() = default;

    // Rule of five
    PuzzleState(const PuzzleState& other) = default;
    PuzzleState& operator=(const PuzzleState& other) = default;
    PuzzleState(PuzzleState&& other) = default;
    PuzzleState& operator=(PuzzleState&& other) = default;

    /**
     * @brief Generate a shuffled, solvable game for a difficulty.
     *
     * @param difficulty Difficulty selecting the board side length.
     * @param rng Random number generator used by the shuffle.
     * @param clock Clock used for the start time and elapsed time.
     * @return A fresh game with zero moves.
     */
    static PuzzleState generate(Difficulty difficulty, mt19937 &rng, ClockReader clock = PuzzleClock::now);

    /**
     * @brief Generate a shuffled, solvable game for an explicit side length.
     *
     * @param side_length Board side length (2..MAX_SIDE_LENGTH).
     * @param rng Random number generator used by the shuffle.
     * @param clock Clock used for the start time and elapsed time.
     * @throws std::invalid_argument if side_length is outside 2..MAX_SIDE_LENGTH.
     * @return A fresh game with zero moves.
     */
    static PuzzleState generate(int side_length, mt19937 &rng, ClockReader clock = PuzzleClock::now);

    /**
     * @brief Replace this game with a new shuffle of the same size.
     */
    void restart(mt19937 &rng);

    /**
     * @brief Replace this game with a new shuffle of another size, keeping the clock.
     *
     * @throws std::invalid_argument if side_length is outside 2..MAX_SIDE_LENGTH;
     *         the current game is left untouched.
     */
    void restart(int new_side_length, mt19937 &rng);

    /**
     * @brief Replace this game with a new shuffle for another difficulty.
     */
    void change_difficulty(Difficulty new_difficulty, mt19937 &rng);

    /**
     * @brief Whether the tile at (row, col) is orthogonally adjacent to the blank.
     *
     * @return False for cells out of bounds and for the blank itself.
     */
    bool can_move(int row, int col) const;

    /**
     * @brief Slide the tile at (row, col) into the blank.
     *
     * Moves are refused while the game is paused or already solved.
     *
     * @return True if the move was legal and applied; false leaves the game unchanged.
     */
    bool move(int row, int col);

    /**
     * @brief Stop the clock. Returns false if already paused or solved.
     */
    bool pause();

    /**
     * @brief Restart the clock after pause(). Returns false if not paused.
     */
    bool resume();

    bool is_paused() const;

    /**
     * @brief Whether the board is in the canonical solved arrangement.
     */
    bool is_solved() const;

    GamePhase get_phase() const;

    /**
     * @brief Playing time since the game was generated, read from the injected clock.
     *
     * Excludes paused spans and stops at the move that solved the board.
     */
    PuzzleClock::duration elapsed_time() const;

    const Board& get_board() const;
    int get_tile(int row, int col) const;
    BlankPosition get_blank_position() const;
    int get_move_count() const;
    int get_side_length() const;

    /**
     * @brief Difficulty matching the board size; empty for side lengths outside the difficulty table.
     */
    optional<Difficulty> get_difficulty() const;

    PuzzleClock::time_point get_start_time() const;
};

#endif // __PUZZLE_STATE_HPP___
