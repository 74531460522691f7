#ifndef __PUZZLE_API_H___
#define __PUZZLE_API_H___

/**
 * @file puzzle_api.h
 * @brief C-friendly wrapper around PuzzleState so a front end can drive it via ctypes/FFI.
 *
 * Return codes: 0 (or a non-negative value) on success, -1 on invalid
 * arguments (null pointers, bad sizes), -2 when an output buffer is too
 * small, -3 when the engine rejected the request.
 */

#ifdef __cplusplus
extern "C" {
#endif

typedef struct puzzle_game puzzle_game;

/* Create a shuffled game. `difficulty` is a key ("easy".."expert") or a side length ("2", "3", ...). */
int puzzle_create(const char* difficulty, unsigned int seed, puzzle_game** out_game);

void puzzle_destroy(puzzle_game* game);

/* Reshuffle with the same size, or with a new difficulty when `difficulty` is not null. The game keeps its clock. */
int puzzle_restart(puzzle_game* game, const char* difficulty);

/* 1 if the tile can slide / slid, 0 if not, negative on error. */
int puzzle_can_move(const puzzle_game* game, int row, int col);
int puzzle_move(puzzle_game* game, int row, int col);
int puzzle_is_solved(const puzzle_game* game);

/* 1 if the clock was stopped / restarted / is stopped, 0 if not, negative on error.
   Moves are refused while paused and once the board is solved. */
int puzzle_pause(puzzle_game* game);
int puzzle_resume(puzzle_game* game);
int puzzle_is_paused(const puzzle_game* game);

int puzzle_side_length(const puzzle_game* game);
int puzzle_move_count(const puzzle_game* game);
int puzzle_blank_position(const puzzle_game* game, int* out_row, int* out_col);

/* Copy the board row-major into `out_cells`; needs side*side entries. */
int puzzle_copy_board(const puzzle_game* game, int* out_cells, int out_cells_len);

int puzzle_elapsed_seconds(const puzzle_game* game, double* out_seconds);

#ifdef __cplusplus
}
#endif

#endif // __PUZZLE_API_H___
