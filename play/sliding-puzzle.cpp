#include <iostream>
#include <random>
#include <chrono>
#include <sstream>
#include <string>
#include <stdexcept>

#include "puzzle_state.hpp"
#include "board_format.hpp"
#include "difficulty.hpp"

using namespace std;

static void print_usage() {
    cout << "Usage: sliding-puzzle [--difficulty easy|medium|hard|expert] [--seed S]\n";
}

static void print_help() {
    cout << "Commands:\n"
         << "  <row> <col>     slide the tile at row/col (1-based) into the blank\n"
         << "  n               new game with the same difficulty\n"
         << "  d <difficulty>  new game with another difficulty (easy, medium, hard, expert)\n"
         << "  p               pause or resume the clock\n"
         << "  t               show elapsed time\n"
         << "  h               show this help\n"
         << "  q               quit\n";
}

static string difficulty_label(const PuzzleState &state) {
    auto difficulty = state.get_difficulty();
    if (difficulty) return difficulty_name(*difficulty);
    int side = state.get_side_length();
    return to_string(side) + "x" + to_string(side);
}

static void print_status(const PuzzleState &state) {
    cout << '\n' << format_board(state.get_board());
    cout << "Moves: " << state.get_move_count()
         << "  Time: " << format_elapsed(state.elapsed_time())
         << "  Difficulty: " << difficulty_label(state)
         << (state.is_paused() ? "  (paused)" : "") << '\n';
}

static void print_win(const PuzzleState &state) {
    cout << "\nCongratulations! You solved the " << difficulty_label(state) << " puzzle!\n"
         << "Moves: " << state.get_move_count() << '\n'
         << "Time: " << format_elapsed(state.elapsed_time(), true) << '\n'
         << "Press n for a new game or q to quit.\n";
}

int main(int argc, char** argv) {
    Difficulty difficulty = Difficulty::Easy;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--difficulty" && i + 1 < argc) { difficulty = parse_difficulty(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--help") {
                print_usage();
                return 0;
            }
            else {
                cerr << "Unknown argument: " << a << '\n';
                print_usage();
                return 1;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Error parsing arguments: " << e.what() << '\n';
        return 1;
    }

    mt19937 rng(seed);
    PuzzleState state = PuzzleState::generate(difficulty, rng);
    print_help();
    print_status(state);

    string line;
    while (cout << "> " << flush, getline(cin, line)) {
        istringstream in(line);
        string command;
        if (!(in >> command)) continue;

        if (command == "q") {
            break;
        } else if (command == "h") {
            print_help();
        } else if (command == "p") {
            if (state.pause()) {
                cout << "Paused at " << format_elapsed(state.elapsed_time(), true) << ". Press p to resume.\n";
            } else if (state.resume()) {
                print_status(state);
            } else {
                cout << "Puzzle already solved. Press n for a new game.\n";
            }
        } else if (command == "t") {
            cout << "Time: " << format_elapsed(state.elapsed_time(), true) << '\n';
        } else if (command == "n") {
            state.restart(rng);
            print_status(state);
        } else if (command == "d") {
            string name;
            if (!(in >> name)) {
                cerr << "Missing difficulty\n";
                continue;
            }
            try {
                state.change_difficulty(parse_difficulty(name), rng);
            } catch (const std::invalid_argument& e) {
                cerr << "Error: " << e.what() << '\n';
                continue;
            }
            print_status(state);
        } else {
            int row = 0, col = 0;
            istringstream coords(line);
            if (!(coords >> row >> col)) {
                cerr << "Unknown command: " << command << " (h for help)\n";
                continue;
            }
            if (state.is_solved()) {
                cout << "Puzzle already solved. Press n for a new game.\n";
                continue;
            }
            if (state.is_paused()) {
                cout << "Game is paused. Press p to resume.\n";
                continue;
            }
            if (!state.move(row - 1, col - 1)) {
                cout << "Tile at " << row << ' ' << col << " cannot move.\n";
                continue;
            }
            print_status(state);
            if (state.is_solved()) {
                print_win(state);
            }
        }
    }
    return 0;
}
