#include <iostream>
#include <random>
#include <chrono>
#include <string>
#include <stdexcept>

#include "board.hpp"
#include "board_format.hpp"
#include "difficulty.hpp"
#include "solvability.hpp"
#include "generate_solvable_board.hpp"

using namespace std;

static void print_usage() {
    cout << "Usage: generate-sample-board [--difficulty easy|medium|hard|expert] [--side N] [--seed S] [--count K]\n";
}

int main(int argc, char** argv) {
    int side_size = side_length_for(Difficulty::Easy);
    int count = 1;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--difficulty" && i + 1 < argc) { side_size = side_length_for(parse_difficulty(argv[++i])); }
            else if (a == "--side" && i + 1 < argc) { side_size = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--count" && i + 1 < argc) { count = stoi(argv[++i]); }
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

    if (side_size < 2) {
        cerr << "side must be at least 2\n";
        return 3;
    }
    if (count < 1) {
        cerr << "count must be at least 1\n";
        return 3;
    }

    mt19937 rng(seed);
    cout << "side: " << side_size << ", seed: " << seed << ", count: " << count << '\n';
    for (int instance = 0; instance < count; ++instance) {
        Board board;
        try {
            board = generate_solvable_board(side_size, rng);
        } catch (const std::exception& e) {
            cerr << "Error generating board: " << e.what() << '\n';
            return 4;
        }
        cout << "instance: " << instance
             << ", inversions: " << count_inversions(board)
             << ", solvable: " << (check_solvability(board) ? 1 : 0) << '\n';
        cout << format_board(board);
    }
    return 0;
}
