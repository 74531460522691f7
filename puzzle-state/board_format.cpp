#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>

#include "board_format.hpp"

using namespace std;

static void write_border(ostringstream &out, int side_length) {
    out << '+';
    for (int col = 0; col < side_length; ++col) {
        out << "----+";
    }
    out << '\n';
}

string format_board(const Board& board) {
    ostringstream out;
    int side_length = static_cast<int>(board.size());
    write_border(out, side_length);
    for (const auto &row : board) {
        out << '|';
        for (int value : row) {
            if (value == 0) {
                out << "    |";
            } else {
                out << setw(3) << value << " |";
            }
        }
        out << '\n';
        write_border(out, side_length);
    }
    return out.str();
}

string format_elapsed(PuzzleClock::duration elapsed, bool with_tenths) {
    long long tenths = chrono::duration_cast<chrono::milliseconds>(elapsed).count() / 100;
    if (tenths < 0) tenths = 0;
    long long total_seconds = tenths / 10;
    ostringstream out;
    out << setfill('0') << setw(2) << total_seconds / 60 << ':' << setw(2) << total_seconds % 60;
    if (with_tenths) {
        out << '.' << tenths % 10;
    }
    return out.str();
}
