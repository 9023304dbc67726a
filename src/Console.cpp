#include "Console.h"
#include <cctype>
#include <iostream>

using namespace std;

static const char* const RED   = "\033[31m";
static const char* const CYAN  = "\033[36m";
static const char* const GREEN = "\033[32m";
static const char* const RESET = "\033[0m";

int letterToRow(char rowChar) {
    if (!isalpha(static_cast<unsigned char>(rowChar))) return -1;
    return toupper(static_cast<unsigned char>(rowChar)) - 'A';
}

char rowToLetter(int row) {
    return static_cast<char>('A' + row);
}

bool parseCoordinate(const string &text, const GridSize &size, Coordinate &out) {
    // trim
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == string::npos) return false;
    size_t last = text.find_last_not_of(" \t\r\n");
    string s = text.substr(first, last - first + 1);

    if (s.size() < 2) return false;
    int row = letterToRow(s[0]);
    if (row < 0) return false;

    int col = 0;
    for (size_t i = 1; i < s.size(); ++i) {
        if (!isdigit(static_cast<unsigned char>(s[i]))) return false;
        col = col * 10 + (s[i] - '0');
        if (col > size.cols) return false;
    }

    Coordinate c(row, col - 1);
    if (!size.contains(c)) return false;
    out = c;
    return true;
}

string formatCoordinate(const Coordinate &c) {
    return string(1, rowToLetter(c.row)) + to_string(c.col + 1);
}

vector<string> renderGrid(const Grid &grid, bool showShips, bool color) {
    GridSize size = grid.size();
    vector<string> lines;

    string header = " ";
    for (int c = 0; c < size.cols; ++c) header += " " + to_string(c + 1);
    lines.push_back(header);

    for (int r = 0; r < size.rows; ++r) {
        string line(1, rowToLetter(r));
        for (int c = 0; c < size.cols; ++c) {
            CellState state = grid.at(Coordinate(r, c));
            char sym = ' ';
            const char *tint = nullptr;
            if (state == CellState::Hit) { sym = HIT; tint = RED; }
            else if (state == CellState::Miss) { sym = MISS; tint = CYAN; }
            else if (state == CellState::ShipPresent && showShips) { sym = SHIP; tint = GREEN; }

            line += ' ';
            if (color && tint) line += string(tint) + sym + RESET;
            else line += sym;
        }
        lines.push_back(line);
    }
    return lines;
}

int renderedWidth(const GridSize &size) {
    // label + " X" per column, wider once column numbers reach two digits
    int width = 1;
    for (int c = 0; c < size.cols; ++c) width += 1 + static_cast<int>(to_string(c + 1).size());
    return width;
}

void clearScreen() {
    cout << "\033[2J\033[1;1H";
}
