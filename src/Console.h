#ifndef CONSOLE_H
#define CONSOLE_H

#include <string>
#include <vector>
#include "battleship.h"

using namespace std;

// Cell markers
const char HIT = 'X';
const char MISS = 'O';
const char SHIP = 'S';

// Conversion helpers
int  letterToRow(char rowChar);   // 'A' / 'a' -> 0, -1 if not a letter
char rowToLetter(int row);

// "B3" -> (1, 2). Rejects anything outside `size`.
bool parseCoordinate(const string &text, const GridSize &size, Coordinate &out);
string formatCoordinate(const Coordinate &c);

// Column header plus one line per row. Ships are only drawn when showShips
// is set; hits and misses always are.
vector<string> renderGrid(const Grid &grid, bool showShips, bool color = true);

// Width of a rendered line without colour codes
int renderedWidth(const GridSize &size);

void clearScreen();

#endif
