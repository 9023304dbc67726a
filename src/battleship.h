#ifndef BATTLESHIP_H
#define BATTLESHIP_H

#include <iostream>
#include <string>
#include <vector>
#include <random>
#include <stdexcept>
#include <cstddef>

using namespace std;

// Board coordinate, 0-indexed
struct Coordinate {
    int row = 0;
    int col = 0;

    Coordinate() = default;
    Coordinate(int r, int c) : row(r), col(c) {}

    bool operator==(const Coordinate &o) const { return row == o.row && col == o.col; }
    bool operator!=(const Coordinate &o) const { return !(*this == o); }
    // Row-major ordering
    bool operator<(const Coordinate &o) const {
        return row < o.row || (row == o.row && col < o.col);
    }
};

struct GridSize {
    int rows = 0;
    int cols = 0;

    GridSize() = default;
    GridSize(int r, int c) : rows(r), cols(c) {}

    bool contains(const Coordinate &c) const {
        return c.row >= 0 && c.row < rows && c.col >= 0 && c.col < cols;
    }
    int cellCount() const { return rows * cols; }
};

enum class CellState { Empty, ShipPresent, Hit, Miss };

enum class ShotResult { Miss, Hit };

struct ShotOutcome {
    ShotResult result = ShotResult::Miss;
    bool sunk = false;

    bool isHit() const { return result == ShotResult::Hit; }

    static ShotOutcome miss() { return ShotOutcome{}; }
    static ShotOutcome hit(bool sunk_) { return ShotOutcome{ShotResult::Hit, sunk_}; }
};

// Invalid placement is a recoverable condition reported by value
enum class PlaceResult { Placed, Empty, OutOfBounds, Overlap, Adjacent };

const char* placeResultName(PlaceResult r);

// Raised when a cell that is already Hit or Miss is fired at
class AlreadyFiredError : public logic_error {
public:
    explicit AlreadyFiredError(const Coordinate &c);
    Coordinate coordinate;
};

// Raised when a hit is routed to a ship that does not occupy the cell
class NotInFootprintError : public logic_error {
public:
    explicit NotInFootprintError(const Coordinate &c);
    Coordinate coordinate;
};

class Ship {
public:
    explicit Ship(vector<Coordinate> footprint);

    // Marks the segment at c as damaged. Throws NotInFootprintError.
    void registerHit(const Coordinate &c);
    bool isSunk() const;
    bool occupies(const Coordinate &c) const;

    int length() const { return static_cast<int>(cells.size()); }
    int hitCount() const;
    const vector<Coordinate>& footprint() const { return cells; }

private:
    vector<Coordinate> cells;
    vector<bool> hits;  // parallel to cells
};

/**
 * @brief One side's board: cell states plus the ships placed on it.
 *
 * Ships are only added through place() during setup; during play the only
 * mutation is fire(). When touching is disallowed, no two ships may share
 * an edge or a corner.
 */
class Grid {
public:
    explicit Grid(GridSize size, bool allowTouching = true);

    PlaceResult canPlace(const vector<Coordinate> &footprint) const;
    PlaceResult place(const vector<Coordinate> &footprint);

    // Throws AlreadyFiredError on a repeated shot, out_of_range off the board
    ShotOutcome fire(const Coordinate &c);

    bool allShipsSunk() const;

    CellState at(const Coordinate &c) const;
    bool alreadyFired(const Coordinate &c) const;
    vector<Coordinate> cellsInState(CellState state) const;
    int countCells(CellState state) const;

    const vector<Ship>& ships() const { return fleet; }
    GridSize size() const { return dims; }
    bool allowsTouching() const { return touching; }

    // Removes every ship and resets all cells to Empty
    void clear();

private:
    int index(const Coordinate &c) const { return c.row * dims.cols + c.col; }

    GridSize dims;
    bool touching;
    vector<CellState> cells;
    vector<int> owner;  // ship index per cell, -1 for none
    vector<Ship> fleet;
};

// Cells covered by a ship of the given length starting at start
vector<Coordinate> shipFootprint(const Coordinate &start, int length, bool horizontal);

// Places every ship at a random legal position. Leaves the grid empty and
// returns false if no layout could be found.
bool randomlyPlaceShips(Grid &grid, const vector<int> &shipSizes, mt19937 &rng);

// Board presets
struct BoardPreset {
    string name;
    int gridSize = 0;
    vector<int> shipSizes;

    GridSize size() const { return GridSize(gridSize, gridSize); }
};

const vector<BoardPreset>& boardPresets();
bool findBoardPreset(const string &name, BoardPreset &out);

enum PlayerType { HUMAN, COMPUTER };

// Stats struct
struct Stats {
    int hits = 0;
    int misses = 0;
    int totalShots = 0;
    double hitMissRatio = 0.0;
    bool won = false;

    void record(const ShotOutcome &outcome);
};

// Move log
void outputCurrentMove(ostream &log, const string &name, const Coordinate &c,
                       const ShotOutcome &outcome);
void outputStats(ostream &log, const Stats &stats, const string &name);

#endif
