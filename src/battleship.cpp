#include "battleship.h"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <cctype>
#include <utility>

using namespace std;

static string coordText(const Coordinate &c) {
    ostringstream oss;
    oss << "(" << c.row << "," << c.col << ")";
    return oss.str();
}

const char* placeResultName(PlaceResult r) {
    switch (r) {
        case PlaceResult::Placed:      return "placed";
        case PlaceResult::Empty:       return "empty footprint";
        case PlaceResult::OutOfBounds: return "out of bounds";
        case PlaceResult::Overlap:     return "overlaps another ship";
        case PlaceResult::Adjacent:    return "touches another ship";
    }
    return "unknown";
}

AlreadyFiredError::AlreadyFiredError(const Coordinate &c)
    : logic_error("cell " + coordText(c) + " was already fired at"), coordinate(c) {}

NotInFootprintError::NotInFootprintError(const Coordinate &c)
    : logic_error("cell " + coordText(c) + " is not part of the ship"), coordinate(c) {}

// ---------------------------------------------------------------- Ship

Ship::Ship(vector<Coordinate> footprint)
    : cells(std::move(footprint)), hits(cells.size(), false) {}

void Ship::registerHit(const Coordinate &c) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (cells[i] == c) {
            hits[i] = true;
            return;
        }
    }
    throw NotInFootprintError(c);
}

bool Ship::isSunk() const {
    return all_of(hits.begin(), hits.end(), [](bool h) { return h; });
}

bool Ship::occupies(const Coordinate &c) const {
    return find(cells.begin(), cells.end(), c) != cells.end();
}

int Ship::hitCount() const {
    return static_cast<int>(count(hits.begin(), hits.end(), true));
}

// ---------------------------------------------------------------- Grid

Grid::Grid(GridSize size, bool allowTouching)
    : dims(size), touching(allowTouching),
      cells(size.cellCount(), CellState::Empty),
      owner(size.cellCount(), -1) {}

PlaceResult Grid::canPlace(const vector<Coordinate> &footprint) const {
    if (footprint.empty()) return PlaceResult::Empty;

    for (auto &c : footprint)
        if (!dims.contains(c)) return PlaceResult::OutOfBounds;

    for (size_t i = 0; i < footprint.size(); ++i) {
        if (owner[index(footprint[i])] != -1) return PlaceResult::Overlap;
        // a footprint listing the same cell twice overlaps itself
        for (size_t j = 0; j < i; ++j)
            if (footprint[j] == footprint[i]) return PlaceResult::Overlap;
    }

    if (!touching) {
        for (auto &c : footprint) {
            for (int dr = -1; dr <= 1; ++dr) {
                for (int dc = -1; dc <= 1; ++dc) {
                    Coordinate n(c.row + dr, c.col + dc);
                    if (dims.contains(n) && owner[index(n)] != -1) return PlaceResult::Adjacent;
                }
            }
        }
    }
    return PlaceResult::Placed;
}

PlaceResult Grid::place(const vector<Coordinate> &footprint) {
    PlaceResult res = canPlace(footprint);
    if (res != PlaceResult::Placed) return res;

    int shipIndex = static_cast<int>(fleet.size());
    fleet.emplace_back(footprint);
    for (auto &c : footprint) {
        cells[index(c)] = CellState::ShipPresent;
        owner[index(c)] = shipIndex;
    }
    return PlaceResult::Placed;
}

ShotOutcome Grid::fire(const Coordinate &c) {
    if (!dims.contains(c)) throw out_of_range("shot " + coordText(c) + " is off the board");

    CellState &cell = cells[index(c)];
    if (cell == CellState::Hit || cell == CellState::Miss) throw AlreadyFiredError(c);

    if (cell == CellState::Empty) {
        cell = CellState::Miss;
        return ShotOutcome::miss();
    }

    cell = CellState::Hit;
    Ship &ship = fleet[owner[index(c)]];
    ship.registerHit(c);
    return ShotOutcome::hit(ship.isSunk());
}

bool Grid::allShipsSunk() const {
    if (fleet.empty()) return false;
    for (auto &s : fleet)
        if (!s.isSunk()) return false;
    return true;
}

CellState Grid::at(const Coordinate &c) const {
    if (!dims.contains(c)) throw out_of_range("cell " + coordText(c) + " is off the board");
    return cells[index(c)];
}

bool Grid::alreadyFired(const Coordinate &c) const {
    CellState s = at(c);
    return s == CellState::Hit || s == CellState::Miss;
}

vector<Coordinate> Grid::cellsInState(CellState state) const {
    vector<Coordinate> out;
    for (int r = 0; r < dims.rows; ++r)
        for (int c = 0; c < dims.cols; ++c)
            if (cells[r * dims.cols + c] == state) out.emplace_back(r, c);
    return out;
}

int Grid::countCells(CellState state) const {
    return static_cast<int>(count(cells.begin(), cells.end(), state));
}

void Grid::clear() {
    fill(cells.begin(), cells.end(), CellState::Empty);
    fill(owner.begin(), owner.end(), -1);
    fleet.clear();
}

// ---------------------------------------------------------------- Placement

vector<Coordinate> shipFootprint(const Coordinate &start, int length, bool horizontal) {
    vector<Coordinate> out;
    out.reserve(length > 0 ? length : 0);
    for (int i = 0; i < length; ++i) {
        if (horizontal) out.emplace_back(start.row, start.col + i);
        else out.emplace_back(start.row + i, start.col);
    }
    return out;
}

bool randomlyPlaceShips(Grid &grid, const vector<int> &shipSizes, mt19937 &rng) {
    const int maxLayouts = 100;
    const int maxAttemptsPerShip = 500;

    GridSize size = grid.size();
    if (size.rows <= 0 || size.cols <= 0) return shipSizes.empty();

    uniform_int_distribution<int> rowDist(0, size.rows - 1);
    uniform_int_distribution<int> colDist(0, size.cols - 1);
    uniform_int_distribution<int> coin(0, 1);

    for (int layout = 0; layout < maxLayouts; ++layout) {
        grid.clear();
        bool ok = true;
        for (int len : shipSizes) {
            bool placed = false;
            for (int attempt = 0; attempt < maxAttemptsPerShip && !placed; ++attempt) {
                bool horiz = coin(rng) == 1;
                Coordinate start(rowDist(rng), colDist(rng));
                placed = grid.place(shipFootprint(start, len, horiz)) == PlaceResult::Placed;
            }
            if (!placed) { ok = false; break; }
        }
        if (ok) return true;
    }
    grid.clear();
    return false;
}

// ---------------------------------------------------------------- Presets

const vector<BoardPreset>& boardPresets() {
    static const vector<BoardPreset> presets = {
        {"small",  5, {2, 2, 3}},
        {"medium", 6, {2, 2, 2, 3}},
        {"big",    8, {2, 2, 2, 3, 4}},
    };
    return presets;
}

bool findBoardPreset(const string &name, BoardPreset &out) {
    string key;
    for (char ch : name) key += static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    for (auto &p : boardPresets()) {
        if (p.name == key) {
            out = p;
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------- Stats / log

void Stats::record(const ShotOutcome &outcome) {
    if (outcome.isHit()) hits++;
    else misses++;
    totalShots++;
    hitMissRatio = totalShots ? (100.0 * hits / totalShots) : 0.0;
}

void outputCurrentMove(ostream &log, const string &name, const Coordinate &c,
                       const ShotOutcome &outcome) {
    log << name << ": " << static_cast<char>('A' + c.row) << (c.col + 1) << " ";
    if (!outcome.isHit()) log << "miss";
    else if (outcome.sunk) log << "hit, sunk ship";
    else log << "hit";
    log << "\n";
}

void outputStats(ostream &log, const Stats &stats, const string &name) {
    log << "*** " << name << " Stats ***\n";
    log << "Number Hits: " << stats.hits << "\n";
    log << "Number Misses: " << stats.misses << "\n";
    log << "Total Shots: " << stats.totalShots << "\n";
    log << "Hit/Miss Ratio: " << fixed << setprecision(2) << stats.hitMissRatio << "%\n";
    log << (stats.won ? "Won" : "Lost") << "\n\n";
}
