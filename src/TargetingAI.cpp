#include "TargetingAI.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <cstdlib>

using namespace std;

const char* difficultyName(Difficulty d) {
    switch (d) {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard:   return "hard";
    }
    return "unknown";
}

bool parseDifficulty(const string &text, Difficulty &out) {
    string key;
    for (char ch : text) {
        if (isspace(static_cast<unsigned char>(ch))) continue;
        key += static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    }
    if (key == "easy")   { out = Difficulty::Easy;   return true; }
    if (key == "medium") { out = Difficulty::Medium; return true; }
    if (key == "hard")   { out = Difficulty::Hard;   return true; }
    return false;
}

// ---------------------------------------------------------------- TargetMemory

bool TargetMemory::isQueued(const Coordinate &c) const {
    return find(queue.begin(), queue.end(), c) != queue.end();
}

void TargetMemory::recordShot(const Coordinate &c) {
    fired.insert(c);
    queue.erase(remove(queue.begin(), queue.end(), c), queue.end());
}

bool TargetMemory::enqueue(const Coordinate &c) {
    if (!isCellAvailable(*this, c) || isQueued(c)) return false;
    queue.push_back(c);
    return true;
}

void TargetMemory::clearTargets() {
    queue.clear();
    hunted.clear();
    oriented = false;
    orientation = 0;
}

void TargetMemory::reset() {
    fired.clear();
    clearTargets();
}

// ---------------------------------------------------------------- Helpers

// Check if a cell is within bounds and not fired at yet
bool isCellAvailable(const TargetMemory &memory, const Coordinate &c) {
    return memory.board.contains(c) && !memory.hasFired(c);
}

vector<Coordinate> untriedCells(const TargetMemory &memory, const GridSize &size) {
    vector<Coordinate> out;
    out.reserve(size.cellCount());
    for (int r = 0; r < size.rows; ++r)
        for (int c = 0; c < size.cols; ++c)
            if (!memory.hasFired(Coordinate(r, c))) out.emplace_back(r, c);
    return out;
}

vector<Coordinate> untriedParityCells(const TargetMemory &memory, const GridSize &size, int parity) {
    vector<Coordinate> out;
    for (int r = 0; r < size.rows; ++r)
        for (int c = 0; c < size.cols; ++c)
            if ((r + c) % 2 == parity && !memory.hasFired(Coordinate(r, c)))
                out.emplace_back(r, c);
    return out;
}

Coordinate pickRandomCell(const vector<Coordinate> &cells, mt19937 &rng) {
    if (cells.empty()) throw logic_error("no untried cell left to target");
    uniform_int_distribution<size_t> dist(0, cells.size() - 1);
    return cells[dist(rng)];
}

bool popNextTarget(TargetMemory &memory, Coordinate &out) {
    while (!memory.queue.empty()) {
        Coordinate c = memory.queue.front();
        memory.queue.pop_front();
        if (!memory.hasFired(c)) {
            out = c;
            return true;
        }
    }
    return false;
}

int enqueueNeighbors(TargetMemory &memory, const Coordinate &c) {
    const int dr[4] = {-1, 1, 0, 0};
    const int dc[4] = {0, 0, -1, 1};
    int added = 0;
    for (int k = 0; k < 4; ++k) {
        if (memory.enqueue(Coordinate(c.row + dr[k], c.col + dc[k]))) added++;
    }
    return added;
}

static bool isHunted(const TargetMemory &memory, const Coordinate &c) {
    return find(memory.hunted.begin(), memory.hunted.end(), c) != memory.hunted.end();
}

/**
 * @brief Extend the known segment along the inferred orientation.
 *
 * Walks from c over consecutive hunted hits in both directions and queues
 * the first cell past each end (the "behind" end first). Cells that are off
 * the board or already fired at are skipped.
 *
 * @return Number of cells added to the queue (0, 1 or 2)
 */
int enqueueOrientedLine(TargetMemory &memory, const Coordinate &c) {
    if (!memory.oriented) return 0;

    int dr = (memory.orientation == 2) ? 1 : 0;
    int dc = (memory.orientation == 1) ? 1 : 0;

    Coordinate behind = c;
    while (isHunted(memory, Coordinate(behind.row - dr, behind.col - dc)))
        behind = Coordinate(behind.row - dr, behind.col - dc);
    Coordinate ahead = c;
    while (isHunted(memory, Coordinate(ahead.row + dr, ahead.col + dc)))
        ahead = Coordinate(ahead.row + dr, ahead.col + dc);

    int added = 0;
    if (memory.enqueue(Coordinate(behind.row - dr, behind.col - dc))) added++;
    if (memory.enqueue(Coordinate(ahead.row + dr, ahead.col + dc))) added++;
    return added;
}

static void checkBoard(const TargetMemory &memory, const GridSize &size) {
    if (memory.board.rows != size.rows || memory.board.cols != size.cols)
        throw logic_error("target memory was built for a different board size");
}

// ---------------------------------------------------------------- Easy

Coordinate RandomShooter::chooseTarget(TargetMemory &memory, const GridSize &size) {
    checkBoard(memory, size);
    return pickRandomCell(untriedCells(memory, size), rng);
}

void RandomShooter::processResult(TargetMemory &, const Coordinate &, const ShotOutcome &) {
    // stateless
}

// ---------------------------------------------------------------- Medium

Coordinate SeekAndDestroy::chooseTarget(TargetMemory &memory, const GridSize &size) {
    checkBoard(memory, size);
    Coordinate next;
    if (popNextTarget(memory, next)) return next;

    // Fallback to random selection when queue is empty
    memory.clearTargets();
    return pickRandomCell(untriedCells(memory, size), rng);
}

void SeekAndDestroy::processResult(TargetMemory &memory, const Coordinate &c,
                                   const ShotOutcome &outcome) {
    if (!outcome.isHit()) return;
    if (outcome.sunk) {
        // Local hunt is over; whatever is still queued is discarded
        memory.clearTargets();
        return;
    }
    memory.hunted.push_back(c);
    enqueueNeighbors(memory, c);
}

// ---------------------------------------------------------------- Hard

StrategicGenius::StrategicGenius(unsigned seed, int parity)
    : AIStrategy(seed), huntParity(((parity % 2) + 2) % 2) {}

Coordinate StrategicGenius::chooseTarget(TargetMemory &memory, const GridSize &size) {
    checkBoard(memory, size);

    // Destroy phase
    Coordinate next;
    if (popNextTarget(memory, next)) return next;

    // Both line ends missed with the ship still afloat: drop the orientation
    // and probe around every hit before giving up on it
    if (memory.oriented && !memory.hunted.empty()) {
        memory.oriented = false;
        memory.orientation = 0;
        for (auto &h : memory.hunted) enqueueNeighbors(memory, h);
        if (popNextTarget(memory, next)) return next;
    }

    // Hunt phase: checkerboard, then anything left
    memory.clearTargets();
    vector<Coordinate> choices = untriedParityCells(memory, size, huntParity);
    if (choices.empty()) choices = untriedCells(memory, size);
    return pickRandomCell(choices, rng);
}

void StrategicGenius::processResult(TargetMemory &memory, const Coordinate &c,
                                    const ShotOutcome &outcome) {
    if (!outcome.isHit()) return;
    if (outcome.sunk) {
        memory.clearTargets();
        return;
    }

    memory.hunted.push_back(c);

    // Two orthogonally adjacent hits fix the orientation
    if (!memory.oriented) {
        for (auto &h : memory.hunted) {
            int rowDiff = abs(h.row - c.row);
            int colDiff = abs(h.col - c.col);
            if (rowDiff + colDiff != 1) continue;
            memory.oriented = true;
            memory.orientation = (rowDiff == 0) ? 1 : 2;
            break;
        }
    }

    if (!memory.oriented) {
        enqueueNeighbors(memory, c);
        return;
    }

    memory.queue.clear();
    if (enqueueOrientedLine(memory, c) == 0) {
        // Both ends are blocked: probe around every hit instead
        for (auto &h : memory.hunted) enqueueNeighbors(memory, h);
    }
}

unique_ptr<AIStrategy> makeStrategy(Difficulty d, unsigned seed, int parity) {
    switch (d) {
        case Difficulty::Easy:   return make_unique<RandomShooter>(seed);
        case Difficulty::Medium: return make_unique<SeekAndDestroy>(seed);
        case Difficulty::Hard:   return make_unique<StrategicGenius>(seed, parity);
    }
    throw invalid_argument("unknown difficulty");
}

// ---------------------------------------------------------------- ComputerOpponent

ComputerOpponent::ComputerOpponent(Difficulty d, GridSize board, unsigned seed, int parity)
    : strategy(makeStrategy(d, seed, parity)), mem(board) {}

Coordinate ComputerOpponent::chooseTarget() {
    return strategy->chooseTarget(mem, mem.board);
}

void ComputerOpponent::recordResult(const Coordinate &c, const ShotOutcome &outcome) {
    mem.recordShot(c);
    strategy->processResult(mem, c, outcome);
}

void ComputerOpponent::reset(unsigned seed) {
    mem.reset();
    strategy->reseed(seed);
}
