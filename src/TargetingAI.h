#ifndef TARGETINGAI_H
#define TARGETINGAI_H

#include <string>
#include <vector>
#include <deque>
#include <set>
#include <memory>
#include <random>
#include "battleship.h"  // Coordinate, GridSize, ShotOutcome

using namespace std;

enum class Difficulty { Easy, Medium, Hard };

const char* difficultyName(Difficulty d);
bool parseDifficulty(const string &text, Difficulty &out);

/**
 * @brief What a computer player knows about the board it is attacking.
 *
 * Everything in here is derived from the outcomes of its own shots; the
 * opponent's ship layout is never visible. `fired` only grows. A cell is
 * never queued twice and never queued once it has been fired at.
 */
struct TargetMemory {
    GridSize board;
    set<Coordinate> fired;
    deque<Coordinate> queue;       // priority candidates, FIFO
    vector<Coordinate> hunted;     // hits on the ship being probed
    bool oriented = false;
    int orientation = 0;           // 0 none, 1 horizontal, 2 vertical

    // Bounds for every queue check; strategies reject any other board size
    explicit TargetMemory(GridSize size) : board(size) {}

    bool hasFired(const Coordinate &c) const { return fired.count(c) != 0; }
    bool isQueued(const Coordinate &c) const;
    bool probing() const { return !queue.empty(); }

    // Marks c as fired and drops it from the queue if it was pending
    void recordShot(const Coordinate &c);
    // Adds c to the queue if it is on the board, unfired and not queued yet
    bool enqueue(const Coordinate &c);
    // Drops the queue and the destroy-phase bookkeeping
    void clearTargets();
    void reset();
};

// Candidate helpers, row-major order
bool isCellAvailable(const TargetMemory &memory, const Coordinate &c);
vector<Coordinate> untriedCells(const TargetMemory &memory, const GridSize &size);
vector<Coordinate> untriedParityCells(const TargetMemory &memory, const GridSize &size, int parity);
Coordinate pickRandomCell(const vector<Coordinate> &cells, mt19937 &rng);

// Pops queued cells until an unfired one is found
bool popNextTarget(TargetMemory &memory, Coordinate &out);

// Queue up neighbors (up, down, left, right); returns how many were added
int enqueueNeighbors(TargetMemory &memory, const Coordinate &c);
// Queue the cells just past both ends of the run of hunted hits through c
int enqueueOrientedLine(TargetMemory &memory, const Coordinate &c);

class AIStrategy {
public:
    explicit AIStrategy(unsigned seed) : rng(seed) {}
    virtual ~AIStrategy() = default;

    virtual Difficulty difficulty() const = 0;

    // Never returns a cell already in memory.fired. Throws logic_error when
    // every cell has been fired at or when size differs from memory.board.
    virtual Coordinate chooseTarget(TargetMemory &memory, const GridSize &size) = 0;

    // Called after the caller has added c to memory.fired
    virtual void processResult(TargetMemory &memory, const Coordinate &c,
                               const ShotOutcome &outcome) = 0;

    void reseed(unsigned seed) { rng.seed(seed); }

protected:
    mt19937 rng;
};

// Easy: uniform over untried cells
class RandomShooter final : public AIStrategy {
public:
    explicit RandomShooter(unsigned seed) : AIStrategy(seed) {}

    Difficulty difficulty() const override { return Difficulty::Easy; }
    Coordinate chooseTarget(TargetMemory &memory, const GridSize &size) override;
    void processResult(TargetMemory &memory, const Coordinate &c,
                       const ShotOutcome &outcome) override;
};

// Medium: probe orthogonal neighbors of every hit until the ship sinks
class SeekAndDestroy final : public AIStrategy {
public:
    explicit SeekAndDestroy(unsigned seed) : AIStrategy(seed) {}

    Difficulty difficulty() const override { return Difficulty::Medium; }
    Coordinate chooseTarget(TargetMemory &memory, const GridSize &size) override;
    void processResult(TargetMemory &memory, const Coordinate &c,
                       const ShotOutcome &outcome) override;
};

// Hard: checkerboard hunt, then line-following destroy once the ship's
// orientation is known
class StrategicGenius final : public AIStrategy {
public:
    StrategicGenius(unsigned seed, int parity);

    Difficulty difficulty() const override { return Difficulty::Hard; }
    Coordinate chooseTarget(TargetMemory &memory, const GridSize &size) override;
    void processResult(TargetMemory &memory, const Coordinate &c,
                       const ShotOutcome &outcome) override;

    int parity() const { return huntParity; }

private:
    int huntParity;
};

unique_ptr<AIStrategy> makeStrategy(Difficulty d, unsigned seed, int parity = 0);

// A strategy plus the memory it plays with, one per game session
class ComputerOpponent {
public:
    ComputerOpponent(Difficulty d, GridSize board, unsigned seed, int parity = 0);

    Coordinate chooseTarget();
    // Records c as fired, then lets the strategy update its memory
    void recordResult(const Coordinate &c, const ShotOutcome &outcome);
    void reset(unsigned seed);

    Difficulty difficulty() const { return strategy->difficulty(); }
    const TargetMemory& memory() const { return mem; }

private:
    unique_ptr<AIStrategy> strategy;
    TargetMemory mem;
};

#endif
