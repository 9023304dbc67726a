#include "Tournament.h"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <algorithm>
#include <atomic>
#include <climits>
#include <exception>
#include <thread>

bool RoundState::buildFleet(Side &side, bool useHumanLayout) {
    side.grid = Grid(setup.preset.size(), setup.allowTouching);
    if (!useHumanLayout) return randomlyPlaceShips(side.grid, setup.preset.shipSizes, rng);

    for (auto &footprint : setup.humanFleet) {
        if (side.grid.place(footprint) != PlaceResult::Placed) {
            side.grid.clear();
            return false;
        }
    }
    return true;
}

bool RoundState::reset(const RoundSetup &setup_, int round_) {
    setup = setup_;
    roundIndex = round_;
    lastLog.clear();
    rng.seed(setup.seed + static_cast<unsigned>(round_));

    // Player types
    bool humanPlays = (setup.mode == PLAYER_VS_COMPUTER);
    sides[0].type = humanPlays ? HUMAN : COMPUTER;
    sides[1].type = COMPUTER;
    sides[0].name = humanPlays ? "Player" : "Player1";
    sides[1].name = humanPlays ? "Computer" : "Player2";

    // Placement
    bool ok = buildFleet(sides[0], humanPlays && !setup.humanFleet.empty());
    ok = buildFleet(sides[1], false) && ok;

    for (int i = 0; i < 2; ++i) {
        sides[i].stats = Stats{};
        sides[i].ai.reset();
    }
    // Each computer attacks the other side's board
    GridSize board = setup.preset.size();
    if (sides[0].type == COMPUTER)
        sides[0].ai = std::make_unique<ComputerOpponent>(setup.p1Difficulty, board, rng(), setup.parity);
    sides[1].ai = std::make_unique<ComputerOpponent>(setup.p2Difficulty, board, rng(), setup.parity);

    // Who starts: the human always opens, computers flip a coin
    turn = humanPlays ? 0 : static_cast<int>(rng() % 2);
    turnCount = 0;
    gameOver = !ok;
    if (log && ok) *log << "=== Round " << roundIndex << ": " << sides[turn].name << " starts ===\n";
    return ok;
}

ShotOutcome RoundState::applyShot(const Coordinate &c) {
    Side &current = sides[turn];
    Side &opponent = sides[1 - turn];

    ShotOutcome outcome = opponent.grid.fire(c);
    lastShot = c;
    lastOutcome = outcome;
    current.stats.record(outcome);
    if (log) outputCurrentMove(*log, current.name, c, outcome);

    {
        std::ostringstream oss;
        oss << current.name << " fires (" << c.row << "," << c.col << ")";
        if (outcome.isHit()) oss << " -> HIT" << (outcome.sunk ? " + SUNK" : "");
        else oss << " -> miss";
        lastLog = oss.str();
    }

    if (current.ai) current.ai->recordResult(c, outcome);

    if (opponent.grid.allShipsSunk()) {
        gameOver = true;
        current.stats.won = true;
        opponent.stats.won = false;
        if (log) {
            *log << "\n" << current.name << " wins round " << roundIndex << "\n";
            outputStats(*log, sides[0].stats, sides[0].name);
            outputStats(*log, sides[1].stats, sides[1].name);
        }
        return outcome;
    }

    turnCount++;
    turn = 1 - turn;
    return outcome;
}

const std::string& RoundState::tick() {
    if (gameOver) { lastLog = "[Round already finished]"; return lastLog; }

    if (sides[turn].type == HUMAN) {
        lastLog = "[Waiting for " + sides[turn].name + " move]";
        return lastLog;
    }

    // An AlreadyFiredError here is a strategy defect and propagates
    Coordinate c = sides[turn].ai->chooseTarget();
    applyShot(c);
    if (gameOver) {
        std::ostringstream oss;
        oss << lastLog << " | " << sides[winner()].name << " wins round " << roundIndex << "!";
        lastLog = oss.str();
    }
    return lastLog;
}

int RoundState::makePlayerMove(const Coordinate &c) {
    if (gameOver || sides[turn].type != HUMAN) return MoveRejected;
    const Grid &targetGrid = sides[1 - turn].grid;
    if (!targetGrid.size().contains(c)) return MoveRejected;
    if (targetGrid.alreadyFired(c)) return MoveRejected;

    ShotOutcome outcome = applyShot(c);
    if (outcome.sunk) return MoveSunk;
    if (outcome.isHit()) return MoveHit;
    return MoveMiss;
}

bool RoundState::isPlayerTurn() const {
    return !gameOver && sides[turn].type == HUMAN;
}

int RoundState::winner() const {
    if (!gameOver) return -1;
    if (sides[0].stats.won) return 0;
    if (sides[1].stats.won) return 1;
    return -1;
}

// ---------------------------------------------------------------- Tournament

bool Tournament::start(const RoundSetup &setup_, int n, std::ostream *log) {
    setup = setup_;
    setup.mode = COMPUTER_VS_COMPUTER;
    totalRounds = n;
    currentRoundIdx = 0;
    p1WinsAccum = p2WinsAccum = 0;
    shotsP1Accum = shotsP2Accum = 0;
    current.log = log;
    lastLog.clear();
    if (n <= 0) {
        current.gameOver = true;
        return true;
    }
    return current.reset(setup, 1);
}

const std::string& Tournament::tick() {
    if (done()) {
        lastLog = "[Tournament finished]";
        return lastLog;
    }

    lastLog = current.tick();

    if (current.isFinished()) {
        p1WinsAccum += (current.winner() == 0) ? 1 : 0;
        p2WinsAccum += (current.winner() == 1) ? 1 : 0;
        shotsP1Accum += current.sides[0].stats.totalShots;
        shotsP2Accum += current.sides[1].stats.totalShots;
        currentRoundIdx++;
        if (currentRoundIdx < totalRounds) {
            if (!current.reset(setup, currentRoundIdx + 1))
                throw std::runtime_error("could not place fleets for round " +
                                         std::to_string(currentRoundIdx + 1));
            lastLog = "[New game started: #" + std::to_string(currentRoundIdx + 1) + "]";
        } else {
            lastLog = summary();
        }
    }
    return lastLog;
}

bool Tournament::done() const {
    return currentRoundIdx >= totalRounds && current.isFinished();
}

std::string Tournament::summary() const {
    std::ostringstream oss;
    int played = currentRoundIdx;
    oss << "[Tournament complete] P1 wins: " << p1WinsAccum
        << " | P2 wins: " << p2WinsAccum
        << " | P1 avg shots: "
        << std::fixed << std::setprecision(2)
        << (played ? double(shotsP1Accum) / played : 0.0)
        << " | P2 avg shots: "
        << (played ? double(shotsP2Accum) / played : 0.0);
    return oss.str();
}

// ---------------------------------------------------------------- Solo

int simulateSolo(Difficulty d, const BoardPreset &preset, unsigned seed,
                 int parity, bool allowTouching) {
    if (preset.shipSizes.empty()) return 0;

    std::mt19937 rng(seed);
    Grid grid(preset.size(), allowTouching);
    if (!randomlyPlaceShips(grid, preset.shipSizes, rng))
        throw std::runtime_error("could not place fleet for preset " + preset.name);

    ComputerOpponent ai(d, preset.size(), rng(), parity);
    int shots = 0;
    while (!grid.allShipsSunk()) {
        Coordinate c = ai.chooseTarget();
        ai.recordResult(c, grid.fire(c));
        shots++;
    }
    return shots;
}

static void atomicMin(std::atomic<int> &target, int v) {
    int cur = target.load();
    while (v < cur && !target.compare_exchange_weak(cur, v)) {}
}

static void atomicMax(std::atomic<int> &target, int v) {
    int cur = target.load();
    while (v > cur && !target.compare_exchange_weak(cur, v)) {}
}

SoloSummary runSoloGames(Difficulty d, const BoardPreset &preset, unsigned seed,
                         int games, int threads, int parity, bool allowTouching) {
    SoloSummary out;
    if (games <= 0) return out;

    std::atomic<long long> accShots{0};
    std::atomic<int> minShots{INT_MAX}, maxShots{0};

    // Split games across threads
    int workers = std::max(1, std::min(threads, games));
    int perThread = games / workers;
    int extra = games % workers;
    std::vector<std::exception_ptr> failures(workers);

    // Worker t plays games [first, last)
    auto work = [&](int t, int first, int last) {
        try {
            for (int g = first; g < last; ++g) {
                int shots = simulateSolo(d, preset, seed + static_cast<unsigned>(g),
                                         parity, allowTouching);
                accShots += shots;
                atomicMin(minShots, shots);
                atomicMax(maxShots, shots);
            }
        } catch (...) {
            failures[t] = std::current_exception();
        }
    };

    std::vector<std::thread> ths;
    try {
        int first = 0;
        for (int t = 0; t < workers; ++t) {
            int last = first + perThread + (t < extra ? 1 : 0);
            ths.emplace_back(work, t, first, last);
            first = last;
        }
    } catch (...) {
        // a joinable thread must not be destroyed
        for (auto &th : ths) th.join();
        throw;
    }
    for (auto &th : ths) th.join();

    for (auto &f : failures) {
        if (f) std::rethrow_exception(f);
    }

    out.games = games;
    out.threads = workers;
    out.avgShots = double(accShots.load()) / games;
    out.minShots = minShots.load();
    out.maxShots = maxShots.load();
    return out;
}
