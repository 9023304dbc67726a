#pragma once
#include <string>
#include <vector>
#include <memory>
#include <random>
#include <iostream>
#include "battleship.h"
#include "TargetingAI.h"

enum GameMode { PLAYER_VS_COMPUTER = 2, COMPUTER_VS_COMPUTER = 3 };

// Return codes of RoundState::makePlayerMove
enum MoveResult { MoveRejected = 0, MoveMiss = 1, MoveHit = 2, MoveSunk = 3 };

struct RoundSetup {
    GameMode mode = COMPUTER_VS_COMPUTER;
    BoardPreset preset;
    Difficulty p1Difficulty = Difficulty::Hard;    // only used when Player1 is a computer
    Difficulty p2Difficulty = Difficulty::Medium;
    bool allowTouching = true;
    int parity = 0;
    unsigned seed = 0;
    // Manual layout for the human side; random placement when empty
    std::vector<std::vector<Coordinate>> humanFleet;
};

struct Side {
    std::string name;
    PlayerType type = COMPUTER;
    Grid grid{GridSize()};   // own board, attacked by the other side
    Stats stats;
    std::unique_ptr<ComputerOpponent> ai;
};

struct RoundState {
    RoundSetup setup;
    int roundIndex = 1;
    Side sides[2];

    // Control
    int turn = 0;              // 0 -> Player1, 1 -> Player2
    int turnCount = 0;
    bool gameOver = true;      // until reset() has built both fleets

    // Per-move log line, also appended to `log` when set
    std::string lastLog;
    std::ostream *log = nullptr;
    Coordinate lastShot;
    ShotOutcome lastOutcome;

    // Builds both fleets. Returns false if a fleet could not be placed.
    bool reset(const RoundSetup &setup_, int round_);
    // Plays one computer turn; returns a short log line
    const std::string& tick();
    int makePlayerMove(const Coordinate &c);

    bool isPlayerTurn() const;
    bool isFinished() const { return gameOver; }
    // Index of the winning side, -1 while the round is running
    int winner() const;

    const Side& shooter() const { return sides[turn]; }
    const Side& target() const { return sides[1 - turn]; }

private:
    ShotOutcome applyShot(const Coordinate &c);
    bool buildFleet(Side &side, bool useHumanLayout);

    std::mt19937 rng;
};

// Series of computer-vs-computer rounds
struct Tournament {
    int totalRounds = 0;
    int currentRoundIdx = 0;
    RoundSetup setup;
    RoundState current;
    long long shotsP1Accum = 0;
    long long shotsP2Accum = 0;
    int p1WinsAccum = 0;
    int p2WinsAccum = 0;
    std::string lastLog;

    bool start(const RoundSetup &setup_, int n, std::ostream *log = nullptr);
    const std::string& tick();
    bool done() const;
    std::string summary() const;
};

// Shots a strategy needs to sink a randomly placed fleet on an empty board.
// Throws runtime_error if the fleet cannot be placed.
int simulateSolo(Difficulty d, const BoardPreset &preset, unsigned seed,
                 int parity = 0, bool allowTouching = true);

struct SoloSummary {
    int games = 0;
    int threads = 0;
    double avgShots = 0.0;
    int minShots = 0;
    int maxShots = 0;
};

// Plays `games` solo games on up to `threads` workers. Game g uses seed + g,
// so the figures do not depend on the thread count. The first worker failure
// is rethrown after every worker has been joined.
SoloSummary runSoloGames(Difficulty d, const BoardPreset &preset, unsigned seed,
                         int games, int threads, int parity = 0, bool allowTouching = true);
