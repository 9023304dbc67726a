#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "Tournament.h"

namespace {

RoundSetup makeSetup(const std::string &preset, GameMode mode, unsigned seed) {
    RoundSetup setup;
    EXPECT_TRUE(findBoardPreset(preset, setup.preset));
    setup.mode = mode;
    setup.seed = seed;
    return setup;
}

int fleetCells(const BoardPreset &preset) {
    int cells = 0;
    for (int s : preset.shipSizes) cells += s;
    return cells;
}

}  // namespace

TEST(RoundState, ComputerRoundBuildsBothFleets) {
    RoundState round;
    ASSERT_TRUE(round.reset(makeSetup("medium", COMPUTER_VS_COMPUTER, 5), 1));
    for (int i = 0; i < 2; ++i) {
        EXPECT_EQ(round.sides[i].type, COMPUTER);
        ASSERT_NE(round.sides[i].ai, nullptr);
        EXPECT_EQ(round.sides[i].grid.ships().size(), 4u);
        EXPECT_EQ(round.sides[i].grid.countCells(CellState::ShipPresent), 9);
    }
    EXPECT_FALSE(round.isFinished());
    EXPECT_FALSE(round.isPlayerTurn());
    EXPECT_EQ(round.winner(), -1);
}

TEST(RoundState, ComputerRoundPlaysToAWinner) {
    RoundSetup setup = makeSetup("big", COMPUTER_VS_COMPUTER, 11);
    setup.p1Difficulty = Difficulty::Hard;
    setup.p2Difficulty = Difficulty::Easy;
    RoundState round;
    std::ostringstream log;
    round.log = &log;
    ASSERT_TRUE(round.reset(setup, 1));

    int ticks = 0;
    while (!round.isFinished()) {
        round.tick();
        ASSERT_LE(++ticks, 2 * 64);
    }

    int w = round.winner();
    ASSERT_TRUE(w == 0 || w == 1);
    const Side &winner = round.sides[w];
    const Side &loser = round.sides[1 - w];
    EXPECT_TRUE(winner.stats.won);
    EXPECT_FALSE(loser.stats.won);
    EXPECT_TRUE(loser.grid.allShipsSunk());
    EXPECT_FALSE(winner.grid.allShipsSunk());
    EXPECT_EQ(winner.stats.hits, fleetCells(setup.preset));
    EXPECT_EQ(winner.stats.totalShots, static_cast<int>(winner.ai->memory().fired.size()));
    EXPECT_EQ(winner.stats.totalShots + loser.stats.totalShots, ticks);
    EXPECT_NE(log.str().find("wins round 1"), std::string::npos);
    EXPECT_NE(round.lastLog.find("wins round 1!"), std::string::npos);
    EXPECT_EQ(round.tick(), "[Round already finished]");
}

TEST(RoundState, SameSeedReplaysTheSameRound) {
    RoundSetup setup = makeSetup("small", COMPUTER_VS_COMPUTER, 1234);
    RoundState a, b;
    ASSERT_TRUE(a.reset(setup, 1));
    ASSERT_TRUE(b.reset(setup, 1));
    while (!a.isFinished() && !b.isFinished()) {
        EXPECT_EQ(a.tick(), b.tick());
    }
    EXPECT_EQ(a.isFinished(), b.isFinished());
    EXPECT_EQ(a.winner(), b.winner());
}

TEST(RoundState, HumanMovesAlternateWithComputer) {
    RoundSetup setup = makeSetup("small", PLAYER_VS_COMPUTER, 3);
    setup.p2Difficulty = Difficulty::Medium;
    RoundState round;
    ASSERT_TRUE(round.reset(setup, 1));

    EXPECT_EQ(round.sides[0].type, HUMAN);
    EXPECT_EQ(round.sides[0].ai, nullptr);
    EXPECT_TRUE(round.isPlayerTurn());
    EXPECT_EQ(round.tick(), "[Waiting for Player move]");

    EXPECT_EQ(round.makePlayerMove(Coordinate(5, 0)), MoveRejected);

    Coordinate target(2, 2);
    CellState before = round.sides[1].grid.at(target);
    int res = round.makePlayerMove(target);
    if (before == CellState::ShipPresent) {
        EXPECT_TRUE(res == MoveHit || res == MoveSunk);
        EXPECT_EQ(round.sides[1].grid.at(target), CellState::Hit);
    } else {
        EXPECT_EQ(res, MoveMiss);
        EXPECT_EQ(round.sides[1].grid.at(target), CellState::Miss);
    }
    EXPECT_EQ(round.sides[0].stats.totalShots, 1);

    // computer's turn now
    EXPECT_FALSE(round.isPlayerTurn());
    EXPECT_EQ(round.makePlayerMove(Coordinate(0, 0)), MoveRejected);
    round.tick();
    EXPECT_EQ(round.sides[1].stats.totalShots, 1);
    EXPECT_TRUE(round.isPlayerTurn());

    // repeated shot is rejected without costing a turn
    EXPECT_EQ(round.makePlayerMove(target), MoveRejected);
    EXPECT_TRUE(round.isPlayerTurn());
    EXPECT_EQ(round.sides[0].stats.totalShots, 1);
}

TEST(RoundState, HumanSinksTheWholeFleet) {
    RoundSetup setup = makeSetup("small", PLAYER_VS_COMPUTER, 9);
    RoundState round;
    ASSERT_TRUE(round.reset(setup, 1));

    std::vector<Coordinate> targets = round.sides[1].grid.cellsInState(CellState::ShipPresent);
    for (size_t i = 0; i < targets.size(); ++i) {
        ASSERT_TRUE(round.isPlayerTurn());
        EXPECT_NE(round.makePlayerMove(targets[i]), MoveRejected);
        if (round.isFinished()) break;
        round.tick();
        ASSERT_FALSE(round.isFinished());  // the computer cannot sink 7 cells in 6 shots
    }
    EXPECT_TRUE(round.isFinished());
    EXPECT_EQ(round.winner(), 0);
    EXPECT_EQ(round.sides[0].stats.hits, 7);
    EXPECT_EQ(round.sides[0].stats.misses, 0);
}

TEST(RoundState, UsesTheHumanLayout) {
    RoundSetup setup = makeSetup("small", PLAYER_VS_COMPUTER, 4);
    setup.humanFleet = {
        shipFootprint(Coordinate(0, 0), 2, true),
        shipFootprint(Coordinate(2, 0), 2, false),
        shipFootprint(Coordinate(4, 2), 3, true),
    };
    RoundState round;
    ASSERT_TRUE(round.reset(setup, 1));
    ASSERT_EQ(round.sides[0].grid.ships().size(), 3u);
    EXPECT_EQ(round.sides[0].grid.at(Coordinate(3, 0)), CellState::ShipPresent);
    EXPECT_EQ(round.sides[0].grid.at(Coordinate(4, 4)), CellState::ShipPresent);
    EXPECT_EQ(round.sides[0].grid.at(Coordinate(1, 1)), CellState::Empty);
}

TEST(RoundState, OverlappingHumanLayoutIsRejected) {
    RoundSetup setup = makeSetup("small", PLAYER_VS_COMPUTER, 4);
    setup.humanFleet = {
        shipFootprint(Coordinate(0, 0), 2, true),
        shipFootprint(Coordinate(0, 1), 2, false),
    };
    RoundState round;
    EXPECT_FALSE(round.reset(setup, 1));
    EXPECT_TRUE(round.isFinished());
    EXPECT_EQ(round.winner(), -1);
}

TEST(RoundState, NothingHappensBeforeReset) {
    RoundState round;
    EXPECT_TRUE(round.isFinished());
    EXPECT_FALSE(round.isPlayerTurn());
    EXPECT_EQ(round.tick(), "[Round already finished]");
    EXPECT_EQ(round.makePlayerMove(Coordinate(0, 0)), MoveRejected);
    EXPECT_EQ(round.winner(), -1);
}

TEST(Tournament, UnstartedTournamentIsDone) {
    Tournament t;
    EXPECT_TRUE(t.done());
    EXPECT_EQ(t.tick(), "[Tournament finished]");
    EXPECT_EQ(t.p1WinsAccum + t.p2WinsAccum, 0);
}

TEST(Tournament, PlaysEveryRound) {
    RoundSetup setup = makeSetup("medium", COMPUTER_VS_COMPUTER, 77);
    Tournament t;
    std::ostringstream log;
    ASSERT_TRUE(t.start(setup, 3, &log));

    int ticks = 0;
    while (!t.done()) {
        t.tick();
        ASSERT_LE(++ticks, 3 * 2 * 36);
    }
    EXPECT_EQ(t.currentRoundIdx, 3);
    EXPECT_EQ(t.p1WinsAccum + t.p2WinsAccum, 3);
    EXPECT_GE(t.shotsP1Accum + t.shotsP2Accum, 3 * 9);
    EXPECT_EQ(t.lastLog, t.summary());
    EXPECT_NE(t.summary().find("[Tournament complete]"), std::string::npos);
    EXPECT_NE(log.str().find("=== Round 3"), std::string::npos);
    EXPECT_EQ(t.tick(), "[Tournament finished]");
}

TEST(SimulateSolo, EveryDifficultyClearsTheBoard) {
    BoardPreset big;
    ASSERT_TRUE(findBoardPreset("big", big));
    for (Difficulty d : {Difficulty::Easy, Difficulty::Medium, Difficulty::Hard}) {
        for (unsigned seed = 0; seed < 5; ++seed) {
            int shots = simulateSolo(d, big, seed);
            EXPECT_GE(shots, 13);
            EXPECT_LE(shots, 64);
            EXPECT_EQ(shots, simulateSolo(d, big, seed));
        }
    }
}

TEST(SimulateSolo, TargetedStrategiesBeatRandomOnAverage) {
    BoardPreset big;
    ASSERT_TRUE(findBoardPreset("big", big));
    long long easy = 0, hard = 0;
    for (unsigned seed = 0; seed < 200; ++seed) {
        easy += simulateSolo(Difficulty::Easy, big, seed);
        hard += simulateSolo(Difficulty::Hard, big, seed);
    }
    EXPECT_LT(hard, easy);
}

TEST(SoloGames, ThreadCountDoesNotChangeTheFigures) {
    BoardPreset medium;
    ASSERT_TRUE(findBoardPreset("medium", medium));

    SoloSummary one = runSoloGames(Difficulty::Medium, medium, 17, 12, 1);
    SoloSummary four = runSoloGames(Difficulty::Medium, medium, 17, 12, 4);
    EXPECT_EQ(one.threads, 1);
    EXPECT_EQ(four.threads, 4);
    EXPECT_EQ(one.games, 12);
    EXPECT_DOUBLE_EQ(one.avgShots, four.avgShots);
    EXPECT_EQ(one.minShots, four.minShots);
    EXPECT_EQ(one.maxShots, four.maxShots);

    long long total = 0;
    for (unsigned g = 0; g < 12; ++g) total += simulateSolo(Difficulty::Medium, medium, 17 + g);
    EXPECT_DOUBLE_EQ(one.avgShots, double(total) / 12);
    EXPECT_LE(one.minShots, one.avgShots);
    EXPECT_GE(one.maxShots, one.avgShots);
}

TEST(SoloGames, NeverStartsMoreWorkersThanGames) {
    BoardPreset small;
    ASSERT_TRUE(findBoardPreset("small", small));
    SoloSummary r = runSoloGames(Difficulty::Easy, small, 3, 2, 8);
    EXPECT_EQ(r.threads, 2);
    EXPECT_EQ(r.games, 2);

    SoloSummary none = runSoloGames(Difficulty::Easy, small, 3, 0, 8);
    EXPECT_EQ(none.games, 0);
}

TEST(SoloGames, WorkerFailureReachesTheCaller) {
    BoardPreset cramped;
    cramped.name = "cramped";
    cramped.gridSize = 2;
    cramped.shipSizes = {3};
    EXPECT_THROW(runSoloGames(Difficulty::Hard, cramped, 0, 6, 3), std::runtime_error);
}
