#include "battleship.h"
#include "TargetingAI.h"
#include "Tournament.h"
#include "Console.h"
#include "Config.h"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

// Reads one trimmed, lower-cased line. Returns false on end of input.
static bool readAnswer(const string &prompt, string &out) {
    cout << prompt;
    string line;
    if (!getline(cin, line)) return false;
    size_t first = line.find_first_not_of(" \t\r");
    size_t last = line.find_last_not_of(" \t\r");
    out.clear();
    if (first == string::npos) return true;
    for (char ch : line.substr(first, last - first + 1))
        out += static_cast<char>(tolower(static_cast<unsigned char>(ch)));
    return true;
}

static string upper(string s) {
    for (auto &ch : s) ch = static_cast<char>(toupper(static_cast<unsigned char>(ch)));
    return s;
}

void welcomeScreen() {
    clearScreen();
    cout << "========================================\n";
    cout << "                 SALVO\n";
    cout << "========================================\n\n";
}

static bool selectDifficulty(Difficulty &out) {
    string answer;
    if (!readAnswer("Select AI difficulty: Easy, Medium or Hard: ", answer)) return false;
    while (!parseDifficulty(answer, out)) {
        if (!readAnswer("Choose one of: Easy, Medium or Hard: ", answer)) return false;
    }
    return true;
}

static bool selectPreset(BoardPreset &out) {
    string prompt = "Select board size: ";
    string names;
    for (auto &p : boardPresets()) {
        if (!names.empty()) { prompt += " / "; names += ", "; }
        string label = p.name;
        label[0] = static_cast<char>(toupper(static_cast<unsigned char>(label[0])));
        prompt += label + " (" + to_string(p.gridSize) + "x" + to_string(p.gridSize) + ")";
        names += p.name;
    }
    prompt += " or 'q' to quit: ";

    string answer;
    while (true) {
        if (!readAnswer(prompt, answer) || answer == "q") return false;
        if (findBoardPreset(answer, out)) return true;
        cout << "Please type one of: " << names << ", or 'q'.\n";
    }
}

// Own fleet on the left, enemy waters on the right
static void displayBoards(const Grid &own, const Grid &enemy, bool color) {
    int width = renderedWidth(own.size());
    vector<string> ownLines = renderGrid(own, true, color);
    vector<string> ownPlain = renderGrid(own, true, false);
    vector<string> enemyLines = renderGrid(enemy, false, color);

    cout << std::left << setw(width) << "Your Fleet" << "    " << "Enemy Waters\n";
    for (size_t i = 0; i < ownLines.size() && i < enemyLines.size(); ++i) {
        int pad = width - static_cast<int>(ownPlain[i].size());
        cout << ownLines[i] << string(pad > 0 ? pad : 0, ' ') << "    " << enemyLines[i] << "\n";
    }
    cout << "\n";
}

/**
 * @brief Interactive ship placement for the human fleet.
 *
 * Asks for a start cell and an orientation per ship and validates the
 * footprint against a scratch grid. Typing 'r' discards the ships placed
 * so far and lays out the whole fleet at random.
 *
 * @return false if the player quit or input ended
 */
static bool manuallyPlaceShips(const GameConfig &cfg, mt19937 &rng,
                               vector<vector<Coordinate>> &fleet) {
    Grid scratch(cfg.preset.size(), cfg.allowTouching);
    fleet.clear();

    for (size_t i = 0; i < cfg.preset.shipSizes.size(); ++i) {
        int size = cfg.preset.shipSizes[i];
        bool placed = false;
        while (!placed) {
            clearScreen();
            for (auto &line : renderGrid(scratch, true, cfg.color)) cout << line << "\n";
            cout << "\n";

            string coord, orient;
            if (!readAnswer("Enter start coord for ship of size " + to_string(size) +
                            " (e.g. A1), 'r' for random or 'q' to quit: ", coord)) return false;
            if (coord == "q") return false;
            if (coord == "r") {
                if (!randomlyPlaceShips(scratch, cfg.preset.shipSizes, rng)) {
                    cerr << "Could not place the fleet on a " << cfg.preset.name << " board\n";
                    return false;
                }
                fleet.clear();
                for (auto &s : scratch.ships()) fleet.push_back(s.footprint());
                return true;
            }

            if (!readAnswer("Orientation horizontal [h] or vertical [v]: ", orient)) return false;
            Coordinate start;
            if ((orient == "h" || orient == "v") && parseCoordinate(coord, scratch.size(), start)) {
                vector<Coordinate> footprint = shipFootprint(start, size, orient == "h");
                PlaceResult res = scratch.place(footprint);
                if (res == PlaceResult::Placed) {
                    fleet.push_back(footprint);
                    placed = true;
                    continue;
                }
                cout << "Invalid placement (" << placeResultName(res) << "), try again.\n";
            } else {
                cout << "Invalid placement, try again.\n";
            }
            string ignored;
            if (!readAnswer("Press Enter to continue...", ignored)) return false;
        }
    }
    return true;
}

static void displayAndExit(const RoundState &round, const vector<string> &reports, bool color) {
    clearScreen();
    displayBoards(round.sides[0].grid, round.sides[1].grid, color);
    for (auto &r : reports) cout << r << "\n";
}

static int playGame(GameConfig &cfg, ostream *log) {
    welcomeScreen();
    if (cfg.askDifficulty && !selectDifficulty(cfg.difficulty)) return 0;
    if (cfg.preset.name.empty() && !selectPreset(cfg.preset)) {
        cout << "\nQuitting game. Goodbye!\n";
        return 0;
    }

    mt19937 rng(effectiveSeed(cfg));
    RoundSetup setup;
    setup.mode = PLAYER_VS_COMPUTER;
    setup.preset = cfg.preset;
    setup.p2Difficulty = cfg.difficulty;
    setup.allowTouching = cfg.allowTouching;
    setup.parity = cfg.parity;
    setup.seed = rng();
    if (!manuallyPlaceShips(cfg, rng, setup.humanFleet)) {
        cout << "\nQuitting game. Goodbye!\n";
        return 0;
    }

    RoundState round;
    round.log = log;
    if (!round.reset(setup, 1)) {
        cerr << "Could not place the fleets on a " << cfg.preset.name << " board\n";
        return 1;
    }

    vector<string> reports;
    while (!round.isFinished()) {
        clearScreen();
        displayBoards(round.sides[0].grid, round.sides[1].grid, cfg.color);
        for (auto &r : reports) cout << r << "\n";
        reports.clear();

        string move;
        if (!readAnswer("Enter target (e.g. B3) or 'q' to quit: ", move) || move == "q") return 0;

        Coordinate target;
        if (!parseCoordinate(move, round.sides[1].grid.size(), target)) {
            reports.push_back("Invalid coordinate!");
            continue;
        }
        if (round.sides[1].grid.alreadyFired(target)) {
            reports.push_back("You already fired at " + upper(move) + "!");
            continue;
        }

        int res = round.makePlayerMove(target);
        if (res == MoveRejected) {
            reports.push_back("It is not your turn.");
            continue;
        }
        reports.push_back("You fire at " + formatCoordinate(target) + ": " +
                          (res == MoveMiss ? "Miss" : (res == MoveSunk ? "Hit, ship sunk!" : "Hit")));
        if (round.isFinished()) {
            reports.push_back("You win!");
            break;
        }

        // Computer turn
        round.tick();
        reports.push_back("Computer fires at " + formatCoordinate(round.lastShot) + ": " +
                          (round.lastOutcome.isHit() ? "Hit" : "Miss"));
        if (round.isFinished()) reports.push_back("You lose!");
    }

    displayAndExit(round, reports, cfg.color);
    return 0;
}

static int watchMatch(GameConfig &cfg, ostream *log) {
    if (cfg.preset.name.empty()) findBoardPreset("big", cfg.preset);

    RoundSetup setup;
    setup.mode = COMPUTER_VS_COMPUTER;
    setup.preset = cfg.preset;
    setup.p1Difficulty = cfg.p1;
    setup.p2Difficulty = cfg.p2;
    setup.allowTouching = cfg.allowTouching;
    setup.parity = cfg.parity;
    setup.seed = effectiveSeed(cfg);

    Tournament t;
    if (!t.start(setup, cfg.rounds, log)) {
        cerr << "Could not place the fleets on a " << cfg.preset.name << " board\n";
        return 1;
    }

    int lastReported = -1;
    while (!t.done()) {
        t.tick();
        if (t.currentRoundIdx == lastReported) continue;
        lastReported = t.currentRoundIdx;

        int played = t.currentRoundIdx;
        clearScreen();
        cout << "=== Tournament Progress ===\n";
        cout << "Player1 (" << difficultyName(cfg.p1) << ") vs Player2 (" << difficultyName(cfg.p2) << ")\n";
        cout << "Rounds Completed: " << played << " / " << t.totalRounds << "\n";
        cout << "Player1 Wins: " << t.p1WinsAccum << "\n";
        cout << "Player2 Wins: " << t.p2WinsAccum << "\n";
        cout << fixed << setprecision(2);
        cout << "Player1 Avg Shots: " << (played > 0 ? double(t.shotsP1Accum) / played : 0.0) << "\n";
        cout << "Player2 Avg Shots: " << (played > 0 ? double(t.shotsP2Accum) / played : 0.0) << "\n";
    }

    cout << "\n=== Tournament Results ===\n";
    cout << t.summary() << "\n";
    cout << "Seed: " << cfg.seed << "\n";
    return 0;
}

int main(int argc, char** argv) {
    GameConfig cfg;
    string error;
    if (!parseConfigArgs(argc, argv, cfg, error)) {
        cerr << error << "\n" << configUsage(argv[0]);
        return 2;
    }

    ofstream logFile;
    ostream *log = nullptr;
    if (!cfg.logFile.empty()) {
        logFile.open(cfg.logFile, ios::app);
        if (logFile) log = &logFile;
        else cerr << "warning: cannot open log file " << cfg.logFile << "\n";
    }

    try {
        if (cfg.mode == "watch") return watchMatch(cfg, log);
        return playGame(cfg, log);
    } catch (const logic_error &e) {
        cerr << "internal error: " << e.what() << "\n";
        return 3;
    } catch (const runtime_error &e) {
        cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
