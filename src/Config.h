#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include "battleship.h"
#include "TargetingAI.h"

using namespace std;

// Settings shared by the game and the benchmark, filled from key=value
// command-line arguments.
struct GameConfig {
    string mode = "play";            // play | watch
    Difficulty difficulty = Difficulty::Medium;
    Difficulty p1 = Difficulty::Hard;
    Difficulty p2 = Difficulty::Medium;
    BoardPreset preset;              // empty name -> ask interactively
    bool askDifficulty = true;
    unsigned seed = 0;
    bool seeded = false;
    int parity = 0;
    bool allowTouching = true;
    bool color = true;
    int rounds = 10;
    int games = 500;
    int threads = 1;
    string logFile = "salvo.log";
};

// Applies one key=value pair. Returns false and sets error on an unknown
// key or a malformed value.
bool applyConfigOption(GameConfig &cfg, const string &key, const string &value, string &error);

// Parses argv[1..]. Arguments without '=' are rejected.
bool parseConfigArgs(int argc, const char* const* argv, GameConfig &cfg, string &error);

// Seed to use for this run: the configured one, or a clock-derived one
unsigned effectiveSeed(GameConfig &cfg);

string configUsage(const string &program);

#endif
