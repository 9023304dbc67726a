#include "Tournament.h"
#include "TargetingAI.h"
#include "Config.h"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace std;

// Parse a list spec like "easy:medium:hard"
static bool parseDifficultyList(const string &spec, vector<Difficulty> &out, string &error) {
    out.clear();
    stringstream ss(spec);
    string item;
    while (getline(ss, item, ':')) {
        Difficulty d;
        if (!parseDifficulty(item, d)) {
            error = "unknown difficulty: " + item;
            return false;
        }
        out.push_back(d);
    }
    if (out.empty()) error = "empty difficulty list";
    return !out.empty();
}

int main(int argc, char** argv) {
    GameConfig cfg;
    string diffSpec = "easy:medium:hard";
    string error;

    // Same key=value options as the game, plus a difficulty list
    for (int i = 1; i < argc; ++i) {
        string s = argv[i];
        size_t eq = s.find('=');
        if (eq == string::npos) {
            cerr << "expected key=value, got: " << s << "\n" << configUsage(argv[0]);
            return 2;
        }
        string k = s.substr(0, eq), v = s.substr(eq + 1);
        if (k == "difficulty") { diffSpec = v; continue; }
        if (!applyConfigOption(cfg, k, v, error)) {
            cerr << error << "\n" << configUsage(argv[0]);
            return 2;
        }
    }

    vector<Difficulty> difficulties;
    if (!parseDifficultyList(diffSpec, difficulties, error)) {
        cerr << error << "\n";
        return 2;
    }

    if (cfg.preset.name.empty()) findBoardPreset("big", cfg.preset);
    effectiveSeed(cfg);

    cout << "difficulty,preset,games,threads,seed,avg_shots,min_shots,max_shots" << endl;

    try {
        for (Difficulty d : difficulties) {
            SoloSummary r = runSoloGames(d, cfg.preset, cfg.seed, cfg.games, cfg.threads,
                                         cfg.parity, cfg.allowTouching);
            cout << difficultyName(d) << "," << cfg.preset.name << "," << r.games << ","
                 << r.threads << "," << cfg.seed << ","
                 << fixed << setprecision(3) << r.avgShots << ","
                 << r.minShots << "," << r.maxShots << endl;
        }
    } catch (const exception &e) {
        cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
