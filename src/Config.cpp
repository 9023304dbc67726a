#include "Config.h"
#include <chrono>
#include <sstream>
#include <stdexcept>

using namespace std;

static bool parseInt(const string &value, int &out) {
    try {
        size_t used = 0;
        int v = stoi(value, &used);
        if (used != value.size()) return false;
        out = v;
        return true;
    } catch (const invalid_argument &) {
        return false;
    } catch (const out_of_range &) {
        return false;
    }
}

static bool parseBool(const string &value, bool &out) {
    if (value == "1" || value == "yes" || value == "true" || value == "on")  { out = true;  return true; }
    if (value == "0" || value == "no" || value == "false" || value == "off") { out = false; return true; }
    return false;
}

bool applyConfigOption(GameConfig &cfg, const string &key, const string &value, string &error) {
    int n = 0;
    if (key == "mode") {
        if (value != "play" && value != "watch") { error = "mode must be play or watch"; return false; }
        cfg.mode = value;
    } else if (key == "difficulty") {
        if (!parseDifficulty(value, cfg.difficulty)) { error = "unknown difficulty: " + value; return false; }
        cfg.askDifficulty = false;
    } else if (key == "p1") {
        if (!parseDifficulty(value, cfg.p1)) { error = "unknown difficulty: " + value; return false; }
    } else if (key == "p2") {
        if (!parseDifficulty(value, cfg.p2)) { error = "unknown difficulty: " + value; return false; }
    } else if (key == "preset") {
        if (!findBoardPreset(value, cfg.preset)) { error = "unknown preset: " + value; return false; }
    } else if (key == "seed") {
        if (!parseInt(value, n) || n < 0) { error = "seed must be a non-negative integer"; return false; }
        cfg.seed = static_cast<unsigned>(n);
        cfg.seeded = true;
    } else if (key == "parity") {
        if (!parseInt(value, n) || (n != 0 && n != 1)) { error = "parity must be 0 or 1"; return false; }
        cfg.parity = n;
    } else if (key == "touching") {
        if (!parseBool(value, cfg.allowTouching)) { error = "touching must be yes or no"; return false; }
    } else if (key == "color") {
        if (!parseBool(value, cfg.color)) { error = "color must be yes or no"; return false; }
    } else if (key == "rounds") {
        if (!parseInt(value, n) || n < 1) { error = "rounds must be at least 1"; return false; }
        cfg.rounds = n;
    } else if (key == "games") {
        if (!parseInt(value, n) || n < 1) { error = "games must be at least 1"; return false; }
        cfg.games = n;
    } else if (key == "threads") {
        if (!parseInt(value, n) || n < 1) { error = "threads must be at least 1"; return false; }
        cfg.threads = n;
    } else if (key == "log") {
        cfg.logFile = value;
    } else {
        error = "unknown option: " + key;
        return false;
    }
    return true;
}

bool parseConfigArgs(int argc, const char* const* argv, GameConfig &cfg, string &error) {
    for (int i = 1; i < argc; ++i) {
        string s = argv[i];
        size_t eq = s.find('=');
        if (eq == string::npos) {
            error = "expected key=value, got: " + s;
            return false;
        }
        if (!applyConfigOption(cfg, s.substr(0, eq), s.substr(eq + 1), error)) return false;
    }
    return true;
}

unsigned effectiveSeed(GameConfig &cfg) {
    if (!cfg.seeded) {
        cfg.seed = static_cast<unsigned>(chrono::steady_clock::now().time_since_epoch().count());
        cfg.seeded = true;
    }
    return cfg.seed;
}

string configUsage(const string &program) {
    ostringstream oss;
    oss << "usage: " << program << " [key=value ...]\n"
        << "  mode=play|watch          interactive game or computer-vs-computer rounds\n"
        << "  difficulty=easy|medium|hard\n"
        << "  p1=, p2=                 difficulties of the two computers in watch mode\n"
        << "  preset=small|medium|big\n"
        << "  seed=N                   fixed random seed\n"
        << "  parity=0|1               checkerboard colour used by the hard AI\n"
        << "  touching=yes|no          allow ships to touch\n"
        << "  rounds=N                 rounds in watch mode\n"
        << "  games=N threads=N        benchmark size\n"
        << "  color=yes|no\n"
        << "  log=FILE                 move log (empty to disable)\n";
    return oss.str();
}
