// main.cpp
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include "simulation.hh"
#include "config_loader.hh"

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " <scenario.json> [--until T] [--log-level error|warn|info|debug|off]"
              << " [--log-file path] [--stats-out file]\n";
}

bool parseTime(const std::string& s, SimTime& out) {
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end && *end == '\0' && out > 0.0;
}

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string scenario_path;
    std::string stats_out;
    std::string log_file;
    std::string level_name;
    SimTime until = -1.0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--until" && has_value) {
            if (!parseTime(argv[++i], until)) {
                std::cerr << "[ERROR] --until expects a positive time\n";
                return 1;
            }
        } else if (arg == "--log-level" && has_value) {
            level_name = argv[++i];
        } else if (arg == "--log-file" && has_value) {
            log_file = argv[++i];
        } else if (arg == "--stats-out" && has_value) {
            stats_out = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && scenario_path.empty()) {
            scenario_path = arg;
        } else {
            std::cerr << "[ERROR] Unexpected argument: " << arg << "\n";
            usage(argv[0]);
            return 1;
        }
    }
    if (scenario_path.empty()) {
        usage(argv[0]);
        return 1;
    }

    Simulation sim;
    try {
        json scenario = loadConfig(scenario_path);
        if (!level_name.empty()) {
            scenario["log_level"] = level_name;
        }
        if (!log_file.empty() && !sim.getLog().open(log_file)) {
            std::cerr << "[ERROR] Cannot open log file: " << log_file << "\n";
            return 1;
        }
        sim.build(scenario);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Setup failed: " << e.what() << "\n";
        return 1;
    }

    try {
        sim.run(until > 0.0 ? until : sim.getDuration());
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Run failed: " << e.what() << "\n";
        return 1;
    }

    json stats = sim.collectStats();
    if (!stats_out.empty()) {
        std::ofstream f(stats_out);
        if (!f.is_open()) {
            std::cerr << "[ERROR] Cannot write stats to " << stats_out << "\n";
            return 1;
        }
        f << stats.dump(2) << "\n";
    }
    std::cout << stats.dump(2) << "\n";
    std::cout << "\n[INFO] Simulation finished at t=" << sim.getEventQueue().now() << "\n";
    return 0;
}
