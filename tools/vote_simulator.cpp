// Vote Simulator - full rounds over an impaired simulated link
//
// Runs the coordinator against simulated controllers for a range of seeds and
// checks every round: one ballot per controller, ballots match what the
// controllers sent, acknowledged votes are counted, and the round closes
// within its deadline (or the retry budget when it has none).

#include "sim/vote_scenario.hpp"
#include "votelink/logging.hpp"

#include <exception>
#include <iostream>
#include <string>

using namespace votelink;

int main(int argc, char* argv[]) {
    try {
        sim::ScenarioConfig scenario;
        int runs = 20;
        bool verbose = false;

        // Default: a rough room
        scenario.num_controllers = 5;
        scenario.silent_controllers = 1;
        scenario.impairments.drop_prob = 0.2f;
        scenario.impairments.duplicate_prob = 0.2f;
        scenario.impairments.reorder_prob = 0.2f;
        scenario.impairments.latency_ms = 20;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if ((arg == "--controllers" || arg == "-n") && i + 1 < argc) {
                scenario.num_controllers = std::stoi(argv[++i]);
            } else if (arg == "--silent" && i + 1 < argc) {
                scenario.silent_controllers = std::stoi(argv[++i]);
            } else if (arg == "--loss" && i + 1 < argc) {
                scenario.impairments.drop_prob = std::stof(argv[++i]);
            } else if (arg == "--dup" && i + 1 < argc) {
                scenario.impairments.duplicate_prob = std::stof(argv[++i]);
            } else if (arg == "--reorder" && i + 1 < argc) {
                scenario.impairments.reorder_prob = std::stof(argv[++i]);
            } else if (arg == "--latency" && i + 1 < argc) {
                scenario.impairments.latency_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--deadline" && i + 1 < argc) {
                scenario.round_ms = static_cast<uint32_t>(std::stoul(argv[++i])) * 1000;
            } else if (arg == "--infinite") {
                scenario.coordinator.timing_mode = TimingMode::INFINITE;
                scenario.round_ms = 0;
            } else if (arg == "--seed" && i + 1 < argc) {
                scenario.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--runs" && i + 1 < argc) {
                runs = std::stoi(argv[++i]);
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cout << "Vote Simulator - coordinator vs. simulated controllers\n\n";
                std::cout << "Options:\n";
                std::cout << "  --controllers, -n <N>  Controllers (default: 5)\n";
                std::cout << "  --silent <N>           Controllers that never answer (default: 1)\n";
                std::cout << "  --loss <p>             Drop probability (default: 0.2)\n";
                std::cout << "  --dup <p>              Duplicate probability (default: 0.2)\n";
                std::cout << "  --reorder <p>          Reorder probability (default: 0.2)\n";
                std::cout << "  --latency <ms>         One-way latency (default: 20)\n";
                std::cout << "  --deadline <s>         Round duration (default: 5)\n";
                std::cout << "  --infinite             No deadline; close on all voted/expired\n";
                std::cout << "  --seed <N>             First seed (default: 42)\n";
                std::cout << "  --runs <N>             Seeds to try (default: 20)\n";
                std::cout << "  --verbose, -v          Debug logging and per-run summaries\n";
                return 0;
            }
        }

        setLogLevel(verbose ? LogLevel::DEBUG : LogLevel::WARN);

        int passed = 0;
        int failed = 0;
        uint32_t first_seed = scenario.seed;

        std::cout << "=== Vote Simulator ===\n";
        std::cout << "Controllers: " << scenario.num_controllers
                  << " (" << scenario.silent_controllers << " silent), runs: " << runs << "\n\n";

        for (int run = 0; run < runs; run++) {
            scenario.seed = first_seed + static_cast<uint32_t>(run);
            sim::ScenarioResult result = sim::runScenario(scenario);

            if (result.ok()) {
                passed++;
                std::cout << "  [PASS] seed " << scenario.seed << ": "
                          << result.report.total_votes << " votes, "
                          << result.report.expired << " expired, closed at "
                          << (result.closed_ms - result.opened_ms) << " ms\n";
            } else {
                failed++;
                std::cout << "  [FAIL] seed " << scenario.seed << "\n";
            }

            if (verbose || !result.ok()) {
                for (const std::string& line : sim::describeScenario(scenario, result)) {
                    std::cout << "         " << line << "\n";
                }
            }
        }

        std::cout << "\n=== Summary ===\n";
        std::cout << "Passed: " << passed << "\n";
        std::cout << "Failed: " << failed << "\n";
        return failed > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal exception in vote_simulator: " << e.what() << "\n";
        return 2;
    }
}
