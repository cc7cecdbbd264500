/**
 * votelink - Vote coordinator for battery-powered BLE voting controllers
 *
 * Runs the coordinator against the in-memory simulated link: a single
 * impaired round (sim) or an interactive operator console (console).
 */

#include "config/settings.hpp"
#include "interface/operator_console.hpp"
#include "protocol/frame.hpp"
#include "protocol/vote_coordinator.hpp"
#include "sim/simulated_link.hpp"
#include "sim/vote_scenario.hpp"
#include "votelink/logging.hpp"
#include "votelink/types.hpp"

#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

using namespace votelink;
namespace wire = votelink::protocol::wire;

// Signal handling for clean shutdown
static volatile std::sig_atomic_t g_running = 1;

void signalHandler(int) {
    g_running = 0;
}

void printUsage(const char* prog) {
    std::cerr << "votelink - Vote coordinator for BLE voting controllers\n\n";
    std::cerr << "Usage: " << prog << " [options] <command> [file]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  info            Show protocol constants and active policy\n";
    std::cerr << "  sim             Run one round over the simulated link\n";
    std::cerr << "  console [file]  Operator commands from file or stdin\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  -c <file>       Settings file (default: " << config::CoordinatorSettings::getDefaultPath() << ")\n";
    std::cerr << "  -v              Verbose (DEBUG) logging\n";
    std::cerr << "  --preset <name> Retry policy: balanced, lossy, lowpower\n";
    std::cerr << "  --infinite      Rounds without a deadline\n";
    std::cerr << "  --anonymous     Reports carry counts only\n";
    std::cerr << "\nSimulation options (sim):\n";
    std::cerr << "  -n <count>      Controllers (default: 3)\n";
    std::cerr << "  --silent <n>    Controllers that never answer (default: 0)\n";
    std::cerr << "  --loss <p>      Frame drop probability 0-1\n";
    std::cerr << "  --dup <p>       Frame duplication probability 0-1\n";
    std::cerr << "  --reorder <p>   Frame reorder probability 0-1\n";
    std::cerr << "  --latency <ms>  One-way latency\n";
    std::cerr << "  --deadline <s>  Round duration in seconds (default: 5)\n";
    std::cerr << "  --seed <n>      Random seed (default: 42)\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << prog << " sim -n 5 --loss 0.2 --dup 0.1 --silent 1\n";
    std::cerr << "  " << prog << " console round.txt\n";
    std::cerr << "\n";
}

void printInfo(const config::CoordinatorSettings& settings) {
    const CoordinatorConfig& c = settings.coordinator;

    std::cout << "=== votelink coordinator \"" << settings.coordinator_name << "\" ===\n\n";
    std::cout << "Wire format:\n";
    std::cout << "  Header:         " << wire::HEADER_SIZE << " bytes (kind + round id, big-endian)\n";
    std::cout << "  PROMPT:         " << wire::PROMPT_OVERHEAD << " + ballot bytes\n";
    std::cout << "  VOTE:           " << wire::VOTE_SIZE << " bytes\n";
    std::cout << "  ACK:            " << wire::ACK_SIZE << " bytes\n";
    std::cout << "  CLOSE / RESET:  " << wire::CLOSE_SIZE << " bytes\n\n";

    std::cout << "Link:\n";
    std::cout << "  Max frame:      " << c.max_frame_size << " bytes\n";
    std::cout << "  Max ballot:     " << c.getMaxBallotSize() << " bytes\n";
    std::cout << "  Controllers:    " << c.max_controllers << (c.auto_register ? " (auto-register)" : "") << "\n\n";

    std::cout << "Retry policy:\n";
    std::cout << "  Backoff:        " << c.base_backoff_ms << " ms doubling, cap " << c.max_backoff_ms << " ms\n";
    std::cout << "  Attempts:       " << c.max_attempts << "\n";
    std::cout << "  Retry budget:   " << c.getRetryBudgetMs() << " ms\n\n";

    std::cout << "Rounds:\n";
    std::cout << "  Timing:         " << timingModeToString(c.timing_mode);
    if (c.timing_mode == TimingMode::TIMED) {
        std::cout << " (default " << c.default_round_ms << " ms)";
    }
    std::cout << "\n";
    std::cout << "  Reporting:      " << reportingModeToString(c.reporting_mode) << "\n";
    std::cout << "  Reset on archive: " << (c.broadcast_reset_on_archive ? "yes" : "no") << "\n";
}

int runSim(const sim::ScenarioConfig& scenario) {
    sim::ScenarioResult result = sim::runScenario(scenario);
    for (const std::string& line : sim::describeScenario(scenario, result)) {
        std::cout << line << "\n";
    }
    std::cout << (result.ok() ? "RESULT: PASS" : "RESULT: FAIL") << "\n";
    return result.ok() ? 0 : 1;
}

int runConsole(const config::CoordinatorSettings& settings, const char* input_file) {
    sim::SimulatedLink link(settings.coordinator.max_frame_size);
    protocol::VoteCoordinator coordinator(link, settings.coordinator);

    coordinator.setRoundChangedCallback([](protocol::SessionState state, RoundId round_id) {
        LOG_SESSION(INFO, "Round %u -> %s", round_id, protocol::sessionStateToString(state));
    });

    interface::OperatorConsole console;
    console.bindCoordinator(&coordinator);
    console.bindSimulatedLink(&link);
    console.setDefaultBallot(settings.default_ballot);

    if (input_file) {
        std::ifstream file(input_file);
        if (!file.is_open()) {
            std::cerr << "Cannot open " << input_file << "\n";
            return 1;
        }
        console.run(file, std::cout);
    } else {
        std::string line;
        while (g_running && std::getline(std::cin, line)) {
            if (!console.processInput(line + "\n", std::cout)) {
                break;
            }
        }
    }
    return 0;
}

// ============================================================================
// Main
// ============================================================================
int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);

    try {
        const char* command = nullptr;
        const char* input_file = nullptr;
        const char* config_path = nullptr;
        const char* preset = nullptr;
        bool verbose = false;
        bool infinite = false;
        bool anonymous = false;

        sim::ScenarioConfig scenario;

        // Parse arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "-c" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "-v" || arg == "--verbose") {
                verbose = true;
            } else if (arg == "--preset" && i + 1 < argc) {
                preset = argv[++i];
            } else if (arg == "--infinite") {
                infinite = true;
            } else if (arg == "--anonymous") {
                anonymous = true;
            } else if (arg == "-n" && i + 1 < argc) {
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
                unsigned long seconds = std::stoul(argv[++i]);
                if (seconds > 7 * 24 * 3600) {
                    std::cerr << "Deadline out of range: " << seconds << " s\n";
                    return 1;
                }
                scenario.round_ms = static_cast<uint32_t>(seconds) * 1000;
            } else if (arg == "--seed" && i + 1 < argc) {
                scenario.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg[0] != '-') {
                if (!command) {
                    command = argv[i];
                } else if (!input_file) {
                    input_file = argv[i];
                }
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        if (!command) {
            printUsage(argv[0]);
            return 1;
        }

        config::CoordinatorSettings settings;
        if (config_path) {
            if (!settings.load(config_path)) {
                std::cerr << "Cannot read settings " << config_path << "\n";
                return 1;
            }
        } else if (!settings.load()) {
            // Missing default file is fine
            LOG_SESSION(DEBUG, "No settings at %s, using defaults",
                        config::CoordinatorSettings::getDefaultPath().c_str());
        }

        if (preset) {
            CoordinatorConfig p = presets::forName(preset);
            settings.coordinator.base_backoff_ms = p.base_backoff_ms;
            settings.coordinator.max_backoff_ms = p.max_backoff_ms;
            settings.coordinator.max_attempts = p.max_attempts;
        }
        if (infinite) settings.coordinator.timing_mode = TimingMode::INFINITE;
        if (anonymous) settings.coordinator.reporting_mode = ReportingMode::ANONYMOUS;

        setLogLevel(verbose ? LogLevel::DEBUG : parseLogLevel(settings.log_level.c_str(), LogLevel::WARN));

        FILE* log_file = nullptr;
        if (!settings.log_file.empty()) {
            log_file = std::fopen(settings.log_file.c_str(), "a");
            if (log_file) {
                setLogFile(log_file);
            } else {
                std::cerr << "Cannot open log file " << settings.log_file << ", logging to stderr\n";
            }
        }

        int rc = 0;
        if (strcmp(command, "info") == 0) {
            printInfo(settings);
        } else if (strcmp(command, "sim") == 0) {
            scenario.coordinator = settings.coordinator;
            if (infinite) scenario.round_ms = 0;
            rc = runSim(scenario);
        } else if (strcmp(command, "console") == 0) {
            rc = runConsole(settings, input_file);
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
            rc = 1;
        }

        if (log_file) {
            setLogFile(nullptr);
            std::fclose(log_file);
        }
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }
}
