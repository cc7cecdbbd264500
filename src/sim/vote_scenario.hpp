#pragma once

#include "simulated_link.hpp"
#include "protocol/vote_coordinator.hpp"
#include <string>
#include <vector>

namespace votelink {
namespace sim {

struct ScenarioConfig {
    CoordinatorConfig coordinator;
    LinkImpairments impairments;
    uint32_t seed = 42;

    int num_controllers = 3;
    int silent_controllers = 0;       // Highest ids never answer
    uint32_t round_ms = 5000;         // 0 = coordinator default / no deadline
    uint32_t step_ms = 10;            // Simulated loop period
    std::string ballot = "Proceed?";
};

struct ScenarioResult {
    bool closed = false;
    TimestampMs opened_ms = 0;
    TimestampMs closed_ms = 0;
    protocol::RoundReport report;
    SessionStats session;
    LinkStats link;
    std::vector<std::string> violations;   // Broken exactly-once / bounded-closure checks

    bool ok() const { return closed && violations.empty(); }
};

// Controller i (1-based) votes YES when odd, NO when even
Choice scenarioChoiceFor(ControllerId id);

/**
 * Run one complete round (connect, start, collect, close, report, archive)
 * over a SimulatedLink and check the result against what the simulated
 * controllers actually sent.
 */
ScenarioResult runScenario(const ScenarioConfig& config);

// Human-readable summary lines
std::vector<std::string> describeScenario(const ScenarioConfig& config, const ScenarioResult& result);

} // namespace sim
} // namespace votelink
