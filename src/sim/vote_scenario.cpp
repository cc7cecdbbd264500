#include "vote_scenario.hpp"
#include "votelink/logging.hpp"
#include <cstdio>
#include <set>

namespace votelink {
namespace sim {

using protocol::LedgerError;
using protocol::SessionError;
using protocol::SessionState;

Choice scenarioChoiceFor(ControllerId id) {
    return (id % 2 == 1) ? CHOICE_YES : CHOICE_NO;
}

namespace {

void checkInvariants(const ScenarioConfig& config, SimulatedLink& link,
                     const protocol::VoteSession& session, ScenarioResult& r) {
    char buf[160];
    auto fail = [&](const char* what) { r.violations.push_back(what); };

    // Bounded closure
    uint64_t bound = 0;
    const CoordinatorConfig& cc = session.getConfig();
    if (config.round_ms > 0) {
        bound = config.round_ms;
    } else if (cc.timing_mode == TimingMode::TIMED) {
        bound = cc.default_round_ms;
    } else {
        bound = cc.getRetryBudgetMs();
    }
    bound += config.step_ms;
    if (r.closed_ms - r.opened_ms > bound) {
        snprintf(buf, sizeof(buf), "round closed after %llu ms, bound is %llu ms",
                 static_cast<unsigned long long>(r.closed_ms - r.opened_ms),
                 static_cast<unsigned long long>(bound));
        fail(buf);
    }

    // Exactly once: one ballot per controller, carrying what it sent
    std::set<ControllerId> seen;
    for (const protocol::BallotEntry& b : r.report.ballots) {
        if (!seen.insert(b.controller).second) {
            snprintf(buf, sizeof(buf), "controller %u counted twice", b.controller);
            fail(buf);
        }
        SimController* c = link.controller(b.controller);
        if (!c) {
            snprintf(buf, sizeof(buf), "ballot from unknown controller %u", b.controller);
            fail(buf);
            continue;
        }
        if (c->isSilent() || c->votesSent() == 0) {
            snprintf(buf, sizeof(buf), "controller %u counted without voting", b.controller);
            fail(buf);
        }
        if (c->getChoice() && *c->getChoice() != b.choice) {
            snprintf(buf, sizeof(buf), "controller %u recorded as %s", b.controller,
                     choiceToString(b.choice));
            fail(buf);
        }
    }

    uint32_t summed = 0;
    for (const auto& [choice, count] : r.report.tally) {
        summed += count;
    }
    if (summed != r.report.total_votes) {
        fail("tally does not sum to total votes");
    }
    if (cc.reporting_mode == ReportingMode::PUBLIC && r.report.ballots.size() != r.report.total_votes) {
        fail("ballot list does not match total votes");
    }

    // An acknowledged controller must have been counted
    for (ControllerId id : link.controllerIds()) {
        SimController* c = link.controller(id);
        if (c->isAcked() && cc.reporting_mode == ReportingMode::PUBLIC && !seen.count(id)) {
            snprintf(buf, sizeof(buf), "controller %u acknowledged but not counted", id);
            fail(buf);
        }
    }

    if (r.report.close_reason == protocol::CloseReason::ALL_VOTED &&
        r.report.total_votes + r.report.expired != r.report.eligible) {
        fail("closed as all-voted with participants outstanding");
    }
}

} // namespace

ScenarioResult runScenario(const ScenarioConfig& config) {
    ScenarioResult r;

    SimulatedLink link(config.coordinator.max_frame_size, config.seed);
    link.setImpairments(config.impairments);

    for (int i = 1; i <= config.num_controllers; i++) {
        ControllerId id = static_cast<ControllerId>(i);
        SimController& c = link.addController(id, scenarioChoiceFor(id));
        c.setSilent(i > config.num_controllers - config.silent_controllers);
    }

    protocol::VoteCoordinator coordinator(link, config.coordinator);

    // Links come up before the round; auto-register picks them up
    TimestampMs now = 0;
    for (ControllerId id : link.controllerIds()) {
        link.connect(id);
    }
    link.advance(now);
    coordinator.runOnce(now);

    Bytes ballot(config.ballot.begin(), config.ballot.end());
    SessionError serr = coordinator.startRound(ballot, config.round_ms);
    if (serr != SessionError::None) {
        r.violations.push_back(std::string("start failed: ") + protocol::sessionErrorToString(serr));
        return r;
    }
    RoundId round_id = coordinator.currentRoundId();
    r.opened_ms = now;

    // Generous cap so a stuck round is reported instead of spinning
    uint64_t limit = static_cast<uint64_t>(config.round_ms > 0 ? config.round_ms
                                                               : config.coordinator.default_round_ms)
                   + config.coordinator.getRetryBudgetMs() * 2 + 1000;

    while (coordinator.getState() == SessionState::OPEN && now <= limit) {
        now += config.step_ms;
        link.advance(now);
        coordinator.runOnce(now);
    }

    if (coordinator.getState() != SessionState::CLOSED) {
        r.violations.push_back("round did not close");
        return r;
    }
    r.closed = true;
    r.closed_ms = coordinator.session().getRound()->closed_ms;

    LedgerError lerr = coordinator.report(round_id, r.report);
    if (lerr != LedgerError::None) {
        r.violations.push_back(std::string("report failed: ") + protocol::ledgerErrorToString(lerr));
        return r;
    }

    // Let the CLOSE broadcast land, then check once every duplicate has drained
    for (int i = 0; i < 100 && link.inFlight() > 0; i++) {
        now += config.step_ms;
        link.advance(now);
        coordinator.runOnce(now);
    }

    checkInvariants(config, link, coordinator.session(), r);

    serr = coordinator.archive();
    if (serr != SessionError::None) {
        r.violations.push_back(std::string("archive failed: ") + protocol::sessionErrorToString(serr));
    }
    link.advance(now + config.coordinator.max_backoff_ms);

    r.session = coordinator.getStats();
    r.link = link.getStats();
    return r;
}

std::vector<std::string> describeScenario(const ScenarioConfig& config, const ScenarioResult& result) {
    std::vector<std::string> lines;
    char buf[160];

    snprintf(buf, sizeof(buf), "Controllers: %d (%d silent), loss %.0f%%, dup %.0f%%, reorder %.0f%%, seed %u",
             config.num_controllers, config.silent_controllers,
             config.impairments.drop_prob * 100.0f, config.impairments.duplicate_prob * 100.0f,
             config.impairments.reorder_prob * 100.0f, config.seed);
    lines.push_back(buf);

    if (result.closed) {
        snprintf(buf, sizeof(buf), "Round closed at %llu ms",
                 static_cast<unsigned long long>(result.closed_ms - result.opened_ms));
        lines.push_back(buf);
        for (const std::string& line : protocol::formatReport(result.report)) {
            lines.push_back(line);
        }
    }

    snprintf(buf, sizeof(buf), "Prompts: %llu (%llu retries), expired: %llu, duplicates dropped: %llu",
             static_cast<unsigned long long>(result.session.prompts_sent),
             static_cast<unsigned long long>(result.session.prompt_retries),
             static_cast<unsigned long long>(result.session.controllers_expired),
             static_cast<unsigned long long>(result.session.duplicates_dropped));
    lines.push_back(buf);

    snprintf(buf, sizeof(buf), "Link: %llu down / %llu up sent, %llu dropped, %llu duplicated, %llu reordered",
             static_cast<unsigned long long>(result.link.downlink_sent),
             static_cast<unsigned long long>(result.link.uplink_sent),
             static_cast<unsigned long long>(result.link.dropped),
             static_cast<unsigned long long>(result.link.duplicated),
             static_cast<unsigned long long>(result.link.reordered));
    lines.push_back(buf);

    for (const std::string& v : result.violations) {
        lines.push_back("VIOLATION: " + v);
    }
    return lines;
}

} // namespace sim
} // namespace votelink
