// test_vote_session.cpp - Round lifecycle over the simulated link
//
// Drives VoteCoordinator + SimulatedLink with a 10 ms simulated clock.
//
// Tests:
// 1. Three controllers vote, round closes early, tally {YES: 2, NO: 1}
// 2. Duplicated vote frame recorded once
// 3. Silent controller: deadline close before expiry, early close after it
// 4. startRound while a round exists is AlreadyRunning
// 5. Reordered sequences keep the highest, one vote
// 6. No responses at all: bounded closure (TIMED and INFINITE)
// 7. Late join and disconnect keeping the pending prompt
// 8. Votes after close, archive with RESET, next round
// 9. Reporting modes, oversize ballot, deregistration, force close
// 10. Malformed / unknown frames, registry full, state callbacks
// 11. INFINITE round with no participants still closes
// 12. forceClose from a CLOSING callback closes once
// 13. No retransmit at the deadline

#include "protocol/frame.hpp"
#include "protocol/vote_coordinator.hpp"
#include "sim/simulated_link.hpp"
#include "votelink/logging.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace votelink;
using namespace votelink::protocol;

static int pass = 0, fail = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        fail++;
    }
}

static Bytes bytesOf(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

// Coordinator and link sharing one simulated clock
struct Bench {
    sim::SimulatedLink link;
    VoteCoordinator coordinator;
    TimestampMs now = 0;

    explicit Bench(const CoordinatorConfig& config = CoordinatorConfig{})
        : link(config.max_frame_size)
        , coordinator(link, config)
    {
    }

    void addConnected(ControllerId id, std::optional<Choice> choice) {
        link.addController(id, choice);
        link.connect(id);
    }

    void step(uint32_t ms = 10) {
        now += ms;
        link.advance(now);
        coordinator.runOnce(now);
    }

    void runFor(uint32_t ms) {
        for (uint32_t t = 0; t < ms; t += 10) step();
    }

    // Returns false if the round is still open after limit_ms
    bool runUntilClosed(uint32_t limit_ms) {
        TimestampMs until = now + limit_ms;
        while (coordinator.getState() == SessionState::OPEN && now < until) {
            step();
        }
        return coordinator.getState() == SessionState::CLOSED;
    }

    SessionError start(const std::string& ballot, uint32_t duration_ms = 0) {
        Bytes b = bytesOf(ballot);
        return coordinator.startRound(b, duration_ms);
    }

    Bytes voteFrame(RoundId round_id, Sequence seq, Choice choice) {
        Bytes frame;
        wire::encode(wire::Message::makeVote(round_id, seq, choice), link.maxFrameSize(), frame);
        return frame;
    }
};

int main() {
    std::cout << "=== Vote Session Test ===\n\n";
    setLogLevel(LogLevel::WARN);

    // ========================================================================
    // TEST 1: All voted
    // ========================================================================
    std::cout << "TEST 1: Three controllers vote YES, NO, YES\n";
    {
        Bench bench;
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, CHOICE_NO);
        bench.addConnected(3, CHOICE_YES);
        bench.step(0);

        check(bench.coordinator.controllers().size() == 3, "three controllers auto-registered");
        check(bench.start("Lunch?", 5000) == SessionError::None, "round opens with a 5 s deadline");

        RoundId round_id = bench.coordinator.currentRoundId();
        bool closed = bench.runUntilClosed(5000);
        check(closed && bench.now < 5000, "round closes before the deadline (" +
              std::to_string(bench.now) + " ms)");

        Tally t;
        LedgerError err = bench.coordinator.tally(round_id, t);
        check(err == LedgerError::None && t.size() == 2 && t[CHOICE_YES] == 2 && t[CHOICE_NO] == 1,
              "tally is {YES: 2, NO: 1}");

        RoundReport report;
        bench.coordinator.report(round_id, report);
        check(report.close_reason == CloseReason::ALL_VOTED && report.total_votes == 3 &&
              report.eligible == 3 && report.expired == 0, "report: ALL_VOTED, 3 of 3");

        bench.runFor(50);
        bool acked = true;
        for (ControllerId id : bench.link.controllerIds()) {
            const sim::SimController* c = bench.link.controller(id);
            if (!c->isAcked() || c->closesSeen() != 1 || c->lastBallot() != bytesOf("Lunch?")) acked = false;
        }
        check(acked, "every controller saw the ballot, its ACK and CLOSE");
    }

    // ========================================================================
    // TEST 2: Duplicate delivery
    // ========================================================================
    std::cout << "\nTEST 2: Duplicated vote frame\n";
    {
        Bench bench;
        bench.addConnected(1, std::nullopt);
        bench.addConnected(2, std::nullopt);
        bench.step(0);
        bench.start("Dup?");
        bench.step();

        RoundId round_id = bench.coordinator.currentRoundId();
        Bytes vote = bench.voteFrame(round_id, 1, CHOICE_YES);
        bench.link.injectFrame(1, vote);
        bench.link.injectFrame(1, vote);
        bench.step();

        SessionStats stats = bench.coordinator.getStats();
        check(bench.coordinator.session().ledger().voteCount() == 1, "exactly one record for controller 1");
        check(stats.votes_accepted == 1 && stats.duplicates_dropped == 1, "second copy counted as duplicate");
        check(bench.coordinator.getState() == SessionState::OPEN, "round still open for controller 2");
        check(!bench.coordinator.session().retries().isPending(1) &&
              bench.coordinator.session().retries().isPending(2), "only controller 2 still prompted");
    }

    // ========================================================================
    // TEST 3: Silent controller
    // ========================================================================
    std::cout << "\nTEST 3: Silent controller\n";
    {
        Bench bench;
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, CHOICE_YES);
        bench.link.controller(2)->setSilent(true);
        bench.step(0);
        bench.start("Quiet?", 5000);
        RoundId round_id = bench.coordinator.currentRoundId();

        check(bench.runUntilClosed(6000), "round closes");

        RoundReport report;
        bench.coordinator.report(round_id, report);
        check(report.close_reason == CloseReason::DEADLINE && bench.now == 5000,
              "closes at the 5 s deadline (" + std::to_string(bench.now) + " ms)");
        check(report.total_votes == 1 && report.tally[CHOICE_YES] == 1 && report.eligible == 2,
              "tally excludes the silent controller");
        check(bench.link.controller(2)->promptsSeen() == 4, "silent controller prompted 4 times before the deadline");
    }
    {
        Bench bench;
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, CHOICE_YES);
        bench.link.controller(2)->setSilent(true);
        bench.step(0);
        bench.start("Quiet?", 20000);
        RoundId round_id = bench.coordinator.currentRoundId();

        check(bench.runUntilClosed(21000), "round closes");

        RoundReport report;
        bench.coordinator.report(round_id, report);
        check(bench.coordinator.session().isExpired(2) && report.expired == 1,
              "silent controller expired after its retry budget");
        check(bench.now == bench.coordinator.getConfig().getRetryBudgetMs() && bench.now < 20000,
              "round closes at expiry, before the 20 s deadline (" + std::to_string(bench.now) + " ms)");
        check(report.total_votes == 1 && report.ballots.size() == 1 && report.ballots[0].controller == 1,
              "tally excludes the expired controller");
        check(bench.coordinator.getStats().controllers_expired == 1 &&
              bench.coordinator.getStats().prompt_retries == 5, "5 retransmits, then expiry");
    }

    // ========================================================================
    // TEST 4: AlreadyRunning
    // ========================================================================
    std::cout << "\nTEST 4: Start while running\n";
    {
        Bench bench;
        bench.addConnected(1, std::nullopt);
        bench.step(0);
        bench.start("First?", 5000);
        bench.step();

        const Round* before = bench.coordinator.session().getRound();
        RoundId id = before->id;
        Bytes ballot = before->ballot;
        auto deadline = before->deadline_ms;

        check(bench.start("Second?", 1000) == SessionError::AlreadyRunning, "second start rejected");

        const Round* after = bench.coordinator.session().getRound();
        check(after->id == id && after->ballot == ballot && after->deadline_ms == deadline &&
              bench.coordinator.getState() == SessionState::OPEN, "existing round untouched");

        bench.coordinator.forceClose();
        check(bench.start("Third?") == SessionError::AlreadyRunning, "closed but unarchived round also blocks");
    }

    // ========================================================================
    // TEST 5: Reordering
    // ========================================================================
    std::cout << "\nTEST 5: Reordered sequences\n";
    {
        Bench bench;
        bench.addConnected(1, std::nullopt);
        bench.addConnected(2, std::nullopt);
        bench.addConnected(3, std::nullopt);
        bench.step(0);
        bench.start("Order?");
        bench.step();
        RoundId round_id = bench.coordinator.currentRoundId();

        // Controller 1: newer frame first
        bench.link.injectFrame(1, bench.voteFrame(round_id, 3, CHOICE_YES));
        bench.link.injectFrame(1, bench.voteFrame(round_id, 2, CHOICE_NO));
        // Controller 2: older frame first
        bench.link.injectFrame(2, bench.voteFrame(round_id, 2, CHOICE_NO));
        bench.link.injectFrame(2, bench.voteFrame(round_id, 3, CHOICE_YES));
        bench.step();

        const ControllerRegistry& reg = bench.coordinator.session().registry();
        check(reg.find(1)->last_sequence == 3 && reg.find(2)->last_sequence == 3,
              "both controllers end at the highest sequence sent");
        check(bench.coordinator.session().ledger().voteCount() == 2, "one vote each");

        // Replay of an acknowledged frame
        bench.link.injectFrame(1, bench.voteFrame(round_id, 3, CHOICE_YES));
        bench.step();
        bench.coordinator.forceClose();

        Tally t;
        bench.coordinator.tally(round_id, t);
        check(t[CHOICE_YES] == 1 && t[CHOICE_NO] == 1, "replay leaves the tally unchanged");
    }

    // ========================================================================
    // TEST 6: Bounded closure
    // ========================================================================
    std::cout << "\nTEST 6: No responses\n";
    {
        CoordinatorConfig cfg;
        Bench bench(cfg);
        for (ControllerId id = 1; id <= 3; id++) {
            bench.addConnected(id, std::nullopt);
        }
        bench.step(0);
        bench.start("Anyone?", 2000);

        uint64_t bound = 2000 + static_cast<uint64_t>(cfg.max_attempts) * cfg.max_backoff_ms;
        check(bench.runUntilClosed(static_cast<uint32_t>(bound)) && bench.now <= bound,
              "TIMED round closes within deadline + retry budget");
    }
    {
        CoordinatorConfig cfg;
        cfg.timing_mode = TimingMode::INFINITE;
        Bench bench(cfg);
        for (ControllerId id = 1; id <= 3; id++) {
            bench.addConnected(id, std::nullopt);
        }
        bench.step(0);
        bench.start("Anyone?");
        check(!bench.coordinator.session().getRound()->deadline_ms, "INFINITE round has no deadline");

        RoundId round_id = bench.coordinator.currentRoundId();
        check(bench.runUntilClosed(60000) && bench.now == cfg.getRetryBudgetMs(),
              "INFINITE round closes when every controller expired (" + std::to_string(bench.now) + " ms)");

        RoundReport report;
        bench.coordinator.report(round_id, report);
        check(report.total_votes == 0 && report.expired == 3 && report.tally.empty(),
              "empty tally, all expired");
    }

    // ========================================================================
    // TEST 7: Late join, disconnect
    // ========================================================================
    std::cout << "\nTEST 7: Late join and disconnect\n";
    {
        Bench bench;
        bench.addConnected(1, std::nullopt);
        bench.step(0);
        bench.start("Late?", 10000);
        bench.runFor(100);

        bench.addConnected(2, CHOICE_NO);
        bench.step();
        check(bench.coordinator.session().getRound()->participants.count(2) == 1,
              "late controller prompted on connect");
        bench.runFor(50);
        check(bench.coordinator.session().ledger().hasVoted(2), "late controller's vote recorded");
    }
    {
        Bench bench;
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, std::nullopt);
        bench.step(0);
        bench.start("Drop?", 10000);

        // Link goes down before the first prompt arrives
        bench.link.disconnect(1);
        bench.runFor(700);

        SessionStats stats = bench.coordinator.getStats();
        check(bench.coordinator.session().retries().isPending(1), "disconnected controller keeps its prompt");
        check(stats.send_failures >= 1, "retransmit to a down link counted as a send failure");
        check(bench.coordinator.getState() == SessionState::OPEN, "round unaffected");

        bench.link.connect(1);
        bench.runFor(1500);
        check(bench.coordinator.session().ledger().hasVoted(1) &&
              bench.link.controller(1)->isAcked(), "vote arrives after reconnect");
    }

    // ========================================================================
    // TEST 8: After close, archive, next round
    // ========================================================================
    std::cout << "\nTEST 8: Close, archive, next round\n";
    {
        Bench bench;
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, CHOICE_NO);
        bench.step(0);
        bench.start("One?");
        RoundId first = bench.coordinator.currentRoundId();
        bench.runUntilClosed(1000);

        bench.link.injectFrame(1, bench.voteFrame(first, 9, CHOICE_NO));
        bench.step();
        Tally t;
        bench.coordinator.tally(first, t);
        check(bench.coordinator.getStats().wrong_round_votes == 1 && t[CHOICE_YES] == 1 && t[CHOICE_NO] == 1,
              "vote after close rejected as wrong round");

        check(bench.coordinator.archive() == SessionError::None &&
              bench.coordinator.getState() == SessionState::IDLE, "archive returns to IDLE");
        bench.runFor(20);
        check(bench.link.controller(1)->resetsSeen() == 1 && bench.link.controller(2)->resetsSeen() == 1,
              "controllers told to reset");
        check(bench.coordinator.tally(first, t) == LedgerError::WrongRound, "archived round has no tally");
        check(bench.coordinator.archive() == SessionError::NotClosed, "second archive rejected");

        bench.link.controller(1)->setChoice(CHOICE_NO);
        bench.start("Two?");
        RoundId second = bench.coordinator.currentRoundId();
        bench.runUntilClosed(1000);
        bench.coordinator.tally(second, t);
        check(second == first + 1 && t[CHOICE_NO] == 2, "next round gets a new id and fresh votes");
        check(bench.coordinator.session().registry().find(1)->last_sequence == 2,
              "sequence numbers carried across rounds");
    }

    // ========================================================================
    // TEST 9: Modes and control surface errors
    // ========================================================================
    std::cout << "\nTEST 9: Reporting modes and control errors\n";
    {
        CoordinatorConfig cfg;
        cfg.reporting_mode = ReportingMode::ANONYMOUS;
        Bench bench(cfg);
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, CHOICE_YES);
        bench.step(0);
        bench.start("Secret?");
        RoundId round_id = bench.coordinator.currentRoundId();
        bench.runUntilClosed(1000);

        RoundReport report;
        bench.coordinator.report(round_id, report);
        std::vector<std::string> lines = formatReport(report);
        check(report.ballots.empty() && report.tally[CHOICE_YES] == 2 && lines.size() == 5,
              "ANONYMOUS report carries counts only");
        check(lines[1] == "Yes: 2" && lines[3] == "Total: 2", "report lines formatted");
    }
    {
        Bench bench;
        bench.addConnected(1, CHOICE_YES);
        bench.step(0);

        std::string too_long(bench.coordinator.getConfig().getMaxBallotSize() + 1, 'x');
        check(bench.start(too_long) == SessionError::PayloadTooLarge, "oversize ballot rejected");
        check(bench.coordinator.getState() == SessionState::IDLE, "no round opened");

        std::string fits(bench.coordinator.getConfig().getMaxBallotSize(), 'x');
        check(bench.start(fits) == SessionError::None, "ballot at the size limit accepted");
        check(bench.coordinator.archive() == SessionError::NotClosed, "archive while open rejected");
        check(bench.coordinator.forceClose() == SessionError::None, "force close");

        RoundReport report;
        bench.coordinator.report(bench.coordinator.currentRoundId(), report);
        check(report.close_reason == CloseReason::ABORTED, "close reason ABORTED");
        check(bench.coordinator.forceClose() == SessionError::NotOpen, "second force close rejected");
        check(bench.coordinator.getStats().rounds_aborted == 1, "abort counted");
    }
    {
        Bench bench;
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, std::nullopt);
        bench.step(0);
        bench.start("Leave?", 10000);
        bench.runFor(50);
        check(bench.coordinator.getState() == SessionState::OPEN, "waiting on controller 2");

        check(bench.coordinator.deregisterController(2) == RegistryError::None, "controller 2 deregistered");
        check(bench.coordinator.getState() == SessionState::CLOSED, "round closes without it");
        check(bench.coordinator.deregisterController(2) == RegistryError::NotRegistered,
              "second deregistration rejected");
    }

    // ========================================================================
    // TEST 10: Bad input and bookkeeping
    // ========================================================================
    std::cout << "\nTEST 10: Bad frames, registry limits, callbacks\n";
    {
        Bench bench;
        std::vector<SessionState> states;
        bench.coordinator.setRoundChangedCallback([&states](SessionState s, RoundId) {
            states.push_back(s);
        });

        bench.addConnected(1, std::nullopt);
        bench.step(0);
        bench.start("Noise?");
        bench.step();
        RoundId round_id = bench.coordinator.currentRoundId();

        bench.link.injectFrame(1, Bytes{0x02, 0x00});
        bench.link.injectFrame(1, Bytes{0x77, 0x00, 0x00, 0x00, 0x01});
        bench.link.injectFrame(1, bench.voteFrame(round_id + 5, 1, CHOICE_YES));
        bench.step();

        SessionStats stats = bench.coordinator.getStats();
        check(stats.malformed_frames == 1 && stats.unknown_frames == 1 && stats.wrong_round_votes == 1,
              "malformed, unknown and wrong-round frames counted");
        check(bench.coordinator.getState() == SessionState::OPEN, "round survives bad frames");

        bench.link.injectFrame(1, bench.voteFrame(round_id, 1, CHOICE_YES));
        bench.step();
        bench.coordinator.archive();

        std::vector<SessionState> expected = {SessionState::OPEN, SessionState::CLOSING,
                                              SessionState::CLOSED, SessionState::IDLE};
        check(states == expected, "callbacks: OPEN, CLOSING, CLOSED, IDLE");
    }
    {
        CoordinatorConfig cfg;
        cfg.max_controllers = 2;
        Bench bench(cfg);
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, CHOICE_YES);
        bench.addConnected(3, CHOICE_YES);
        bench.step(0);
        check(bench.coordinator.controllers().size() == 2, "third controller refused when full");

        bench.start("Full?");
        bench.runUntilClosed(1000);
        check(bench.coordinator.session().ledger().voteCount() == 2 &&
              bench.link.controller(3)->promptsSeen() == 0, "refused controller never prompted");
    }
    {
        CoordinatorConfig cfg;
        cfg.auto_register = false;
        Bench bench(cfg);
        bench.coordinator.registerController(1);
        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, CHOICE_YES);
        bench.step(0);
        bench.start("Known?");
        bench.runUntilClosed(1000);
        check(bench.coordinator.session().ledger().voteCount() == 1 &&
              !bench.coordinator.session().registry().isRegistered(2),
              "without auto-register only known controllers take part");
    }

    // ========================================================================
    // TEST 11: INFINITE round with nobody to prompt
    // ========================================================================
    std::cout << "\nTEST 11: INFINITE round with no participants\n";
    {
        CoordinatorConfig cfg;
        cfg.timing_mode = TimingMode::INFINITE;
        Bench bench(cfg);
        bench.coordinator.registerController(1);
        bench.step(0);
        check(bench.start("Empty?") == SessionError::None, "round opens with no connected controller");
        RoundId round_id = bench.coordinator.currentRoundId();

        check(bench.runUntilClosed(60000) && bench.now == cfg.getRetryBudgetMs(),
              "closes after one retry budget (" + std::to_string(bench.now) + " ms)");

        RoundReport report;
        bench.coordinator.report(round_id, report);
        check(report.close_reason == CloseReason::ALL_VOTED && report.eligible == 0 &&
              report.total_votes == 0, "report: ALL_VOTED, nobody eligible");
    }
    {
        CoordinatorConfig cfg;
        cfg.timing_mode = TimingMode::INFINITE;
        Bench bench(cfg);
        bench.step(0);
        bench.start("Anyone yet?");
        bench.runFor(1000);
        check(bench.coordinator.getState() == SessionState::OPEN, "still open for late joiners");

        bench.addConnected(1, CHOICE_YES);
        check(bench.runUntilClosed(1000) && bench.coordinator.session().ledger().voteCount() == 1,
              "late joiner votes and closes the round");
    }
    {
        CoordinatorConfig cfg;
        cfg.timing_mode = TimingMode::INFINITE;
        Bench bench(cfg);
        bench.addConnected(1, std::nullopt);
        bench.step(0);
        bench.start("Leaving?");
        bench.runFor(1000);

        check(bench.coordinator.deregisterController(1) == RegistryError::None, "only participant deregistered");
        check(bench.runUntilClosed(60000) && bench.now == cfg.getRetryBudgetMs(),
              "round without participants still closes (" + std::to_string(bench.now) + " ms)");
    }

    // ========================================================================
    // TEST 12: Force close from inside a state callback
    // ========================================================================
    std::cout << "\nTEST 12: forceClose while CLOSING\n";
    {
        Bench bench;
        std::vector<SessionState> states;
        std::vector<SessionError> results;
        VoteCoordinator& coordinator = bench.coordinator;
        coordinator.setRoundChangedCallback([&](SessionState s, RoundId) {
            states.push_back(s);
            if (s == SessionState::CLOSING || s == SessionState::CLOSED) {
                results.push_back(coordinator.forceClose());
            }
        });

        bench.addConnected(1, CHOICE_YES);
        bench.addConnected(2, CHOICE_NO);
        bench.step(0);
        bench.start("Reentrant?", 5000);
        RoundId round_id = coordinator.currentRoundId();
        check(bench.runUntilClosed(5000), "round closes");

        std::vector<SessionState> expected = {SessionState::OPEN, SessionState::CLOSING, SessionState::CLOSED};
        check(states == expected, "one CLOSING and one CLOSED notification");
        check(results.size() == 2 && results[0] == SessionError::None && results[1] == SessionError::NotOpen,
              "forceClose: None while CLOSING, NotOpen once CLOSED");

        RoundReport report;
        coordinator.report(round_id, report);
        SessionStats stats = coordinator.getStats();
        check(report.close_reason == CloseReason::ALL_VOTED, "first close reason kept");
        check(stats.rounds_closed == 1 && stats.rounds_aborted == 0, "round counted once");
    }

    // ========================================================================
    // TEST 13: Deadline before retransmit
    // ========================================================================
    std::cout << "\nTEST 13: Retransmit due at the deadline\n";
    {
        Bench bench;
        bench.addConnected(1, CHOICE_YES);
        bench.link.controller(1)->setSilent(true);
        bench.step(0);
        // Retransmits fall due at 500, 1500, 3500
        bench.start("Cutoff?", 3500);
        RoundId round_id = bench.coordinator.currentRoundId();
        check(bench.runUntilClosed(4000) && bench.now == 3500, "closes at 3500 ms");

        RoundReport report;
        bench.coordinator.report(round_id, report);
        SessionStats stats = bench.coordinator.getStats();
        check(report.close_reason == CloseReason::DEADLINE, "closed by DEADLINE");
        check(stats.prompts_sent == 3 && stats.prompt_retries == 2,
              "no prompt sent at the deadline (" + std::to_string(stats.prompts_sent) + " sent)");

        bench.runFor(100);
        check(bench.link.controller(1)->promptsSeen() == 3 && bench.link.controller(1)->closesSeen() == 1,
              "controller saw 3 prompts then CLOSE");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All vote session tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
