#pragma once

#include "controller_registry.hpp"
#include "frame.hpp"
#include "retry_manager.hpp"
#include "vote_ledger.hpp"
#include "transport/transport_interface.hpp"
#include "votelink/types.hpp"
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace votelink {
namespace protocol {

// Session states
enum class SessionState {
    IDLE,       // No round
    OPEN,       // Collecting votes
    CLOSING,    // Broadcasting CLOSE
    CLOSED,     // Tally final, waiting for archive()
};

const char* sessionStateToString(SessionState state);

enum class SessionError {
    None,
    AlreadyRunning,    // startRound() while a round exists
    NotOpen,           // forceClose() with no open/closing round
    NotClosed,         // archive() before the round closed
    PayloadTooLarge,   // Ballot does not fit one PROMPT frame
};

const char* sessionErrorToString(SessionError err);

enum class CloseReason : uint8_t {
    NONE,        // Still open
    ALL_VOTED,   // Every participant voted or expired
    DEADLINE,
    ABORTED,     // Operator force-close
};

const char* closeReasonToString(CloseReason reason);

enum class RoundState : uint8_t {
    OPEN,
    CLOSING,
    CLOSED,
};

// The one round the session owns, if any
struct Round {
    RoundId id = 0;
    Bytes ballot;
    RoundState state = RoundState::OPEN;
    TimestampMs opened_ms = 0;
    std::optional<TimestampMs> deadline_ms;    // Empty in INFINITE timing mode
    TimestampMs closed_ms = 0;
    CloseReason close_reason = CloseReason::NONE;
    std::set<ControllerId> participants;       // Prompted in this round
    std::set<ControllerId> expired;            // Retry budget exhausted
};

struct BallotEntry {
    ControllerId controller = 0;
    Choice choice = 0;
};

// Closed-round summary for the result consumer
struct RoundReport {
    RoundId round_id = 0;
    CloseReason close_reason = CloseReason::NONE;
    ReportingMode reporting_mode = ReportingMode::PUBLIC;
    Tally tally;
    uint32_t total_votes = 0;
    uint32_t eligible = 0;                 // Participants prompted
    uint32_t expired = 0;
    std::vector<BallotEntry> ballots;      // PUBLIC mode only
};

// Display lines ("Yes: 2", "No: 1", "Total: 3", ...)
std::vector<std::string> formatReport(const RoundReport& report);

/**
 * Vote Session
 *
 * Round lifecycle: IDLE -> OPEN -> CLOSING -> CLOSED -> IDLE
 *
 * Driven only by handleEvent() and tick(); nothing here blocks or spawns
 * threads. The current time is the latest value passed to tick(), so a
 * simulated clock drives it the same way as a real one.
 *
 * Per-controller failures (malformed frames, duplicates, send errors,
 * dropped links) are logged, counted and dropped. They never end a round.
 */
class VoteSession {
public:
    using StateChangedCallback = std::function<void(SessionState state, RoundId round_id)>;

    VoteSession(transport::ITransport& transport,
                const CoordinatorConfig& config = CoordinatorConfig{});

    // --- Control surface ---

    RegistryError registerController(ControllerId id);
    RegistryError deregisterController(ControllerId id);

    // duration_ms == 0: default_round_ms when TIMED, no deadline when INFINITE
    SessionError startRound(ByteSpan ballot, uint32_t duration_ms = 0);
    SessionError forceClose();
    SessionError archive();

    // --- Results ---

    LedgerError tally(RoundId round_id, Tally& out) const;
    LedgerError report(RoundId round_id, RoundReport& out) const;

    // --- Event processing ---

    void handleEvent(const transport::TransportEvent& event);
    void tick(TimestampMs now_ms);

    // Move the clock without running retries or deadline checks. Never goes back.
    void advanceClock(TimestampMs now_ms) { if (now_ms > now_ms_) now_ms_ = now_ms; }

    // --- Callbacks ---

    void setStateChangedCallback(StateChangedCallback cb) { on_state_changed_ = std::move(cb); }

    // --- State ---

    SessionState getState() const;
    const Round* getRound() const { return round_ ? &*round_ : nullptr; }
    RoundId lastRoundId() const { return next_round_id_ - 1; }
    TimestampMs now() const { return now_ms_; }
    bool isExpired(ControllerId id) const;

    const CoordinatorConfig& getConfig() const { return config_; }
    const ControllerRegistry& registry() const { return registry_; }
    const VoteLedger& ledger() const { return ledger_; }
    const RetryManager& retries() const { return retry_; }

    SessionStats getStats() const { return stats_; }
    void resetStats();

private:
    transport::ITransport& transport_;
    CoordinatorConfig config_;

    ControllerRegistry registry_;
    VoteLedger ledger_;
    RetryManager retry_;

    std::optional<Round> round_;
    RoundId next_round_id_ = 1;
    TimestampMs now_ms_ = 0;

    SessionStats stats_;
    StateChangedCallback on_state_changed_;

    // session_handlers.cpp
    void onControllerConnected(ControllerId id);
    void onControllerDisconnected(ControllerId id);
    void onFrameReceived(ControllerId id, ByteSpan frame);
    void handleVote(ControllerId id, const wire::Message& msg);

    // vote_session.cpp
    void promptController(ControllerId id);
    bool sendMessage(ControllerId id, const wire::Message& msg);
    void broadcast(const wire::Message& msg);
    void checkCompletion();
    void closeRound(CloseReason reason);
    void notifyState();
};

} // namespace protocol
} // namespace votelink
