// Vote session state machine - core logic
// Event handlers are in session_handlers.cpp

#include "vote_session.hpp"
#include "votelink/logging.hpp"
#include <algorithm>
#include <cstdio>

namespace votelink {
namespace protocol {

const char* sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::IDLE:    return "IDLE";
        case SessionState::OPEN:    return "OPEN";
        case SessionState::CLOSING: return "CLOSING";
        case SessionState::CLOSED:  return "CLOSED";
        default: return "UNKNOWN";
    }
}

const char* sessionErrorToString(SessionError err) {
    switch (err) {
        case SessionError::None:            return "None";
        case SessionError::AlreadyRunning:  return "Round already running";
        case SessionError::NotOpen:         return "No open round";
        case SessionError::NotClosed:       return "Round not closed";
        case SessionError::PayloadTooLarge: return "Ballot too large";
        default: return "Unknown error";
    }
}

const char* closeReasonToString(CloseReason reason) {
    switch (reason) {
        case CloseReason::NONE:      return "NONE";
        case CloseReason::ALL_VOTED: return "ALL_VOTED";
        case CloseReason::DEADLINE:  return "DEADLINE";
        case CloseReason::ABORTED:   return "ABORTED";
        default: return "UNKNOWN";
    }
}

// =============================================================================
// CONSTRUCTOR
// =============================================================================

VoteSession::VoteSession(transport::ITransport& transport, const CoordinatorConfig& config)
    : transport_(transport)
    , config_(config)
    , registry_(config.max_controllers)
    , ledger_(registry_)
    , retry_(RetryConfig::fromCoordinator(config))
{
    size_t link_mtu = transport_.maxFrameSize();
    if (link_mtu < config_.max_frame_size) {
        LOG_SESSION(WARN, "Session: %s carries %zu-byte frames, clamping max_frame_size from %u",
                    transport_.getName().c_str(), link_mtu, config_.max_frame_size);
        config_.max_frame_size = static_cast<uint32_t>(link_mtu);
    }
}

// =============================================================================
// CONTROL SURFACE
// =============================================================================

RegistryError VoteSession::registerController(ControllerId id) {
    // Prompted once its link comes up
    return registry_.registerController(id, now_ms_);
}

RegistryError VoteSession::deregisterController(ControllerId id) {
    RegistryError err = registry_.deregisterController(id);
    if (err != RegistryError::None) {
        return err;
    }

    if (round_ && round_->state == RoundState::OPEN) {
        retry_.cancel(id, round_->id);
        if (!ledger_.hasVoted(id)) {
            round_->participants.erase(id);
            round_->expired.erase(id);
        }
        checkCompletion();
    }
    return err;
}

SessionError VoteSession::startRound(ByteSpan ballot, uint32_t duration_ms) {
    if (round_) {
        LOG_SESSION(WARN, "Session: start rejected, round %u is %s",
                    round_->id, sessionStateToString(getState()));
        return SessionError::AlreadyRunning;
    }
    if (ballot.size() > config_.getMaxBallotSize()) {
        LOG_SESSION(WARN, "Session: ballot of %zu bytes exceeds %u-byte limit",
                    ballot.size(), config_.getMaxBallotSize());
        return SessionError::PayloadTooLarge;
    }

    Round r;
    r.id = next_round_id_++;
    r.ballot.assign(ballot.begin(), ballot.end());
    r.state = RoundState::OPEN;
    r.opened_ms = now_ms_;

    if (duration_ms > 0) {
        r.deadline_ms = now_ms_ + duration_ms;
    } else if (config_.timing_mode == TimingMode::TIMED) {
        r.deadline_ms = now_ms_ + config_.default_round_ms;
    }

    round_ = std::move(r);
    ledger_.openRound(round_->id);
    retry_.clear();

    if (round_->deadline_ms) {
        LOG_SESSION(INFO, "Session: round %u open (%zu-byte ballot, deadline %llu ms)",
                    round_->id, round_->ballot.size(),
                    static_cast<unsigned long long>(*round_->deadline_ms));
    } else {
        LOG_SESSION(INFO, "Session: round %u open (%zu-byte ballot, no deadline)",
                    round_->id, round_->ballot.size());
    }
    notifyState();

    for (ControllerId id : registry_.connectedControllers()) {
        promptController(id);
    }
    return SessionError::None;
}

SessionError VoteSession::forceClose() {
    if (!round_ || round_->state == RoundState::CLOSED) {
        return SessionError::NotOpen;
    }
    if (round_->state == RoundState::CLOSING) {
        // Already on its way to CLOSED; the first close reason stands
        return SessionError::None;
    }
    closeRound(CloseReason::ABORTED);
    return SessionError::None;
}

SessionError VoteSession::archive() {
    if (!round_ || round_->state != RoundState::CLOSED) {
        return SessionError::NotClosed;
    }

    RoundId id = round_->id;
    if (config_.broadcast_reset_on_archive) {
        broadcast(wire::Message::makeReset(id));
    }

    ledger_.clear();
    registry_.clearVoted();
    retry_.clear();
    round_.reset();

    LOG_SESSION(INFO, "Session: round %u archived", id);
    notifyState();
    return SessionError::None;
}

// =============================================================================
// RESULTS
// =============================================================================

LedgerError VoteSession::tally(RoundId round_id, Tally& out) const {
    return ledger_.tally(round_id, out);
}

LedgerError VoteSession::report(RoundId round_id, RoundReport& out) const {
    out = RoundReport{};
    LedgerError err = ledger_.tally(round_id, out.tally);
    if (err != LedgerError::None) {
        return err;
    }

    out.round_id = round_id;
    out.close_reason = round_->close_reason;
    out.reporting_mode = config_.reporting_mode;
    out.total_votes = static_cast<uint32_t>(ledger_.voteCount());
    out.eligible = static_cast<uint32_t>(round_->participants.size());
    out.expired = static_cast<uint32_t>(round_->expired.size());

    if (config_.reporting_mode == ReportingMode::PUBLIC) {
        for (const VoteRecord& rec : ledger_.records()) {
            out.ballots.push_back(BallotEntry{rec.controller, rec.choice});
        }
    }
    return LedgerError::None;
}

std::vector<std::string> formatReport(const RoundReport& report) {
    std::vector<std::string> lines;
    char buf[96];

    snprintf(buf, sizeof(buf), "Round %u (%s)", report.round_id,
             closeReasonToString(report.close_reason));
    lines.push_back(buf);

    auto countFor = [&](Choice c) -> uint32_t {
        auto it = report.tally.find(c);
        return it == report.tally.end() ? 0 : it->second;
    };

    snprintf(buf, sizeof(buf), "Yes: %u", countFor(CHOICE_YES));
    lines.push_back(buf);
    snprintf(buf, sizeof(buf), "No: %u", countFor(CHOICE_NO));
    lines.push_back(buf);

    // Any other button values a controller might send
    for (const auto& [choice, count] : report.tally) {
        if (choice == CHOICE_YES || choice == CHOICE_NO) continue;
        snprintf(buf, sizeof(buf), "Choice %u: %u", static_cast<unsigned>(choice), count);
        lines.push_back(buf);
    }

    snprintf(buf, sizeof(buf), "Total: %u", report.total_votes);
    lines.push_back(buf);
    snprintf(buf, sizeof(buf), "Eligible: %u  Expired: %u", report.eligible, report.expired);
    lines.push_back(buf);

    if (report.reporting_mode == ReportingMode::PUBLIC) {
        for (const BallotEntry& b : report.ballots) {
            snprintf(buf, sizeof(buf), "  #%u: %s", b.controller, choiceToString(b.choice));
            lines.push_back(buf);
        }
    }
    return lines;
}

// =============================================================================
// TIMER
// =============================================================================

void VoteSession::tick(TimestampMs now_ms) {
    advanceClock(now_ms);

    if (!round_ || round_->state != RoundState::OPEN) {
        return;
    }

    // Nothing goes out at or past the deadline
    checkCompletion();
    if (!round_ || round_->state != RoundState::OPEN) {
        return;
    }

    for (const DuePrompt& due : retry_.tick(now_ms_)) {
        if (due.action == RetryAction::EXPIRE) {
            round_->expired.insert(due.controller);
            stats_.controllers_expired++;
            LOG_SESSION(INFO, "Session: controller %u expired in round %u", due.controller, round_->id);
            continue;
        }
        stats_.prompt_retries++;
        LOG_SESSION(DEBUG, "Session: re-prompting controller %u (attempt %u)", due.controller, due.attempt);
        sendMessage(due.controller, wire::Message::makePrompt(round_->id, round_->ballot));
        stats_.prompts_sent++;
    }

    checkCompletion();
}

// =============================================================================
// INTERNALS
// =============================================================================

void VoteSession::promptController(ControllerId id) {
    if (!round_ || round_->state != RoundState::OPEN) return;
    if (ledger_.hasVoted(id) || round_->expired.count(id) || retry_.isPending(id)) return;

    round_->participants.insert(id);
    retry_.schedule(id, round_->id, now_ms_);

    // A failed send is retried on the normal schedule
    sendMessage(id, wire::Message::makePrompt(round_->id, round_->ballot));
    stats_.prompts_sent++;
}

bool VoteSession::sendMessage(ControllerId id, const wire::Message& msg) {
    Bytes frame;
    wire::CodecError cerr = wire::encode(msg, config_.max_frame_size, frame);
    if (cerr != wire::CodecError::None) {
        LOG_SESSION(ERROR, "Session: cannot encode %s for controller %u: %s",
                    wire::messageKindToString(msg.kind), id, wire::codecErrorToString(cerr));
        return false;
    }

    transport::TransportError terr = transport_.send(id, frame);
    if (terr != transport::TransportError::None) {
        stats_.send_failures++;
        LOG_SESSION(WARN, "Session: send %s to controller %u failed: %s",
                    wire::messageKindToString(msg.kind), id, transport::transportErrorToString(terr));
        return false;
    }

    LOG_SESSION(TRACE, "Session: -> %u %s", id, wire::describe(msg).c_str());
    return true;
}

void VoteSession::broadcast(const wire::Message& msg) {
    for (ControllerId id : registry_.connectedControllers()) {
        sendMessage(id, msg);
    }
}

void VoteSession::checkCompletion() {
    if (!round_ || round_->state != RoundState::OPEN) {
        return;
    }

    if (round_->deadline_ms && now_ms_ >= *round_->deadline_ms) {
        closeRound(CloseReason::DEADLINE);
        return;
    }

    // Every participant has either voted or expired
    if (!round_->participants.empty() && retry_.pendingCount() == 0) {
        closeRound(CloseReason::ALL_VOTED);
        return;
    }

    // Nobody to wait for and no deadline: give late joiners one retry budget
    if (!round_->deadline_ms && round_->participants.empty() &&
        now_ms_ >= round_->opened_ms + config_.getRetryBudgetMs()) {
        closeRound(CloseReason::ALL_VOTED);
    }
}

void VoteSession::closeRound(CloseReason reason) {
    if (round_->state != RoundState::OPEN) {
        return;
    }
    round_->state = RoundState::CLOSING;
    round_->close_reason = reason;
    notifyState();

    // Best effort, not retried
    broadcast(wire::Message::makeClose(round_->id));

    retry_.clear();
    ledger_.closeRound();
    round_->state = RoundState::CLOSED;
    round_->closed_ms = now_ms_;

    if (reason == CloseReason::ABORTED) {
        stats_.rounds_aborted++;
    } else {
        stats_.rounds_closed++;
    }

    LOG_SESSION(INFO, "Session: round %u closed (%s): %zu votes, %zu participants, %zu expired",
                round_->id, closeReasonToString(reason), ledger_.voteCount(),
                round_->participants.size(), round_->expired.size());
    notifyState();
}

void VoteSession::notifyState() {
    if (on_state_changed_) {
        on_state_changed_(getState(), round_ ? round_->id : lastRoundId());
    }
}

SessionState VoteSession::getState() const {
    if (!round_) return SessionState::IDLE;
    switch (round_->state) {
        case RoundState::OPEN:    return SessionState::OPEN;
        case RoundState::CLOSING: return SessionState::CLOSING;
        case RoundState::CLOSED:  return SessionState::CLOSED;
        default: return SessionState::IDLE;
    }
}

bool VoteSession::isExpired(ControllerId id) const {
    return round_ && round_->expired.count(id) != 0;
}

void VoteSession::resetStats() {
    stats_ = SessionStats{};
    retry_.resetStats();
}

} // namespace protocol
} // namespace votelink
