// Vote session event handlers
// Split from vote_session.cpp for maintainability

#include "vote_session.hpp"
#include "votelink/logging.hpp"

namespace votelink {
namespace protocol {

void VoteSession::handleEvent(const transport::TransportEvent& event) {
    switch (event.type) {
        case transport::TransportEvent::Type::CONNECTED:
            onControllerConnected(event.controller);
            break;
        case transport::TransportEvent::Type::DISCONNECTED:
            onControllerDisconnected(event.controller);
            break;
        case transport::TransportEvent::Type::FRAME:
            onFrameReceived(event.controller, event.data);
            break;
    }
}

// =============================================================================
// LINK EVENTS
// =============================================================================

void VoteSession::onControllerConnected(ControllerId id) {
    if (!registry_.isRegistered(id)) {
        if (!config_.auto_register) {
            LOG_SESSION(WARN, "Session: ignoring connect from unregistered controller %u", id);
            return;
        }
        RegistryError err = registry_.registerController(id, now_ms_);
        if (err != RegistryError::None) {
            LOG_SESSION(WARN, "Session: cannot auto-register controller %u: %s",
                        id, registryErrorToString(err));
            return;
        }
    }

    registry_.onConnect(id, now_ms_);
    LOG_SESSION(INFO, "Session: controller %u connected", id);

    // Late join
    if (round_ && round_->state == RoundState::OPEN) {
        promptController(id);
    }
}

void VoteSession::onControllerDisconnected(ControllerId id) {
    // Pending prompt stays; retries keep running against the dead link
    if (registry_.onDisconnect(id, now_ms_) == RegistryError::None) {
        LOG_SESSION(INFO, "Session: controller %u disconnected", id);
    }
}

// =============================================================================
// FRAME HANDLERS
// =============================================================================

void VoteSession::onFrameReceived(ControllerId id, ByteSpan frame) {
    registry_.touch(id, now_ms_);

    wire::Message msg;
    wire::CodecError err = wire::decode(frame, msg);
    if (err != wire::CodecError::None) {
        stats_.malformed_frames++;
        LOG_SESSION(WARN, "Session: dropped %zu-byte frame from controller %u: %s",
                    frame.size(), id, wire::codecErrorToString(err));
        return;
    }

    LOG_SESSION(TRACE, "Session: <- %u %s", id, wire::describe(msg).c_str());

    switch (msg.kind) {
        case wire::MessageKind::VOTE:
            handleVote(id, msg);
            break;
        case wire::MessageKind::UNKNOWN:
            stats_.unknown_frames++;
            LOG_SESSION(DEBUG, "Session: unknown kind 0x%02X from controller %u",
                        msg.raw_kind, id);
            break;
        default:
            // Coordinator-to-controller kinds have no meaning here
            stats_.unknown_frames++;
            LOG_SESSION(DEBUG, "Session: unexpected %s from controller %u",
                        wire::messageKindToString(msg.kind), id);
            break;
    }
}

void VoteSession::handleVote(ControllerId id, const wire::Message& msg) {
    if (!registry_.isRegistered(id)) {
        LOG_SESSION(WARN, "Session: vote from unregistered controller %u dropped", id);
        return;
    }
    if (isExpired(id) && round_->id == msg.round_id) {
        LOG_SESSION(DEBUG, "Session: vote from expired controller %u dropped", id);
        return;
    }

    LedgerError err = ledger_.record(id, msg.round_id, msg.choice, msg.sequence);
    switch (err) {
        case LedgerError::None:
            stats_.votes_accepted++;
            retry_.cancel(id, msg.round_id);
            LOG_SESSION(INFO, "Session: controller %u voted %s in round %u (seq=%u)",
                        id, choiceToString(msg.choice), msg.round_id, msg.sequence);
            sendMessage(id, wire::Message::makeAck(msg.round_id, msg.sequence));
            checkCompletion();
            break;

        case LedgerError::AlreadyVoted:
        case LedgerError::StaleSequence:
            // Retransmit or replay; never re-acknowledged
            stats_.duplicates_dropped++;
            LOG_SESSION(DEBUG, "Session: duplicate vote from controller %u (seq=%u): %s",
                        id, msg.sequence, ledgerErrorToString(err));
            break;

        case LedgerError::WrongRound:
        default:
            stats_.wrong_round_votes++;
            LOG_SESSION(DEBUG, "Session: vote for round %u from controller %u rejected: %s",
                        msg.round_id, id, ledgerErrorToString(err));
            break;
    }
}

} // namespace protocol
} // namespace votelink
