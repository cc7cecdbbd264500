#include "vote_coordinator.hpp"
#include "votelink/logging.hpp"

namespace votelink {
namespace protocol {

VoteCoordinator::VoteCoordinator(transport::ITransport& transport, const CoordinatorConfig& config)
    : transport_(transport)
    , session_(transport, config)
{
    LOG_SESSION(INFO, "Coordinator: using %s (mtu %zu, %u controllers max, %s/%s)",
                transport_.getName().c_str(), transport_.maxFrameSize(), config.max_controllers,
                timingModeToString(config.timing_mode), reportingModeToString(config.reporting_mode));
}

size_t VoteCoordinator::runOnce(TimestampMs now_ms) {
    std::lock_guard<CoordinatorMutex> lock(mutex_);

    // Events are stamped with the loop time
    session_.advanceClock(now_ms);

    size_t processed = 0;
    transport::TransportEvent event;
    while (transport_.pollEvent(event)) {
        session_.handleEvent(event);
        processed++;
    }

    session_.tick(now_ms);
    return processed;
}

RegistryError VoteCoordinator::registerController(ControllerId id) {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.registerController(id);
}

RegistryError VoteCoordinator::deregisterController(ControllerId id) {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.deregisterController(id);
}

SessionError VoteCoordinator::startRound(ByteSpan ballot, uint32_t duration_ms) {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.startRound(ballot, duration_ms);
}

SessionError VoteCoordinator::forceClose() {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.forceClose();
}

SessionError VoteCoordinator::archive() {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.archive();
}

LedgerError VoteCoordinator::tally(RoundId round_id, Tally& out) const {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.tally(round_id, out);
}

LedgerError VoteCoordinator::report(RoundId round_id, RoundReport& out) const {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.report(round_id, out);
}

void VoteCoordinator::setRoundChangedCallback(RoundChangedCallback cb) {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    session_.setStateChangedCallback(std::move(cb));
}

SessionState VoteCoordinator::getState() const {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.getState();
}

RoundId VoteCoordinator::currentRoundId() const {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    const Round* round = session_.getRound();
    return round ? round->id : session_.lastRoundId();
}

std::vector<ControllerInfo> VoteCoordinator::controllers() const {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.registry().snapshot();
}

SessionStats VoteCoordinator::getStats() const {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    return session_.getStats();
}

void VoteCoordinator::resetStats() {
    std::lock_guard<CoordinatorMutex> lock(mutex_);
    session_.resetStats();
}

} // namespace protocol
} // namespace votelink
