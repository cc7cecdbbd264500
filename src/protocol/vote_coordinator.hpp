#pragma once

#include "vote_session.hpp"
#include "transport/transport_interface.hpp"
#include <functional>
#include <mutex>

namespace votelink {
namespace protocol {

// Round-change callbacks can call straight back into the coordinator
// (e.g. reading the report when a round closes), so the lock is recursive.
using CoordinatorMutex = std::recursive_mutex;

/**
 * Vote Coordinator
 *
 * Binds a VoteSession to one transport and runs the control loop:
 * runOnce(now) drains every pending transport event in arrival order,
 * then ticks the session. The control surface may be called from another
 * thread (an operator console); every call is serialized with the loop.
 */
class VoteCoordinator {
public:
    using RoundChangedCallback = VoteSession::StateChangedCallback;

    VoteCoordinator(transport::ITransport& transport,
                    const CoordinatorConfig& config = CoordinatorConfig{});

    // --- Event loop ---

    // Returns the number of transport events processed
    size_t runOnce(TimestampMs now_ms);

    // --- Control surface ---

    RegistryError registerController(ControllerId id);
    RegistryError deregisterController(ControllerId id);
    SessionError startRound(ByteSpan ballot, uint32_t duration_ms = 0);
    SessionError forceClose();
    SessionError archive();

    // --- Results ---

    LedgerError tally(RoundId round_id, Tally& out) const;
    LedgerError report(RoundId round_id, RoundReport& out) const;

    // --- Callbacks ---

    void setRoundChangedCallback(RoundChangedCallback cb);

    // --- State ---

    SessionState getState() const;
    RoundId currentRoundId() const;    // Current round, or the last one when idle
    std::vector<ControllerInfo> controllers() const;
    std::string transportName() const { return transport_.getName(); }
    const CoordinatorConfig& getConfig() const { return session_.getConfig(); }

    SessionStats getStats() const;
    void resetStats();

    // Direct access for tests and tools. Not synchronized.
    const VoteSession& session() const { return session_; }

private:
    transport::ITransport& transport_;
    VoteSession session_;
    mutable CoordinatorMutex mutex_;
};

} // namespace protocol
} // namespace votelink
