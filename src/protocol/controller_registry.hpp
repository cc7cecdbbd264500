#pragma once

#include "votelink/types.hpp"
#include <cstddef>
#include <map>
#include <vector>

namespace votelink {
namespace protocol {

// Controller connection states
enum class ControllerState {
    DISCONNECTED,
    CONNECTED,
    VOTED,         // Connected and has a vote recorded in the current round
};

const char* controllerStateToString(ControllerState state);

enum class RegistryError {
    None,
    AlreadyRegistered,
    Full,
    NotRegistered,
};

const char* registryErrorToString(RegistryError err);

struct ControllerInfo {
    ControllerId id = 0;
    ControllerState state = ControllerState::DISCONNECTED;
    Sequence last_sequence = 0;     // Highest sequence accepted, 0 = none yet
    TimestampMs last_seen_ms = 0;
    bool voted = false;             // Vote recorded in the current round
};

/**
 * Controller Registry
 *
 * Known controllers, their link state, and the last vote sequence accepted
 * from each. Sequence history survives disconnects and rounds; it is only
 * discarded when the controller is deregistered.
 */
class ControllerRegistry {
public:
    explicit ControllerRegistry(size_t max_controllers = 5);

    // --- Membership ---

    RegistryError registerController(ControllerId id, TimestampMs now_ms = 0);
    RegistryError deregisterController(ControllerId id);
    bool isRegistered(ControllerId id) const;

    size_t size() const { return controllers_.size(); }
    size_t capacity() const { return max_controllers_; }

    // --- Link events ---

    RegistryError onConnect(ControllerId id, TimestampMs now_ms);
    RegistryError onDisconnect(ControllerId id, TimestampMs now_ms);
    void touch(ControllerId id, TimestampMs now_ms);

    bool isConnected(ControllerId id) const;
    std::vector<ControllerId> connectedControllers() const;

    // --- Replay protection ---

    Sequence nextExpectedSequence(ControllerId id) const;

    // Accepts and stores seq only when strictly greater than the stored value.
    // Ties and regressions are duplicates or replays.
    bool acceptSequence(ControllerId id, Sequence seq);

    // --- Round bookkeeping ---

    void markVoted(ControllerId id);
    void clearVoted();

    // --- Inspection ---

    const ControllerInfo* find(ControllerId id) const;
    std::vector<ControllerInfo> snapshot() const;

private:
    size_t max_controllers_;
    std::map<ControllerId, ControllerInfo> controllers_;

    ControllerInfo* lookup(ControllerId id);
};

} // namespace protocol
} // namespace votelink
