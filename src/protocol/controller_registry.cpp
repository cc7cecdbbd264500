#include "controller_registry.hpp"
#include "votelink/logging.hpp"

namespace votelink {
namespace protocol {

const char* controllerStateToString(ControllerState state) {
    switch (state) {
        case ControllerState::DISCONNECTED: return "DISCONNECTED";
        case ControllerState::CONNECTED:    return "CONNECTED";
        case ControllerState::VOTED:        return "VOTED";
        default: return "UNKNOWN";
    }
}

const char* registryErrorToString(RegistryError err) {
    switch (err) {
        case RegistryError::None:              return "None";
        case RegistryError::AlreadyRegistered: return "Already registered";
        case RegistryError::Full:              return "Registry full";
        case RegistryError::NotRegistered:     return "Not registered";
        default: return "Unknown error";
    }
}

ControllerRegistry::ControllerRegistry(size_t max_controllers)
    : max_controllers_(max_controllers)
{
}

RegistryError ControllerRegistry::registerController(ControllerId id, TimestampMs now_ms) {
    if (controllers_.count(id)) {
        return RegistryError::AlreadyRegistered;
    }
    if (controllers_.size() >= max_controllers_) {
        LOG_PROTO(WARN, "Registry: cannot register controller %u, full (%zu/%zu)",
                  id, controllers_.size(), max_controllers_);
        return RegistryError::Full;
    }

    ControllerInfo info;
    info.id = id;
    info.last_seen_ms = now_ms;
    controllers_.emplace(id, info);

    LOG_PROTO(INFO, "Registry: registered controller %u (%zu/%zu)",
              id, controllers_.size(), max_controllers_);
    return RegistryError::None;
}

RegistryError ControllerRegistry::deregisterController(ControllerId id) {
    if (controllers_.erase(id) == 0) {
        return RegistryError::NotRegistered;
    }
    LOG_PROTO(INFO, "Registry: deregistered controller %u", id);
    return RegistryError::None;
}

bool ControllerRegistry::isRegistered(ControllerId id) const {
    return controllers_.count(id) != 0;
}

RegistryError ControllerRegistry::onConnect(ControllerId id, TimestampMs now_ms) {
    ControllerInfo* c = lookup(id);
    if (!c) {
        return RegistryError::NotRegistered;
    }
    c->state = c->voted ? ControllerState::VOTED : ControllerState::CONNECTED;
    c->last_seen_ms = now_ms;
    LOG_PROTO(DEBUG, "Registry: controller %u connected (last_seq=%u)", id, c->last_sequence);
    return RegistryError::None;
}

RegistryError ControllerRegistry::onDisconnect(ControllerId id, TimestampMs now_ms) {
    ControllerInfo* c = lookup(id);
    if (!c) {
        return RegistryError::NotRegistered;
    }
    c->state = ControllerState::DISCONNECTED;
    c->last_seen_ms = now_ms;
    LOG_PROTO(DEBUG, "Registry: controller %u disconnected", id);
    return RegistryError::None;
}

void ControllerRegistry::touch(ControllerId id, TimestampMs now_ms) {
    if (ControllerInfo* c = lookup(id)) {
        c->last_seen_ms = now_ms;
    }
}

bool ControllerRegistry::isConnected(ControllerId id) const {
    const ControllerInfo* c = find(id);
    return c && c->state != ControllerState::DISCONNECTED;
}

std::vector<ControllerId> ControllerRegistry::connectedControllers() const {
    std::vector<ControllerId> ids;
    ids.reserve(controllers_.size());
    for (const auto& [id, info] : controllers_) {
        if (info.state != ControllerState::DISCONNECTED) {
            ids.push_back(id);
        }
    }
    return ids;
}

Sequence ControllerRegistry::nextExpectedSequence(ControllerId id) const {
    const ControllerInfo* c = find(id);
    return c ? c->last_sequence + 1 : 1;
}

bool ControllerRegistry::acceptSequence(ControllerId id, Sequence seq) {
    ControllerInfo* c = lookup(id);
    if (!c) {
        return false;
    }
    if (seq <= c->last_sequence) {
        LOG_PROTO(DEBUG, "Registry: controller %u seq=%u rejected (stored %u)",
                  id, seq, c->last_sequence);
        return false;
    }
    c->last_sequence = seq;
    return true;
}

void ControllerRegistry::markVoted(ControllerId id) {
    if (ControllerInfo* c = lookup(id)) {
        c->voted = true;
        if (c->state == ControllerState::CONNECTED) {
            c->state = ControllerState::VOTED;
        }
    }
}

void ControllerRegistry::clearVoted() {
    for (auto& [id, info] : controllers_) {
        info.voted = false;
        if (info.state == ControllerState::VOTED) {
            info.state = ControllerState::CONNECTED;
        }
    }
}

const ControllerInfo* ControllerRegistry::find(ControllerId id) const {
    auto it = controllers_.find(id);
    return it == controllers_.end() ? nullptr : &it->second;
}

ControllerInfo* ControllerRegistry::lookup(ControllerId id) {
    auto it = controllers_.find(id);
    return it == controllers_.end() ? nullptr : &it->second;
}

std::vector<ControllerInfo> ControllerRegistry::snapshot() const {
    std::vector<ControllerInfo> out;
    out.reserve(controllers_.size());
    for (const auto& [id, info] : controllers_) {
        out.push_back(info);
    }
    return out;
}

} // namespace protocol
} // namespace votelink
