#include "simulated_link.hpp"
#include "votelink/logging.hpp"
#include <algorithm>

namespace votelink {
namespace sim {

namespace wire = protocol::wire;
using transport::TransportError;
using transport::TransportEvent;

// =============================================================================
// SIMULATED CONTROLLER
// =============================================================================

SimController::SimController(ControllerId id, std::optional<Choice> choice)
    : id_(id), choice_(choice)
{
}

void SimController::onFrame(ByteSpan frame, size_t max_frame_size, std::vector<Bytes>& out) {
    wire::Message msg;
    if (wire::decode(frame, msg) != wire::CodecError::None) {
        LOG_LINK(WARN, "Controller %u: undecodable %zu-byte frame", id_, frame.size());
        return;
    }

    switch (msg.kind) {
        case wire::MessageKind::PROMPT: {
            prompts_seen_++;
            if (silent_) return;

            if (msg.round_id != round_) {
                round_ = msg.round_id;
                sequence_++;
                done_ = false;
                acked_ = false;
                ByteSpan ballot = msg.ballotView();
                ballot_.assign(ballot.begin(), ballot.end());
            }
            if (!done_ && choice_) {
                emitVote(*choice_, max_frame_size, out);
            }
            break;
        }

        case wire::MessageKind::ACK:
            if (msg.round_id == round_ && msg.sequence == sequence_) {
                done_ = true;
                acked_ = true;
                LOG_LINK(DEBUG, "Controller %u: vote acknowledged (round %u)", id_, round_);
            }
            break;

        case wire::MessageKind::CLOSE:
            closes_seen_++;
            if (msg.round_id == round_) {
                done_ = true;
            }
            break;

        case wire::MessageKind::RESET:
            resets_seen_++;
            ballot_.clear();
            break;

        default:
            break;
    }
}

bool SimController::castVote(Choice choice, size_t max_frame_size, std::vector<Bytes>& out) {
    if (silent_ || round_ == 0 || done_) {
        return false;
    }
    return emitVote(choice, max_frame_size, out);
}

bool SimController::emitVote(Choice choice, size_t max_frame_size, std::vector<Bytes>& out) {
    Bytes frame;
    wire::Message vote = wire::Message::makeVote(round_, sequence_, choice);
    if (wire::encode(vote, max_frame_size, frame) != wire::CodecError::None) {
        LOG_LINK(ERROR, "Controller %u: vote does not fit %zu-byte frame", id_, max_frame_size);
        return false;
    }
    out.push_back(std::move(frame));
    votes_sent_++;
    return true;
}

// =============================================================================
// SIMULATED LINK
// =============================================================================

SimulatedLink::SimulatedLink(size_t max_frame_size, uint32_t seed)
    : max_frame_size_(max_frame_size), seed_(seed), rng_(seed)
{
}

SimController& SimulatedLink::addController(ControllerId id, std::optional<Choice> choice) {
    auto it = controllers_.find(id);
    if (it == controllers_.end()) {
        it = controllers_.emplace(id, SimController(id, choice)).first;
        up_[id] = false;
    }
    return it->second;
}

SimController* SimulatedLink::controller(ControllerId id) {
    auto it = controllers_.find(id);
    return it == controllers_.end() ? nullptr : &it->second;
}

std::vector<ControllerId> SimulatedLink::controllerIds() const {
    std::vector<ControllerId> ids;
    for (const auto& [id, c] : controllers_) {
        ids.push_back(id);
    }
    return ids;
}

bool SimulatedLink::connect(ControllerId id) {
    if (!controllers_.count(id) || up_[id]) {
        return false;
    }
    up_[id] = true;
    uplink_.emplace(now_ms_, InFlight{id, TransportEvent::Type::CONNECTED, {}});
    LOG_LINK(INFO, "Link: controller %u up", id);
    return true;
}

bool SimulatedLink::disconnect(ControllerId id) {
    if (!controllers_.count(id) || !up_[id]) {
        return false;
    }
    up_[id] = false;
    uplink_.emplace(now_ms_, InFlight{id, TransportEvent::Type::DISCONNECTED, {}});
    LOG_LINK(INFO, "Link: controller %u down", id);
    return true;
}

bool SimulatedLink::isUp(ControllerId id) const {
    auto it = up_.find(id);
    return it != up_.end() && it->second;
}

bool SimulatedLink::castVote(ControllerId id, Choice choice) {
    SimController* c = controller(id);
    if (!c) {
        return false;
    }

    std::vector<Bytes> replies;
    if (!c->castVote(choice, max_frame_size_, replies)) {
        return false;
    }
    if (!isUp(id)) {
        stats_.lost_link_down += replies.size();
        return false;
    }
    for (const Bytes& reply : replies) {
        stats_.uplink_sent++;
        transmit(uplink_, now_ms_, id, reply);
    }
    return true;
}

void SimulatedLink::injectFrame(ControllerId id, Bytes frame) {
    uplink_.emplace(now_ms_, InFlight{id, TransportEvent::Type::FRAME, std::move(frame)});
}

TransportError SimulatedLink::send(ControllerId controller, ByteSpan frame) {
    if (frame.size() > max_frame_size_) {
        stats_.rejected++;
        return TransportError::FrameTooLarge;
    }
    if (!controllers_.count(controller)) {
        stats_.rejected++;
        return TransportError::UnknownController;
    }
    if (!isUp(controller)) {
        stats_.rejected++;
        return TransportError::NotConnected;
    }

    stats_.downlink_sent++;
    transmit(downlink_, now_ms_, controller, Bytes(frame.begin(), frame.end()));
    return TransportError::None;
}

bool SimulatedLink::pollEvent(TransportEvent& event) {
    while (!uplink_.empty()) {
        auto it = uplink_.begin();
        if (it->first > now_ms_) {
            return false;
        }

        InFlight item = std::move(it->second);
        uplink_.erase(it);

        // Frames from a controller whose link went down in flight are lost
        if (item.type == TransportEvent::Type::FRAME && !isUp(item.controller)) {
            stats_.lost_link_down++;
            continue;
        }

        event.type = item.type;
        event.controller = item.controller;
        event.data = std::move(item.data);
        if (item.type == TransportEvent::Type::FRAME) {
            stats_.delivered++;
        }
        return true;
    }
    return false;
}

void SimulatedLink::advance(TimestampMs now_ms) {
    if (now_ms > now_ms_) {
        now_ms_ = now_ms;
    }

    while (!downlink_.empty() && downlink_.begin()->first <= now_ms_) {
        auto it = downlink_.begin();
        TimestampMs at_ms = it->first;
        InFlight item = std::move(it->second);
        downlink_.erase(it);

        SimController* c = controller(item.controller);
        if (!c || !isUp(item.controller)) {
            stats_.lost_link_down++;
            continue;
        }
        stats_.delivered++;

        std::vector<Bytes> replies;
        c->onFrame(item.data, max_frame_size_, replies);
        for (const Bytes& reply : replies) {
            stats_.uplink_sent++;
            transmit(uplink_, at_ms, item.controller, reply);
        }
    }
}

TimestampMs SimulatedLink::deliveryTime(TimestampMs at_ms) {
    TimestampMs when = at_ms + impairments_.latency_ms;
    if (impairments_.reorder_prob > 0.0f && unit_(rng_) < impairments_.reorder_prob) {
        std::uniform_int_distribution<uint32_t> jitter(1, std::max<uint32_t>(1, impairments_.reorder_jitter_ms));
        when += jitter(rng_);
        stats_.reordered++;
    }
    return when;
}

void SimulatedLink::transmit(std::multimap<TimestampMs, InFlight>& queue, TimestampMs at_ms,
                             ControllerId id, const Bytes& frame) {
    if (impairments_.drop_prob > 0.0f && unit_(rng_) < impairments_.drop_prob) {
        stats_.dropped++;
        LOG_LINK(TRACE, "Link: dropped %zu-byte frame for controller %u", frame.size(), id);
        return;
    }

    queue.emplace(deliveryTime(at_ms), InFlight{id, TransportEvent::Type::FRAME, frame});

    if (impairments_.duplicate_prob > 0.0f && unit_(rng_) < impairments_.duplicate_prob) {
        stats_.duplicated++;
        queue.emplace(deliveryTime(at_ms), InFlight{id, TransportEvent::Type::FRAME, frame});
    }
}

} // namespace sim
} // namespace votelink
