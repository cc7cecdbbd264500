#pragma once

#include "protocol/frame.hpp"
#include "transport/transport_interface.hpp"
#include "votelink/types.hpp"
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace votelink {
namespace sim {

// Per-frame impairments, applied independently in both directions
struct LinkImpairments {
    float drop_prob = 0.0f;          // Frame lost
    float duplicate_prob = 0.0f;     // Frame delivered twice
    float reorder_prob = 0.0f;       // Frame held back by a random extra delay
    uint32_t latency_ms = 0;         // Fixed one-way delay
    uint32_t reorder_jitter_ms = 200;  // Upper bound of the extra delay
};

struct LinkStats {
    uint64_t downlink_sent = 0;      // Coordinator -> controllers
    uint64_t uplink_sent = 0;        // Controllers -> coordinator
    uint64_t dropped = 0;
    uint64_t duplicated = 0;
    uint64_t reordered = 0;
    uint64_t delivered = 0;
    uint64_t lost_link_down = 0;     // Arrived while the link was down
    uint64_t rejected = 0;           // send() returned an error
};

/**
 * Simulated voting controller
 *
 * Answers each PROMPT with a VOTE until it sees an ACK or CLOSE for that
 * round. Retransmits within a round reuse the same sequence number; a new
 * round takes the next one. A controller without a choice (manual mode)
 * records the prompt and votes once castVote() is called.
 */
class SimController {
public:
    explicit SimController(ControllerId id, std::optional<Choice> choice = CHOICE_YES);

    ControllerId id() const { return id_; }

    void setChoice(std::optional<Choice> choice) { choice_ = choice; }
    std::optional<Choice> getChoice() const { return choice_; }
    void setSilent(bool silent) { silent_ = silent; }
    bool isSilent() const { return silent_; }

    // Handle one coordinator frame. Replies are appended to out.
    void onFrame(ByteSpan frame, size_t max_frame_size, std::vector<Bytes>& out);

    // Operator button press for the current round only. Returns true if a
    // vote frame was produced.
    bool castVote(Choice choice, size_t max_frame_size, std::vector<Bytes>& out);

    // --- Indicators ---

    RoundId currentRound() const { return round_; }
    Sequence sequence() const { return sequence_; }
    bool isAcked() const { return acked_; }
    bool isDone() const { return done_; }
    const Bytes& lastBallot() const { return ballot_; }

    uint32_t promptsSeen() const { return prompts_seen_; }
    uint32_t votesSent() const { return votes_sent_; }
    uint32_t closesSeen() const { return closes_seen_; }
    uint32_t resetsSeen() const { return resets_seen_; }

private:
    ControllerId id_;
    std::optional<Choice> choice_;
    bool silent_ = false;

    RoundId round_ = 0;
    Sequence sequence_ = 0;
    bool done_ = false;
    bool acked_ = false;
    Bytes ballot_;

    uint32_t prompts_seen_ = 0;
    uint32_t votes_sent_ = 0;
    uint32_t closes_seen_ = 0;
    uint32_t resets_seen_ = 0;

    bool emitVote(Choice choice, size_t max_frame_size, std::vector<Bytes>& out);
};

/**
 * In-memory transport
 *
 * Frames travel through two seeded, impaired queues (downlink to the
 * simulated controllers, uplink to the coordinator) and are released as
 * the simulated clock passes their delivery time. Same seed, same run.
 */
class SimulatedLink : public transport::ITransport {
public:
    explicit SimulatedLink(size_t max_frame_size = 20, uint32_t seed = 42);

    // --- ITransport ---

    std::string getName() const override { return "SimulatedLink"; }
    size_t maxFrameSize() const override { return max_frame_size_; }
    transport::TransportError send(ControllerId controller, ByteSpan frame) override;
    bool pollEvent(transport::TransportEvent& event) override;

    // --- Configuration ---

    void setSeed(uint32_t seed) { seed_ = seed; rng_.seed(seed); }
    void setImpairments(const LinkImpairments& imp) { impairments_ = imp; }
    const LinkImpairments& getImpairments() const { return impairments_; }

    // --- Controllers ---

    SimController& addController(ControllerId id, std::optional<Choice> choice = CHOICE_YES);
    SimController* controller(ControllerId id);
    std::vector<ControllerId> controllerIds() const;

    // Link up/down; queues CONNECTED / DISCONNECTED for the coordinator
    bool connect(ControllerId id);
    bool disconnect(ControllerId id);
    bool isUp(ControllerId id) const;

    // Operator presses a button on a simulated controller
    bool castVote(ControllerId id, Choice choice);

    // Raw frame from a controller, bypassing impairments (tests)
    void injectFrame(ControllerId id, Bytes frame);

    // --- Clock ---

    // Deliver everything due at or before now_ms
    void advance(TimestampMs now_ms);
    TimestampMs now() const { return now_ms_; }
    size_t inFlight() const { return downlink_.size() + uplink_.size(); }

    LinkStats getStats() const { return stats_; }

private:
    struct InFlight {
        ControllerId controller = 0;
        transport::TransportEvent::Type type = transport::TransportEvent::Type::FRAME;
        Bytes data;
    };

    size_t max_frame_size_;
    uint32_t seed_;
    std::mt19937 rng_;
    std::uniform_real_distribution<float> unit_{0.0f, 1.0f};
    LinkImpairments impairments_;

    TimestampMs now_ms_ = 0;
    std::map<ControllerId, SimController> controllers_;
    std::map<ControllerId, bool> up_;

    // Keyed by delivery time; equal keys keep insertion order
    std::multimap<TimestampMs, InFlight> downlink_;
    std::multimap<TimestampMs, InFlight> uplink_;

    LinkStats stats_;

    void transmit(std::multimap<TimestampMs, InFlight>& queue, TimestampMs at_ms,
                  ControllerId id, const Bytes& frame);
    TimestampMs deliveryTime(TimestampMs at_ms);
};

} // namespace sim
} // namespace votelink
