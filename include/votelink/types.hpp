#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace votelink {

// Core types
using Bytes = std::vector<uint8_t>;            // Frame / payload buffer
using ByteSpan = std::span<const uint8_t>;     // Zero-copy view for decode paths
using MutableByteSpan = std::span<uint8_t>;

using ControllerId = uint16_t;                 // Short id assigned at registration
using RoundId = uint32_t;                      // Monotonic per coordinator lifetime
using Sequence = uint32_t;                     // Per-controller monotonic counter
using Choice = uint8_t;                        // Ballot option chosen by a voter
using TimestampMs = uint64_t;                  // Monotonic milliseconds

// Two-button controllers (red = NO, green = YES)
constexpr Choice CHOICE_NO = 0;
constexpr Choice CHOICE_YES = 1;

inline const char* choiceToString(Choice choice) {
    switch (choice) {
        case CHOICE_NO:  return "NO";
        case CHOICE_YES: return "YES";
        default: return "OTHER";
    }
}

// Whether the closed-round report names who voted for what
enum class ReportingMode : uint8_t {
    PUBLIC = 0,      // Report carries per-controller ballots
    ANONYMOUS = 1,   // Report carries counts only
};

inline const char* reportingModeToString(ReportingMode mode) {
    switch (mode) {
        case ReportingMode::PUBLIC:    return "PUBLIC";
        case ReportingMode::ANONYMOUS: return "ANONYMOUS";
        default: return "UNKNOWN";
    }
}

// Whether a round has a deadline
enum class TimingMode : uint8_t {
    TIMED = 0,       // Round closes at its deadline at the latest
    INFINITE = 1,    // Round closes only when everyone voted/expired, or on abort
};

inline const char* timingModeToString(TimingMode mode) {
    switch (mode) {
        case TimingMode::TIMED:    return "TIMED";
        case TimingMode::INFINITE: return "INFINITE";
        default: return "UNKNOWN";
    }
}

// Coordinator configuration
struct CoordinatorConfig {
    // Link parameters
    // BLE default ATT_MTU is 23; 3 bytes go to the ATT header
    uint32_t max_frame_size = 20;      // Largest frame the transport carries
    uint32_t max_controllers = 5;      // Registry bound (link concurrent-connection limit)
    bool auto_register = true;         // Register unknown controllers on first connect

    // Prompt retry policy
    // Retry n waits min(base_backoff_ms << n, max_backoff_ms)
    uint32_t base_backoff_ms = 500;
    uint32_t max_backoff_ms = 4000;
    uint32_t max_attempts = 5;         // Retransmissions before a controller expires

    // Round policy
    uint32_t default_round_ms = 30000; // Used when START gives no duration in TIMED mode
    ReportingMode reporting_mode = ReportingMode::PUBLIC;
    TimingMode timing_mode = TimingMode::TIMED;
    bool broadcast_reset_on_archive = true;  // Tell controllers to clear their indicators

    // Largest ballot payload that still fits one Prompt frame
    // Prompt = kind(1) + round(4) + length(1) + payload
    uint32_t getMaxBallotSize() const {
        constexpr uint32_t PROMPT_OVERHEAD = 6;
        if (max_frame_size <= PROMPT_OVERHEAD) return 0;
        uint32_t room = max_frame_size - PROMPT_OVERHEAD;
        return room > 255 ? 255 : room;
    }

    // Longest a silent controller can hold a round open after its first prompt
    uint64_t getRetryBudgetMs() const {
        uint64_t total = 0;
        for (uint32_t attempt = 0; attempt <= max_attempts; attempt++) {
            uint64_t wait = (attempt < 32) ? (static_cast<uint64_t>(base_backoff_ms) << attempt)
                                           : max_backoff_ms;
            total += (wait < max_backoff_ms) ? wait : max_backoff_ms;
        }
        return total;
    }
};

// Coordinator statistics
struct SessionStats {
    uint64_t prompts_sent = 0;
    uint64_t prompt_retries = 0;
    uint64_t controllers_expired = 0;
    uint64_t votes_accepted = 0;
    uint64_t duplicates_dropped = 0;
    uint64_t wrong_round_votes = 0;
    uint64_t malformed_frames = 0;
    uint64_t unknown_frames = 0;
    uint64_t send_failures = 0;
    uint64_t rounds_closed = 0;
    uint64_t rounds_aborted = 0;
};

// Policy presets
namespace presets {

// Balanced: defaults, good for a room-sized BLE star
inline CoordinatorConfig balanced() {
    return CoordinatorConfig{};
}

// Lossy link: more patience before expiring a controller
inline CoordinatorConfig lossyLink() {
    CoordinatorConfig cfg;
    cfg.base_backoff_ms = 750;
    cfg.max_backoff_ms = 6000;
    cfg.max_attempts = 8;
    return cfg;
}

// Low power: fewer, slower retries so controllers can sleep between prompts
inline CoordinatorConfig lowPower() {
    CoordinatorConfig cfg;
    cfg.base_backoff_ms = 2000;
    cfg.max_backoff_ms = 8000;
    cfg.max_attempts = 3;
    return cfg;
}

inline CoordinatorConfig forName(const std::string& name) {
    if (name == "lossy") return lossyLink();
    if (name == "lowpower") return lowPower();
    return balanced();
}

} // namespace presets

} // namespace votelink
