#pragma once

#include "votelink/types.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <vector>

namespace votelink {
namespace protocol {

struct RetryConfig {
    uint32_t base_backoff_ms = 500;   // Wait before the first retransmit
    uint32_t max_backoff_ms = 4000;   // Cap on any single wait
    uint32_t max_attempts = 5;        // Retransmits before the controller expires

    static RetryConfig fromCoordinator(const CoordinatorConfig& cfg) {
        RetryConfig rc;
        rc.base_backoff_ms = std::max(1u, cfg.base_backoff_ms);
        rc.max_backoff_ms = std::max(rc.base_backoff_ms, cfg.max_backoff_ms);
        rc.max_attempts = cfg.max_attempts;
        return rc;
    }
};

// Prompt still waiting for a vote
struct PendingPrompt {
    ControllerId controller = 0;
    RoundId round_id = 0;
    uint32_t attempts = 0;          // Retransmits so far
    TimestampMs next_retry_ms = 0;
};

enum class RetryAction : uint8_t {
    RESEND,    // Caller retransmits the prompt
    EXPIRE,    // Attempt budget exhausted, prompt removed
};

const char* retryActionToString(RetryAction action);

struct DuePrompt {
    ControllerId controller = 0;
    RoundId round_id = 0;
    uint32_t attempt = 0;           // Retransmit number for RESEND, total for EXPIRE
    RetryAction action = RetryAction::RESEND;
};

struct RetryStats {
    uint64_t scheduled = 0;
    uint64_t retries = 0;
    uint64_t expired = 0;
    uint64_t cancelled = 0;
};

/**
 * Retry / Timeout Manager
 *
 * One Pending Prompt per controller. tick(now) returns the prompts whose
 * deadline has passed, in controller order, and advances each one:
 *   - attempts < max_attempts: attempts++, next wait = backoff(attempts), RESEND
 *   - otherwise: prompt removed, EXPIRE
 *
 * backoff(n) = min(base_backoff_ms << n, max_backoff_ms)
 *
 * No timers are armed; the caller polls with its own clock, so a simulated
 * clock drives it the same way as a real one.
 */
class RetryManager {
public:
    explicit RetryManager(const RetryConfig& config = RetryConfig{});

    void setConfig(const RetryConfig& config) { config_ = config; }
    const RetryConfig& getConfig() const { return config_; }

    // Create a prompt with attempt count 0, due at now + base_backoff_ms.
    // Returns false if the controller already has one.
    bool schedule(ControllerId controller, RoundId round_id, TimestampMs now_ms);

    std::vector<DuePrompt> tick(TimestampMs now_ms);

    bool cancel(ControllerId controller, RoundId round_id);
    void clear();

    bool isPending(ControllerId controller) const;
    size_t pendingCount() const { return pending_.size(); }
    const PendingPrompt* find(ControllerId controller) const;
    std::optional<TimestampMs> nextDeadline() const;

    uint32_t backoffForAttempt(uint32_t attempt) const;

    RetryStats getStats() const { return stats_; }
    void resetStats() { stats_ = RetryStats{}; }

private:
    RetryConfig config_;
    std::map<ControllerId, PendingPrompt> pending_;
    RetryStats stats_;
};

} // namespace protocol
} // namespace votelink
