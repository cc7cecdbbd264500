#include "retry_manager.hpp"
#include "votelink/logging.hpp"

namespace votelink {
namespace protocol {

const char* retryActionToString(RetryAction action) {
    switch (action) {
        case RetryAction::RESEND: return "RESEND";
        case RetryAction::EXPIRE: return "EXPIRE";
        default: return "UNKNOWN";
    }
}

RetryManager::RetryManager(const RetryConfig& config)
    : config_(config)
{
}

uint32_t RetryManager::backoffForAttempt(uint32_t attempt) const {
    if (attempt >= 31) {
        return config_.max_backoff_ms;
    }
    uint64_t wait = static_cast<uint64_t>(config_.base_backoff_ms) << attempt;
    return static_cast<uint32_t>(std::min<uint64_t>(wait, config_.max_backoff_ms));
}

bool RetryManager::schedule(ControllerId controller, RoundId round_id, TimestampMs now_ms) {
    if (pending_.count(controller)) {
        return false;
    }

    PendingPrompt p;
    p.controller = controller;
    p.round_id = round_id;
    p.attempts = 0;
    p.next_retry_ms = now_ms + backoffForAttempt(0);
    pending_.emplace(controller, p);
    stats_.scheduled++;

    LOG_PROTO(DEBUG, "Retry: scheduled controller %u round %u, due at %llu ms",
              controller, round_id, static_cast<unsigned long long>(p.next_retry_ms));
    return true;
}

std::vector<DuePrompt> RetryManager::tick(TimestampMs now_ms) {
    std::vector<DuePrompt> due;

    for (auto it = pending_.begin(); it != pending_.end();) {
        PendingPrompt& p = it->second;
        if (now_ms < p.next_retry_ms) {
            ++it;
            continue;
        }

        DuePrompt d;
        d.controller = p.controller;
        d.round_id = p.round_id;

        if (p.attempts >= config_.max_attempts) {
            d.attempt = p.attempts;
            d.action = RetryAction::EXPIRE;
            stats_.expired++;
            LOG_PROTO(INFO, "Retry: controller %u expired after %u retries",
                      p.controller, p.attempts);
            it = pending_.erase(it);
            due.push_back(d);
            continue;
        }

        p.attempts++;
        p.next_retry_ms = now_ms + backoffForAttempt(p.attempts);
        stats_.retries++;

        d.attempt = p.attempts;
        d.action = RetryAction::RESEND;
        LOG_PROTO(DEBUG, "Retry: controller %u retransmit %u/%u, next in %u ms",
                  p.controller, p.attempts, config_.max_attempts, backoffForAttempt(p.attempts));
        due.push_back(d);
        ++it;
    }

    return due;
}

bool RetryManager::cancel(ControllerId controller, RoundId round_id) {
    auto it = pending_.find(controller);
    if (it == pending_.end() || it->second.round_id != round_id) {
        return false;
    }
    pending_.erase(it);
    stats_.cancelled++;
    return true;
}

void RetryManager::clear() {
    pending_.clear();
}

bool RetryManager::isPending(ControllerId controller) const {
    return pending_.count(controller) != 0;
}

const PendingPrompt* RetryManager::find(ControllerId controller) const {
    auto it = pending_.find(controller);
    return it == pending_.end() ? nullptr : &it->second;
}

std::optional<TimestampMs> RetryManager::nextDeadline() const {
    std::optional<TimestampMs> earliest;
    for (const auto& [id, p] : pending_) {
        if (!earliest || p.next_retry_ms < *earliest) {
            earliest = p.next_retry_ms;
        }
    }
    return earliest;
}

} // namespace protocol
} // namespace votelink
