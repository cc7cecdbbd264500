// test_retry_manager.cpp - Prompt retransmission and expiry
//
// Tests:
// 1. Backoff curve (doubling, capped)
// 2. Full retry schedule of a silent controller
// 3. Cancel stops retransmits
// 4. One pending prompt per controller
// 5. nextDeadline() and zero-attempt policy

#include "protocol/retry_manager.hpp"
#include "votelink/logging.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace votelink;
using namespace votelink::protocol;

static int pass = 0, fail = 0;

static void check(bool ok, const std::string& what) {
    if (ok) {
        std::cout << "  [PASS] " << what << "\n";
        pass++;
    } else {
        std::cout << "  [FAIL] " << what << "\n";
        fail++;
    }
}

int main() {
    std::cout << "=== Retry Manager Unit Test ===\n\n";
    setLogLevel(LogLevel::WARN);

    // ========================================================================
    // TEST 1: Backoff curve
    // ========================================================================
    std::cout << "TEST 1: Backoff curve\n";
    {
        RetryManager rm;
        const uint32_t expected[] = {500, 1000, 2000, 4000, 4000, 4000};
        bool ok = true;
        for (uint32_t n = 0; n < 6; n++) {
            uint32_t b = rm.backoffForAttempt(n);
            std::cout << "    backoff(" << n << ") = " << b << " ms\n";
            if (b != expected[n]) ok = false;
        }
        check(ok, "500, 1000, 2000, 4000, then capped at 4000");
        check(rm.backoffForAttempt(40) == 4000, "large attempt numbers do not overflow");

        CoordinatorConfig cfg;
        cfg.base_backoff_ms = 0;
        cfg.max_backoff_ms = 0;
        RetryConfig rc = RetryConfig::fromCoordinator(cfg);
        check(rc.base_backoff_ms == 1 && rc.max_backoff_ms == 1, "zero backoff clamped to 1 ms");
    }

    // ========================================================================
    // TEST 2: Silent controller
    // ========================================================================
    std::cout << "\nTEST 2: Silent controller schedule\n";
    {
        RetryManager rm;
        rm.schedule(3, 1, 0);

        std::vector<TimestampMs> resend_times;
        TimestampMs expired_at = 0;
        for (TimestampMs t = 0; t <= 20000; t += 10) {
            for (const DuePrompt& d : rm.tick(t)) {
                if (d.action == RetryAction::RESEND) {
                    resend_times.push_back(t);
                } else {
                    expired_at = t;
                }
            }
        }

        std::vector<TimestampMs> expected = {500, 1500, 3500, 7500, 11500};
        check(resend_times == expected, "retransmits at 500, 1500, 3500, 7500, 11500 ms");
        check(expired_at == 15500, "expires at 15500 ms (" + std::to_string(expired_at) + ")");

        CoordinatorConfig defaults;
        check(expired_at == defaults.getRetryBudgetMs(), "expiry time equals the retry budget");
        check(!rm.isPending(3) && rm.getStats().expired == 1 && rm.getStats().retries == 5,
              "prompt removed after expiry");
    }

    // ========================================================================
    // TEST 3: Cancel
    // ========================================================================
    std::cout << "\nTEST 3: Cancel\n";
    {
        RetryManager rm;
        rm.schedule(1, 2, 0);
        rm.schedule(2, 2, 0);

        check(!rm.cancel(1, 3), "cancel with the wrong round is ignored");
        check(rm.cancel(1, 2), "cancel with the right round removes the prompt");

        std::vector<DuePrompt> due = rm.tick(500);
        check(due.size() == 1 && due[0].controller == 2 && due[0].attempt == 1,
              "only the uncancelled prompt is retransmitted");
        check(!rm.cancel(1, 2), "second cancel finds nothing");

        rm.clear();
        check(rm.pendingCount() == 0 && rm.tick(100000).empty(), "clear() drops every prompt");
    }

    // ========================================================================
    // TEST 4: One prompt per controller
    // ========================================================================
    std::cout << "\nTEST 4: One prompt per controller\n";
    {
        RetryManager rm;
        check(rm.schedule(5, 1, 0), "first schedule");
        check(!rm.schedule(5, 1, 200), "second schedule rejected");
        check(rm.find(5)->next_retry_ms == 500, "original deadline kept");
    }

    // ========================================================================
    // TEST 5: Deadlines and zero attempts
    // ========================================================================
    std::cout << "\nTEST 5: nextDeadline and zero attempts\n";
    {
        RetryManager rm;
        check(!rm.nextDeadline(), "no deadline when idle");
        rm.schedule(1, 1, 300);
        rm.schedule(2, 1, 100);
        check(rm.nextDeadline() && *rm.nextDeadline() == 600, "earliest deadline is 600 ms");

        RetryConfig none;
        none.max_attempts = 0;
        RetryManager once(none);
        once.schedule(9, 1, 0);
        std::vector<DuePrompt> due = once.tick(500);
        check(due.size() == 1 && due[0].action == RetryAction::EXPIRE,
              "max_attempts 0 expires at the first deadline");
    }

    // ========================================================================
    // Summary
    // ========================================================================
    std::cout << "\n========================================\n";
    std::cout << "RESULTS: " << pass << " passed, " << fail << " failed\n";
    std::cout << "========================================\n";

    if (fail == 0) {
        std::cout << "\n[SUCCESS] All retry manager tests passed!\n";
        return 0;
    } else {
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
}
