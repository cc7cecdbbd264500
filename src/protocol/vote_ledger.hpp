#pragma once

#include "controller_registry.hpp"
#include "votelink/types.hpp"
#include <map>
#include <optional>
#include <vector>

namespace votelink {
namespace protocol {

enum class LedgerError {
    None,
    AlreadyVoted,     // Controller already has a vote in this round
    WrongRound,       // Round id mismatch, or no round open
    RoundNotClosed,   // Tally requested before the round closed
    StaleSequence,    // Sequence not newer than the last one accepted
};

const char* ledgerErrorToString(LedgerError err);

// One accepted vote. Immutable once recorded.
struct VoteRecord {
    ControllerId controller = 0;
    RoundId round_id = 0;
    Choice choice = 0;
    Sequence sequence = 0;
};

// choice -> number of votes
using Tally = std::map<Choice, uint32_t>;

/**
 * Vote Ledger
 *
 * At most one VoteRecord per (controller, round). A vote is accepted only
 * while the round is open, and only if the registry accepts its sequence
 * number. The tally is a fold over the records and is readable once the
 * round is closed. Ties are reported as-is.
 */
class VoteLedger {
public:
    explicit VoteLedger(ControllerRegistry& registry);

    // --- Round scope ---

    void openRound(RoundId round_id);
    void closeRound();
    void clear();

    std::optional<RoundId> currentRound() const { return round_id_; }
    bool isOpen() const { return round_id_.has_value() && !closed_; }
    bool isClosed() const { return round_id_.has_value() && closed_; }

    // --- Votes ---

    LedgerError record(ControllerId controller, RoundId round_id, Choice choice, Sequence seq);

    bool hasVoted(ControllerId controller) const;
    size_t voteCount() const { return records_.size(); }
    std::vector<VoteRecord> records() const;

    // --- Results ---

    LedgerError tally(RoundId round_id, Tally& out) const;

private:
    ControllerRegistry& registry_;
    std::optional<RoundId> round_id_;
    bool closed_ = false;
    std::map<ControllerId, VoteRecord> records_;
};

} // namespace protocol
} // namespace votelink
