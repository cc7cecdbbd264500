#include "vote_ledger.hpp"
#include "votelink/logging.hpp"

namespace votelink {
namespace protocol {

const char* ledgerErrorToString(LedgerError err) {
    switch (err) {
        case LedgerError::None:           return "None";
        case LedgerError::AlreadyVoted:   return "Already voted";
        case LedgerError::WrongRound:     return "Wrong round";
        case LedgerError::RoundNotClosed: return "Round not closed";
        case LedgerError::StaleSequence:  return "Stale sequence";
        default: return "Unknown error";
    }
}

VoteLedger::VoteLedger(ControllerRegistry& registry)
    : registry_(registry)
{
}

void VoteLedger::openRound(RoundId round_id) {
    records_.clear();
    round_id_ = round_id;
    closed_ = false;
}

void VoteLedger::closeRound() {
    if (round_id_) {
        closed_ = true;
    }
}

void VoteLedger::clear() {
    records_.clear();
    round_id_.reset();
    closed_ = false;
}

LedgerError VoteLedger::record(ControllerId controller, RoundId round_id, Choice choice, Sequence seq) {
    if (!isOpen() || *round_id_ != round_id) {
        return LedgerError::WrongRound;
    }

    // Sequence first: a newer retransmit from a controller that already voted
    // still advances its stored sequence, but never replaces the vote.
    bool fresh = registry_.acceptSequence(controller, seq);
    bool voted = records_.count(controller) != 0;

    if (voted) {
        return LedgerError::AlreadyVoted;
    }
    if (!fresh) {
        return LedgerError::StaleSequence;
    }

    VoteRecord rec;
    rec.controller = controller;
    rec.round_id = round_id;
    rec.choice = choice;
    rec.sequence = seq;
    records_.emplace(controller, rec);
    registry_.markVoted(controller);

    LOG_PROTO(DEBUG, "Ledger: round %u controller %u voted %u (seq=%u, %zu votes)",
              round_id, controller, static_cast<unsigned>(choice), seq, records_.size());
    return LedgerError::None;
}

bool VoteLedger::hasVoted(ControllerId controller) const {
    return records_.count(controller) != 0;
}

std::vector<VoteRecord> VoteLedger::records() const {
    std::vector<VoteRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, rec] : records_) {
        out.push_back(rec);
    }
    return out;
}

LedgerError VoteLedger::tally(RoundId round_id, Tally& out) const {
    out.clear();
    if (!round_id_ || *round_id_ != round_id) {
        return LedgerError::WrongRound;
    }
    if (!closed_) {
        return LedgerError::RoundNotClosed;
    }
    for (const auto& [id, rec] : records_) {
        out[rec.choice]++;
    }
    return LedgerError::None;
}

} // namespace protocol
} // namespace votelink
