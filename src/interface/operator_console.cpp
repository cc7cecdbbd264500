// OperatorConsole implementation

#include "operator_console.hpp"
#include "protocol/vote_coordinator.hpp"
#include "sim/simulated_link.hpp"
#include "votelink/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <istream>
#include <ostream>

namespace votelink {
namespace interface {

using protocol::LedgerError;
using protocol::RegistryError;
using protocol::SessionError;

namespace {

std::optional<ControllerId> controllerArg(const ParsedCommand& cmd, size_t index) {
    std::optional<uint32_t> v = cmd.wordAsUint32(index);
    if (!v || *v > 0xFFFF) {
        return std::nullopt;
    }
    return static_cast<ControllerId>(*v);
}

// Several display lines in one response
Response lines(const std::vector<std::string>& text) {
    std::string joined;
    for (size_t i = 0; i < text.size(); i++) {
        if (i) joined += "\r";
        joined += text[i];
    }
    return Response::custom(joined);
}

} // namespace

Response OperatorConsole::handleCommand(const ParsedCommand& cmd) {
    if (!coordinator_) {
        return Response::error("Not initialized");
    }

    switch (cmd.cmd) {
        case Command::Register:
            return handleRegister(cmd);
        case Command::Deregister:
            return handleDeregister(cmd);
        case Command::Start:
            return handleStart(cmd);
        case Command::Close:
            return handleClose();
        case Command::Archive:
            return handleArchive();
        case Command::Tally:
            return handleTally(cmd);
        case Command::Report:
            return handleReport(cmd);
        case Command::State:
            return handleState();
        case Command::Controllers:
            return handleControllers();
        case Command::Stats:
            return handleStats();
        case Command::Connect:
            return handleConnect(cmd, true);
        case Command::Disconnect:
            return handleConnect(cmd, false);
        case Command::Vote:
            return handleVote(cmd);
        case Command::Wait:
            return handleWait(cmd);
        case Command::Quit:
            return Response::close();
        case Command::Unknown:
        default:
            return Response::error("Unknown command: " + cmd.args);
    }
}

bool OperatorConsole::processInput(const std::string& data, std::ostream& out) {
    for (const ParsedCommand& cmd : parser_.parse(data)) {
        LOG_SESSION(DEBUG, "Console: %s %s", commandToString(cmd.cmd), cmd.args.c_str());
        Response response = handleCommand(cmd);
        out << response.toString() << "\n";
        if (response.shouldClose()) {
            return false;
        }
    }
    return true;
}

void OperatorConsole::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        if (!processInput(line + "\n", out)) {
            return;
        }
    }
}

void OperatorConsole::pump() {
    if (link_) {
        link_->advance(now_ms_);
    }
    coordinator_->runOnce(now_ms_);
}

// =============================================================================
// REGISTRY
// =============================================================================

Response OperatorConsole::handleRegister(const ParsedCommand& cmd) {
    std::optional<ControllerId> id = controllerArg(cmd, 0);
    if (!id) {
        return Response::error("Usage: REGISTER <id>");
    }
    RegistryError err = coordinator_->registerController(*id);
    if (err != RegistryError::None) {
        return Response::error(protocol::registryErrorToString(err));
    }
    if (link_) {
        link_->addController(*id, std::nullopt);
    }
    return Response::ok();
}

Response OperatorConsole::handleDeregister(const ParsedCommand& cmd) {
    std::optional<ControllerId> id = controllerArg(cmd, 0);
    if (!id) {
        return Response::error("Usage: DEREGISTER <id>");
    }
    RegistryError err = coordinator_->deregisterController(*id);
    if (err != RegistryError::None) {
        return Response::error(protocol::registryErrorToString(err));
    }
    return Response::ok();
}

// =============================================================================
// ROUND CONTROL
// =============================================================================

Response OperatorConsole::handleStart(const ParsedCommand& cmd) {
    uint32_t duration_ms = 0;
    std::string ballot = cmd.args;

    std::optional<uint32_t> seconds = cmd.wordAsUint32(0);
    if (seconds) {
        if (*seconds > MAX_ROUND_SECONDS) {
            return Response::error("Duration out of range");
        }
        duration_ms = *seconds * 1000;
        ballot = cmd.restAfter(0);
    }
    if (ballot.empty()) {
        ballot = default_ballot_;
    }

    Bytes payload(ballot.begin(), ballot.end());
    SessionError err = coordinator_->startRound(payload, duration_ms);
    if (err != SessionError::None) {
        return Response::error(protocol::sessionErrorToString(err));
    }
    pump();
    return Response::round(coordinator_->currentRoundId());
}

Response OperatorConsole::handleClose() {
    SessionError err = coordinator_->forceClose();
    if (err != SessionError::None) {
        return Response::error(protocol::sessionErrorToString(err));
    }
    pump();
    return Response::ok();
}

Response OperatorConsole::handleArchive() {
    SessionError err = coordinator_->archive();
    if (err != SessionError::None) {
        return Response::error(protocol::sessionErrorToString(err));
    }
    pump();
    return Response::ok();
}

// =============================================================================
// RESULTS AND STATUS
// =============================================================================

Response OperatorConsole::handleTally(const ParsedCommand& cmd) {
    RoundId round_id = cmd.argAsUint32(coordinator_->currentRoundId());
    protocol::Tally tally;
    LedgerError err = coordinator_->tally(round_id, tally);
    if (err != LedgerError::None) {
        return Response::error(protocol::ledgerErrorToString(err));
    }
    return Response::tally(round_id, tally);
}

Response OperatorConsole::handleReport(const ParsedCommand& cmd) {
    RoundId round_id = cmd.argAsUint32(coordinator_->currentRoundId());
    protocol::RoundReport report;
    LedgerError err = coordinator_->report(round_id, report);
    if (err != LedgerError::None) {
        return Response::error(protocol::ledgerErrorToString(err));
    }
    return lines(protocol::formatReport(report));
}

Response OperatorConsole::handleState() {
    return Response::state(protocol::sessionStateToString(coordinator_->getState()),
                           coordinator_->currentRoundId());
}

Response OperatorConsole::handleControllers() {
    std::vector<std::string> text;
    char buf[96];
    for (const protocol::ControllerInfo& c : coordinator_->controllers()) {
        snprintf(buf, sizeof(buf), "%u %s seq=%u", c.id,
                 protocol::controllerStateToString(c.state), c.last_sequence);
        text.push_back(buf);
    }
    if (text.empty()) {
        text.push_back("(none)");
    }
    return lines(text);
}

Response OperatorConsole::handleStats() {
    SessionStats s = coordinator_->getStats();
    char buf[256];
    snprintf(buf, sizeof(buf),
             "prompts=%llu retries=%llu expired=%llu votes=%llu duplicates=%llu "
             "wrong_round=%llu malformed=%llu unknown=%llu send_failures=%llu closed=%llu aborted=%llu",
             static_cast<unsigned long long>(s.prompts_sent),
             static_cast<unsigned long long>(s.prompt_retries),
             static_cast<unsigned long long>(s.controllers_expired),
             static_cast<unsigned long long>(s.votes_accepted),
             static_cast<unsigned long long>(s.duplicates_dropped),
             static_cast<unsigned long long>(s.wrong_round_votes),
             static_cast<unsigned long long>(s.malformed_frames),
             static_cast<unsigned long long>(s.unknown_frames),
             static_cast<unsigned long long>(s.send_failures),
             static_cast<unsigned long long>(s.rounds_closed),
             static_cast<unsigned long long>(s.rounds_aborted));
    return Response::custom(buf);
}

// =============================================================================
// SIMULATION HOOKS
// =============================================================================

Response OperatorConsole::handleConnect(const ParsedCommand& cmd, bool up) {
    if (!link_) {
        return Response::error("No simulated link");
    }
    std::optional<ControllerId> id = controllerArg(cmd, 0);
    if (!id) {
        return Response::error(up ? "Usage: CONNECT <id>" : "Usage: DISCONNECT <id>");
    }

    link_->addController(*id, std::nullopt);
    bool changed = up ? link_->connect(*id) : link_->disconnect(*id);
    if (!changed) {
        return Response::error(up ? "Already connected" : "Not connected");
    }
    pump();
    return Response::ok();
}

Response OperatorConsole::handleVote(const ParsedCommand& cmd) {
    if (!link_) {
        return Response::error("No simulated link");
    }
    std::vector<std::string> words = cmd.words();
    std::optional<ControllerId> id = controllerArg(cmd, 0);
    std::optional<uint8_t> choice = words.size() >= 2 ? parseChoice(words[1]) : std::nullopt;
    if (!id || !choice) {
        return Response::error("Usage: VOTE <id> <YES|NO|n>");
    }
    if (!link_->castVote(*id, *choice)) {
        return Response::error("Controller has no open prompt");
    }
    pump();
    return Response::ok();
}

Response OperatorConsole::handleWait(const ParsedCommand& cmd) {
    std::optional<uint32_t> ms = cmd.wordAsUint32(0);
    if (!ms) {
        return Response::error("Usage: WAIT <ms>");
    }

    TimestampMs until = now_ms_ + *ms;
    while (now_ms_ < until) {
        now_ms_ = std::min<TimestampMs>(now_ms_ + STEP_MS, until);
        pump();
    }
    return Response::ok();
}

} // namespace interface
} // namespace votelink
