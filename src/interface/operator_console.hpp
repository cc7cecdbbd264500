// OperatorConsole - line-oriented control surface for the coordinator
// Commands in, CR-terminated responses out

#pragma once

#include "command_parser.hpp"
#include "response.hpp"
#include "votelink/types.hpp"

#include <iosfwd>
#include <string>

// Forward declarations
namespace votelink {
namespace protocol {
    class VoteCoordinator;
}
namespace sim {
    class SimulatedLink;
}
}

namespace votelink {
namespace interface {

class OperatorConsole {
public:
    OperatorConsole() = default;

    // Non-copyable
    OperatorConsole(const OperatorConsole&) = delete;
    OperatorConsole& operator=(const OperatorConsole&) = delete;

    // Bind to existing components (not owned)
    void bindCoordinator(protocol::VoteCoordinator* coordinator) { coordinator_ = coordinator; }

    // Simulation hooks (CONNECT, DISCONNECT, VOTE, WAIT) need a simulated link
    void bindSimulatedLink(sim::SimulatedLink* link) { link_ = link; }

    void setDefaultBallot(const std::string& ballot) { default_ballot_ = ballot; }

    // Execute one parsed command
    Response handleCommand(const ParsedCommand& cmd);

    // Feed raw input; responses for every complete line are written to out.
    // Returns false once QUIT has been seen.
    bool processInput(const std::string& data, std::ostream& out);

    // Read commands until end of input or QUIT
    void run(std::istream& in, std::ostream& out);

    TimestampMs now() const { return now_ms_; }

private:
    protocol::VoteCoordinator* coordinator_ = nullptr;
    sim::SimulatedLink* link_ = nullptr;
    CommandParser parser_;

    std::string default_ballot_ = "Proceed?";
    TimestampMs now_ms_ = 0;
    static constexpr uint32_t STEP_MS = 10;
    static constexpr uint32_t MAX_ROUND_SECONDS = 7 * 24 * 3600;

    // Let the link and the coordinator catch up with the console clock
    void pump();

    Response handleRegister(const ParsedCommand& cmd);
    Response handleDeregister(const ParsedCommand& cmd);
    Response handleStart(const ParsedCommand& cmd);
    Response handleClose();
    Response handleArchive();
    Response handleTally(const ParsedCommand& cmd);
    Response handleReport(const ParsedCommand& cmd);
    Response handleState();
    Response handleControllers();
    Response handleStats();
    Response handleConnect(const ParsedCommand& cmd, bool up);
    Response handleVote(const ParsedCommand& cmd);
    Response handleWait(const ParsedCommand& cmd);
};

} // namespace interface
} // namespace votelink
