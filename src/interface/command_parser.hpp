// Operator command parsing
// One command per line, case-insensitive keyword, space-separated arguments

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace votelink {
namespace interface {

// Commands accepted by the coordinator console
enum class Command {
    // Registry
    Register,       // REGISTER <id>
    Deregister,     // DEREGISTER <id>

    // Round control
    Start,          // START [seconds] [ballot text]
    Close,          // CLOSE - force close (abort)
    Archive,        // ARCHIVE

    // Results and status
    Tally,          // TALLY [round]
    Report,         // REPORT [round]
    State,          // STATE
    Controllers,    // CONTROLLERS
    Stats,          // STATS

    // Simulation hooks
    Connect,        // CONNECT <id>
    Disconnect,     // DISCONNECT <id>
    Vote,           // VOTE <id> <YES|NO|n>
    Wait,           // WAIT <ms> - advance the simulated clock

    Quit,           // QUIT / EXIT

    Unknown
};

// Parsed command with arguments
struct ParsedCommand {
    Command cmd = Command::Unknown;
    std::string args;

    // Whitespace-separated words of args
    std::vector<std::string> words() const;

    // n-th word as a number; empty when missing or not a number
    std::optional<uint32_t> wordAsUint32(size_t index) const;

    // Everything after the n-th word, trimmed
    std::string restAfter(size_t index) const;

    uint32_t argAsUint32(uint32_t default_val = 0) const;
};

// Command parser with buffering for partial lines
class CommandParser {
public:
    CommandParser() = default;

    // Parse incoming data, return complete commands
    std::vector<ParsedCommand> parse(const std::string& data);

    // Clear internal buffer
    void clear();

    static ParsedCommand parseLine(const std::string& line);

private:
    std::string buffer_;
};

// YES / NO / Y / N / decimal 0-255
std::optional<uint8_t> parseChoice(const std::string& word);

// Command to string (for debugging)
const char* commandToString(Command cmd);

} // namespace interface
} // namespace votelink
