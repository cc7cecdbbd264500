// Operator command parsing implementation

#include "command_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace votelink {
namespace interface {

// Helper: convert string to uppercase
static std::string toUpper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// Helper: trim whitespace
static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Helper: strict decimal parse, whole string must be digits
static std::optional<uint32_t> toUint32(const std::string& s) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    errno = 0;
    unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
    if (errno == ERANGE || v > 0xFFFFFFFFull) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(v);
}

std::vector<std::string> ParsedCommand::words() const {
    std::vector<std::string> result;
    std::istringstream ss(args);
    std::string word;
    while (ss >> word) {
        result.push_back(word);
    }
    return result;
}

std::optional<uint32_t> ParsedCommand::wordAsUint32(size_t index) const {
    std::vector<std::string> w = words();
    if (index >= w.size()) {
        return std::nullopt;
    }
    return toUint32(w[index]);
}

std::string ParsedCommand::restAfter(size_t index) const {
    size_t pos = 0;
    for (size_t i = 0; i <= index; i++) {
        pos = args.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) return "";
        pos = args.find_first_of(" \t", pos);
        if (pos == std::string::npos) return "";
    }
    return trim(args.substr(pos));
}

uint32_t ParsedCommand::argAsUint32(uint32_t default_val) const {
    std::optional<uint32_t> v = wordAsUint32(0);
    return v ? *v : default_val;
}

std::optional<uint8_t> parseChoice(const std::string& word) {
    std::string upper = toUpper(trim(word));
    if (upper == "YES" || upper == "Y" || upper == "GREEN") return static_cast<uint8_t>(1);
    if (upper == "NO" || upper == "N" || upper == "RED") return static_cast<uint8_t>(0);

    std::optional<uint32_t> v = toUint32(upper);
    if (!v || *v > 255) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(*v);
}

std::vector<ParsedCommand> CommandParser::parse(const std::string& data) {
    buffer_ += data;

    std::vector<ParsedCommand> commands;

    // Extract complete lines (terminated by \r or \n)
    size_t pos;
    while ((pos = buffer_.find_first_of("\r\n")) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_ = buffer_.substr(pos + 1);

        // Skip empty lines and comments (scripts)
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        commands.push_back(parseLine(line));
    }

    return commands;
}

void CommandParser::clear() {
    buffer_.clear();
}

ParsedCommand CommandParser::parseLine(const std::string& line) {
    ParsedCommand result;

    // Split into command and arguments
    std::string trimmed = trim(line);
    size_t space_pos = trimmed.find_first_of(" \t");
    std::string cmd_str;

    if (space_pos != std::string::npos) {
        cmd_str = toUpper(trimmed.substr(0, space_pos));
        result.args = trim(trimmed.substr(space_pos + 1));
    } else {
        cmd_str = toUpper(trimmed);
    }

    if (cmd_str == "REGISTER" || cmd_str == "REG") {
        result.cmd = Command::Register;
    } else if (cmd_str == "DEREGISTER" || cmd_str == "UNREGISTER") {
        result.cmd = Command::Deregister;
    } else if (cmd_str == "START") {
        result.cmd = Command::Start;
    } else if (cmd_str == "CLOSE" || cmd_str == "ABORT") {
        result.cmd = Command::Close;
    } else if (cmd_str == "ARCHIVE") {
        result.cmd = Command::Archive;
    } else if (cmd_str == "TALLY") {
        result.cmd = Command::Tally;
    } else if (cmd_str == "REPORT" || cmd_str == "RESULTS") {
        result.cmd = Command::Report;
    } else if (cmd_str == "STATE") {
        result.cmd = Command::State;
    } else if (cmd_str == "CONTROLLERS" || cmd_str == "LIST") {
        result.cmd = Command::Controllers;
    } else if (cmd_str == "STATS") {
        result.cmd = Command::Stats;
    } else if (cmd_str == "CONNECT") {
        result.cmd = Command::Connect;
    } else if (cmd_str == "DISCONNECT") {
        result.cmd = Command::Disconnect;
    } else if (cmd_str == "VOTE") {
        result.cmd = Command::Vote;
    } else if (cmd_str == "WAIT") {
        result.cmd = Command::Wait;
    } else if (cmd_str == "QUIT" || cmd_str == "EXIT") {
        result.cmd = Command::Quit;
    } else {
        result.cmd = Command::Unknown;
        result.args = trimmed;  // Store original line for unknown commands
    }

    return result;
}

const char* commandToString(Command cmd) {
    switch (cmd) {
        case Command::Register: return "REGISTER";
        case Command::Deregister: return "DEREGISTER";
        case Command::Start: return "START";
        case Command::Close: return "CLOSE";
        case Command::Archive: return "ARCHIVE";
        case Command::Tally: return "TALLY";
        case Command::Report: return "REPORT";
        case Command::State: return "STATE";
        case Command::Controllers: return "CONTROLLERS";
        case Command::Stats: return "STATS";
        case Command::Connect: return "CONNECT";
        case Command::Disconnect: return "DISCONNECT";
        case Command::Vote: return "VOTE";
        case Command::Wait: return "WAIT";
        case Command::Quit: return "QUIT";
        case Command::Unknown: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

} // namespace interface
} // namespace votelink
