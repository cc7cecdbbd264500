#include "settings.hpp"
#include "votelink/logging.hpp"
#include <cstdlib>
#include <fstream>

#ifdef _WIN32
#include <direct.h>
#define MKDIR(path) _mkdir(path)
#else
#include <sys/stat.h>
#define MKDIR(path) mkdir(path, 0755)
#endif

namespace votelink {
namespace config {

// Get default settings file path
// VOTELINK_CONFIG overrides it (several coordinators on one host)
std::string CoordinatorSettings::getDefaultPath() {
    const char* config_override = std::getenv("VOTELINK_CONFIG");
    if (config_override && config_override[0] != '\0') {
        return std::string(config_override);
    }

#ifdef _WIN32
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\votelink\\coordinator.ini";
    }
    return "coordinator.ini";
#else
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/votelink/coordinator.ini";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/votelink/coordinator.ini";
    }
    return "coordinator.ini";
#endif
}

// Helper to create directory if it doesn't exist
static void ensureDirectory(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos) {
        std::string dir = path.substr(0, pos);
        // Create parent directories recursively
        for (size_t i = 0; i < dir.size(); i++) {
            if (dir[i] == '/' || dir[i] == '\\') {
                std::string subdir = dir.substr(0, i);
                if (!subdir.empty()) {
                    MKDIR(subdir.c_str());
                }
            }
        }
        MKDIR(dir.c_str());
    }
}

static bool parseBool(const std::string& value) {
    return value == "1" || value == "true";
}

// Parse a positive integer within [lo, hi]; anything else keeps the default
static uint32_t parseBounded(const std::string& value, uint32_t lo, uint32_t hi, uint32_t fallback) {
    long v = std::atol(value.c_str());
    if (v < static_cast<long>(lo) || v > static_cast<long>(hi)) {
        return fallback;
    }
    return static_cast<uint32_t>(v);
}

// Save settings to INI file
bool CoordinatorSettings::save(const std::string& path) const {
    std::string filepath = path.empty() ? getDefaultPath() : path;
    ensureDirectory(filepath);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_SESSION(WARN, "Settings: cannot write %s", filepath.c_str());
        return false;
    }

    const CoordinatorConfig& c = coordinator;

    file << "[Coordinator]\n";
    file << "name=" << coordinator_name << "\n";
    file << "max_frame_size=" << c.max_frame_size << "\n";
    file << "max_controllers=" << c.max_controllers << "\n";
    file << "auto_register=" << (c.auto_register ? "1" : "0") << "\n";

    file << "\n[Retry]\n";
    file << "base_backoff_ms=" << c.base_backoff_ms << "\n";
    file << "max_backoff_ms=" << c.max_backoff_ms << "\n";
    file << "max_attempts=" << c.max_attempts << "\n";

    file << "\n[Round]\n";
    file << "default_round_ms=" << c.default_round_ms << "\n";
    file << "reporting_mode=" << reportingModeToString(c.reporting_mode) << "\n";
    file << "timing_mode=" << timingModeToString(c.timing_mode) << "\n";
    file << "broadcast_reset=" << (c.broadcast_reset_on_archive ? "1" : "0") << "\n";
    file << "default_ballot=" << default_ballot << "\n";

    file << "\n[Logging]\n";
    file << "log_level=" << log_level << "\n";
    file << "log_file=" << log_file << "\n";

    return file.good();
}

// Load settings from INI file
bool CoordinatorSettings::load(const std::string& path) {
    std::string filepath = path.empty() ? getDefaultPath() : path;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    const CoordinatorConfig defaults;
    CoordinatorConfig& c = coordinator;

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // Skip empty lines, comments and section headers
        if (line.empty() || line[0] == '#' || line[0] == '[') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);

        // Coordinator
        if (key == "name") {
            coordinator_name = value;
        } else if (key == "max_frame_size") {
            // Must at least hold a VOTE frame
            c.max_frame_size = parseBounded(value, 10, 512, defaults.max_frame_size);
        } else if (key == "max_controllers") {
            c.max_controllers = parseBounded(value, 1, 64, defaults.max_controllers);
        } else if (key == "auto_register") {
            c.auto_register = parseBool(value);
        }
        // Retry
        else if (key == "base_backoff_ms") {
            c.base_backoff_ms = parseBounded(value, 1, 60000, defaults.base_backoff_ms);
        } else if (key == "max_backoff_ms") {
            c.max_backoff_ms = parseBounded(value, 1, 600000, defaults.max_backoff_ms);
        } else if (key == "max_attempts") {
            c.max_attempts = parseBounded(value, 0, 32, defaults.max_attempts);
        }
        // Round
        else if (key == "default_round_ms") {
            c.default_round_ms = parseBounded(value, 1, 86400000, defaults.default_round_ms);
        } else if (key == "reporting_mode") {
            c.reporting_mode = (value == "ANONYMOUS") ? ReportingMode::ANONYMOUS : ReportingMode::PUBLIC;
        } else if (key == "timing_mode") {
            c.timing_mode = (value == "INFINITE") ? TimingMode::INFINITE : TimingMode::TIMED;
        } else if (key == "broadcast_reset") {
            c.broadcast_reset_on_archive = parseBool(value);
        } else if (key == "default_ballot") {
            default_ballot = value;
        }
        // Logging
        else if (key == "log_level") {
            log_level = value;
        } else if (key == "log_file") {
            log_file = value;
        }
    }

    if (c.max_backoff_ms < c.base_backoff_ms) {
        c.max_backoff_ms = c.base_backoff_ms;
    }
    if (default_ballot.size() > c.getMaxBallotSize()) {
        LOG_SESSION(WARN, "Settings: default ballot longer than %u bytes, truncated", c.getMaxBallotSize());
        default_ballot.resize(c.getMaxBallotSize());
    }

    return true;
}

} // namespace config
} // namespace votelink
