#pragma once

#include "votelink/types.hpp"
#include <string>

namespace votelink {
namespace config {

// Coordinator settings that persist across runs
struct CoordinatorSettings {
    // Save/load to file
    bool save(const std::string& path = "") const;
    bool load(const std::string& path = "");

    // Get default settings file path
    static std::string getDefaultPath();

    // Station
    std::string coordinator_name = "votelink";

    // Protocol and round policy
    CoordinatorConfig coordinator;

    // Round defaults
    std::string default_ballot = "Proceed?";

    // Logging
    std::string log_level = "INFO";   // NONE, ERROR, WARN, INFO, DEBUG, TRACE
    std::string log_file;             // Empty = stderr
};

} // namespace config
} // namespace votelink
