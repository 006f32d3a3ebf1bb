#pragma once

#include "config/session_config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pgsession {

// Command-line surface; every set field overrides the config file
struct CliArgs {
    std::string config_file;
    std::optional<std::string> db_path;
    std::optional<std::string> db_name;
    std::optional<uint16_t> port;
    std::vector<std::string> engine_libraries;
    std::optional<std::string> seed_command;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
    bool verbose = false;
    bool help = false;
    std::vector<std::string> workload;      // everything after "--"
};

class CliParser {
public:
    struct ParseResult {
        bool success = false;
        std::string error_message;
        CliArgs args;
    };

    [[nodiscard]] static ParseResult parse(int argc, const char* const* argv);

    static void apply_overrides(const CliArgs& args, SessionOptions& options);

    [[nodiscard]] static std::string usage(const char* program);
};

} // namespace pgsession
