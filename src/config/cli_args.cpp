#include "config/cli_args.hpp"
#include "core/utils.hpp"

#include <format>
#include <string_view>

namespace pgsession {

CliParser::ParseResult CliParser::parse(int argc, const char* const* argv) {
    ParseResult result;
    auto& args = result.args;

    auto fail = [&result](std::string message) {
        result.success = false;
        result.error_message = std::move(message);
        return result;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--") {
            for (int j = i + 1; j < argc; ++j) {
                args.workload.emplace_back(argv[j]);
            }
            break;
        }
        if (arg == "-h" || arg == "--help") {
            args.help = true;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }

        // Remaining flags all take a value
        if (i + 1 >= argc) {
            return fail(std::format("Unknown option or missing value: {}", arg));
        }
        const std::string value = argv[i + 1];

        if (arg == "--config") {
            args.config_file = value;
        } else if (arg == "--db-path") {
            args.db_path = value;
        } else if (arg == "--db-name") {
            args.db_name = value;
        } else if (arg == "--port") {
            const auto port = utils::try_parse_int<uint16_t>(value);
            if (!port) {
                return fail(std::format("--port must be 0-65535, got '{}'", value));
            }
            args.port = *port;
        } else if (arg == "--engine") {
            args.engine_libraries.push_back(value);
        } else if (arg == "--seed") {
            args.seed_command = value;
        } else if (arg == "--log-file") {
            args.log_file = value;
        } else if (arg == "--log-level") {
            if (!utils::log::parse_level(value)) {
                return fail(std::format("--log-level must be debug, info, warn or error, got '{}'", value));
            }
            args.log_level = value;
        } else {
            return fail(std::format("Unknown option: {}", arg));
        }
        ++i;
    }

    result.success = true;
    return result;
}

void CliParser::apply_overrides(const CliArgs& args, SessionOptions& options) {
    if (args.db_path) options.db_path = *args.db_path;
    if (args.db_name) options.db_name = *args.db_name;
    if (args.port) options.port = *args.port;
    if (!args.engine_libraries.empty()) options.engine_libraries = args.engine_libraries;
    if (args.seed_command) options.seed.command = *args.seed_command;
    if (args.log_file) options.native.log_file = *args.log_file;
    if (args.log_level) options.logging.level = *args.log_level;
    if (args.verbose) options.native.verbose = true;
}

std::string CliParser::usage(const char* program) {
    return std::format(
        "Usage: {} [options] [-- command [args...]]\n"
        "\n"
        "Starts a local PostgreSQL backend for the session, runs the command\n"
        "with PGHOST/PGPORT/PGDATABASE/PGDATA set, then tears the backend down.\n"
        "Without a command, serves until SIGINT/SIGTERM.\n"
        "\n"
        "Options:\n"
        "  --config FILE      TOML config (default: ./pgsession.toml if present)\n"
        "  --db-path PATH     storage location\n"
        "  --db-name NAME     database name\n"
        "  --port N           listening port (0 = pick a free port)\n"
        "  --engine LIB       embedded engine library candidate (repeatable)\n"
        "  --seed CMD         seed command run through /bin/sh -c\n"
        "  --log-file FILE    native server log file\n"
        "  --log-level LEVEL  debug, info, warn or error\n"
        "  -v, --verbose      pass native server output through\n"
        "  -h, --help         show this help\n",
        program);
}

} // namespace pgsession
