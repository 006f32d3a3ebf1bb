#include "config/cli_args.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "session/seed_runner.hpp"
#include "session/session_environment.hpp"
#include "session/session_resolver.hpp"
#include "session/shutdown_signal.hpp"
#include "session/workload_runner.hpp"
#include "supervisor/backend_supervisor.hpp"
#include "supervisor/mode_detector.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <iostream>
#include <thread>

using namespace pgsession;

namespace {

constexpr const char* DEFAULT_CONFIG_FILE = "pgsession.toml";
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

SessionOptions load_options(const CliArgs& args) {
    std::string config_file = args.config_file;
    if (config_file.empty() && std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
        config_file = DEFAULT_CONFIG_FILE;
    }

    SessionOptions options;
    if (!config_file.empty()) {
        utils::log::info(std::format("Loading configuration from {}", config_file));
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            throw SessionError(ErrorCategory::CONFIG_ERROR, loaded.error_message);
        }
        options = std::move(loaded.options);
    }

    CliParser::apply_overrides(args, options);

    const auto errors = ConfigLoader::validate(options);
    if (!errors.empty()) {
        std::string msg = "Config validation failed:";
        for (const auto& e : errors) {
            msg += "\n  - " + e;
        }
        throw SessionError(ErrorCategory::CONFIG_ERROR, msg);
    }
    return options;
}

bool shutdown_requested_during_startup() {
    if (!ShutdownSignal::requested()) return false;
    utils::log::info(std::format("Received signal {} during startup, shutting down...",
        ShutdownSignal::signal_number()));
    return true;
}

void serve_until_signal(const Endpoint& endpoint) {
    utils::log::info(std::format("Serving {} on {}:{}; press Ctrl-C to stop",
        endpoint.db_name, endpoint.host, endpoint.port));
    while (!ShutdownSignal::requested()) {
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    utils::log::info(std::format("Received signal {}, shutting down...", ShutdownSignal::signal_number()));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto parsed = CliParser::parse(argc, argv);
    if (!parsed.success) {
        std::cerr << parsed.error_message << "\n\n" << CliParser::usage(argv[0]);
        return 1;
    }
    if (parsed.args.help) {
        std::cout << CliParser::usage(argv[0]);
        return 0;
    }

    try {
        const auto options = load_options(parsed.args);
        utils::log::set_level(*utils::log::parse_level(options.logging.level));

        ShutdownSignal::install();

        utils::log::info("[1/5] Detecting backend mode");
        auto selection = ModeDetector::detect(options.engine_libraries);

        utils::log::info("[2/5] Resolving session");
        const auto config = SessionResolver(options).resolve(selection.mode);

        utils::log::info("[3/5] Starting backend");
        BackendSupervisor supervisor(BackendSupervisor::default_factory(std::move(selection), options));
        const auto endpoint = supervisor.start(config);

        utils::log::info("[4/5] Exporting environment");
        SessionEnvironment::apply(SessionEnvironment::build(endpoint, options.gateway));

        if (shutdown_requested_during_startup()) {
            supervisor.stop();
            return 128 + ShutdownSignal::signal_number();
        }

        if (SeedRunner seed(options.seed); seed.configured()) {
            // Seed failures are logged by the runner; the backend stays up
            const auto seeded = seed.run();
            if (seeded.is_error()) {
                utils::log::warn("Continuing without seed data");
            }
        }

        if (shutdown_requested_during_startup()) {
            supervisor.stop();
            return 128 + ShutdownSignal::signal_number();
        }

        utils::log::info("[5/5] Session ready");
        int exit_code = 0;
        if (!parsed.args.workload.empty()) {
            exit_code = run_workload(parsed.args.workload);
        } else {
            serve_until_signal(endpoint);
        }

        supervisor.stop();
        return exit_code;

    } catch (const SessionError& e) {
        utils::log::error(std::format("Fatal: [{}] {}", error_category_name(e.category()), e.what()));
        return 1;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
