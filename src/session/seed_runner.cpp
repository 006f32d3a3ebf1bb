#include "session/seed_runner.hpp"
#include "process/child_process.hpp"
#include "core/utils.hpp"

#include <format>

namespace pgsession {

SeedRunner::SeedRunner(SeedOptions options, std::string shell)
    : options_(std::move(options)), shell_(std::move(shell)) {}

Result<int> SeedRunner::run() const {
    if (!configured()) {
        return Result<int>::ok(0);
    }

    utils::log::info(std::format("Seed: running '{}'", options_.command));

    ProcessSpec spec;
    spec.argv = {shell_, "-c", options_.command};
    spec.output = OutputPolicy::INHERIT;

    ExitStatus status;
    try {
        status = run_command(spec);
    } catch (const SessionError& e) {
        utils::log::error(std::format("{}: {}", error_category_name(ErrorCategory::SEED_FAILURE), e.what()));
        return Result<int>::error(ErrorCategory::SEED_FAILURE, e.what());
    }

    if (!status.success()) {
        auto message = std::format("seed command '{}' finished with {}", options_.command, status.describe());
        utils::log::error(std::format("{}: {}", error_category_name(ErrorCategory::SEED_FAILURE), message));
        return Result<int>::error(ErrorCategory::SEED_FAILURE, std::move(message));
    }

    utils::log::info("Seed: done");
    return Result<int>::ok(0);
}

} // namespace pgsession
