#pragma once

#include "config/session_config.hpp"
#include "core/error.hpp"

#include <string>

namespace pgsession {

/**
 * @brief Runs the user's seed command through /bin/sh -c
 *
 * Failures come back as Result errors with SEED_FAILURE and are logged;
 * they never stop an already running backend.
 */
class SeedRunner {
public:
    explicit SeedRunner(SeedOptions options, std::string shell = "/bin/sh");

    [[nodiscard]] bool configured() const { return !options_.command.empty(); }

    // Exit code on success (always 0)
    [[nodiscard]] Result<int> run() const;

private:
    SeedOptions options_;
    std::string shell_;
};

} // namespace pgsession
