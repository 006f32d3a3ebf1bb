#include "readiness/readiness_prober.hpp"
#include "core/utils.hpp"

#include <format>
#include <thread>

namespace pgsession {

ReadinessProber::ReadinessProber(std::shared_ptr<IReadinessProbe> probe,
                                 ReadinessOptions options,
                                 std::string host)
    : probe_(std::move(probe)),
      options_(options),
      host_(std::move(host)) {}

bool ReadinessProber::wait_until_ready(uint16_t port) {
    last_attempts_ = 0;
    utils::Timer timer;

    for (uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        if (attempt > 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(options_.interval_ms));
        }

        last_attempts_ = attempt;
        if (probe_->accepting_connections(host_, port)) {
            utils::log::debug(std::format("Readiness: {}:{} ready after {} attempt(s), {}ms",
                host_, port, attempt, timer.elapsed_ms().count()));
            return true;
        }
    }

    utils::log::warn(std::format("Readiness: {}:{} not ready after {} attempts",
        host_, port, last_attempts_));
    return false;
}

} // namespace pgsession
