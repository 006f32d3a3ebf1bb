#pragma once

#include "config/session_config.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace pgsession {

// Single "is it accepting connections" check
class IReadinessProbe {
public:
    virtual ~IReadinessProbe() = default;
    [[nodiscard]] virtual bool accepting_connections(const std::string& host, uint16_t port) = 0;
};

/**
 * @brief Polls a probe at a fixed interval until it succeeds or the budget runs out
 *
 * Knows nothing about what is behind the endpoint. Never throws on
 * exhaustion; the caller decides what a false result means.
 */
class ReadinessProber {
public:
    ReadinessProber(std::shared_ptr<IReadinessProbe> probe,
                    ReadinessOptions options,
                    std::string host = LOOPBACK_HOST);

    [[nodiscard]] bool wait_until_ready(uint16_t port);

    // Attempts made by the last wait_until_ready() call
    [[nodiscard]] uint32_t last_attempts() const { return last_attempts_; }

    [[nodiscard]] const ReadinessOptions& options() const { return options_; }

private:
    std::shared_ptr<IReadinessProbe> probe_;
    ReadinessOptions options_;
    std::string host_;
    uint32_t last_attempts_ = 0;
};

} // namespace pgsession
