#pragma once

#include "readiness/readiness_prober.hpp"

#include <string>

namespace pgsession {

/**
 * @brief Readiness probe backed by libpq PQping
 *
 * Only PQPING_OK counts as ready. PQPING_REJECT is what a server still
 * starting up (57P03) or shutting down answers, so polling continues.
 */
class PqPingProbe : public IReadinessProbe {
public:
    explicit PqPingProbe(std::string dbname = "postgres", uint32_t connect_timeout_s = 1);

    [[nodiscard]] bool accepting_connections(const std::string& host, uint16_t port) override;

    [[nodiscard]] static std::string conninfo(const std::string& host, uint16_t port,
                                              const std::string& dbname,
                                              uint32_t connect_timeout_s = 1);

private:
    std::string dbname_;
    uint32_t connect_timeout_s_;
};

} // namespace pgsession
