#pragma once

#include "config/session_config.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace pgsession {

// Where the workload reaches the database
struct Endpoint {
    BackendMode mode = BackendMode::NATIVE;
    std::string host;
    uint16_t port = 0;
    std::string db_name;
    std::string storage_location;
};

/**
 * @brief Live resources of one backend mode
 *
 * start() acquires everything or throws a fatal SessionError, leaving
 * whatever it acquired for stop() to release. stop() releases in reverse
 * order of acquisition and must tolerate a partial start.
 */
class IBackend {
public:
    virtual ~IBackend() = default;

    [[nodiscard]] virtual Endpoint start() = 0;
    virtual void stop() = 0;
    [[nodiscard]] virtual BackendMode mode() const = 0;
};

using BackendFactory = std::function<std::unique_ptr<IBackend>(const SessionConfig&)>;

} // namespace pgsession
