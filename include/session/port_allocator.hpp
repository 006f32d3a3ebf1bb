#pragma once

#include <cstdint>
#include <string>

namespace pgsession {

/**
 * @brief Picks a currently unused TCP port on the loopback interface
 *
 * Binds an ephemeral socket to port 0, reads back the kernel-assigned port
 * and releases it. Another process may still grab the port before the
 * backend binds it; the backend then reports its own bind failure.
 */
class PortAllocator {
public:
    explicit PortAllocator(std::string host = "127.0.0.1");

    // Throws std::runtime_error when no port can be obtained
    [[nodiscard]] uint16_t allocate() const;

    // True if nothing is listening on host:port right now
    [[nodiscard]] bool is_available(uint16_t port) const;

private:
    std::string host_;
};

} // namespace pgsession
