#include "session/port_allocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>

namespace pgsession {

PortAllocator::PortAllocator(std::string host)
    : host_(std::move(host)) {}

uint16_t PortAllocator::allocate() const {
    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::format("PortAllocator: socket() failed: {}", strerror(errno)));
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    inet_aton(host_.c_str(), &addr.sin_addr);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        close(fd);
        throw std::runtime_error(std::format("PortAllocator: bind({}:0) failed: {}",
            host_, strerror(err)));
    }

    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        const int err = errno;
        close(fd);
        throw std::runtime_error(std::format("PortAllocator: getsockname() failed: {}",
            strerror(err)));
    }

    close(fd);
    return ntohs(addr.sin_port);
}

bool PortAllocator::is_available(uint16_t port) const {
    const int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return false;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_aton(host_.c_str(), &addr.sin_addr);

    const bool ok = bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0;
    close(fd);
    return ok;
}

} // namespace pgsession
