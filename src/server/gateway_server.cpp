#include "server/gateway_server.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace pgsession {

GatewayServer::GatewayServer(std::shared_ptr<IEmbeddedEngine> engine,
                             GatewayOptions options,
                             std::string host,
                             uint16_t port)
    : engine_(std::move(engine)),
      options_(std::move(options)),
      host_(std::move(host)),
      port_(port) {}

GatewayServer::~GatewayServer() {
    stop();
}

void GatewayServer::start() {
    if (running_.load() || stopped_.load()) return;

    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw SessionError(ErrorCategory::GATEWAY_BIND_FAILURE,
            std::format("Gateway: socket() failed: {}", strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        utils::log::warn(std::format("Gateway: SO_REUSEADDR failed: {}", strerror(errno)));
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_aton(host_.c_str(), &addr.sin_addr) == 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        throw SessionError(ErrorCategory::GATEWAY_BIND_FAILURE,
            std::format("Gateway: invalid listen address '{}'", host_));
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        const int err = errno;
        ::close(server_fd_);
        server_fd_ = -1;
        throw SessionError(ErrorCategory::GATEWAY_BIND_FAILURE,
            std::format("Gateway: bind({}:{}) failed: {}", host_, port_, strerror(err)));
    }

    if (listen(server_fd_, 128) < 0) {
        const int err = errno;
        ::close(server_fd_);
        server_fd_ = -1;
        throw SessionError(ErrorCategory::GATEWAY_BIND_FAILURE,
            std::format("Gateway: listen() failed: {}", strerror(err)));
    }

    struct sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) < 0) {
        const int err = errno;
        ::close(server_fd_);
        server_fd_ = -1;
        throw SessionError(ErrorCategory::GATEWAY_BIND_FAILURE,
            std::format("Gateway: getsockname() failed: {}", strerror(err)));
    }
    bound_port_ = ntohs(bound.sin_port);

    running_.store(true);
    accept_thread_ = std::jthread([this](std::stop_token) { accept_loop(); });

    utils::log::info(std::format("Gateway: listening on {}:{}", host_, bound_port_));
}

void GatewayServer::stop() {
    if (stopped_.exchange(true)) return;
    running_.store(false);

    // shutdown() wakes accept(); the fd is closed only after the accept thread is gone
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
    }

    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        listener_close_count_.fetch_add(1);
    }

    // Unblock workers waiting in recv()
    {
        std::lock_guard lock(clients_mutex_);
        for (const int fd : client_fds_) {
            shutdown(fd, SHUT_RDWR);
        }
    }

    for (auto& [id, w] : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
    retained_workers_.store(0);

    utils::log::info("Gateway: stopped");
}

void GatewayServer::accept_loop() {
    while (running_.load()) {
        struct sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);

        const int client_fd = accept4(server_fd_,
            reinterpret_cast<struct sockaddr*>(&client_addr), &addr_len, SOCK_CLOEXEC);

        if (client_fd < 0) {
            if (!running_.load()) break;  // Shutting down
            if (errno == EBADF || errno == EINVAL) break;
            continue;
        }

        if (active_connections_.load() >= options_.max_connections) {
            utils::log::warn(std::format("Gateway: connection limit {} reached, rejecting",
                options_.max_connections));
            ::close(client_fd);
            continue;
        }

        std::string remote_addr = std::format("{}:{}",
            inet_ntoa(client_addr.sin_addr), ntohs(client_addr.sin_port));

        {
            std::lock_guard lock(clients_mutex_);
            client_fds_.insert(client_fd);
        }

        reap_finished_workers();
        spawn_worker(client_fd, next_connection_id_.fetch_add(1), std::move(remote_addr));
    }
}

void GatewayServer::spawn_worker(int client_fd, int32_t connection_id, std::string remote_addr) {
    active_connections_.fetch_add(1);
    try {
        workers_.emplace(connection_id, std::jthread(
            [this, client_fd, connection_id, addr = std::move(remote_addr)]() mutable {
                handle_connection(client_fd, connection_id, std::move(addr));
                {
                    std::lock_guard lock(clients_mutex_);
                    client_fds_.erase(client_fd);
                    finished_workers_.push_back(connection_id);
                }
                ::close(client_fd);
                active_connections_.fetch_sub(1);
            }));
    } catch (const std::system_error& e) {
        utils::log::error(std::format("Gateway: cannot start worker for connection #{}: {}",
            connection_id, e.what()));
        {
            std::lock_guard lock(clients_mutex_);
            client_fds_.erase(client_fd);
        }
        ::close(client_fd);
        active_connections_.fetch_sub(1);
    }
    retained_workers_.store(workers_.size());
}

void GatewayServer::reap_finished_workers() {
    std::vector<int32_t> finished;
    {
        std::lock_guard lock(clients_mutex_);
        finished.swap(finished_workers_);
    }
    for (const int32_t id : finished) {
        const auto it = workers_.find(id);
        if (it == workers_.end()) continue;
        if (it->second.joinable()) it->second.join();
        workers_.erase(it);
    }
    retained_workers_.store(workers_.size());
}

void GatewayServer::handle_connection(int client_fd, int32_t connection_id, std::string remote_addr) {
    utils::log::debug(std::format("Gateway: connection #{} from {}", connection_id, remote_addr));
    GatewaySession session(engine_, options_, connection_id, std::move(remote_addr));
    session.run(client_fd);
}

} // namespace pgsession
