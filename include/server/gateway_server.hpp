#pragma once

#include "server/gateway_session.hpp"
#include "engine/embedded_engine.hpp"
#include "config/session_config.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pgsession {

/**
 * @brief TCP listener speaking the wire protocol on behalf of the embedded engine
 *
 * One accept thread plus one worker thread per connection. Every connection
 * shares the same engine instance.
 */
class GatewayServer {
public:
    GatewayServer(std::shared_ptr<IEmbeddedEngine> engine,
                  GatewayOptions options,
                  std::string host,
                  uint16_t port);

    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    /**
     * @brief Bind, listen and spawn the accept thread (non-blocking)
     * @throws SessionError(GATEWAY_BIND_FAILURE)
     */
    void start();

    // Idempotent. The listener is closed exactly once.
    void stop();

    [[nodiscard]] bool running() const { return running_.load(); }

    // Bound port (differs from the requested one when 0 was requested)
    [[nodiscard]] uint16_t port() const { return bound_port_; }

    [[nodiscard]] uint32_t active_connections() const {
        return active_connections_.load();
    }

    [[nodiscard]] uint32_t listener_close_count() const {
        return listener_close_count_.load();
    }

    // Worker threads not yet joined (finished ones are joined on the next accept)
    [[nodiscard]] size_t retained_workers() const {
        return retained_workers_.load();
    }

private:
    void accept_loop();
    void handle_connection(int client_fd, int32_t connection_id, std::string remote_addr);
    void spawn_worker(int client_fd, int32_t connection_id, std::string remote_addr);
    void reap_finished_workers();

    std::shared_ptr<IEmbeddedEngine> engine_;
    GatewayOptions options_;
    std::string host_;
    uint16_t port_;
    uint16_t bound_port_ = 0;

    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<uint32_t> active_connections_{0};
    std::atomic<uint32_t> listener_close_count_{0};
    std::atomic<int32_t> next_connection_id_{1};

    std::mutex clients_mutex_;
    std::unordered_set<int> client_fds_;
    std::vector<int32_t> finished_workers_;     // guarded by clients_mutex_

    std::jthread accept_thread_;
    std::unordered_map<int32_t, std::jthread> workers_;     // accept thread only, until stop()
    std::atomic<size_t> retained_workers_{0};
};

} // namespace pgsession
