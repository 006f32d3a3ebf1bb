#pragma once

#include "server/wire_protocol.hpp"
#include "engine/embedded_engine.hpp"
#include "config/session_config.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pgsession {

/**
 * @brief Per-connection protocol state machine in front of the embedded engine
 *
 * CONNECTING -> AUTHENTICATING (trust) -> READY -> CLOSED
 *
 * on_startup() and on_frame() are transport independent: they return the
 * bytes to write back and never touch a socket. run() drives them over a
 * connected socket until the client disconnects or terminates.
 */
class GatewaySession {
public:
    enum class State {
        CONNECTING,
        AUTHENTICATING,
        READY,
        CLOSED
    };

    GatewaySession(std::shared_ptr<IEmbeddedEngine> engine,
                   GatewayOptions options,
                   int32_t backend_pid,
                   std::string remote_addr = "");

    // Blocking socket loop; closes nothing, the caller owns fd
    void run(int fd);

    /**
     * @brief Handle a startup packet (payload after the length prefix)
     *
     * SSL/GSSENC requests are declined with 'N' and the session stays in
     * CONNECTING. A cancel request closes the session. A regular startup
     * waits for the engine to be ready, then completes the trust handshake.
     */
    [[nodiscard]] std::vector<uint8_t> on_startup(const std::vector<uint8_t>& payload);

    /**
     * @brief Handle one typed frame
     *
     * Frames arriving before READY are dropped without reaching the engine.
     * Engine failures become ErrorResponse + ReadyForQuery('E'); the session
     * stays READY.
     */
    [[nodiscard]] std::vector<uint8_t> on_frame(const WireFrame& frame);

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool authenticated() const { return state_ == State::READY; }
    [[nodiscard]] const std::string& user() const { return user_; }
    [[nodiscard]] const std::string& database() const { return database_; }
    [[nodiscard]] uint64_t dropped_frames() const { return dropped_frames_; }

private:
    [[nodiscard]] std::vector<uint8_t> handshake();

    bool read_exact(int fd, void* buf, size_t len);
    bool write_all(int fd, const std::vector<uint8_t>& data);
    [[nodiscard]] bool read_startup(int fd, std::vector<uint8_t>& payload);
    [[nodiscard]] bool read_frame(int fd, WireFrame& frame);

    std::shared_ptr<IEmbeddedEngine> engine_;
    GatewayOptions options_;
    int32_t backend_pid_;
    int32_t secret_key_;
    std::string remote_addr_;

    State state_ = State::CONNECTING;
    std::string user_;
    std::string database_;
    uint64_t dropped_frames_ = 0;
};

} // namespace pgsession
