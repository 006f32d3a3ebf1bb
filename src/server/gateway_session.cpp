#include "server/gateway_session.hpp"
#include "server/error_translator.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <random>
#include <sys/socket.h>

namespace pgsession {

namespace {

// SQLSTATE cannot_connect_now
constexpr const char* SQLSTATE_CANNOT_CONNECT_NOW = "57P03";
// SQLSTATE feature_not_supported
constexpr const char* SQLSTATE_FEATURE_NOT_SUPPORTED = "0A000";

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // anonymous namespace

GatewaySession::GatewaySession(std::shared_ptr<IEmbeddedEngine> engine,
                               GatewayOptions options,
                               int32_t backend_pid,
                               std::string remote_addr)
    : engine_(std::move(engine)),
      options_(std::move(options)),
      backend_pid_(backend_pid),
      secret_key_(static_cast<int32_t>(std::random_device{}())),
      remote_addr_(std::move(remote_addr)) {}

// ---- Protocol core ------------------------------------------------------

std::vector<uint8_t> GatewaySession::on_startup(const std::vector<uint8_t>& payload) {
    if (state_ != State::CONNECTING) return {};

    const auto startup = parse_startup_message(payload);
    if (!startup) {
        state_ = State::CLOSED;
        return {};
    }

    switch (startup->protocol_version) {
        case wire::SSL_REQUEST_CODE:
        case wire::GSSENC_REQUEST_CODE:
            // Client retries with a plain startup message
            return {static_cast<uint8_t>('N')};
        case wire::CANCEL_REQUEST_CODE:
            state_ = State::CLOSED;
            return {};
        default:
            break;
    }

    if ((startup->protocol_version >> 16) != 3) {
        state_ = State::CLOSED;
        return WireWriter::error_response("FATAL", SQLSTATE_FEATURE_NOT_SUPPORTED,
            std::format("unsupported frontend protocol {}.{}",
                startup->protocol_version >> 16, startup->protocol_version & 0xFFFF));
    }

    user_ = startup->user.empty() ? options_.default_user : startup->user;
    database_ = startup->database.empty() ? user_ : startup->database;
    state_ = State::AUTHENTICATING;

    try {
        engine_->await_ready();
    } catch (const std::exception& e) {
        utils::log::error(std::format("Gateway: engine not ready for {}: {}", remote_addr_, e.what()));
        state_ = State::CLOSED;
        return WireWriter::error_response("FATAL", SQLSTATE_CANNOT_CONNECT_NOW, e.what());
    }

    return handshake();
}

std::vector<uint8_t> GatewaySession::handshake() {
    std::vector<uint8_t> out;
    append(out, WireWriter::auth_ok());
    append(out, WireWriter::parameter_status("server_version", options_.server_version));
    append(out, WireWriter::parameter_status("server_encoding", "UTF8"));
    append(out, WireWriter::parameter_status("client_encoding", "UTF8"));
    append(out, WireWriter::parameter_status("DateStyle", "ISO, MDY"));
    append(out, WireWriter::parameter_status("integer_datetimes", "on"));
    append(out, WireWriter::parameter_status("standard_conforming_strings", "on"));
    append(out, WireWriter::backend_key_data(backend_pid_, secret_key_));
    append(out, WireWriter::ready_for_query(wire::TX_IDLE));

    state_ = State::READY;
    utils::log::debug(std::format("Gateway: {} authenticated as {} (db={})",
        remote_addr_, user_, database_));
    return out;
}

std::vector<uint8_t> GatewaySession::on_frame(const WireFrame& frame) {
    if (state_ != State::READY) {
        ++dropped_frames_;
        return {};
    }

    if (frame.type == wire::MSG_TERMINATE) {
        state_ = State::CLOSED;
        return {};
    }

    try {
        const auto responses = engine_->execute(frame.encode());
        std::vector<uint8_t> out;
        for (const auto& r : responses) {
            append(out, r);
        }
        return out;
    } catch (const SessionError& e) {
        utils::log::debug(std::format("Gateway: engine error for {}: {}", remote_addr_, e.what()));
        return ErrorTranslator::to_frames(ErrorTranslator::to_fields(e));
    } catch (const std::exception& e) {
        utils::log::debug(std::format("Gateway: engine error for {}: {}", remote_addr_, e.what()));
        return ErrorTranslator::to_frames(ErrorTranslator::to_fields(e.what(), std::nullopt));
    }
}

// ---- Socket loop --------------------------------------------------------

bool GatewaySession::read_exact(int fd, void* buf, size_t len) {
    auto* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        const ssize_t n = recv(fd, ptr, remaining, MSG_WAITALL);
        if (n <= 0) return false;
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

bool GatewaySession::write_all(int fd, const std::vector<uint8_t>& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool GatewaySession::read_startup(int fd, std::vector<uint8_t>& payload) {
    uint8_t len_buf[4];
    if (!read_exact(fd, len_buf, 4)) return false;

    const int32_t length = WireBuffer::read_int32(len_buf);
    if (length < 8 || length > wire::MAX_STARTUP_LENGTH) return false;

    payload.resize(static_cast<size_t>(length - 4));
    return read_exact(fd, payload.data(), payload.size());
}

bool GatewaySession::read_frame(int fd, WireFrame& frame) {
    uint8_t header[5];
    if (!read_exact(fd, header, 5)) return false;
    frame.type = static_cast<char>(header[0]);

    const int32_t length = WireBuffer::read_int32(header + 1);
    if (length < 4 || length > wire::MAX_FRAME_LENGTH) return false;

    frame.payload.resize(static_cast<size_t>(length - 4));
    if (frame.payload.empty()) return true;
    return read_exact(fd, frame.payload.data(), frame.payload.size());
}

void GatewaySession::run(int fd) {
    while (state_ != State::CLOSED) {
        std::vector<uint8_t> reply;
        if (state_ == State::CONNECTING) {
            std::vector<uint8_t> payload;
            if (!read_startup(fd, payload)) break;
            reply = on_startup(payload);
        } else {
            WireFrame frame;
            if (!read_frame(fd, frame)) break;
            reply = on_frame(frame);
        }

        if (!reply.empty() && !write_all(fd, reply)) break;
    }
    state_ = State::CLOSED;
}

} // namespace pgsession
