#include <catch2/catch_test_macros.hpp>
#include "server/gateway_session.hpp"
#include "mocks/mock_engine.hpp"

using namespace pgsession;
using pgsession::test::MockEngine;

namespace {

std::vector<uint8_t> startup_payload(const std::vector<std::pair<std::string, std::string>>& params,
                                     int32_t version = wire::PROTOCOL_VERSION) {
    const auto packet = WireWriter::startup(params, version);
    return std::vector<uint8_t>(packet.begin() + 4, packet.end());
}

WireFrame query_frame(const std::string& sql) {
    const auto bytes = WireWriter::query(sql);
    return WireFrame(wire::MSG_QUERY, std::vector<uint8_t>(bytes.begin() + 5, bytes.end()));
}

std::vector<WireFrame> frames_of(const std::vector<uint8_t>& bytes) {
    auto frames = split_frames(bytes);
    REQUIRE(frames.has_value());
    return *frames;
}

GatewayOptions options() {
    GatewayOptions opts;
    opts.server_version = "16.3 (test)";
    return opts;
}

} // anonymous namespace

TEST_CASE("GatewaySession: trust handshake", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 7);
    REQUIRE(session.state() == GatewaySession::State::CONNECTING);

    const auto reply = session.on_startup(startup_payload({{"user", "alice"}, {"database", "app"}}));
    CHECK(session.state() == GatewaySession::State::READY);
    CHECK(session.authenticated());
    CHECK(session.user() == "alice");
    CHECK(session.database() == "app");
    CHECK(engine->ready_calls.load() == 1);

    const auto frames = frames_of(reply);
    REQUIRE(frames.size() == 9);
    CHECK(frames.front().type == wire::MSG_AUTH);
    CHECK(WireBuffer::read_int32(frames.front().payload.data()) == wire::AUTH_OK);
    CHECK(frames[1].type == wire::MSG_PARAM_STATUS);
    CHECK(WireBuffer::read_string(frames[1].payload.data(), frames[1].payload.size()) == "server_version");
    CHECK(frames[7].type == wire::MSG_BACKEND_KEY);
    CHECK(WireBuffer::read_int32(frames[7].payload.data()) == 7);
    CHECK(frames.back().type == wire::MSG_READY);
    CHECK(frames.back().payload[0] == static_cast<uint8_t>(wire::TX_IDLE));
}

TEST_CASE("GatewaySession: missing user falls back to default", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);
    (void)session.on_startup(startup_payload({}));
    CHECK(session.user() == "postgres");
    CHECK(session.database() == "postgres");
}

TEST_CASE("GatewaySession: SSL and GSS requests are declined", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);

    auto reply = session.on_startup(startup_payload({}, wire::SSL_REQUEST_CODE));
    REQUIRE(reply == std::vector<uint8_t>{'N'});
    CHECK(session.state() == GatewaySession::State::CONNECTING);

    reply = session.on_startup(startup_payload({}, wire::GSSENC_REQUEST_CODE));
    REQUIRE(reply == std::vector<uint8_t>{'N'});
    CHECK(session.state() == GatewaySession::State::CONNECTING);
    CHECK(engine->ready_calls.load() == 0);

    (void)session.on_startup(startup_payload({{"user", "bob"}}));
    CHECK(session.state() == GatewaySession::State::READY);
}

TEST_CASE("GatewaySession: cancel request closes without reply", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);
    WireBuffer cancel;
    cancel.write_int32(wire::CANCEL_REQUEST_CODE);
    cancel.write_int32(1);
    cancel.write_int32(2);

    CHECK(session.on_startup(cancel.data()).empty());
    CHECK(session.state() == GatewaySession::State::CLOSED);
}

TEST_CASE("GatewaySession: unsupported protocol version is refused", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);
    const auto reply = session.on_startup(startup_payload({{"user", "x"}}, 2 << 16));

    const auto frames = frames_of(reply);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].type == wire::MSG_ERROR);
    CHECK(parse_error_fields(frames[0].payload).severity == "FATAL");
    CHECK(session.state() == GatewaySession::State::CLOSED);
}

TEST_CASE("GatewaySession: frames before authentication are dropped", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);

    CHECK(session.on_frame(query_frame("SELECT 1")).empty());
    CHECK(session.dropped_frames() == 1);
    CHECK(engine->executed_count() == 0);

    (void)session.on_startup(startup_payload({{"user", "alice"}}));
    const auto reply = session.on_frame(query_frame("SELECT 1"));
    CHECK_FALSE(reply.empty());
    REQUIRE(engine->executed_count() == 1);
}

TEST_CASE("GatewaySession: forwards the exact frame bytes", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);
    (void)session.on_startup(startup_payload({{"user", "alice"}}));

    const auto reply = session.on_frame(query_frame("SELECT 42"));
    REQUIRE(engine->executed.size() == 1);
    CHECK(engine->executed[0] == WireWriter::query("SELECT 42"));

    const auto frames = frames_of(reply);
    REQUIRE(frames.size() == 2);
    CHECK(frames[0].type == wire::MSG_CMD_COMPLETE);
    CHECK(frames[1].type == wire::MSG_READY);
}

TEST_CASE("GatewaySession: engine failure becomes an error frame and the session stays open", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);
    (void)session.on_startup(startup_payload({{"user", "alice"}}));

    engine->fail_message = "syntax error at or near \"BAD\"";
    auto frames = frames_of(session.on_frame(query_frame("BAD")));
    REQUIRE(frames.size() == 2);
    CHECK(frames[0].type == wire::MSG_ERROR);
    const auto fields = parse_error_fields(frames[0].payload);
    CHECK(fields.severity == "ERROR");
    CHECK(fields.code == "XX000");
    CHECK(fields.message == "syntax error at or near \"BAD\"");
    CHECK(frames[1].payload[0] == static_cast<uint8_t>(wire::TX_ERROR));
    CHECK(session.state() == GatewaySession::State::READY);

    engine->fail_message.reset();
    frames = frames_of(session.on_frame(query_frame("SELECT 1")));
    CHECK(frames[0].type == wire::MSG_CMD_COMPLETE);
    CHECK(engine->executed_count() == 2);
}

TEST_CASE("GatewaySession: engine SQLSTATE reaches the client", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);
    (void)session.on_startup(startup_payload({{"user", "alice"}}));

    engine->fail_message = "division by zero";
    engine->fail_code = "22012";
    const auto frames = frames_of(session.on_frame(query_frame("SELECT 1/0")));
    CHECK(parse_error_fields(frames[0].payload).code == "22012");
}

TEST_CASE("GatewaySession: terminate closes without forwarding", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    GatewaySession session(engine, options(), 1);
    (void)session.on_startup(startup_payload({{"user", "alice"}}));

    CHECK(session.on_frame(WireFrame(wire::MSG_TERMINATE, {})).empty());
    CHECK(session.state() == GatewaySession::State::CLOSED);
    CHECK(engine->executed_count() == 0);
}

TEST_CASE("GatewaySession: engine not ready refuses the connection", "[gateway]") {
    auto engine = std::make_shared<MockEngine>();
    engine->fail_ready = true;
    GatewaySession session(engine, options(), 1);

    const auto frames = frames_of(session.on_startup(startup_payload({{"user", "alice"}})));
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].type == wire::MSG_ERROR);
    CHECK(parse_error_fields(frames[0].payload).code == "57P03");
    CHECK(session.state() == GatewaySession::State::CLOSED);
    CHECK_FALSE(session.authenticated());
}
