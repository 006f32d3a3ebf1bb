#include <catch2/catch_test_macros.hpp>
#include "supervisor/backend_supervisor.hpp"
#include "supervisor/native_backend.hpp"
#include "core/error.hpp"
#include "mocks/fake_commands.hpp"
#include "mocks/mock_backend.hpp"

using namespace pgsession;
using pgsession::test::FakeCommands;
using pgsession::test::MockDatabaseCreator;
using pgsession::test::MockProbe;

namespace {

struct NativeFixture {
    explicit NativeFixture(const std::string& name) : fake(name) {
        options.initdb = fake.initdb_ok();
        options.postgres = fake.postgres_ok();
        options.log_file = fake.path("postgres.log");
        options.shutdown_timeout_ms = 2000;
    }

    BackendFactory factory(std::shared_ptr<IReadinessProbe> probe, ReadinessOptions readiness = {5, 10}) {
        return [this, probe, readiness](const SessionConfig& config) -> std::unique_ptr<IBackend> {
            return std::make_unique<NativeBackend>(config,
                std::make_shared<NativeProcessManager>(options),
                std::make_shared<ReadinessProber>(probe, readiness),
                creator);
        };
    }

    [[nodiscard]] SessionConfig config(uint16_t port = 6100) const {
        return SessionConfig(BackendMode::NATIVE, LOOPBACK_HOST, port, "app", fake.path("data"));
    }

    FakeCommands fake;
    NativeOptions options;
    std::shared_ptr<MockDatabaseCreator> creator = std::make_shared<MockDatabaseCreator>();
};

} // anonymous namespace

TEST_CASE("Native session: init, spawn, ready, create, stop", "[native][e2e]") {
    NativeFixture fx("native-e2e");
    auto probe = std::make_shared<MockProbe>(2);

    // First session: fresh location
    {
        BackendSupervisor supervisor(fx.factory(probe));
        const auto endpoint = supervisor.start(fx.config());
        CHECK(endpoint.mode == BackendMode::NATIVE);
        CHECK(endpoint.port == 6100);
        CHECK(endpoint.db_name == "app");
        CHECK(fx.fake.initdb_calls() == 1);
        CHECK(probe->calls.load() == 2);

        auto* backend = dynamic_cast<NativeBackend*>(supervisor.backend());
        REQUIRE(backend != nullptr);
        auto* process = backend->process();
        REQUIRE(process != nullptr);
        CHECK_FALSE(process->exited());

        supervisor.stop();
        CHECK(process->exited());
        CHECK(process->log_sink_closed());
        CHECK(process->termination_signals_sent() == 1);
    }
    REQUIRE(fx.creator->calls == 1);

    // Restart on the same location: no init, "already exists" is swallowed
    {
        BackendSupervisor supervisor(fx.factory(std::make_shared<MockProbe>(1)));
        REQUIRE_NOTHROW((void)supervisor.start(fx.config(6101)));
        CHECK(fx.fake.initdb_calls() == 1);
        supervisor.stop();
    }
    CHECK(fx.creator->calls == 2);
    CHECK(fx.creator->names == std::vector<std::string>{"app", "app"});
}

TEST_CASE("Native session: creation failure does not abort the session", "[native][e2e]") {
    NativeFixture fx("native-create-fail");
    fx.creator->fail = true;

    BackendSupervisor supervisor(fx.factory(std::make_shared<MockProbe>(1)));
    REQUIRE_NOTHROW((void)supervisor.start(fx.config()));
    supervisor.stop();
}

TEST_CASE("Native session: readiness timeout terminates the spawned process", "[native][e2e]") {
    NativeFixture fx("native-timeout");
    auto probe = std::make_shared<MockProbe>(0);

    BackendSupervisor supervisor(fx.factory(probe, ReadinessOptions{3, 10}));
    try {
        (void)supervisor.start(fx.config());
        FAIL("start did not throw");
    } catch (const SessionError& e) {
        CHECK(e.category() == ErrorCategory::READINESS_TIMEOUT);
        CHECK(std::string(e.what()).find("6100") != std::string::npos);
    }
    CHECK(probe->calls.load() == 3);

    auto* backend = dynamic_cast<NativeBackend*>(supervisor.backend());
    REQUIRE(backend != nullptr);
    REQUIRE(backend->process() != nullptr);
    CHECK(backend->process()->exited());
    CHECK(backend->process()->termination_signals_sent() == 1);
    CHECK(fx.creator->calls == 0);
    CHECK(supervisor.stopped());
}

TEST_CASE("Native session: init failure never spawns", "[native][e2e]") {
    NativeFixture fx("native-init-fail");
    fx.options.initdb = fx.fake.initdb_failing();
    auto probe = std::make_shared<MockProbe>(1);

    BackendSupervisor supervisor(fx.factory(probe));
    try {
        (void)supervisor.start(fx.config());
        FAIL("start did not throw");
    } catch (const SessionError& e) {
        CHECK(e.category() == ErrorCategory::INITIALIZATION_FAILURE);
    }

    auto* backend = dynamic_cast<NativeBackend*>(supervisor.backend());
    REQUIRE(backend != nullptr);
    CHECK(backend->process() == nullptr);
    CHECK(probe->calls.load() == 0);
}

TEST_CASE("Native session: missing server binary is a ProcessStartFailure", "[native][e2e]") {
    NativeFixture fx("native-missing");
    fx.options.postgres = "/nonexistent/bin/postgres";

    BackendSupervisor supervisor(fx.factory(std::make_shared<MockProbe>(1)));
    try {
        (void)supervisor.start(fx.config());
        FAIL("start did not throw");
    } catch (const SessionError& e) {
        CHECK(e.category() == ErrorCategory::PROCESS_START_FAILURE);
        CHECK(std::string(e.what()).find("/nonexistent/bin/postgres") != std::string::npos);
    }
}
