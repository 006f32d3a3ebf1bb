#include <catch2/catch_test_macros.hpp>
#include "process/native_process_manager.hpp"
#include "core/error.hpp"
#include "mocks/fake_commands.hpp"

#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace pgsession;
using pgsession::test::FakeCommands;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // anonymous namespace

TEST_CASE("NativeProcessManager: fresh location runs initdb exactly once", "[native]") {
    FakeCommands fake("init-once");
    NativeOptions opts;
    opts.initdb = fake.initdb_ok();
    NativeProcessManager manager(opts);

    const auto data_dir = fake.path("data");
    CHECK(manager.ensure_initialized(data_dir));
    CHECK(fake.initdb_calls() == 1);
    CHECK(std::filesystem::exists(std::filesystem::path(data_dir) / "PG_VERSION"));

    // Marker present: never invoked again
    CHECK_FALSE(manager.ensure_initialized(data_dir));
    CHECK_FALSE(manager.ensure_initialized(data_dir));
    CHECK(fake.initdb_calls() == 1);
}

TEST_CASE("NativeProcessManager: existing marker skips initdb", "[native]") {
    FakeCommands fake("marker");
    NativeOptions opts;
    opts.initdb = fake.initdb_ok();
    NativeProcessManager manager(opts);

    const auto data_dir = fake.path("data");
    std::filesystem::create_directories(data_dir);
    std::ofstream(data_dir + "/PG_VERSION") << "16\n";

    CHECK_FALSE(manager.ensure_initialized(data_dir));
    CHECK(fake.initdb_calls() == 0);
}

TEST_CASE("NativeProcessManager: initdb failure is an InitializationFailure", "[native]") {
    FakeCommands fake("init-fail");
    NativeOptions opts;
    opts.initdb = fake.initdb_failing(3);
    NativeProcessManager manager(opts);

    try {
        manager.ensure_initialized(fake.path("data"));
        FAIL("ensure_initialized did not throw");
    } catch (const SessionError& e) {
        CHECK(e.category() == ErrorCategory::INITIALIZATION_FAILURE);
        CHECK(std::string(e.what()).find("exit code 3") != std::string::npos);
    }
}

TEST_CASE("NativeProcessManager: missing initdb names the command", "[native]") {
    NativeOptions opts;
    opts.initdb = "/nonexistent/bin/initdb";
    NativeProcessManager manager(opts);
    FakeCommands fake("init-missing");

    try {
        manager.ensure_initialized(fake.path("data"));
        FAIL("ensure_initialized did not throw");
    } catch (const SessionError& e) {
        CHECK(e.category() == ErrorCategory::INITIALIZATION_FAILURE);
        CHECK(std::string(e.what()).find("/nonexistent/bin/initdb") != std::string::npos);
    }
}

TEST_CASE("NativeProcessManager: missing postgres is a ProcessStartFailure", "[native]") {
    FakeCommands fake("spawn-missing");
    NativeOptions opts;
    opts.postgres = "/nonexistent/bin/postgres";
    NativeProcessManager manager(opts);

    try {
        (void)manager.spawn(fake.path("data"), 5999);
        FAIL("spawn did not throw");
    } catch (const SessionError& e) {
        CHECK(e.category() == ErrorCategory::PROCESS_START_FAILURE);
        CHECK(std::string(e.what()).find("/nonexistent/bin/postgres") != std::string::npos);
    }
}

TEST_CASE("NativeProcessManager: terminate signals once and closes the log sink", "[native]") {
    FakeCommands fake("terminate");
    NativeOptions opts;
    opts.postgres = fake.postgres_ok();
    opts.log_file = fake.path("postgres.log");
    NativeProcessManager manager(opts);

    auto handle = manager.spawn(fake.path("data"), 6001);
    REQUIRE(handle->output() == OutputPolicy::FILE);
    CHECK_FALSE(handle->exited());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    manager.terminate(*handle);
    CHECK(handle->exited());
    CHECK(handle->log_sink_closed());
    CHECK(handle->termination_signals_sent() == 1);
    CHECK_FALSE(handle->exited_unexpectedly());

    manager.terminate(*handle);
    CHECK(handle->termination_signals_sent() == 1);

    const auto log = read_file(opts.log_file);
    CHECK(log.find("postgres started -D") != std::string::npos);
    CHECK(log.find("-p 6001") != std::string::npos);
}

TEST_CASE("NativeProcessManager: concurrent terminate signals once", "[native]") {
    FakeCommands fake("terminate-concurrent");
    NativeOptions opts;
    opts.postgres = fake.postgres_ok();
    NativeProcessManager manager(opts);

    auto handle = manager.spawn(fake.path("data"), 6002);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&] { handle->terminate(); });
    }
    for (auto& t : threads) t.join();

    CHECK(handle->exited());
    CHECK(handle->termination_signals_sent() == 1);
}

TEST_CASE("NativeProcessManager: SIGKILL after the shutdown timeout", "[native]") {
    FakeCommands fake("stubborn");
    NativeOptions opts;
    opts.postgres = fake.postgres_stubborn();
    opts.shutdown_timeout_ms = 300;
    NativeProcessManager manager(opts);

    auto handle = manager.spawn(fake.path("data"), 6003);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    handle->terminate();

    CHECK(handle->exited());
    const auto status = handle->exit_status();
    REQUIRE(status.has_value());
    CHECK_FALSE(status->exited);
    CHECK(status->signal == SIGKILL);
    CHECK(handle->termination_signals_sent() == 1);
}

TEST_CASE("NativeProcessManager: unexpected exit is reported, not thrown", "[native]") {
    FakeCommands fake("crash");
    NativeOptions opts;
    opts.postgres = fake.postgres_crashing(4);
    opts.log_file = fake.path("postgres.log");
    NativeProcessManager manager(opts);

    auto handle = manager.spawn(fake.path("data"), 6004);
    REQUIRE(handle->wait_for_exit(std::chrono::milliseconds(5000)));
    CHECK(handle->exited_unexpectedly());
    CHECK(handle->log_sink_closed());
    REQUIRE(handle->exit_status().has_value());
    CHECK(handle->exit_status()->code == 4);

    // terminate after an external exit sends nothing
    handle->terminate();
    CHECK(handle->termination_signals_sent() == 0);
    CHECK(read_file(opts.log_file).find("could not bind") != std::string::npos);
}

TEST_CASE("NativeProcessManager: log file truncated or appended per session", "[native]") {
    FakeCommands fake("log-mode");
    const auto log_path = fake.path("postgres.log");

    NativeOptions opts;
    opts.postgres = fake.postgres_ok();
    opts.log_file = log_path;

    SECTION("truncate") {
        std::ofstream(log_path) << "previous session\n";
        opts.log_truncate = true;
        NativeProcessManager manager(opts);
        auto handle = manager.spawn(fake.path("data"), 6005);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        handle->terminate();
        CHECK(read_file(log_path).find("previous session") == std::string::npos);
    }

    SECTION("append") {
        std::ofstream(log_path) << "previous session\n";
        opts.log_truncate = false;
        NativeProcessManager manager(opts);
        auto handle = manager.spawn(fake.path("data"), 6006);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        handle->terminate();
        const auto log = read_file(log_path);
        CHECK(log.find("previous session") != std::string::npos);
        CHECK(log.find("postgres started") != std::string::npos);
    }
}

TEST_CASE("NativeProcessManager: log sink policy priority", "[native]") {
    FakeCommands fake("log-policy");
    NativeOptions opts;
    opts.postgres = fake.postgres_ok();

    SECTION("verbose wins over a log file") {
        opts.verbose = true;
        opts.log_file = fake.path("ignored.log");
        NativeProcessManager manager(opts);
        auto handle = manager.spawn(fake.path("data"), 6007);
        CHECK(handle->output() == OutputPolicy::INHERIT);
        handle->terminate();
        CHECK_FALSE(std::filesystem::exists(fake.path("ignored.log")));
    }

    SECTION("no log file discards") {
        NativeProcessManager manager(opts);
        auto handle = manager.spawn(fake.path("data"), 6008);
        CHECK(handle->output() == OutputPolicy::DISCARD);
        handle->terminate();
    }

    SECTION("unopenable log file falls back to inherit") {
        opts.log_file = "/nonexistent/dir/postgres.log";
        NativeProcessManager manager(opts);
        auto handle = manager.spawn(fake.path("data"), 6009);
        CHECK(handle->output() == OutputPolicy::INHERIT);
        handle->terminate();
    }
}
