#pragma once

#include "supervisor/backend.hpp"
#include "readiness/readiness_prober.hpp"
#include "db/database_creator.hpp"
#include "core/error.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

namespace pgsession::test {

// Probe that starts succeeding after a number of failed attempts
class MockProbe : public IReadinessProbe {
public:
    explicit MockProbe(uint32_t succeed_on_attempt = 1) : succeed_on_(succeed_on_attempt) {}

    bool accepting_connections(const std::string& /*host*/, uint16_t /*port*/) override {
        const auto n = calls.fetch_add(1) + 1;
        call_times.push_back(std::chrono::steady_clock::now());
        return succeed_on_ != 0 && n >= succeed_on_;
    }

    std::atomic<uint32_t> calls{0};
    std::vector<std::chrono::steady_clock::time_point> call_times;

private:
    uint32_t succeed_on_;   // 0 = never
};

// Reports CREATED once, ALREADY_EXISTS afterwards, like a real server across restarts
class MockDatabaseCreator : public IDatabaseCreator {
public:
    CreateResult create_database(const std::string& /*host*/, uint16_t /*port*/,
                                 const std::string& db_name) override {
        names.push_back(db_name);
        if (fail) {
            return CreateResult{CreateOutcome::FAILED, "connection refused"};
        }
        if (calls++ == 0) {
            return CreateResult{CreateOutcome::CREATED, ""};
        }
        return CreateResult{CreateOutcome::ALREADY_EXISTS, "database already exists"};
    }

    uint32_t calls = 0;
    bool fail = false;
    std::vector<std::string> names;
};

// Backend that records start/stop calls
class MockBackend : public IBackend {
public:
    explicit MockBackend(BackendMode mode = BackendMode::NATIVE) : mode_(mode) {}

    Endpoint start() override {
        start_calls.fetch_add(1);
        if (fail_with) {
            throw SessionError(*fail_with, "mock backend failed to start");
        }
        return Endpoint{mode_, LOOPBACK_HOST, 54321, "mockdb", "/tmp/mock"};
    }

    void stop() override {
        stop_calls.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(stop_delay_ms));
    }

    BackendMode mode() const override { return mode_; }

    std::atomic<uint32_t> start_calls{0};
    std::atomic<uint32_t> stop_calls{0};
    std::optional<ErrorCategory> fail_with;
    uint32_t stop_delay_ms = 0;

private:
    BackendMode mode_;
};

} // namespace pgsession::test
