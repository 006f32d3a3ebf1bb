#include "session/shutdown_signal.hpp"

#include <signal.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>

namespace pgsession {

namespace {

volatile std::sig_atomic_t g_signal = 0;

void on_shutdown_signal(int sig) {
    g_signal = sig;
}

} // anonymous namespace

void ShutdownSignal::install() {
    struct sigaction sa{};
    sa.sa_handler = on_shutdown_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    for (const int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &sa, nullptr) != 0) {
            throw std::runtime_error(std::format("sigaction({}) failed: {}", sig, strerror(errno)));
        }
    }
}

bool ShutdownSignal::requested() {
    return g_signal != 0;
}

int ShutdownSignal::signal_number() {
    return g_signal;
}

void ShutdownSignal::trigger(int sig) {
    g_signal = sig;
}

void ShutdownSignal::reset() {
    g_signal = 0;
}

} // namespace pgsession
