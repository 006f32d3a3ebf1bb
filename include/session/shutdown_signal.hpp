#pragma once

#include <csignal>

namespace pgsession {

/**
 * @brief Process-wide record of SIGINT/SIGTERM
 *
 * The handler only stores the signal number; teardown runs on the main
 * thread when it next polls requested().
 */
class ShutdownSignal {
public:
    // Throws std::runtime_error if a handler cannot be installed
    static void install();

    [[nodiscard]] static bool requested();
    [[nodiscard]] static int signal_number();

    // Tests and the CLI may raise a shutdown without a real signal
    static void trigger(int sig);
    static void reset();
};

} // namespace pgsession
