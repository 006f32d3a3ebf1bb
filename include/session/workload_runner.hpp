#pragma once

#include <string>
#include <vector>

namespace pgsession {

/**
 * @brief Runs the session workload and forwards the first shutdown signal to it
 *
 * Returns the workload's exit code, 128 + signal when it was killed, 127 when
 * it cannot be started. A shutdown already requested before the launch skips
 * the workload and returns 128 + that signal.
 */
[[nodiscard]] int run_workload(const std::vector<std::string>& command);

} // namespace pgsession
