#pragma once

#include "config/session_config.hpp"
#include "engine/engine_library.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pgsession {

/**
 * @brief Outcome of the one-time capability check
 *
 * EMBEDDED always carries the loaded library; NATIVE never does.
 */
struct ModeSelection {
    BackendMode mode = BackendMode::NATIVE;
    std::shared_ptr<EngineLibrary> library;

    [[nodiscard]] static ModeSelection native() { return {}; }
    [[nodiscard]] static ModeSelection embedded(std::shared_ptr<EngineLibrary> lib) {
        return {BackendMode::EMBEDDED, std::move(lib)};
    }
};

class ModeDetector {
public:
    // First loadable engine library wins; none -> native
    [[nodiscard]] static ModeSelection detect(const std::vector<std::string>& engine_candidates);
};

} // namespace pgsession
