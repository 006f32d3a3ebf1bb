#include "supervisor/mode_detector.hpp"
#include "core/utils.hpp"

#include <format>

namespace pgsession {

ModeSelection ModeDetector::detect(const std::vector<std::string>& engine_candidates) {
    if (auto lib = EngineLibrary::load_first(engine_candidates)) {
        utils::log::info(std::format("Mode: embedded ({})", lib->path()));
        return ModeSelection::embedded(std::shared_ptr<EngineLibrary>(std::move(lib)));
    }

    if (!engine_candidates.empty()) {
        utils::log::info(std::format("Mode: native (none of {} engine libraries loadable)",
            engine_candidates.size()));
    } else {
        utils::log::info("Mode: native");
    }
    return ModeSelection::native();
}

} // namespace pgsession
