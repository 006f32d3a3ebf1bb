#pragma once

#include "engine/engine_plugin.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pgsession {

// RAII wrapper for a loaded embedded-engine shared library
class EngineLibrary {
public:
    EngineLibrary(std::string path, void* handle, EnginePlugin* plugin);
    ~EngineLibrary();

    // Non-copyable, non-movable (plugin instance is tied to the handle)
    EngineLibrary(const EngineLibrary&) = delete;
    EngineLibrary& operator=(const EngineLibrary&) = delete;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] EnginePlugin* plugin() const { return plugin_; }
    [[nodiscard]] std::string name() const;
    [[nodiscard]] std::string version() const;

    /**
     * @brief dlopen a candidate library and instantiate its engine
     * @return nullptr if the library is missing, lacks the factory symbol,
     *         or was built against a different engine API version
     */
    [[nodiscard]] static std::unique_ptr<EngineLibrary> load(const std::string& path);

    /**
     * @brief Try candidates in order, first loadable one wins
     */
    [[nodiscard]] static std::unique_ptr<EngineLibrary> load_first(
        const std::vector<std::string>& candidates);

private:
    std::string path_;
    void* handle_;
    EnginePlugin* plugin_;
};

} // namespace pgsession
