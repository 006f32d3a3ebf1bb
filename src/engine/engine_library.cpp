#include "engine/engine_library.hpp"
#include "core/utils.hpp"

#include <dlfcn.h>
#include <format>

namespace pgsession {

EngineLibrary::EngineLibrary(std::string path, void* handle, EnginePlugin* plugin)
    : path_(std::move(path)), handle_(handle), plugin_(plugin) {}

EngineLibrary::~EngineLibrary() {
    // Destroy engine instance before dlclose
    if (plugin_) {
        if (plugin_->destroy) {
            plugin_->destroy(plugin_->instance);
        }
        delete plugin_;
        plugin_ = nullptr;
    }
    if (handle_) {
        dlclose(handle_);
    }
}

std::string EngineLibrary::name() const {
    const auto info = plugin_->get_info(plugin_->instance);
    return info.name ? info.name : "";
}

std::string EngineLibrary::version() const {
    const auto info = plugin_->get_info(plugin_->instance);
    return info.version ? info.version : "";
}

std::unique_ptr<EngineLibrary> EngineLibrary::load(const std::string& path) {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        utils::log::debug(std::format("Engine: {} not loadable: {}", path, err ? err : "unknown"));
        return nullptr;
    }

    const auto factory = reinterpret_cast<EnginePluginFactory>(
        dlsym(handle, PGSESSION_ENGINE_FACTORY_SYMBOL));
    if (!factory) {
        utils::log::warn(std::format("Engine [{}]: missing {} symbol",
            path, PGSESSION_ENGINE_FACTORY_SYMBOL));
        dlclose(handle);
        return nullptr;
    }

    auto* plugin = factory();
    if (!plugin) {
        utils::log::warn(std::format("Engine [{}]: factory returned null", path));
        dlclose(handle);
        return nullptr;
    }

    const auto info = plugin->get_info(plugin->instance);
    if (info.api_version != PGSESSION_ENGINE_API_VERSION) {
        utils::log::warn(std::format("Engine [{}]: API version mismatch (got {}, expected {})",
            path, info.api_version, PGSESSION_ENGINE_API_VERSION));
        if (plugin->destroy) plugin->destroy(plugin->instance);
        delete plugin;
        dlclose(handle);
        return nullptr;
    }

    utils::log::info(std::format("Engine loaded: {} v{} ({})",
        info.name ? info.name : "?", info.version ? info.version : "?", path));
    return std::make_unique<EngineLibrary>(path, handle, plugin);
}

std::unique_ptr<EngineLibrary> EngineLibrary::load_first(
    const std::vector<std::string>& candidates) {
    for (const auto& path : candidates) {
        if (auto lib = load(path)) {
            return lib;
        }
    }
    return nullptr;
}

} // namespace pgsession
