#include "engine/embedded_engine.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace pgsession {

namespace {

void collect_response(void* sink_ctx, const uint8_t* data, size_t len) {
    auto* frames = static_cast<ResponseFrames*>(sink_ctx);
    frames->emplace_back(data, data + len);
}

} // anonymous namespace

PluginEngine::PluginEngine(std::shared_ptr<EngineLibrary> library, std::string storage_location)
    : library_(std::move(library)),
      plugin_(library_->plugin()),
      storage_location_(std::move(storage_location)) {}

PluginEngine::~PluginEngine() {
    close();
}

std::shared_ptr<PluginEngine> PluginEngine::start(
    std::shared_ptr<EngineLibrary> library, const std::string& storage_location) {
    auto engine = std::make_shared<PluginEngine>(std::move(library), storage_location);
    engine->open();
    return engine;
}

void PluginEngine::open() {
    std::lock_guard lock(exec_mutex_);
    if (plugin_->open(plugin_->instance, storage_location_.c_str()) != 0) {
        throw SessionError(ErrorCategory::INITIALIZATION_FAILURE,
            std::format("Embedded engine failed to open {}: {}",
                storage_location_, last_error_locked()));
    }
    utils::log::info(std::format("Engine: opened {}", storage_location_));
}

void PluginEngine::await_ready() {
    std::lock_guard lock(ready_mutex_);
    if (ready_) return;

    if (closed_.load()) {
        throw SessionError(ErrorCategory::ENGINE_EXECUTION_ERROR, "Embedded engine is closed");
    }

    if (plugin_->wait_ready(plugin_->instance) != 0) {
        std::lock_guard exec_lock(exec_mutex_);
        throw SessionError(ErrorCategory::ENGINE_EXECUTION_ERROR,
            std::format("Embedded engine failed to initialize: {}", last_error_locked()));
    }
    ready_ = true;
}

ResponseFrames PluginEngine::execute(const std::vector<uint8_t>& frame_bytes) {
    std::lock_guard lock(exec_mutex_);
    if (closed_.load()) {
        throw SessionError(ErrorCategory::ENGINE_EXECUTION_ERROR, "Embedded engine is closed");
    }

    execute_count_.fetch_add(1, std::memory_order_relaxed);

    ResponseFrames frames;
    const int rc = plugin_->exec_protocol(plugin_->instance,
        frame_bytes.data(), frame_bytes.size(), collect_response, &frames);

    if (rc != 0) {
        std::optional<std::string> code;
        if (plugin_->last_error_code) {
            if (const char* c = plugin_->last_error_code(plugin_->instance); c && *c) {
                code = c;
            }
        }
        throw SessionError(ErrorCategory::ENGINE_EXECUTION_ERROR, last_error_locked(), std::move(code));
    }

    return frames;
}

void PluginEngine::close() {
    if (closed_.exchange(true)) return;

    std::lock_guard lock(exec_mutex_);
    if (plugin_->close) {
        plugin_->close(plugin_->instance);
    }
    utils::log::info(std::format("Engine: closed {}", storage_location_));
}

std::string PluginEngine::last_error_locked() const {
    if (plugin_->last_error) {
        if (const char* msg = plugin_->last_error(plugin_->instance); msg && *msg) {
            return msg;
        }
    }
    return "unknown engine error";
}

} // namespace pgsession
