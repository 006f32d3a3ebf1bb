#pragma once

#include "engine/engine_library.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pgsession {

using ResponseFrames = std::vector<std::vector<uint8_t>>;

/**
 * @brief In-process database engine speaking raw protocol frames
 *
 * execute() takes the exact bytes of one or more client frames and returns
 * the response frame sequences in the order the engine produced them.
 * Failures are raised as SessionError(ENGINE_EXECUTION_ERROR).
 */
class IEmbeddedEngine {
public:
    virtual ~IEmbeddedEngine() = default;

    // Blocks until the engine finished its own initialization
    virtual void await_ready() = 0;

    [[nodiscard]] virtual ResponseFrames execute(const std::vector<uint8_t>& frame_bytes) = 0;

    // Idempotent
    virtual void close() = 0;
};

/**
 * @brief IEmbeddedEngine backed by a dlopen'ed EnginePlugin
 *
 * One instance per session. execute() calls are serialized on an internal
 * mutex because gateway connections run on their own threads and engine
 * libraries are not required to be reentrant.
 */
class PluginEngine : public IEmbeddedEngine {
public:
    PluginEngine(std::shared_ptr<EngineLibrary> library, std::string storage_location);
    ~PluginEngine() override;

    PluginEngine(const PluginEngine&) = delete;
    PluginEngine& operator=(const PluginEngine&) = delete;

    /**
     * @brief Open the engine store at the given location
     * @throws SessionError(INITIALIZATION_FAILURE) when the engine refuses
     */
    [[nodiscard]] static std::shared_ptr<PluginEngine> start(
        std::shared_ptr<EngineLibrary> library, const std::string& storage_location);

    void await_ready() override;
    [[nodiscard]] ResponseFrames execute(const std::vector<uint8_t>& frame_bytes) override;
    void close() override;

    [[nodiscard]] const std::string& storage_location() const { return storage_location_; }
    [[nodiscard]] uint64_t execute_count() const {
        return execute_count_.load(std::memory_order_relaxed);
    }

private:
    void open();
    [[nodiscard]] std::string last_error_locked() const;

    std::shared_ptr<EngineLibrary> library_;
    EnginePlugin* plugin_;
    std::string storage_location_;

    std::mutex exec_mutex_;
    std::mutex ready_mutex_;
    bool ready_ = false;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> execute_count_{0};
};

} // namespace pgsession
