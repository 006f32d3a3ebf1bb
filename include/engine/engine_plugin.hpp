#pragma once

#include <cstddef>
#include <cstdint>

// C ABI for embedded database engines loaded via dlopen/dlsym.
// An engine library exports a factory function returning an EnginePlugin.

extern "C" {

// Engine metadata
struct EngineInfo {
    const char* name;
    const char* version;
    uint32_t api_version;   // Must match PGSESSION_ENGINE_API_VERSION
};

constexpr uint32_t PGSESSION_ENGINE_API_VERSION = 1;

// Receives one response frame sequence produced by exec_protocol
typedef void (*EngineResponseSink)(void* sink_ctx, const uint8_t* data, size_t len);

// Engine vtable. Functions returning int report 0 on success.
struct EnginePlugin {
    void* instance;
    EngineInfo (*get_info)(void* instance);
    int (*open)(void* instance, const char* storage_path);
    int (*wait_ready)(void* instance);
    int (*exec_protocol)(void* instance, const uint8_t* data, size_t len,
                         EngineResponseSink sink, void* sink_ctx);
    const char* (*last_error)(void* instance);        // null when unknown
    const char* (*last_error_code)(void* instance);   // SQLSTATE or null
    void (*close)(void* instance);
    void (*destroy)(void* instance);
};

// Factory function signature (engine libraries export this)
// "create_pgsession_engine_plugin" -> EnginePlugin*
typedef EnginePlugin* (*EnginePluginFactory)();

} // extern "C"

#define PGSESSION_ENGINE_FACTORY_SYMBOL "create_pgsession_engine_plugin"
