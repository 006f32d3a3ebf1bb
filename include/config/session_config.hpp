#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pgsession {

enum class BackendMode {
    NATIVE,     // external postgres server process
    EMBEDDED    // in-process engine behind the protocol gateway
};

[[nodiscard]] constexpr const char* backend_mode_name(BackendMode mode) {
    return mode == BackendMode::EMBEDDED ? "embedded" : "native";
}

// ============================================================================
// User-supplied options (mirrors the TOML hierarchy)
// ============================================================================

struct NativeOptions {
    std::string initdb = "initdb";
    std::string postgres = "postgres";
    std::string log_file;
    bool log_truncate = true;
    bool verbose = false;
    uint32_t shutdown_timeout_ms = 10000;
};

struct ReadinessOptions {
    uint32_t max_attempts = 30;
    uint32_t interval_ms = 100;
};

struct GatewayOptions {
    std::string server_version = "16.3 (pgsession)";
    uint32_t max_connections = 100;
    std::string default_user = "postgres";
    std::string default_password = "postgres";
};

struct SeedOptions {
    std::string command;
};

struct LoggingOptions {
    std::string level = "info";
};

struct SessionOptions {
    std::string project_root;               // empty = current directory
    std::string db_path;                    // empty = derived from project root
    std::string db_name;                    // empty = project root basename
    uint16_t port = 0;                      // 0 = allocate a free port
    std::vector<std::string> engine_libraries;

    NativeOptions native;
    ReadinessOptions readiness;
    GatewayOptions gateway;
    SeedOptions seed;
    LoggingOptions logging;
};

// ============================================================================
// SessionConfig - resolved once at startup, never mutated afterwards
// ============================================================================

class SessionConfig {
public:
    SessionConfig(BackendMode mode, std::string host, uint16_t port,
                  std::string db_name, std::string storage_location)
        : mode_(mode),
          host_(std::move(host)),
          port_(port),
          db_name_(std::move(db_name)),
          storage_location_(std::move(storage_location)) {}

    [[nodiscard]] BackendMode mode() const { return mode_; }
    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] const std::string& db_name() const { return db_name_; }
    [[nodiscard]] const std::string& storage_location() const { return storage_location_; }

private:
    BackendMode mode_;
    std::string host_;
    uint16_t port_;
    std::string db_name_;
    std::string storage_location_;
};

// Loopback address every backend listens on
constexpr const char* LOOPBACK_HOST = "127.0.0.1";

} // namespace pgsession
