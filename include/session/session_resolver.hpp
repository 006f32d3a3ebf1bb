#pragma once

#include "config/session_config.hpp"

#include <string>

namespace pgsession {

/**
 * @brief Turns user options plus the detected mode into the immutable SessionConfig
 *
 * Every derived value (project hash, default storage location, port,
 * database name) is computed here exactly once. The embedded storage-shape
 * correction (an existing directory where a file was expected) also
 * happens here, before any component sees the location.
 */
class SessionResolver {
public:
    explicit SessionResolver(SessionOptions options, std::string temp_dir = default_temp_dir());

    /**
     * @throws SessionError(CONFIG_ERROR) when no port can be allocated or
     *         the storage location cannot be prepared
     */
    [[nodiscard]] SessionConfig resolve(BackendMode mode) const;

    [[nodiscard]] const std::string& project_root() const { return project_root_; }
    [[nodiscard]] std::string db_name() const;

    // First 7 hex chars of SHA-256(path)
    [[nodiscard]] static std::string root_hash(const std::string& path);

    // $TMPDIR or /tmp
    [[nodiscard]] static std::string default_temp_dir();

    [[nodiscard]] std::string default_storage_location(BackendMode mode) const;

    // Embedded only: dir/ or existing dir -> dir/<db_name>.db
    [[nodiscard]] std::string correct_storage_shape(const std::string& location) const;

private:
    SessionOptions options_;
    std::string temp_dir_;
    std::string project_root_;
};

} // namespace pgsession
