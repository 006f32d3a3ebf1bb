#pragma once

#include "config/session_config.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace pgsession {

// ============================================================================
// ConfigLoader - Extract typed session options from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SessionOptions options;

        static LoadResult ok(SessionOptions opts) {
            LoadResult result;
            result.success = true;
            result.options = std::move(opts);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load session options from a TOML file
     * @param config_path Path to pgsession.toml
     * @return LoadResult with parsed options or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load session options from a TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed options or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Check option ranges, returns one message per violation
     */
    [[nodiscard]] static std::vector<std::string> validate(const SessionOptions& options);

private:
    static SessionOptions extract_all_sections(const toml::table& root);
    static void extract_session(const toml::table& root, SessionOptions& opts);
    static void extract_engine(const toml::table& root, SessionOptions& opts);
    static NativeOptions extract_native(const toml::table& root);
    static ReadinessOptions extract_readiness(const toml::table& root);
    static GatewayOptions extract_gateway(const toml::table& root);
    static SeedOptions extract_seed(const toml::table& root);
    static LoggingOptions extract_logging(const toml::table& root);

    static LoadResult validate_and_return(SessionOptions options);
};

} // namespace pgsession
