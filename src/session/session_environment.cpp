#include "session/session_environment.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>

namespace pgsession {

SessionEnvironment::Variables SessionEnvironment::build(const Endpoint& endpoint,
                                                        const GatewayOptions& gateway,
                                                        const Lookup& lookup) {
    Variables vars = {
        {"PGHOST", endpoint.host},
        {"PGPORT", std::to_string(endpoint.port)},
        {"PGDATABASE", endpoint.db_name},
        {"PGDATA", endpoint.storage_location},
    };

    // Some clients insist on credentials even under trust auth
    if (endpoint.mode == BackendMode::EMBEDDED) {
        const char* user = lookup("PGUSER");
        if (!user || !*user) vars.emplace_back("PGUSER", gateway.default_user);
        const char* password = lookup("PGPASSWORD");
        if (!password || !*password) vars.emplace_back("PGPASSWORD", gateway.default_password);
    }
    return vars;
}

SessionEnvironment::Variables SessionEnvironment::build(const Endpoint& endpoint,
                                                        const GatewayOptions& gateway) {
    return build(endpoint, gateway, [](const char* name) { return std::getenv(name); });
}

void SessionEnvironment::apply(const Variables& vars) {
    for (const auto& [name, value] : vars) {
        if (::setenv(name.c_str(), value.c_str(), 1) != 0) {
            utils::log::warn(std::format("Session: failed to export {}", name));
            continue;
        }
        utils::log::debug(std::format("Session: {}={}", name, name == "PGPASSWORD" ? "***" : value));
    }
}

} // namespace pgsession
