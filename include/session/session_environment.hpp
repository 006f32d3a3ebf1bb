#pragma once

#include "supervisor/backend.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace pgsession {

/**
 * @brief PG* variables a workload uses to find the session database
 */
class SessionEnvironment {
public:
    using Lookup = std::function<const char*(const char*)>;
    using Variables = std::vector<std::pair<std::string, std::string>>;

    /**
     * PGHOST, PGPORT, PGDATABASE and PGDATA always; in embedded mode also
     * PGUSER/PGPASSWORD, each only when the lookup reports it unset.
     */
    [[nodiscard]] static Variables build(const Endpoint& endpoint,
                                         const GatewayOptions& gateway,
                                         const Lookup& lookup);

    [[nodiscard]] static Variables build(const Endpoint& endpoint, const GatewayOptions& gateway);

    // setenv() every variable, overwriting
    static void apply(const Variables& vars);
};

} // namespace pgsession
