#include "db/pq_ping_probe.hpp"

#include <format>
#include <libpq-fe.h>

namespace pgsession {

PqPingProbe::PqPingProbe(std::string dbname, uint32_t connect_timeout_s)
    : dbname_(std::move(dbname)), connect_timeout_s_(connect_timeout_s) {}

std::string PqPingProbe::conninfo(const std::string& host, uint16_t port,
                                  const std::string& dbname, uint32_t connect_timeout_s) {
    return std::format("host={} port={} dbname={} connect_timeout={}",
        host, port, dbname, connect_timeout_s);
}

bool PqPingProbe::accepting_connections(const std::string& host, uint16_t port) {
    const auto info = conninfo(host, port, dbname_, connect_timeout_s_);
    const PGPing result = PQping(info.c_str());
    return result == PQPING_OK;
}

} // namespace pgsession
