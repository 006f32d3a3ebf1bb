#pragma once

#include <cstdint>
#include <string>

namespace pgsession {

enum class CreateOutcome {
    CREATED,
    ALREADY_EXISTS,
    FAILED
};

struct CreateResult {
    CreateOutcome outcome = CreateOutcome::FAILED;
    std::string message;

    // ALREADY_EXISTS is the normal case on every restart of a session
    [[nodiscard]] bool ok() const { return outcome != CreateOutcome::FAILED; }
};

class IDatabaseCreator {
public:
    virtual ~IDatabaseCreator() = default;

    [[nodiscard]] virtual CreateResult create_database(
        const std::string& host, uint16_t port, const std::string& db_name) = 0;
};

/**
 * @brief Issues CREATE DATABASE through libpq against the maintenance database
 */
class PgDatabaseCreator : public IDatabaseCreator {
public:
    // SQLSTATE duplicate_database
    static constexpr const char* SQLSTATE_DUPLICATE_DATABASE = "42P04";

    explicit PgDatabaseCreator(std::string maintenance_db = "postgres");

    [[nodiscard]] CreateResult create_database(
        const std::string& host, uint16_t port, const std::string& db_name) override;

private:
    std::string maintenance_db_;
};

} // namespace pgsession
