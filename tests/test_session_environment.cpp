#include <catch2/catch_test_macros.hpp>
#include "session/session_environment.hpp"

#include <cstdlib>
#include <map>
#include <string_view>

using namespace pgsession;

namespace {

std::map<std::string, std::string> as_map(const SessionEnvironment::Variables& vars) {
    return {vars.begin(), vars.end()};
}

SessionEnvironment::Lookup unset_lookup() {
    return [](const char*) -> const char* { return nullptr; };
}

Endpoint endpoint(BackendMode mode) {
    return Endpoint{mode, LOOPBACK_HOST, 6100, "app", "/tmp/pgsession/app-70467ef"};
}

} // namespace

TEST_CASE("SessionEnvironment: native exports location variables only", "[session][env]") {
    const auto vars = as_map(SessionEnvironment::build(
        endpoint(BackendMode::NATIVE), GatewayOptions{}, unset_lookup()));

    CHECK(vars.size() == 4);
    CHECK(vars.at("PGHOST") == "127.0.0.1");
    CHECK(vars.at("PGPORT") == "6100");
    CHECK(vars.at("PGDATABASE") == "app");
    CHECK(vars.at("PGDATA") == "/tmp/pgsession/app-70467ef");
    CHECK(vars.count("PGUSER") == 0);
    CHECK(vars.count("PGPASSWORD") == 0);
}

TEST_CASE("SessionEnvironment: embedded adds default credentials", "[session][env]") {
    GatewayOptions gateway;
    gateway.default_user = "dev";
    gateway.default_password = "devpw";

    const auto vars = as_map(SessionEnvironment::build(
        endpoint(BackendMode::EMBEDDED), gateway, unset_lookup()));

    CHECK(vars.size() == 6);
    CHECK(vars.at("PGUSER") == "dev");
    CHECK(vars.at("PGPASSWORD") == "devpw");
}

TEST_CASE("SessionEnvironment: embedded keeps credentials the user already set", "[session][env]") {
    const SessionEnvironment::Lookup lookup = [](const char* name) -> const char* {
        return std::string_view(name) == "PGUSER" ? "alice" : nullptr;
    };

    const auto vars = as_map(SessionEnvironment::build(
        endpoint(BackendMode::EMBEDDED), GatewayOptions{}, lookup));

    CHECK(vars.count("PGUSER") == 0);
    CHECK(vars.at("PGPASSWORD") == "postgres");
}

TEST_CASE("SessionEnvironment: apply exports into the process environment", "[session][env]") {
    SessionEnvironment::apply({{"PGSESSION_TEST_EXPORT", "42"}});
    const char* value = std::getenv("PGSESSION_TEST_EXPORT");
    REQUIRE(value != nullptr);
    CHECK(std::string(value) == "42");
    ::unsetenv("PGSESSION_TEST_EXPORT");
}
