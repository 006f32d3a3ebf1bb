#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace pgsession;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() /
                    ("pgsession_test_include_" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("ConfigInclude: included file supplies defaults", "[config][include]") {
    TmpDir tmp;

    tmp.file("team.toml", R"(
[native]
initdb = "/opt/pg/bin/initdb"
postgres = "/opt/pg/bin/postgres"

[readiness]
max_attempts = 60
)");

    const auto main_path = tmp.file("pgsession.toml", R"(
include = "team.toml"

[session]
db_name = "mine"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.options.native.postgres == "/opt/pg/bin/postgres");
    CHECK(result.options.readiness.max_attempts == 60);
    CHECK(result.options.db_name == "mine");
}

TEST_CASE("ConfigInclude: main file overrides included scalars", "[config][include]") {
    TmpDir tmp;

    tmp.file("team.toml", R"(
[session]
port = 5432
db_name = "team"
)");

    const auto main_path = tmp.file("pgsession.toml", R"(
include = "team.toml"

[session]
port = 6000
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.options.port == 6000);
    CHECK(result.options.db_name == "team");
}

TEST_CASE("ConfigInclude: array of includes, relative to including file", "[config][include]") {
    TmpDir tmp;

    tmp.file("conf/native.toml", R"(
[native]
verbose = true
)");
    tmp.file("conf/gateway.toml", R"(
[gateway]
max_connections = 7
)");

    const auto main_path = tmp.file("pgsession.toml", R"(
include = ["conf/native.toml", "conf/gateway.toml"]
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.options.native.verbose);
    CHECK(result.options.gateway.max_connections == 7);
}

TEST_CASE("ConfigInclude: circular include is rejected", "[config][include]") {
    TmpDir tmp;

    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");

    auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Circular") != std::string::npos);
}

TEST_CASE("ConfigInclude: missing include fails", "[config][include]") {
    TmpDir tmp;

    const auto main_path = tmp.file("pgsession.toml", "include = \"missing.toml\"\n");

    auto result = ConfigLoader::load_from_file(main_path);
    CHECK_FALSE(result.success);
}
