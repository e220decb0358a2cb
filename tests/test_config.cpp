#include <catch2/catch.hpp>
#include <cstdlib>
#include <fstream>
#include "config.hpp"
#include "lib.hpp"
#include "tmpdir.hpp"

namespace {

    Config parse(const std::string& js, const std::string& base = "/srv/app") {
        return Config::from_json(nlohmann::json::parse(js), base);
    }

}

TEST_CASE("Configuration defaults", "[config]") {
    ::unsetenv(ENV_DSN);
    auto c = parse("{}");
    REQUIRE(c.dsn.empty());
    REQUIRE(c.driver == "postgres");
    REQUIRE(c.migration_dir == "/srv/app/migrations");
    REQUIRE(c.log_level == "info");
    REQUIRE(c.pool_size == 1);
    REQUIRE(c.statement_timeout_ms == 0);
    REQUIRE(c.index_length == 8);
    REQUIRE_THROWS(c.load_models());
}

TEST_CASE("Configuration values and path resolution", "[config]") {
    ::unsetenv(ENV_DSN);
    auto c = parse(R"({
      "dsn": "host=localhost dbname=app",
      "driver": "sqlite",
      "migration_dir": "/var/lib/app/migrations",
      "models": "schema/models.json",
      "log_level": "debug",
      "pool_size": 4,
      "statement_timeout_ms": 5000,
      "index_length": 4
    })");
    REQUIRE(c.dsn == "host=localhost dbname=app");
    REQUIRE(c.driver == "sqlite");
    REQUIRE(c.migration_dir == "/var/lib/app/migrations");
    REQUIRE(c.models_file == "/srv/app/schema/models.json");
    REQUIRE(c.pool_size == 4);
    REQUIRE(c.statement_timeout_ms == 5000);
    REQUIRE(c.index_length == 4);
}

TEST_CASE("Environment overrides the dsn", "[config]") {
    ::setenv(ENV_DSN, "dbname=from_env", 1);
    auto c = parse(R"({ "dsn": "dbname=from_file" })");
    ::unsetenv(ENV_DSN);
    REQUIRE(c.dsn == "dbname=from_env");
}

TEST_CASE("Invalid configuration values", "[config][error]") {
    REQUIRE_THROWS(parse(R"({ "driver": "oracle" })"));
    REQUIRE_THROWS(parse(R"({ "pool_size": 0 })"));
    REQUIRE_THROWS(parse(R"({ "statement_timeout_ms": -1 })"));
    REQUIRE_THROWS(parse(R"({ "index_length": 0 })"));
    REQUIRE_THROWS(parse(R"({ "models": 42 })"));
    REQUIRE_THROWS(parse(R"({ "pool_size": "four" })"));
    REQUIRE_THROWS(parse("[]"));
}

TEST_CASE("Models inline or from a file", "[config][models]") {
    SECTION("inline array") {
        auto c = parse(R"({ "models": [ { "name": "Book", "fields": [ { "name": "id", "sql_type": "SERIAL" } ] } ] })");
        auto reg = c.load_models();
        REQUIRE(reg.size() == 1);
        REQUIRE(reg.has("Book"));
    }
    SECTION("file next to the config") {
        TempDir tmp;
        std::ofstream(tmp.path / "models.json")
            << R"({ "models": [ { "name": "Author", "fields": [ { "name": "id", "sql_type": "SERIAL" } ] } ] })";
        std::ofstream(tmp.path / "ormigrate.json") << R"({ "models": "models.json", "migration_dir": "mig" })";

        auto c = Config::load(tmp.str("ormigrate.json"));
        REQUIRE(c.migration_dir == (tmp.path / "mig").lexically_normal().string());
        REQUIRE(c.load_models().has("Author"));
    }
}
