/**
 * @file startup_test.cpp
 * @brief Unit tests for the service startup migration hook
 */

#include <catch2/catch_test_macros.hpp>

#include <migrator/executor/startup.hpp>
#include <migrator/storage/version_ledger.hpp>

#include "../fixtures/migration_fixture.hpp"

using namespace migrator;

TEST_CASE("run_startup_migrations", "[executor][startup]") {
    test::migrations_dir dir;
    auto db = test::open_memory_database();

    auto cfg = config::default_config();
    cfg.migrations.directory = dir.path();
    cfg.migrations.ledger_table = "service_migrations";

    SECTION("applies pending scripts into the configured ledger") {
        dir.add("001_init.sql", "CREATE TABLE sessions (id INTEGER);");

        auto report = executor::run_startup_migrations(*db, cfg);
        REQUIRE(report.is_ok());
        CHECK(report.value().applied.size() == 1);
        CHECK(db->table_exists("sessions"));
        CHECK(db->table_exists("service_migrations"));
        CHECK_FALSE(db->table_exists("migrations"));

        auto again = executor::run_startup_migrations(*db, cfg);
        REQUIRE(again.is_ok());
        CHECK(again.value().up_to_date());
    }

    SECTION("a failing script is reported") {
        dir.add("001_bad.sql", "THIS IS NOT SQL;");

        auto report = executor::run_startup_migrations(*db, cfg);
        REQUIRE(report.is_err());
        CHECK(report.error().code == error_codes::execution_failed);
    }

    SECTION("invalid configuration is refused") {
        cfg.migrations.ledger_table = "bad name";
        auto report = executor::run_startup_migrations(*db, cfg);
        REQUIRE(report.is_err());
        CHECK(report.error().code == error_codes::invalid_configuration);
    }
}
