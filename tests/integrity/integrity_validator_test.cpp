/**
 * @file integrity_validator_test.cpp
 * @brief Unit tests for ledger checksum validation
 */

#include <catch2/catch_test_macros.hpp>

#include <migrator/catalog/migration_catalog.hpp>
#include <migrator/executor/migration_executor.hpp>
#include <migrator/integrity/checksum.hpp>
#include <migrator/integrity/integrity_validator.hpp>
#include <migrator/storage/version_ledger.hpp>

#include "../fixtures/migration_fixture.hpp"

using namespace migrator;
using namespace migrator::integrity;

TEST_CASE("integrity_validator", "[integrity][validator]") {
    test::migrations_dir dir;
    dir.add("001_init.sql", "CREATE TABLE a (id INTEGER);");
    dir.add("002_add_col.sql", "ALTER TABLE a ADD COLUMN name TEXT;");

    auto db = test::open_memory_database();
    catalog::migration_catalog catalog(dir.path());
    storage::version_ledger ledger(*db);
    integrity_validator validator(catalog, ledger);

    SECTION("no ledger table means nothing to check") {
        auto report = validator.validate();
        REQUIRE(report.is_ok());
        CHECK(report.value().valid);
        CHECK(report.value().checked == 0);
        CHECK_FALSE(ledger.exists());
    }

    executor::migration_executor exec(*db, catalog, ledger);
    REQUIRE(exec.apply_pending().is_ok());

    SECTION("untouched scripts are valid") {
        auto report = validator.validate();
        REQUIRE(report.is_ok());
        CHECK(report.value().valid);
        CHECK(report.value().checked == 2);
        CHECK(report.value().violations.empty());
    }

    SECTION("edited script yields exactly one checksum violation") {
        dir.add("002_add_col.sql", "ALTER TABLE a ADD COLUMN title TEXT;");

        auto report = validator.validate();
        REQUIRE(report.is_ok());
        CHECK_FALSE(report.value().valid);
        REQUIRE(report.value().violations.size() == 1);

        const auto& violation = report.value().violations[0];
        CHECK(violation.version == 2);
        CHECK(violation.name == "002_add_col.sql");
        CHECK(violation.type == violation_type::checksum_mismatch);
        CHECK(violation.expected_checksum ==
              sha256_hex("ALTER TABLE a ADD COLUMN name TEXT;").value());
        REQUIRE(violation.actual_checksum.has_value());
        CHECK(*violation.actual_checksum ==
              sha256_hex("ALTER TABLE a ADD COLUMN title TEXT;").value());
    }

    SECTION("deleted script yields a missing file violation") {
        dir.remove("001_init.sql");

        auto report = validator.validate();
        REQUIRE(report.is_ok());
        REQUIRE(report.value().violations.size() == 1);
        CHECK(report.value().violations[0].version == 1);
        CHECK(report.value().violations[0].type == violation_type::missing_file);
        CHECK_FALSE(report.value().violations[0].actual_checksum.has_value());
    }

    SECTION("validation never mutates the ledger") {
        dir.add("002_add_col.sql", "-- edited\n");
        REQUIRE(validator.validate().is_ok());

        auto applied = ledger.list_applied();
        REQUIRE(applied.is_ok());
        REQUIRE(applied.value().size() == 2);
        CHECK(applied.value()[1].checksum ==
              sha256_hex("ALTER TABLE a ADD COLUMN name TEXT;").value());
    }
}
