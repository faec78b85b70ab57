/**
 * @file migration_scaffolder_test.cpp
 * @brief Unit tests for migration scaffolding
 */

#include <catch2/catch_test_macros.hpp>

#include <migrator/catalog/migration_scaffolder.hpp>

#include "../fixtures/migration_fixture.hpp"

using namespace migrator;
using namespace migrator::catalog;

TEST_CASE("sanitize_name", "[catalog][scaffold]") {
    CHECK(migration_scaffolder::sanitize_name("add_users") == "add_users");
    CHECK(migration_scaffolder::sanitize_name("Add Users Table") == "add_users_table");
    CHECK(migration_scaffolder::sanitize_name("add  -- users!") == "add_users_");
    CHECK(migration_scaffolder::sanitize_name("v2.Schema") == "v2_schema");
}

TEST_CASE("format_version", "[catalog][scaffold]") {
    CHECK(migration_scaffolder::format_version(1) == "001");
    CHECK(migration_scaffolder::format_version(42) == "042");
    CHECK(migration_scaffolder::format_version(1234) == "1234");
}

TEST_CASE("templates", "[catalog][scaffold]") {
    auto forward = migration_scaffolder::forward_template(
        "003_add_index.sql", "add_index", "alice", "2026-10-19");
    CHECK(forward ==
          "-- Migration: 003_add_index.sql\n"
          "-- Description: add index\n"
          "-- Author: alice\n"
          "-- Date: 2026-10-19\n"
          "\n"
          "-- Your migration SQL here\n");

    auto rollback =
        migration_scaffolder::rollback_template("003_add_index.sql", "add_index");
    CHECK(rollback ==
          "-- Rollback for: 003_add_index.sql\n"
          "-- Description: Rollback add_index\n"
          "\n"
          "-- Your rollback SQL here\n");
}

TEST_CASE("migration_scaffolder create", "[catalog][scaffold]") {
    test::migrations_dir dir;
    migration_catalog catalog(dir.path());
    migration_scaffolder scaffolder(catalog);

    SECTION("first migration is version 001") {
        auto result = scaffolder.create("Initial Schema");
        REQUIRE(result.is_ok());
        CHECK(result.value().version == 1);
        CHECK(result.value().file_name == "001_initial_schema.sql");
        CHECK(std::filesystem::exists(dir.path() / "001_initial_schema.sql"));
        CHECK(std::filesystem::exists(dir.path() / "rollback" /
                                      "001_initial_schema.rollback.sql"));

        auto content = test::read_file(result.value().script_path);
        CHECK(content.rfind("-- Migration: 001_initial_schema.sql\n", 0) == 0);
        CHECK(content.find("-- Description: initial schema\n") != std::string::npos);
    }

    SECTION("next version follows the highest numeric version") {
        dir.add("9_nine.sql", "SELECT 9;");
        dir.add("10_ten.sql", "SELECT 10;");

        auto result = scaffolder.create("eleven");
        REQUIRE(result.is_ok());
        CHECK(result.value().version == 11);
        CHECK(result.value().file_name == "011_eleven.sql");

        auto all = catalog.list_all();
        REQUIRE(all.is_ok());
        CHECK(all.value().back().version == 11);
        CHECK(all.value().back().rollback_path.has_value());
    }

    SECTION("unusable names are rejected") {
        auto result = scaffolder.create("!!!");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::invalid_argument);
    }

    SECTION("failed rollback stub leaves no forward script behind") {
        // Dangling link: not an existing file, but cannot be written either
        std::filesystem::create_directories(dir.path() / "rollback");
        std::filesystem::create_symlink(dir.temp_root() / "nowhere" / "stub.sql",
                                        dir.path() / "rollback" /
                                            "001_init.rollback.sql");

        auto result = scaffolder.create("init");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::file_write_error);
        CHECK_FALSE(std::filesystem::exists(dir.path() / "001_init.sql"));
        CHECK(catalog.next_version().value() == 1);
    }

    SECTION("existing files are never overwritten") {
        dir.add_rollback("001_init.rollback.sql", "-- keep me\n");

        auto result = scaffolder.create("init");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::migration_exists);
        CHECK(test::read_file(dir.path() / "rollback" / "001_init.rollback.sql") ==
              "-- keep me\n");
        CHECK_FALSE(std::filesystem::exists(dir.path() / "001_init.sql"));
    }
}
