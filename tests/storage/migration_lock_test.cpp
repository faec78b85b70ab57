/**
 * @file migration_lock_test.cpp
 * @brief Unit tests for the advisory migration lease
 */

#include <catch2/catch_test_macros.hpp>

#include <migrator/compat/process.hpp>
#include <migrator/storage/migration_lock.hpp>

#include <string>

#include "../fixtures/migration_fixture.hpp"

using namespace migrator;
using namespace migrator::storage;

TEST_CASE("migration_lock acquisition", "[storage][lock]") {
    auto db = test::open_memory_database();
    const auto lease = std::chrono::seconds(60);

    SECTION("lock table is derived from the ledger table") {
        CHECK(migration_lock::table_name_for("migrations") == "migrations_lock");

        auto lock = migration_lock::acquire(*db, "migrations", lease);
        REQUIRE(lock.is_ok());
        CHECK(db->table_exists("migrations_lock"));
        CHECK(lock.value()->is_held());
        CHECK_FALSE(lock.value()->owner().empty());
    }

    SECTION("owner token starts with the process id") {
        auto lock = migration_lock::acquire(*db, "migrations", lease);
        REQUIRE(lock.is_ok());
        const auto prefix = std::to_string(compat::current_pid()) + "@";
        CHECK(lock.value()->owner().rfind(prefix, 0) == 0);
    }

    SECTION("a live lease blocks a second holder") {
        auto first = migration_lock::acquire(*db, "migrations", lease);
        REQUIRE(first.is_ok());

        auto second = migration_lock::acquire(*db, "migrations", lease);
        REQUIRE(second.is_err());
        CHECK(second.error().code == error_codes::lock_held);
    }

    SECTION("release makes the lease available again") {
        {
            auto first = migration_lock::acquire(*db, "migrations", lease);
            REQUIRE(first.is_ok());
        }
        CHECK(test::query_int(*db, "SELECT COUNT(*) FROM migrations_lock;") == 0);

        auto second = migration_lock::acquire(*db, "migrations", lease);
        CHECK(second.is_ok());
    }

    SECTION("an expired lease is taken over") {
        REQUIRE(db->execute(R"(
            CREATE TABLE migrations_lock (
                id          INTEGER PRIMARY KEY CHECK (id = 1),
                owner       TEXT NOT NULL,
                acquired_at INTEGER NOT NULL,
                expires_at  INTEGER NOT NULL
            );
            INSERT INTO migrations_lock VALUES (1, 'crashed@0', 0, 1);
        )").is_ok());

        auto lock = migration_lock::acquire(*db, "migrations", lease);
        REQUIRE(lock.is_ok());
        CHECK(lock.value()->owner() != "crashed@0");
    }

    SECTION("release only removes its own lease") {
        auto lock = migration_lock::acquire(*db, "migrations", lease);
        REQUIRE(lock.is_ok());

        // Simulate a takeover after expiry
        REQUIRE(db->execute("UPDATE migrations_lock SET owner = 'other@1';").is_ok());
        REQUIRE(lock.value()->release().is_ok());
        CHECK(test::query_int(*db, "SELECT COUNT(*) FROM migrations_lock;") == 1);
    }
}
