/**
 * @file migration_executor_test.cpp
 * @brief Unit tests for migration_executor
 */

#include <catch2/catch_test_macros.hpp>

#include <migrator/catalog/migration_catalog.hpp>
#include <migrator/executor/migration_executor.hpp>
#include <migrator/storage/migration_lock.hpp>
#include <migrator/storage/version_ledger.hpp>

#include "../fixtures/migration_fixture.hpp"

using namespace migrator;
using namespace migrator::executor;

namespace {

/// Executor wired to an in-memory database and a temporary directory
struct executor_fixture {
    test::migrations_dir dir;
    std::unique_ptr<storage::database_connection> db = test::open_memory_database();
    catalog::migration_catalog script_catalog{dir.path()};
    storage::version_ledger ledger{*db};
    migration_executor exec{*db, script_catalog, ledger};

    auto ledger_versions() -> std::vector<std::int64_t> {
        std::vector<std::int64_t> versions;
        auto applied = ledger.list_applied();
        if (applied.is_ok()) {
            for (const auto& entry : applied.value()) {
                versions.push_back(entry.version);
            }
        }
        return versions;
    }

    void add_users_pair() {
        dir.add("001_init.sql", "CREATE TABLE users (id INTEGER PRIMARY KEY);");
        dir.add("002_add_col.sql", "ALTER TABLE users ADD COLUMN email TEXT;");
        dir.add_rollback("001_init.rollback.sql", "DROP TABLE users;");
        dir.add_rollback("002_add_col.rollback.sql",
                         "ALTER TABLE users DROP COLUMN email;");
    }
};

}  // namespace

// ============================================================================
// Forward Migrations
// ============================================================================

TEST_CASE("apply_pending on an empty directory", "[executor][apply]") {
    executor_fixture f;

    auto report = f.exec.apply_pending();
    REQUIRE(report.is_ok());
    CHECK(report.value().up_to_date());
    CHECK(report.value().applied.empty());
    CHECK(f.ledger.exists());

    auto status = f.exec.status();
    REQUIRE(status.is_ok());
    CHECK(status.value().applied.empty());
    CHECK(status.value().pending.empty());
}

TEST_CASE("apply_pending applies in order and is idempotent", "[executor][apply]") {
    executor_fixture f;
    f.add_users_pair();

    auto first = f.exec.apply_pending();
    REQUIRE(first.is_ok());
    CHECK(first.value().pending_count == 2);
    REQUIRE(first.value().applied.size() == 2);
    CHECK(first.value().applied[0].file_name == "001_init.sql");
    CHECK(first.value().applied[1].file_name == "002_add_col.sql");
    CHECK(test::column_exists(*f.db, "users", "email"));
    CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2});
    CHECK(f.exec.state() == executor_state::idle);
    CHECK(f.exec.current_version() == 2);

    auto second = f.exec.apply_pending();
    REQUIRE(second.is_ok());
    CHECK(second.value().up_to_date());
    CHECK(second.value().applied.empty());
    CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2});
}

TEST_CASE("versions 9 and 10 apply numerically", "[executor][apply]") {
    executor_fixture f;
    f.dir.add("10_second.sql", "INSERT INTO log (step) VALUES (10);");
    f.dir.add("9_first.sql", "CREATE TABLE log (seq INTEGER PRIMARY KEY, step INTEGER);"
                             "INSERT INTO log (step) VALUES (9);");

    auto report = f.exec.apply_pending();
    REQUIRE(report.is_ok());
    REQUIRE(report.value().applied.size() == 2);
    CHECK(report.value().applied[0].version == 9);
    CHECK(report.value().applied[1].version == 10);
    CHECK(test::query_int(*f.db, "SELECT step FROM log WHERE seq = 1;") == 9);
}

TEST_CASE("failing script rolls back and stops", "[executor][apply]") {
    executor_fixture f;
    f.dir.add("001_init.sql", "CREATE TABLE a (id INTEGER);");
    f.dir.add("002_broken.sql",
              "CREATE TABLE b (id INTEGER); INSERT INTO missing_table VALUES (1);");
    f.dir.add("003_later.sql", "CREATE TABLE c (id INTEGER);");

    auto report = f.exec.apply_pending();
    REQUIRE(report.is_err());
    CHECK(report.error().code == error_codes::execution_failed);
    CHECK(report.error().message.find("002_broken.sql") != std::string::npos);

    CHECK(f.db->table_exists("a"));
    CHECK_FALSE(f.db->table_exists("b"));
    CHECK_FALSE(f.db->table_exists("c"));
    CHECK(f.ledger_versions() == std::vector<std::int64_t>{1});
    CHECK(f.exec.state() == executor_state::failed);
    CHECK(f.exec.current_version() == 2);
    CHECK_FALSE(f.db->in_transaction());
}

TEST_CASE("script that ends the transaction is refused", "[executor][apply]") {
    executor_fixture f;
    f.dir.add("001_init.sql", "CREATE TABLE a (id INTEGER);");
    REQUIRE(f.exec.apply_pending().is_ok());

    SECTION("COMMIT") {
        f.dir.add("002_commit.sql", "CREATE TABLE t (id INTEGER); COMMIT;");
    }
    SECTION("END") {
        f.dir.add("002_commit.sql", "CREATE TABLE t (id INTEGER); END;");
    }
    SECTION("RELEASE of a savepoint") {
        f.dir.add("002_commit.sql",
                  "SAVEPOINT s; CREATE TABLE t (id INTEGER); RELEASE s;");
    }

    auto report = f.exec.apply_pending();
    REQUIRE(report.is_err());
    CHECK(report.error().code == error_codes::execution_failed);
    CHECK(report.error().message.find("002_commit.sql") != std::string::npos);
    CHECK_FALSE(f.db->table_exists("t"));
    CHECK(f.ledger_versions() == std::vector<std::int64_t>{1});
    CHECK(f.exec.state() == executor_state::failed);
    CHECK_FALSE(f.db->in_transaction());
}

TEST_CASE("edited applied script blocks further migrations", "[executor][integrity]") {
    executor_fixture f;
    f.add_users_pair();
    REQUIRE(f.exec.apply_pending().is_ok());

    f.dir.add("002_add_col.sql", "ALTER TABLE users ADD COLUMN phone TEXT;");
    f.dir.add("003_new.sql", "CREATE TABLE t3 (id INTEGER);");

    auto report = f.exec.apply_pending();
    REQUIRE(report.is_err());
    CHECK(report.error().code == error_codes::checksum_mismatch);
    CHECK_FALSE(f.db->table_exists("t3"));
    CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2});
}

// ============================================================================
// Rollback
// ============================================================================

TEST_CASE("rollback", "[executor][rollback]") {
    executor_fixture f;
    f.add_users_pair();
    f.dir.add("003_audit.sql", "CREATE TABLE audit (id INTEGER);");
    f.dir.add_rollback("003_audit.rollback.sql", "DROP TABLE audit;");
    REQUIRE(f.exec.apply_pending().is_ok());

    SECTION("latest only") {
        auto report = f.exec.rollback();
        REQUIRE(report.is_ok());
        REQUIRE(report.value().rolled_back.has_value());
        CHECK(report.value().rolled_back->version == 3);
        CHECK_FALSE(f.db->table_exists("audit"));
        CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2});
    }

    SECTION("specific version") {
        auto report = f.exec.rollback(3);
        REQUIRE(report.is_ok());
        CHECK(report.value().rolled_back->name == "003_audit.sql");
    }

    SECTION("unknown version") {
        auto report = f.exec.rollback(7);
        REQUIRE(report.is_err());
        CHECK(report.error().code == error_codes::version_not_found);
        CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2, 3});
    }

    SECTION("missing rollback script leaves everything untouched") {
        f.dir.remove("rollback/002_add_col.rollback.sql");

        auto report = f.exec.rollback(2);
        REQUIRE(report.is_err());
        CHECK(report.error().code == error_codes::missing_rollback_script);
        CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2, 3});
        CHECK(test::column_exists(*f.db, "users", "email"));
    }

    SECTION("failing rollback script keeps the ledger row") {
        f.dir.add_rollback("003_audit.rollback.sql",
                           "DROP TABLE audit; DROP TABLE no_such_table;");

        auto report = f.exec.rollback();
        REQUIRE(report.is_err());
        CHECK(report.error().code == error_codes::execution_failed);
        CHECK(f.db->table_exists("audit"));
        CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2, 3});
    }

    SECTION("rollback script that commits keeps schema and ledger") {
        f.dir.add_rollback("003_audit.rollback.sql", "DROP TABLE audit; COMMIT;");

        auto report = f.exec.rollback();
        REQUIRE(report.is_err());
        CHECK(report.error().code == error_codes::execution_failed);
        CHECK(f.db->table_exists("audit"));
        CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2, 3});
        CHECK_FALSE(f.db->in_transaction());
    }

    SECTION("rollback then apply restores schema and ledger") {
        auto before = f.ledger.find(3).value();
        REQUIRE(f.exec.rollback().is_ok());

        auto report = f.exec.apply_pending();
        REQUIRE(report.is_ok());
        REQUIRE(report.value().applied.size() == 1);
        CHECK(f.db->table_exists("audit"));

        auto after = f.ledger.find(3).value();
        REQUIRE(after.has_value());
        CHECK(after->checksum == before->checksum);
        CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2, 3});
    }
}

TEST_CASE("rollback with an empty ledger is a no-op", "[executor][rollback]") {
    executor_fixture f;

    auto latest = f.exec.rollback();
    REQUIRE(latest.is_ok());
    CHECK_FALSE(latest.value().rolled_back.has_value());

    auto specific = f.exec.rollback(5);
    REQUIRE(specific.is_ok());
    CHECK_FALSE(specific.value().rolled_back.has_value());
}

// ============================================================================
// Reset
// ============================================================================

TEST_CASE("reset", "[executor][reset]") {
    executor_fixture f;
    f.add_users_pair();
    REQUIRE(f.exec.apply_pending().is_ok());
    REQUIRE(f.db->execute("INSERT INTO users (id, email) VALUES (1, 'a@b.c');").is_ok());

    SECTION("rolls back newest first and re-applies") {
        auto report = f.exec.reset();
        REQUIRE(report.is_ok());
        REQUIRE(report.value().rolled_back.size() == 2);
        CHECK(report.value().rolled_back[0].version == 2);
        CHECK(report.value().rolled_back[1].version == 1);
        CHECK(report.value().reapplied.applied.size() == 2);
        CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2});
        CHECK(test::query_int(*f.db, "SELECT COUNT(*) FROM users;") == 0);
    }

    SECTION("missing rollback script aborts before reverting anything") {
        f.dir.remove("rollback/001_init.rollback.sql");

        auto report = f.exec.reset();
        REQUIRE(report.is_err());
        CHECK(report.error().code == error_codes::missing_rollback_script);
        CHECK(f.ledger_versions() == std::vector<std::int64_t>{1, 2});
        CHECK(test::query_int(*f.db, "SELECT COUNT(*) FROM users;") == 1);
    }
}

// ============================================================================
// Status and Locking
// ============================================================================

TEST_CASE("status lists applied and pending", "[executor][status]") {
    executor_fixture f;
    f.dir.add("001_init.sql", "CREATE TABLE a (id INTEGER);");

    SECTION("status never creates the ledger") {
        auto status = f.exec.status();
        REQUIRE(status.is_ok());
        CHECK(status.value().applied.empty());
        REQUIRE(status.value().pending.size() == 1);
        CHECK_FALSE(f.ledger.exists());
    }

    SECTION("after applying") {
        REQUIRE(f.exec.apply_pending().is_ok());
        f.dir.add("002_next.sql", "CREATE TABLE b (id INTEGER);");

        auto status = f.exec.status();
        REQUIRE(status.is_ok());
        REQUIRE(status.value().applied.size() == 1);
        CHECK(status.value().applied[0].name == "001_init.sql");
        REQUIRE(status.value().pending.size() == 1);
        CHECK(status.value().pending[0].version == 2);
    }
}

TEST_CASE("mutating operations respect the lease", "[executor][lock]") {
    executor_fixture f;
    f.dir.add("001_init.sql", "CREATE TABLE a (id INTEGER);");

    auto held = storage::migration_lock::acquire(*f.db, "migrations",
                                                 std::chrono::seconds(60));
    REQUIRE(held.is_ok());

    auto report = f.exec.apply_pending();
    REQUIRE(report.is_err());
    CHECK(report.error().code == error_codes::lock_held);
    CHECK_FALSE(f.db->table_exists("a"));

    SECTION("status is not blocked") {
        CHECK(f.exec.status().is_ok());
    }

    SECTION("lock can be disabled") {
        executor_options options;
        options.use_lock = false;
        migration_executor unlocked(*f.db, f.script_catalog, f.ledger, options);
        CHECK(unlocked.apply_pending().is_ok());
        CHECK(f.db->table_exists("a"));
    }
}
