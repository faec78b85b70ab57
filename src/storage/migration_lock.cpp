/**
 * @file migration_lock.cpp
 * @brief Implementation of the advisory migration lease
 */

#include <migrator/storage/migration_lock.hpp>

#include <migrator/compat/format.hpp>
#include <migrator/compat/process.hpp>
#include <migrator/config/migrator_config.hpp>
#include <migrator/integration/logger_adapter.hpp>
#include <migrator/storage/database_connection.hpp>
#include <migrator/storage/scoped_transaction.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <utility>

namespace migrator::storage {

namespace {

constexpr const char* module_name = "lock";

auto now_epoch_seconds() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

auto make_owner_token() -> std::string {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    return compat::format("{}@{}", compat::current_pid(),
                          static_cast<long long>(ms));
}

auto read_holder(database_connection& db, const std::string& table)
    -> std::optional<std::pair<std::string, std::int64_t>> {
    const auto sql =
        compat::format("SELECT owner, expires_at FROM {} WHERE id = 1;", table);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt, nullptr) !=
        SQLITE_OK) {
        return std::nullopt;
    }

    std::optional<std::pair<std::string, std::int64_t>> holder;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const auto* text =
            reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        holder.emplace(text ? text : "", sqlite3_column_int64(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return holder;
}

}  // namespace

auto migration_lock::table_name_for(std::string_view ledger_table) -> std::string {
    return std::string(ledger_table) + "_lock";
}

// ============================================================================
// Acquisition
// ============================================================================

auto migration_lock::acquire(database_connection& db,
                             std::string_view ledger_table,
                             std::chrono::seconds lease)
    -> Result<std::unique_ptr<migration_lock>> {
    const auto table = table_name_for(ledger_table);
    if (!config::is_valid_identifier(table)) {
        return make_error<std::unique_ptr<migration_lock>>(
            error_codes::invalid_configuration,
            compat::format("Invalid lock table name '{}'", table), module_name);
    }

    auto create = db.execute(compat::format(R"(
        CREATE TABLE IF NOT EXISTS {} (
            id          INTEGER PRIMARY KEY CHECK (id = 1),
            owner       TEXT NOT NULL,
            acquired_at INTEGER NOT NULL,
            expires_at  INTEGER NOT NULL
        );
    )", table));
    if (create.is_err()) {
        return make_error<std::unique_ptr<migration_lock>>(
            error_codes::database_query_error,
            compat::format("Failed to create lock table: {}",
                           create.error().message),
            module_name);
    }

    scoped_transaction tx(db);
    if (auto begun = tx.begin(); begun.is_err()) {
        return make_error<std::unique_ptr<migration_lock>>(
            error_codes::lock_held,
            compat::format("Could not obtain write access for the lock: {}",
                           begun.error().message),
            module_name);
    }

    const auto now = now_epoch_seconds();

    sqlite3_stmt* stmt = nullptr;
    auto sql = compat::format("DELETE FROM {} WHERE expires_at <= ?;", table);
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt, nullptr) !=
        SQLITE_OK) {
        return make_error<std::unique_ptr<migration_lock>>(
            error_codes::database_query_error,
            compat::format("Failed to prepare statement: {}",
                           db.last_error_message()),
            module_name);
    }
    sqlite3_bind_int64(stmt, 1, now);
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return make_error<std::unique_ptr<migration_lock>>(
            error_codes::database_query_error,
            compat::format("Failed to expire stale lease: {}",
                           db.last_error_message()),
            module_name);
    }

    if (auto holder = read_holder(db, table)) {
        return make_error<std::unique_ptr<migration_lock>>(
            error_codes::lock_held,
            compat::format("Migration lock is held by {} until {}",
                           holder->first, holder->second),
            module_name);
    }

    auto owner = make_owner_token();
    sql = compat::format(
        "INSERT INTO {} (id, owner, acquired_at, expires_at) VALUES (1, ?, ?, ?);",
        table);
    if (sqlite3_prepare_v2(db.handle(), sql.c_str(), -1, &stmt, nullptr) !=
        SQLITE_OK) {
        return make_error<std::unique_ptr<migration_lock>>(
            error_codes::database_query_error,
            compat::format("Failed to prepare statement: {}",
                           db.last_error_message()),
            module_name);
    }
    sqlite3_bind_text(stmt, 1, owner.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, now);
    sqlite3_bind_int64(stmt, 3, now + lease.count());
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return make_error<std::unique_ptr<migration_lock>>(
            error_codes::lock_held,
            compat::format("Failed to record lease: {}", db.last_error_message()),
            module_name);
    }

    if (auto committed = tx.commit(); committed.is_err()) {
        return make_error<std::unique_ptr<migration_lock>>(
            committed.error().code, committed.error().message, module_name);
    }

    integration::logger_adapter::debug("Migration lock acquired by {}", owner);

    auto instance = std::unique_ptr<migration_lock>(
        new migration_lock(db, table, std::move(owner)));
    return instance;
}

migration_lock::migration_lock(database_connection& db, std::string table,
                               std::string owner)
    : db_(db), table_(std::move(table)), owner_(std::move(owner)) {}

migration_lock::~migration_lock() {
    if (held_) {
        auto result = release();
        if (result.is_err()) {
            integration::logger_adapter::warn("Failed to release migration lock: {}",
                                              result.error().message);
        }
    }
}

// ============================================================================
// Release
// ============================================================================

auto migration_lock::release() -> VoidResult {
    if (!held_) {
        return ok();
    }
    held_ = false;

    const auto sql = compat::format("DELETE FROM {} WHERE owner = ?;", table_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt, nullptr) !=
        SQLITE_OK) {
        return migrator_void_error(
            error_codes::database_query_error,
            compat::format("Failed to prepare statement: {}",
                           db_.last_error_message()),
            module_name);
    }
    sqlite3_bind_text(stmt, 1, owner_.c_str(), -1, SQLITE_TRANSIENT);
    auto rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return migrator_void_error(
            error_codes::database_query_error,
            compat::format("Failed to release lease: {}", db_.last_error_message()),
            module_name);
    }

    integration::logger_adapter::debug("Migration lock released by {}", owner_);
    return ok();
}

}  // namespace migrator::storage
