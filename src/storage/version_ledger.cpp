/**
 * @file version_ledger.cpp
 * @brief Implementation of the ledger table access
 */

#include <migrator/storage/version_ledger.hpp>

#include <migrator/compat/format.hpp>
#include <migrator/config/migrator_config.hpp>
#include <migrator/storage/database_connection.hpp>

#include <sqlite3.h>

namespace migrator::storage {

namespace {

constexpr const char* module_name = "ledger";

auto column_text(sqlite3_stmt* stmt, int index) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
    return text ? text : "";
}

auto parse_row(sqlite3_stmt* stmt) -> ledger_entry {
    ledger_entry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.version = sqlite3_column_int64(stmt, 1);
    entry.name = column_text(stmt, 2);
    entry.checksum = column_text(stmt, 3);
    entry.applied_at = column_text(stmt, 4);
    entry.execution_time_ms = sqlite3_column_int64(stmt, 5);
    return entry;
}

}  // namespace

version_ledger::version_ledger(database_connection& db, std::string table_name)
    : db_(db), table_name_(std::move(table_name)) {}

// ============================================================================
// Schema
// ============================================================================

auto version_ledger::ensure_schema() -> VoidResult {
    if (!config::is_valid_identifier(table_name_)) {
        return migrator_void_error(
            error_codes::invalid_configuration,
            compat::format("Invalid ledger table name '{}'", table_name_),
            module_name);
    }

    const auto sql = compat::format(R"(
        CREATE TABLE IF NOT EXISTS {0} (
            id                INTEGER PRIMARY KEY AUTOINCREMENT,
            version           INTEGER UNIQUE NOT NULL,
            name              TEXT NOT NULL,
            checksum          TEXT NOT NULL,
            applied_at        DATETIME DEFAULT CURRENT_TIMESTAMP,
            execution_time_ms INTEGER NOT NULL
        );

        CREATE UNIQUE INDEX IF NOT EXISTS idx_{0}_version ON {0}(version);
    )", table_name_);

    auto result = db_.execute(sql);
    if (result.is_err()) {
        return migrator_void_error(
            error_codes::ledger_error,
            compat::format("Failed to create ledger table {}: {}", table_name_,
                           result.error().message),
            module_name);
    }

    return ok();
}

auto version_ledger::exists() const -> bool {
    return db_.table_exists(table_name_);
}

// ============================================================================
// Queries
// ============================================================================

auto version_ledger::list_applied() const -> Result<std::vector<ledger_entry>> {
    std::vector<ledger_entry> entries;

    if (!config::is_valid_identifier(table_name_)) {
        return make_error<std::vector<ledger_entry>>(
            error_codes::invalid_configuration,
            compat::format("Invalid ledger table name '{}'", table_name_),
            module_name);
    }

    if (!exists()) {
        return entries;
    }

    const auto sql = compat::format(
        "SELECT id, version, name, checksum, applied_at, execution_time_ms "
        "FROM {} ORDER BY version;",
        table_name_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<std::vector<ledger_entry>>(
            error_codes::database_query_error,
            compat::format("Failed to prepare statement: {}",
                           db_.last_error_message()),
            module_name);
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(parse_row(stmt));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_error<std::vector<ledger_entry>>(
            error_codes::database_query_error,
            compat::format("Failed to read ledger: {}", db_.last_error_message()),
            module_name);
    }

    return entries;
}

auto version_ledger::find(std::int64_t version) const
    -> Result<std::optional<ledger_entry>> {
    std::optional<ledger_entry> found;

    if (!config::is_valid_identifier(table_name_)) {
        return make_error<std::optional<ledger_entry>>(
            error_codes::invalid_configuration,
            compat::format("Invalid ledger table name '{}'", table_name_),
            module_name);
    }

    if (!exists()) {
        return found;
    }

    const auto sql = compat::format(
        "SELECT id, version, name, checksum, applied_at, execution_time_ms "
        "FROM {} WHERE version = ?;",
        table_name_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<std::optional<ledger_entry>>(
            error_codes::database_query_error,
            compat::format("Failed to prepare statement: {}",
                           db_.last_error_message()),
            module_name);
    }

    sqlite3_bind_int64(stmt, 1, version);

    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        found = parse_row(stmt);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return make_error<std::optional<ledger_entry>>(
            error_codes::database_query_error,
            compat::format("Failed to read ledger: {}", db_.last_error_message()),
            module_name);
    }

    return found;
}

// ============================================================================
// Mutations
// ============================================================================

auto version_ledger::insert(const ledger_entry& entry) -> VoidResult {
    auto guard = require_transaction("insert");
    if (guard.is_err()) {
        return guard;
    }

    const auto sql = compat::format(
        "INSERT INTO {} (version, name, checksum, applied_at, execution_time_ms) "
        "VALUES (?, ?, ?, COALESCE(?, CURRENT_TIMESTAMP), ?);",
        table_name_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrator_void_error(
            error_codes::database_query_error,
            compat::format("Failed to prepare statement: {}",
                           db_.last_error_message()),
            module_name);
    }

    sqlite3_bind_int64(stmt, 1, entry.version);
    sqlite3_bind_text(stmt, 2, entry.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, entry.checksum.c_str(), -1, SQLITE_TRANSIENT);
    if (entry.applied_at.empty()) {
        sqlite3_bind_null(stmt, 4);
    } else {
        sqlite3_bind_text(stmt, 4, entry.applied_at.c_str(), -1, SQLITE_TRANSIENT);
    }
    sqlite3_bind_int64(stmt, 5, entry.execution_time_ms);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return migrator_void_error(
            error_codes::ledger_error,
            compat::format("Failed to record migration {}: {}", entry.name,
                           db_.last_error_message()),
            module_name);
    }

    return ok();
}

auto version_ledger::remove_by_version(std::int64_t version) -> VoidResult {
    auto guard = require_transaction("remove");
    if (guard.is_err()) {
        return guard;
    }

    const auto sql =
        compat::format("DELETE FROM {} WHERE version = ?;", table_name_);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return migrator_void_error(
            error_codes::database_query_error,
            compat::format("Failed to prepare statement: {}",
                           db_.last_error_message()),
            module_name);
    }

    sqlite3_bind_int64(stmt, 1, version);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return migrator_void_error(
            error_codes::ledger_error,
            compat::format("Failed to remove ledger entry for version {}: {}",
                           version, db_.last_error_message()),
            module_name);
    }

    if (sqlite3_changes(db_.handle()) == 0) {
        return migrator_void_error(
            error_codes::version_not_found,
            compat::format("No ledger entry for version {}", version),
            module_name);
    }

    return ok();
}

auto version_ledger::require_transaction(const char* operation) const
    -> VoidResult {
    if (!db_.in_transaction()) {
        return migrator_void_error(
            error_codes::database_transaction_error,
            compat::format("Ledger {} must run inside a migration transaction",
                           operation),
            module_name);
    }
    return ok();
}

}  // namespace migrator::storage
