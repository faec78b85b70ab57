/**
 * @file migrator_config.hpp
 * @brief Configuration for the migration engine and its command-line tool
 *
 * Configuration is layered, lowest precedence first: built-in defaults,
 * environment variables, a JSON configuration file, then command-line
 * flags applied by the caller.
 *
 * JSON layout:
 * @code
 * {
 *   "database": { "path": "data/app.db", "foreign_keys": true,
 *                 "wal_mode": true, "busy_timeout_ms": 5000 },
 *   "migrations": { "directory": "migrations", "rollback_subdirectory": "rollback",
 *                   "ledger_table": "migrations" },
 *   "lock": { "enabled": true, "lease_seconds": 900 },
 *   "logging": { "directory": "logs", "level": "info", "console": true,
 *                "file": true, "audit": true }
 * }
 * @endcode
 */

#pragma once

#include <migrator/core/result.hpp>
#include <migrator/integration/logger_adapter.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace migrator::config {

/**
 * @brief Connection settings for the target SQLite datastore
 */
struct database_config {
    /// Database file, or ":memory:"
    std::filesystem::path path{"data/database.db"};

    /// Enable PRAGMA foreign_keys
    bool foreign_keys = true;

    /// Enable WAL journal mode (ignored for in-memory databases)
    bool wal_mode = true;

    /// SQLite busy timeout
    int busy_timeout_ms = 5000;

    /// Open without write access (status and validate); not read from files
    bool read_only = false;
};

/**
 * @brief Migration script discovery and ledger settings
 */
struct migrations_config {
    /// Directory holding <version>_<name>.sql scripts
    std::filesystem::path directory{"migrations"};

    /// Subdirectory (relative to directory) holding rollback scripts
    std::string rollback_subdirectory{"rollback"};

    /// Name of the ledger table inside the target datastore
    std::string ledger_table{"migrations"};
};

/**
 * @brief Advisory lease taken by mutating commands
 */
struct lock_config {
    bool enabled = true;
    std::chrono::seconds lease{900};
};

/**
 * @brief Complete migrator configuration
 */
struct migrator_config {
    database_config database;
    migrations_config migrations;
    lock_config lock;
    integration::logger_config logging;
};

/**
 * @brief Build a configuration with defaults suitable for the CLI
 *
 * Console logging is limited to warnings so that command output stays
 * readable; the rotating log file receives everything at info and above.
 */
[[nodiscard]] auto default_config() -> migrator_config;

/**
 * @brief Override configuration values from environment variables
 *
 * Recognized variables: MIGRATOR_DATABASE_PATH (DATABASE_PATH is accepted
 * as a fallback), MIGRATOR_MIGRATIONS_DIR, MIGRATOR_LEDGER_TABLE,
 * MIGRATOR_LOG_LEVEL, MIGRATOR_LOG_DIRECTORY, MIGRATOR_USE_LOCK.
 *
 * @param config Configuration to update in place
 * @return Error if a variable holds an unparseable value
 */
[[nodiscard]] auto apply_environment(migrator_config& config) -> VoidResult;

/**
 * @brief Override configuration values from a JSON file
 *
 * Keys that are absent leave the current value untouched.
 *
 * @param config Configuration to update in place
 * @param file_path Path of the JSON file
 * @return Error if the file cannot be read or is not valid JSON
 */
[[nodiscard]] auto load_config_file(migrator_config& config,
                                    const std::filesystem::path& file_path)
    -> VoidResult;

/**
 * @brief Check a configuration for consistency
 *
 * Rejects empty paths, a ledger table name that is not a plain SQL
 * identifier and a non-positive lease.
 */
[[nodiscard]] auto validate_config(const migrator_config& config) -> VoidResult;

/**
 * @brief Check whether a name is a plain SQL identifier ([A-Za-z_][A-Za-z0-9_]*)
 */
[[nodiscard]] auto is_valid_identifier(std::string_view name) noexcept -> bool;

}  // namespace migrator::config
