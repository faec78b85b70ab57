/**
 * @file database_connection.hpp
 * @brief Owning SQLite connection passed to the migration components
 *
 * The connection is opened once by the caller and handed by reference to
 * the ledger, the lock and the executor. Closing happens when the owning
 * std::unique_ptr goes out of scope.
 */

#pragma once

#include <migrator/config/migrator_config.hpp>
#include <migrator/core/result.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Forward declaration of SQLite handle
struct sqlite3;

namespace migrator::storage {

/**
 * @brief RAII wrapper around a sqlite3 handle
 *
 * Thread Safety: This class is NOT thread-safe. The migration engine is
 * single-writer by design; use one connection per thread.
 *
 * @example
 * @code
 * auto db_result = database_connection::open(config.database);
 * if (db_result.is_err()) {
 *     // Handle error
 * }
 * auto db = std::move(db_result.value());
 * auto exec = db->execute("CREATE TABLE t (id INTEGER);");
 * @endcode
 */
class database_connection {
public:
    /**
     * @brief Open or create a database
     *
     * Creates the parent directory of a file database when missing, then
     * applies the configured pragmas (foreign keys, WAL journal, busy
     * timeout). A read-only open never creates the file or its directory
     * and leaves the journal mode untouched; a missing file is an error.
     *
     * @param config Connection settings
     * @return Result containing the connection or error
     */
    [[nodiscard]] static auto open(const config::database_config& config)
        -> Result<std::unique_ptr<database_connection>>;

    /**
     * @brief Open or create a database with default settings
     *
     * @param db_path Path to the database file, or ":memory:"
     * @return Result containing the connection or error
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<database_connection>>;

    /**
     * @brief Destructor - closes the database connection
     */
    ~database_connection();

    database_connection(const database_connection&) = delete;
    auto operator=(const database_connection&) -> database_connection& = delete;
    database_connection(database_connection&&) = delete;
    auto operator=(database_connection&&) -> database_connection& = delete;

    /**
     * @brief Execute one or more SQL statements verbatim
     *
     * The whole text is passed to sqlite3_exec, so a script may contain any
     * number of statements. Execution stops at the first failing statement.
     *
     * @param sql SQL text
     * @return VoidResult Success or error carrying the SQLite message
     */
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

    /**
     * @brief Execute a migration script inside the caller's transaction
     *
     * Same as execute(), but transaction control statements (BEGIN, COMMIT,
     * END, ROLLBACK, SAVEPOINT, RELEASE) are denied while the script runs.
     * A script that tries to end the enclosing transaction fails at that
     * statement and leaves the transaction open for the caller to roll back.
     *
     * @param sql Script text
     * @return VoidResult Success or error carrying the SQLite message
     */
    [[nodiscard]] auto execute_script(std::string_view sql) -> VoidResult;

    /**
     * @brief Check whether a table exists in the main schema
     */
    [[nodiscard]] auto table_exists(std::string_view table_name) const -> bool;

    /**
     * @brief Check whether an explicit transaction is open on this connection
     */
    [[nodiscard]] auto in_transaction() const noexcept -> bool;

    /**
     * @brief Get the most recent SQLite error message
     */
    [[nodiscard]] auto last_error_message() const -> std::string;

    /**
     * @brief Get the raw SQLite handle
     */
    [[nodiscard]] auto handle() const noexcept -> sqlite3* { return db_; }

    /**
     * @brief Get the path this connection was opened with
     */
    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

private:
    explicit database_connection(sqlite3* db, std::string path);

    sqlite3* db_{nullptr};
    std::string path_;
};

}  // namespace migrator::storage
