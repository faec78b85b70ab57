/**
 * @file version_ledger.hpp
 * @brief Durable record of applied migrations inside the target database
 *
 * The ledger table lives in the same database the migrations change, so
 * the ledger row and the schema change can share one transaction.
 */

#pragma once

#include "ledger_entry.hpp"

#include <migrator/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace migrator::storage {

class database_connection;

/**
 * @brief Access to the ledger table
 *
 * Reads work whether or not the table exists yet (an absent table is an
 * empty ledger), so status and validation never need to create it.
 * Writes are refused unless the connection is inside a transaction.
 *
 * Thread Safety: This class is NOT thread-safe.
 */
class version_ledger {
public:
    /**
     * @brief Construct a ledger bound to a connection
     *
     * @param db Open connection; must outlive the ledger
     * @param table_name Ledger table name (plain SQL identifier)
     */
    explicit version_ledger(database_connection& db,
                            std::string table_name = "migrations");

    /**
     * @brief Create the ledger table and its version index if absent
     *
     * Idempotent; safe to call on every startup.
     */
    [[nodiscard]] auto ensure_schema() -> VoidResult;

    /**
     * @brief Check whether the ledger table exists
     */
    [[nodiscard]] auto exists() const -> bool;

    /**
     * @brief List all applied migrations ordered by ascending version
     */
    [[nodiscard]] auto list_applied() const -> Result<std::vector<ledger_entry>>;

    /**
     * @brief Find the entry for a version
     *
     * @return The entry, std::nullopt if the version was never applied
     */
    [[nodiscard]] auto find(std::int64_t version) const
        -> Result<std::optional<ledger_entry>>;

    /**
     * @brief Record an applied migration
     *
     * Must be called inside the transaction that executed the script.
     * An empty applied_at is filled with CURRENT_TIMESTAMP.
     */
    [[nodiscard]] auto insert(const ledger_entry& entry) -> VoidResult;

    /**
     * @brief Delete the entry for a version
     *
     * Must be called inside the transaction that executed the rollback
     * script. Fails if no row was deleted.
     */
    [[nodiscard]] auto remove_by_version(std::int64_t version) -> VoidResult;

    [[nodiscard]] auto table_name() const noexcept -> const std::string& {
        return table_name_;
    }

private:
    [[nodiscard]] auto require_transaction(const char* operation) const
        -> VoidResult;

    database_connection& db_;
    std::string table_name_;
};

}  // namespace migrator::storage
