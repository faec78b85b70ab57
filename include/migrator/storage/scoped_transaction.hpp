/**
 * @file scoped_transaction.hpp
 * @brief RAII transaction boundary for migration steps
 *
 * Every forward migration and every rollback runs inside one
 * scoped_transaction together with its ledger write, so either both the
 * schema change and the ledger row persist or neither does.
 */

#pragma once

#include <migrator/core/result.hpp>

namespace migrator::storage {

class database_connection;

/**
 * @brief Explicit BEGIN/COMMIT/ROLLBACK scope on a database_connection
 *
 * A transaction that was begun but never committed is rolled back when the
 * object is destroyed.
 *
 * @example
 * @code
 * scoped_transaction tx(db);
 * if (auto r = tx.begin(); r.is_err()) return r;
 * if (auto r = db.execute(script); r.is_err()) return r;  // rolled back
 * return tx.commit();
 * @endcode
 */
class scoped_transaction {
public:
    explicit scoped_transaction(database_connection& db) noexcept;

    ~scoped_transaction();

    scoped_transaction(const scoped_transaction&) = delete;
    auto operator=(const scoped_transaction&) -> scoped_transaction& = delete;
    scoped_transaction(scoped_transaction&&) = delete;
    auto operator=(scoped_transaction&&) -> scoped_transaction& = delete;

    /**
     * @brief Start the transaction (BEGIN IMMEDIATE)
     *
     * Takes the write lock up front so that a concurrent writer is detected
     * before any script statement runs.
     */
    [[nodiscard]] auto begin() -> VoidResult;

    /**
     * @brief Commit the transaction
     *
     * On failure the transaction is rolled back before the error is
     * returned.
     */
    [[nodiscard]] auto commit() -> VoidResult;

    /**
     * @brief Roll the transaction back explicitly
     */
    [[nodiscard]] auto rollback() -> VoidResult;

    /**
     * @brief Check whether begin() succeeded and neither commit() nor
     *        rollback() has completed yet
     */
    [[nodiscard]] auto is_active() const noexcept -> bool { return active_; }

private:
    database_connection& db_;
    bool active_{false};
};

}  // namespace migrator::storage
