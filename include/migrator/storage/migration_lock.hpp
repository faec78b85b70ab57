/**
 * @file migration_lock.hpp
 * @brief Advisory lease that keeps two migrators off the same datastore
 *
 * The lease is a single row in a companion table named
 * "<ledger_table>_lock". A lease that was not released (crashed process)
 * expires after its duration and can then be taken over.
 */

#pragma once

#include <migrator/core/result.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace migrator::storage {

class database_connection;

/**
 * @brief Held migration lease, released on destruction
 *
 * Thread Safety: This class is NOT thread-safe.
 *
 * @example
 * @code
 * auto lock = migration_lock::acquire(db, "migrations", std::chrono::minutes(15));
 * if (lock.is_err()) {
 *     // Another migrator is running
 * }
 * // ... mutate ...
 * @endcode
 */
class migration_lock {
public:
    /**
     * @brief Take the lease
     *
     * Creates the lock table when missing, discards expired leases and
     * inserts a new one, all inside one BEGIN IMMEDIATE transaction.
     *
     * @param db Open connection; must outlive the lock
     * @param ledger_table Ledger table name the lock table is derived from
     * @param lease How long the lease stays valid without being released
     * @return The held lock, or lock_held if a live lease exists
     */
    [[nodiscard]] static auto acquire(database_connection& db,
                                      std::string_view ledger_table,
                                      std::chrono::seconds lease)
        -> Result<std::unique_ptr<migration_lock>>;

    /**
     * @brief Destructor - releases the lease if still held
     */
    ~migration_lock();

    migration_lock(const migration_lock&) = delete;
    auto operator=(const migration_lock&) -> migration_lock& = delete;
    migration_lock(migration_lock&&) = delete;
    auto operator=(migration_lock&&) -> migration_lock& = delete;

    /**
     * @brief Release the lease explicitly
     *
     * Only deletes the row carrying this lock's owner token, so a lease
     * that expired and was taken over by someone else is left alone.
     */
    [[nodiscard]] auto release() -> VoidResult;

    [[nodiscard]] auto owner() const noexcept -> const std::string& { return owner_; }

    [[nodiscard]] auto is_held() const noexcept -> bool { return held_; }

    /**
     * @brief Name of the lock table for a ledger table
     */
    [[nodiscard]] static auto table_name_for(std::string_view ledger_table)
        -> std::string;

private:
    migration_lock(database_connection& db, std::string table, std::string owner);

    database_connection& db_;
    std::string table_;
    std::string owner_;
    bool held_{true};
};

}  // namespace migrator::storage
