/**
 * @file migration_executor.hpp
 * @brief Applies and reverts migrations against the target datastore
 *
 * Each forward script runs inside its own transaction together with the
 * ledger insert that records it; each rollback script runs inside its own
 * transaction together with the ledger delete. A failure rolls the current
 * step back as a unit and stops the run, so the ledger always matches the
 * datastore.
 *
 * @example
 * @code
 * auto db = database_connection::open(config.database);
 * migration_catalog catalog(config.migrations.directory);
 * version_ledger ledger(*db.value());
 * migration_executor executor(*db.value(), catalog, ledger);
 *
 * auto report = executor.apply_pending();
 * if (report.is_err()) {
 *     std::cerr << report.error().message << "\n";
 * }
 * @endcode
 */

#pragma once

#include "migration_report.hpp"

#include <migrator/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace migrator::catalog {
class migration_catalog;
}  // namespace migrator::catalog

namespace migrator::storage {
class database_connection;
class migration_lock;
class version_ledger;
}  // namespace migrator::storage

namespace migrator::executor {

// =============================================================================
// State
// =============================================================================

/**
 * @brief Executor state machine
 *
 * idle -> applying(version) -> committed(version) -> idle
 *                           -> rolled_back -> failed
 */
enum class executor_state {
    idle,
    applying,
    committed,
    rolled_back,
    failed
};

/**
 * @brief Convert executor_state to string
 */
[[nodiscard]] inline auto to_string(executor_state state) -> std::string {
    switch (state) {
        case executor_state::idle: return "idle";
        case executor_state::applying: return "applying";
        case executor_state::committed: return "committed";
        case executor_state::rolled_back: return "rolled_back";
        case executor_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Executor options
 */
struct executor_options {
    /// Take the advisory lease for apply, rollback and reset
    bool use_lock = true;

    /// Lease duration
    std::chrono::seconds lease{900};
};

// =============================================================================
// Executor
// =============================================================================

/**
 * @brief Runs migrations and rollbacks
 *
 * The connection, catalog and ledger are borrowed and must outlive the
 * executor.
 *
 * Thread Safety: This class is NOT thread-safe.
 */
class migration_executor {
public:
    migration_executor(storage::database_connection& db,
                       const catalog::migration_catalog& catalog,
                       storage::version_ledger& ledger,
                       executor_options options = {});

    migration_executor(const migration_executor&) = delete;
    auto operator=(const migration_executor&) -> migration_executor& = delete;
    migration_executor(migration_executor&&) = delete;
    auto operator=(migration_executor&&) -> migration_executor& = delete;

    /**
     * @brief Apply every pending migration in ascending version order
     *
     * Before anything is applied, every already-applied script that is
     * still on disk is checked against its ledger checksum; drift aborts
     * the run with checksum_mismatch. Execution is fail-fast: the first
     * failing script is rolled back and no later script is attempted.
     *
     * @return Report of what was applied; pending_count == 0 means the
     *         datastore was already up to date
     */
    [[nodiscard]] auto apply_pending() -> Result<apply_report>;

    /**
     * @brief Revert one applied migration
     *
     * @param target_version Version to revert; the highest applied version
     *        when std::nullopt
     * @return Report naming the reverted entry. An empty ledger is a no-op.
     *         version_not_found if target_version was never applied,
     *         missing_rollback_script if no rollback script exists.
     */
    [[nodiscard]] auto rollback(std::optional<std::int64_t> target_version = std::nullopt)
        -> Result<rollback_report>;

    /**
     * @brief Revert every applied migration, newest first, then re-apply all
     *
     * All rollback scripts must exist before anything is reverted.
     */
    [[nodiscard]] auto reset() -> Result<reset_report>;

    /**
     * @brief Report applied and pending migrations without mutating anything
     */
    [[nodiscard]] auto status() const -> Result<status_report>;

    [[nodiscard]] auto state() const noexcept -> executor_state { return state_; }

    /**
     * @brief Version currently (or last) being processed
     */
    [[nodiscard]] auto current_version() const noexcept -> std::optional<std::int64_t> {
        return current_version_;
    }

private:
    [[nodiscard]] auto acquire_lock() -> Result<std::unique_ptr<storage::migration_lock>>;
    [[nodiscard]] auto apply_pending_locked() -> Result<apply_report>;
    [[nodiscard]] auto apply_one(const catalog::migration_descriptor& migration,
                                 const std::string& content,
                                 const std::string& checksum)
        -> Result<applied_migration>;
    [[nodiscard]] auto revert_one(const storage::ledger_entry& entry) -> VoidResult;
    [[nodiscard]] auto verify_applied_scripts(
        const std::vector<catalog::migration_descriptor>& all,
        const std::vector<storage::ledger_entry>& applied) const -> VoidResult;

    void transition(executor_state next,
                    std::optional<std::int64_t> version = std::nullopt);

    storage::database_connection& db_;
    const catalog::migration_catalog& catalog_;
    storage::version_ledger& ledger_;
    executor_options options_;
    executor_state state_{executor_state::idle};
    std::optional<std::int64_t> current_version_;
};

}  // namespace migrator::executor
