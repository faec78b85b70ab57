/**
 * @file migration_executor.cpp
 * @brief Implementation of transactional migration execution
 */

#include <migrator/executor/migration_executor.hpp>

#include <migrator/catalog/migration_catalog.hpp>
#include <migrator/compat/format.hpp>
#include <migrator/compat/time.hpp>
#include <migrator/integration/logger_adapter.hpp>
#include <migrator/integrity/checksum.hpp>
#include <migrator/storage/database_connection.hpp>
#include <migrator/storage/migration_lock.hpp>
#include <migrator/storage/scoped_transaction.hpp>
#include <migrator/storage/version_ledger.hpp>

#include <algorithm>
#include <set>
#include <system_error>

namespace migrator::executor {

using integration::logger_adapter;

namespace {

constexpr const char* module_name = "executor";

template <typename T, typename U>
auto forward_error(const Result<U>& failed) -> Result<T> {
    return make_error<T>(failed.error().code, failed.error().message, module_name);
}

auto applied_versions(const std::vector<storage::ledger_entry>& applied)
    -> std::set<std::int64_t> {
    std::set<std::int64_t> versions;
    for (const auto& entry : applied) {
        versions.insert(entry.version);
    }
    return versions;
}

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

}  // namespace

migration_executor::migration_executor(storage::database_connection& db,
                                       const catalog::migration_catalog& catalog,
                                       storage::version_ledger& ledger,
                                       executor_options options)
    : db_(db), catalog_(catalog), ledger_(ledger), options_(options) {}

// ============================================================================
// Forward Migrations
// ============================================================================

auto migration_executor::apply_pending() -> Result<apply_report> {
    transition(executor_state::idle);

    auto lock = acquire_lock();
    if (lock.is_err()) {
        return forward_error<apply_report>(lock);
    }

    return apply_pending_locked();
}

auto migration_executor::apply_pending_locked() -> Result<apply_report> {
    if (auto schema = ledger_.ensure_schema(); schema.is_err()) {
        return forward_error<apply_report>(schema);
    }

    auto all = catalog_.list_all();
    if (all.is_err()) {
        return forward_error<apply_report>(all);
    }

    auto applied = ledger_.list_applied();
    if (applied.is_err()) {
        return forward_error<apply_report>(applied);
    }

    if (auto verified = verify_applied_scripts(all.value(), applied.value());
        verified.is_err()) {
        return forward_error<apply_report>(verified);
    }

    const auto done = applied_versions(applied.value());
    std::vector<catalog::migration_descriptor> pending;
    for (const auto& migration : all.value()) {
        if (done.count(migration.version) == 0) {
            pending.push_back(migration);
        }
    }

    apply_report report;
    report.pending_count = pending.size();

    if (pending.empty()) {
        logger_adapter::info("All migrations are up to date");
        return report;
    }

    logger_adapter::info("Found {} pending migration(s)", pending.size());

    for (const auto& migration : pending) {
        auto content = catalog::migration_catalog::read_script(migration.script_path);
        if (content.is_err()) {
            transition(executor_state::failed, migration.version);
            return forward_error<apply_report>(content);
        }

        auto checksum = integrity::sha256_hex(content.value());
        if (checksum.is_err()) {
            transition(executor_state::failed, migration.version);
            return forward_error<apply_report>(checksum);
        }

        // The ledger may have changed since the pending set was computed
        auto existing = ledger_.find(migration.version);
        if (existing.is_err()) {
            transition(executor_state::failed, migration.version);
            return forward_error<apply_report>(existing);
        }

        if (existing.value().has_value()) {
            const auto& entry = *existing.value();
            if (entry.checksum != checksum.value()) {
                transition(executor_state::failed, migration.version);
                logger_adapter::log_integrity_violation(
                    migration.version, migration.file_name,
                    integration::integrity_violation_kind::checksum_mismatch,
                    entry.checksum, checksum.value());
                return make_error<apply_report>(
                    error_codes::checksum_mismatch,
                    compat::format("Migration {} has been modified since it was "
                                   "applied. Expected checksum: {}, got: {}",
                                   migration.file_name, entry.checksum,
                                   checksum.value()),
                    module_name);
            }
            logger_adapter::info("Migration {} already applied", migration.file_name);
            report.skipped.push_back(migration.file_name);
            continue;
        }

        auto result = apply_one(migration, content.value(), checksum.value());
        if (result.is_err()) {
            return forward_error<apply_report>(result);
        }
        report.applied.push_back(result.value());
    }

    logger_adapter::info("All migrations completed successfully ({} applied)",
                         report.applied.size());
    return report;
}

auto migration_executor::apply_one(const catalog::migration_descriptor& migration,
                                   const std::string& content,
                                   const std::string& checksum)
    -> Result<applied_migration> {
    transition(executor_state::applying, migration.version);
    logger_adapter::info("Applying migration: {}", migration.file_name);

    const auto start = std::chrono::steady_clock::now();

    storage::scoped_transaction tx(db_);
    if (auto begun = tx.begin(); begun.is_err()) {
        transition(executor_state::failed, migration.version);
        logger_adapter::log_migration_failed(migration.version, migration.file_name,
                                             "apply", begun.error().message);
        return forward_error<applied_migration>(begun);
    }

    auto executed = db_.execute_script(content);
    if (executed.is_err()) {
        (void)tx.rollback();
        transition(executor_state::rolled_back, migration.version);
        transition(executor_state::failed, migration.version);
        logger_adapter::error("Migration {} failed: {}", migration.file_name,
                              executed.error().message);
        logger_adapter::log_migration_failed(migration.version, migration.file_name,
                                             "apply", executed.error().message);
        return make_error<applied_migration>(
            error_codes::execution_failed,
            compat::format("Migration {} failed: {}", migration.file_name,
                           executed.error().message),
            module_name);
    }

    applied_migration applied;
    applied.version = migration.version;
    applied.file_name = migration.file_name;
    applied.checksum = checksum;
    applied.execution_time_ms = elapsed_ms(start);

    storage::ledger_entry entry;
    entry.version = migration.version;
    entry.name = migration.file_name;
    entry.checksum = checksum;
    entry.applied_at = compat::format_utc(std::chrono::system_clock::now());
    entry.execution_time_ms = applied.execution_time_ms;

    auto recorded = ledger_.insert(entry);
    if (recorded.is_err()) {
        (void)tx.rollback();
        transition(executor_state::rolled_back, migration.version);
        transition(executor_state::failed, migration.version);
        logger_adapter::log_migration_failed(migration.version, migration.file_name,
                                             "apply", recorded.error().message);
        return forward_error<applied_migration>(recorded);
    }

    if (auto committed = tx.commit(); committed.is_err()) {
        transition(executor_state::rolled_back, migration.version);
        transition(executor_state::failed, migration.version);
        logger_adapter::log_migration_failed(migration.version, migration.file_name,
                                             "apply", committed.error().message);
        return forward_error<applied_migration>(committed);
    }

    transition(executor_state::committed, migration.version);
    logger_adapter::info("Migration {} applied successfully ({}ms)",
                         migration.file_name, applied.execution_time_ms);
    logger_adapter::log_migration_applied(migration.version, migration.file_name,
                                          checksum, applied.execution_time_ms);
    transition(executor_state::idle, migration.version);

    return applied;
}

auto migration_executor::verify_applied_scripts(
    const std::vector<catalog::migration_descriptor>& all,
    const std::vector<storage::ledger_entry>& applied) const -> VoidResult {
    for (const auto& entry : applied) {
        auto it = std::find_if(all.begin(), all.end(),
                               [&](const catalog::migration_descriptor& m) {
                                   return m.version == entry.version;
                               });
        if (it == all.end()) {
            // Reported by validate(); nothing on disk to compare against
            continue;
        }

        auto actual = integrity::file_checksum(it->script_path);
        if (actual.is_err()) {
            return forward_error<std::monostate>(actual);
        }

        if (actual.value() != entry.checksum) {
            logger_adapter::log_integrity_violation(
                entry.version, entry.name,
                integration::integrity_violation_kind::checksum_mismatch,
                entry.checksum, actual.value());
            return migrator_void_error(
                error_codes::checksum_mismatch,
                compat::format("Migration {} has been modified since it was "
                               "applied. Expected checksum: {}, got: {}",
                               it->file_name, entry.checksum, actual.value()),
                module_name);
        }
    }
    return ok();
}

// ============================================================================
// Rollback
// ============================================================================

auto migration_executor::rollback(std::optional<std::int64_t> target_version)
    -> Result<rollback_report> {
    transition(executor_state::idle);

    auto lock = acquire_lock();
    if (lock.is_err()) {
        return forward_error<rollback_report>(lock);
    }

    auto applied = ledger_.list_applied();
    if (applied.is_err()) {
        return forward_error<rollback_report>(applied);
    }

    rollback_report report;
    const auto& entries = applied.value();

    if (entries.empty()) {
        logger_adapter::info("No migrations to rollback");
        return report;
    }

    auto target = entries.end() - 1;
    if (target_version) {
        target = std::find_if(entries.begin(), entries.end(),
                              [&](const storage::ledger_entry& entry) {
                                  return entry.version == *target_version;
                              });
        if (target == entries.end()) {
            return make_error<rollback_report>(
                error_codes::version_not_found,
                compat::format("Migration version {} not found", *target_version),
                module_name);
        }
    }

    if (auto reverted = revert_one(*target); reverted.is_err()) {
        return forward_error<rollback_report>(reverted);
    }

    report.rolled_back = *target;
    return report;
}

auto migration_executor::revert_one(const storage::ledger_entry& entry) -> VoidResult {
    const auto rollback_path = catalog_.rollback_path_for(entry.name);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(rollback_path, ec)) {
        return migrator_void_error(
            error_codes::missing_rollback_script,
            compat::format("No rollback file found for migration {} (expected {})",
                           entry.name, rollback_path.string()),
            module_name);
    }

    auto content = catalog::migration_catalog::read_script(rollback_path);
    if (content.is_err()) {
        return forward_error<std::monostate>(content);
    }

    transition(executor_state::applying, entry.version);
    logger_adapter::info("Rolling back migration: {}", entry.name);

    storage::scoped_transaction tx(db_);
    if (auto begun = tx.begin(); begun.is_err()) {
        transition(executor_state::failed, entry.version);
        logger_adapter::log_migration_failed(entry.version, entry.name, "rollback",
                                             begun.error().message);
        return begun;
    }

    auto executed = db_.execute_script(content.value());
    if (executed.is_err()) {
        (void)tx.rollback();
        transition(executor_state::rolled_back, entry.version);
        transition(executor_state::failed, entry.version);
        logger_adapter::error("Rollback failed for {}: {}", entry.name,
                              executed.error().message);
        logger_adapter::log_migration_failed(entry.version, entry.name, "rollback",
                                             executed.error().message);
        return migrator_void_error(
            error_codes::execution_failed,
            compat::format("Rollback failed for {}: {}", entry.name,
                           executed.error().message),
            module_name);
    }

    auto removed = ledger_.remove_by_version(entry.version);
    if (removed.is_err()) {
        (void)tx.rollback();
        transition(executor_state::rolled_back, entry.version);
        transition(executor_state::failed, entry.version);
        logger_adapter::log_migration_failed(entry.version, entry.name, "rollback",
                                             removed.error().message);
        return removed;
    }

    if (auto committed = tx.commit(); committed.is_err()) {
        transition(executor_state::rolled_back, entry.version);
        transition(executor_state::failed, entry.version);
        logger_adapter::log_migration_failed(entry.version, entry.name, "rollback",
                                             committed.error().message);
        return committed;
    }

    transition(executor_state::committed, entry.version);
    logger_adapter::info("Rolled back migration: {}", entry.name);
    logger_adapter::log_migration_rolled_back(entry.version, entry.name);
    transition(executor_state::idle, entry.version);

    return ok();
}

// ============================================================================
// Reset
// ============================================================================

auto migration_executor::reset() -> Result<reset_report> {
    transition(executor_state::idle);

    auto lock = acquire_lock();
    if (lock.is_err()) {
        return forward_error<reset_report>(lock);
    }

    auto applied = ledger_.list_applied();
    if (applied.is_err()) {
        return forward_error<reset_report>(applied);
    }

    auto entries = applied.value();
    std::sort(entries.begin(), entries.end(),
              [](const storage::ledger_entry& a, const storage::ledger_entry& b) {
                  return a.version > b.version;
              });

    for (const auto& entry : entries) {
        std::error_code ec;
        const auto rollback_path = catalog_.rollback_path_for(entry.name);
        if (!std::filesystem::is_regular_file(rollback_path, ec)) {
            return make_error<reset_report>(
                error_codes::missing_rollback_script,
                compat::format("No rollback file found for migration {} (expected {})",
                               entry.name, rollback_path.string()),
                module_name);
        }
    }

    reset_report report;

    logger_adapter::info("Resetting: rolling back {} migration(s)", entries.size());
    for (const auto& entry : entries) {
        if (auto reverted = revert_one(entry); reverted.is_err()) {
            return forward_error<reset_report>(reverted);
        }
        report.rolled_back.push_back(entry);
    }

    auto reapplied = apply_pending_locked();
    if (reapplied.is_err()) {
        return forward_error<reset_report>(reapplied);
    }
    report.reapplied = std::move(reapplied.value());

    return report;
}

// ============================================================================
// Status
// ============================================================================

auto migration_executor::status() const -> Result<status_report> {
    auto all = catalog_.list_all();
    if (all.is_err()) {
        return forward_error<status_report>(all);
    }

    auto applied = ledger_.list_applied();
    if (applied.is_err()) {
        return forward_error<status_report>(applied);
    }

    status_report report;
    const auto done = applied_versions(applied.value());
    for (const auto& migration : all.value()) {
        if (done.count(migration.version) == 0) {
            report.pending.push_back(migration);
        }
    }
    report.applied = std::move(applied.value());

    return report;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_executor::acquire_lock()
    -> Result<std::unique_ptr<storage::migration_lock>> {
    if (!options_.use_lock) {
        return std::unique_ptr<storage::migration_lock>{};
    }
    return storage::migration_lock::acquire(db_, ledger_.table_name(),
                                            options_.lease);
}

void migration_executor::transition(executor_state next,
                                    std::optional<std::int64_t> version) {
    logger_adapter::trace("Executor state {} -> {}", to_string(state_),
                          to_string(next));
    state_ = next;
    current_version_ = version;
}

}  // namespace migrator::executor
