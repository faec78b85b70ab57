/**
 * @file migration_report.hpp
 * @brief Results returned by the migration executor
 */

#pragma once

#include <migrator/catalog/migration_descriptor.hpp>
#include <migrator/storage/ledger_entry.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace migrator::executor {

/**
 * @brief A forward migration committed during this run
 */
struct applied_migration {
    std::int64_t version{0};
    std::string file_name;
    std::string checksum;
    std::int64_t execution_time_ms{0};
};

/**
 * @brief Result of apply_pending()
 */
struct apply_report {
    /// Migrations committed by this run, in application order
    std::vector<applied_migration> applied;

    /// Pending scripts found already recorded with a matching checksum
    std::vector<std::string> skipped;

    /// Number of pending migrations found before applying
    std::size_t pending_count{0};

    [[nodiscard]] auto up_to_date() const noexcept -> bool {
        return pending_count == 0;
    }
};

/**
 * @brief Result of rollback()
 */
struct rollback_report {
    /// The ledger entry that was removed; std::nullopt if the ledger was empty
    std::optional<storage::ledger_entry> rolled_back;
};

/**
 * @brief Result of reset()
 */
struct reset_report {
    /// Entries rolled back, in descending version order
    std::vector<storage::ledger_entry> rolled_back;

    /// Outcome of re-applying every migration afterwards
    apply_report reapplied;
};

/**
 * @brief Snapshot of applied and pending migrations
 */
struct status_report {
    std::vector<storage::ledger_entry> applied;
    std::vector<catalog::migration_descriptor> pending;
};

}  // namespace migrator::executor
