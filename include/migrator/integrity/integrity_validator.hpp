/**
 * @file integrity_validator.hpp
 * @brief Detection of applied migration scripts that changed or vanished
 *
 * The checksum stored in the ledger is the truth for a version. The
 * validator recomputes each applied script's checksum from disk and
 * reports every difference without repairing anything.
 */

#pragma once

#include <migrator/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace migrator::catalog {
class migration_catalog;
}  // namespace migrator::catalog

namespace migrator::storage {
class version_ledger;
}  // namespace migrator::storage

namespace migrator::integrity {

// =============================================================================
// Violation Types
// =============================================================================

/**
 * @brief Kind of integrity violation
 */
enum class violation_type {
    checksum_mismatch,  ///< Script content differs from what was applied
    missing_file        ///< Script of an applied version no longer exists
};

/**
 * @brief Convert violation_type to string
 */
[[nodiscard]] inline auto to_string(violation_type type) -> std::string {
    switch (type) {
        case violation_type::checksum_mismatch: return "checksum_mismatch";
        case violation_type::missing_file: return "missing_file";
        default: return "unknown";
    }
}

/**
 * @brief One applied migration that no longer matches its ledger entry
 */
struct integrity_violation {
    std::int64_t version{0};
    std::string name;
    violation_type type{violation_type::checksum_mismatch};
    std::string expected_checksum;

    /// Recomputed checksum; std::nullopt when the file is missing
    std::optional<std::string> actual_checksum;
};

/**
 * @brief Outcome of a validation run
 */
struct validation_report {
    /// True when no violation was found
    bool valid{true};

    /// Violations ordered by ascending version
    std::vector<integrity_violation> violations;

    /// Number of ledger entries that were checked
    std::size_t checked{0};
};

// =============================================================================
// Validator
// =============================================================================

/**
 * @brief Read-only comparison of ledger checksums against disk
 *
 * Never creates the ledger table and never writes to the datastore.
 * Every violation found is also written to the audit log.
 */
class integrity_validator {
public:
    integrity_validator(const catalog::migration_catalog& catalog,
                        const storage::version_ledger& ledger);

    /**
     * @brief Check every ledger entry against its script on disk
     *
     * @return Report (possibly with violations), or an error if the ledger
     *         could not be read
     */
    [[nodiscard]] auto validate() const -> Result<validation_report>;

private:
    const catalog::migration_catalog& catalog_;
    const storage::version_ledger& ledger_;
};

}  // namespace migrator::integrity
