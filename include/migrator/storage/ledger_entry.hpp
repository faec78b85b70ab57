/**
 * @file ledger_entry.hpp
 * @brief Ledger row describing one applied migration
 */

#pragma once

#include <cstdint>
#include <string>

namespace migrator::storage {

/**
 * @brief Represents a migration recorded in the ledger table
 *
 * The checksum of a version never changes once written; a different
 * checksum on disk means the script was edited after it was applied.
 */
struct ledger_entry {
    std::int64_t id{0};                 ///< Surrogate key
    std::int64_t version{0};            ///< Migration version (unique)
    std::string name;                   ///< Script file name, e.g. "001_init.sql"
    std::string checksum;               ///< SHA-256 hex digest of the script bytes
    std::string applied_at;             ///< UTC timestamp "YYYY-MM-DD HH:MM:SS"
    std::int64_t execution_time_ms{0};  ///< Time spent executing the script
};

}  // namespace migrator::storage
