/**
 * @file startup.hpp
 * @brief Apply pending migrations while a service starts
 */

#pragma once

#include "migration_report.hpp"

#include <migrator/config/migrator_config.hpp>
#include <migrator/core/result.hpp>

namespace migrator::storage {
class database_connection;
}  // namespace migrator::storage

namespace migrator::executor {

/**
 * @brief Bring the datastore up to date before a service accepts work
 *
 * Uses the migrations directory, ledger table and lock settings from the
 * configuration; the caller keeps ownership of the connection. A service
 * should refuse to start when this returns an error.
 *
 * @param db Open connection to the service's datastore
 * @param config Migration settings
 * @return Report of the applied migrations
 */
[[nodiscard]] auto run_startup_migrations(storage::database_connection& db,
                                          const config::migrator_config& config)
    -> Result<apply_report>;

}  // namespace migrator::executor
