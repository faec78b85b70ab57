/**
 * @file startup.cpp
 * @brief Implementation of the service startup migration hook
 */

#include <migrator/executor/startup.hpp>

#include <migrator/catalog/migration_catalog.hpp>
#include <migrator/executor/migration_executor.hpp>
#include <migrator/integration/logger_adapter.hpp>
#include <migrator/storage/database_connection.hpp>
#include <migrator/storage/version_ledger.hpp>

namespace migrator::executor {

auto run_startup_migrations(storage::database_connection& db,
                            const config::migrator_config& config)
    -> Result<apply_report> {
    if (auto valid = config::validate_config(config); valid.is_err()) {
        return make_error<apply_report>(valid.error().code, valid.error().message,
                                        "startup");
    }

    catalog::migration_catalog catalog(config.migrations.directory,
                                       config.migrations.rollback_subdirectory);
    storage::version_ledger ledger(db, config.migrations.ledger_table);

    executor_options options;
    options.use_lock = config.lock.enabled;
    options.lease = config.lock.lease;

    migration_executor executor(db, catalog, ledger, options);

    integration::logger_adapter::info("Checking migrations in {}",
                                      config.migrations.directory.string());

    auto report = executor.apply_pending();
    if (report.is_err()) {
        integration::logger_adapter::error("Startup migrations failed: {}",
                                           report.error().message);
        return report;
    }

    if (report.value().up_to_date()) {
        integration::logger_adapter::info("Database schema is up to date");
    } else {
        integration::logger_adapter::info("Applied {} migration(s) at startup",
                                          report.value().applied.size());
    }

    return report;
}

}  // namespace migrator::executor
