/**
 * @file main.cpp
 * @brief Service Startup - apply migrations before serving
 *
 * Shows how a long-running service brings its datastore up to date at
 * startup and refuses to start when a migration fails.
 *
 * Usage:
 *   service_startup [config.json]
 *
 * Example:
 *   service_startup samples/config/migrator.json
 */

#include <migrator/config/migrator_config.hpp>
#include <migrator/executor/startup.hpp>
#include <migrator/integration/logger_adapter.hpp>
#include <migrator/storage/database_connection.hpp>

#include <iostream>

using namespace migrator;

int main(int argc, char* argv[]) {
    auto cfg = config::default_config();
    cfg.logging.enable_console = true;

    if (auto env = config::apply_environment(cfg); env.is_err()) {
        std::cerr << "Error: " << env.error().message << "\n";
        return 1;
    }

    if (argc > 1) {
        if (auto loaded = config::load_config_file(cfg, argv[1]); loaded.is_err()) {
            std::cerr << "Error: " << loaded.error().message << "\n";
            return 1;
        }
    }

    integration::logger_adapter::initialize(cfg.logging);

    auto db_result = storage::database_connection::open(cfg.database);
    if (db_result.is_err()) {
        integration::logger_adapter::fatal("Cannot open database: {}",
                                           db_result.error().message);
        integration::logger_adapter::shutdown();
        return 1;
    }
    auto& db = *db_result.value();

    auto report = executor::run_startup_migrations(db, cfg);
    if (report.is_err()) {
        integration::logger_adapter::fatal("Refusing to start: {}: {}",
                                           error_name(report.error().code),
                                           report.error().message);
        integration::logger_adapter::shutdown();
        return 1;
    }

    std::cout << "Schema ready (" << report.value().applied.size()
              << " migration(s) applied); service would start serving here\n";

    integration::logger_adapter::shutdown();
    return 0;
}
