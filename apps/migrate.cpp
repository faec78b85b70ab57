/**
 * @file migrate.cpp
 * @brief migrate - schema migration command-line tool
 *
 * Applies, reverts, inspects and scaffolds SQL migrations for a SQLite
 * datastore.
 *
 * Usage:
 *   migrate [command] [options]
 *
 * Example:
 *   migrate up --database data/app.db
 *   migrate down --version 3
 *   migrate create --name "add users table"
 */

#include <migrator/catalog/migration_catalog.hpp>
#include <migrator/catalog/migration_scaffolder.hpp>
#include <migrator/config/migrator_config.hpp>
#include <migrator/executor/migration_executor.hpp>
#include <migrator/integration/logger_adapter.hpp>
#include <migrator/integrity/integrity_validator.hpp>
#include <migrator/storage/database_connection.hpp>
#include <migrator/storage/version_ledger.hpp>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

using namespace migrator;

namespace {

/**
 * @brief Commands supported by the tool
 */
enum class command_type {
    up,
    down,
    status,
    validate,
    create,
    reset,
    help
};

/**
 * @brief Command line options
 */
struct options {
    command_type command{command_type::up};

    std::optional<std::string> database_path;
    std::optional<std::string> migrations_dir;
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;

    std::optional<std::int64_t> target_version;
    std::string name;

    bool no_lock{false};
    bool verbose{false};
};

/**
 * @brief Print program usage
 * @param program_name Name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << R"(
migrate - SQL schema migrations

Usage: )" << program_name
              << R"( [command] [options]

Commands:
  up                      Apply all pending migrations (default)
  down [--version <n>]    Roll back the latest or the given migration
  status                  Show applied and pending migrations
  validate                Check applied migrations against their scripts
  create --name <name>    Create a new migration and its rollback stub
  reset                   Roll back every migration, then apply all again
  help                    Show this help message

Options:
  --database, -d <path>        Database file (default: data/database.db)
  --migrations-dir, -m <dir>   Migrations directory (default: migrations)
  --config, -c <file>          JSON configuration file
  --log-level <level>          trace, debug, info, warn, error, fatal, off
  --no-lock                    Do not take the migration lease
  --verbose, -v                Also log to the console
  --help, -h                   Show this help message

Environment:
  MIGRATOR_DATABASE_PATH (or DATABASE_PATH), MIGRATOR_MIGRATIONS_DIR,
  MIGRATOR_LEDGER_TABLE, MIGRATOR_LOG_LEVEL, MIGRATOR_LOG_DIRECTORY,
  MIGRATOR_USE_LOCK, MIGRATOR_CONFIG

Examples:
  )" << program_name
              << R"( up
  )" << program_name
              << R"( down --version 2
  )" << program_name
              << R"( create --name "add user id to companies"

Exit Codes:
  0  Success
  1  Failure, integrity violations, or invalid arguments
)";
}

/**
 * @brief Parse command string to enum
 * @param cmd Command string
 * @return Corresponding command_type, std::nullopt if unknown
 */
std::optional<command_type> parse_command(const std::string& cmd) {
    if (cmd == "up") return command_type::up;
    if (cmd == "down") return command_type::down;
    if (cmd == "status") return command_type::status;
    if (cmd == "validate") return command_type::validate;
    if (cmd == "create") return command_type::create;
    if (cmd == "reset") return command_type::reset;
    if (cmd == "help" || cmd == "--help" || cmd == "-h") return command_type::help;
    return std::nullopt;
}

std::optional<std::int64_t> parse_version_arg(const std::string& text) {
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param opts Output options structure
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    int first_option = 1;

    if (argc > 1 && argv[1][0] != '-') {
        auto command = parse_command(argv[1]);
        if (!command) {
            std::cerr << "Error: Unknown command '" << argv[1] << "'\n";
            return false;
        }
        opts.command = *command;
        first_option = 2;
    }

    for (int i = first_option; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.command = command_type::help;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--no-lock") {
            opts.no_lock = true;
        } else if ((arg == "--database" || arg == "-d") && i + 1 < argc) {
            opts.database_path = argv[++i];
        } else if ((arg == "--migrations-dir" || arg == "-m") && i + 1 < argc) {
            opts.migrations_dir = argv[++i];
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            opts.log_level = argv[++i];
        } else if (arg == "--version" && i + 1 < argc) {
            opts.target_version = parse_version_arg(argv[++i]);
            if (!opts.target_version) {
                std::cerr << "Error: --version expects a positive integer, got '"
                          << argv[i] << "'\n";
                return false;
            }
        } else if (arg == "--name" && i + 1 < argc) {
            opts.name = argv[++i];
        } else {
            std::cerr << "Error: Unknown or incomplete option '" << arg << "'\n";
            return false;
        }
    }

    return true;
}

/**
 * @brief Build the effective configuration: defaults, environment,
 *        configuration file, then command-line flags
 */
bool build_config(const options& opts, config::migrator_config& cfg) {
    cfg = config::default_config();

    if (auto env = config::apply_environment(cfg); env.is_err()) {
        std::cerr << "Error: " << env.error().message << "\n";
        return false;
    }

    auto config_path = opts.config_path;
    if (!config_path) {
        if (const char* env_path = std::getenv("MIGRATOR_CONFIG");
            env_path != nullptr && *env_path != '\0') {
            config_path = env_path;
        }
    }

    if (config_path) {
        auto loaded = config::load_config_file(cfg, *config_path);
        if (loaded.is_err()) {
            std::cerr << "Error: " << loaded.error().message << "\n";
            return false;
        }
    }

    if (opts.database_path) {
        cfg.database.path = *opts.database_path;
    }
    if (opts.migrations_dir) {
        cfg.migrations.directory = *opts.migrations_dir;
    }
    if (opts.log_level) {
        auto level = integration::parse_log_level(*opts.log_level);
        if (!level) {
            std::cerr << "Error: Invalid log level '" << *opts.log_level << "'\n";
            return false;
        }
        cfg.logging.min_level = *level;
    }
    if (opts.no_lock) {
        cfg.lock.enabled = false;
    }
    if (opts.verbose) {
        cfg.logging.enable_console = true;
    }

    if (auto valid = config::validate_config(cfg); valid.is_err()) {
        std::cerr << "Error: " << valid.error().message << "\n";
        return false;
    }

    return true;
}

/**
 * @brief Print an engine error as "<ErrorName>: <message>"
 */
int report_error(const error_info& err) {
    std::cerr << "Error: " << error_name(err.code) << ": " << err.message << "\n";
    return 1;
}

/**
 * @brief Open the datastore, read-only for commands that never write
 *
 * A database that does not exist yet has an empty ledger, so read-only
 * commands inspect a throwaway in-memory database instead of creating it.
 */
auto open_database(config::database_config db_config, bool read_only)
    -> Result<std::unique_ptr<storage::database_connection>> {
    if (read_only && db_config.path != ":memory:") {
        std::error_code ec;
        if (!std::filesystem::exists(db_config.path, ec)) {
            integration::logger_adapter::info("Database {} does not exist yet",
                                              db_config.path.string());
            db_config.path = ":memory:";
        } else {
            db_config.read_only = true;
        }
    }
    return storage::database_connection::open(db_config);
}

/**
 * @brief Initializes the logger for the lifetime of a command
 */
struct logging_scope {
    explicit logging_scope(const integration::logger_config& config) {
        integration::logger_adapter::initialize(config);
    }
    ~logging_scope() { integration::logger_adapter::shutdown(); }

    logging_scope(const logging_scope&) = delete;
    logging_scope& operator=(const logging_scope&) = delete;
};

// ============================================================================
// Commands
// ============================================================================

int do_up(executor::migration_executor& exec) {
    auto result = exec.apply_pending();
    if (result.is_err()) {
        return report_error(result.error());
    }

    const auto& report = result.value();
    if (report.up_to_date()) {
        std::cout << "All migrations are up to date\n";
        return 0;
    }

    std::cout << "Found " << report.pending_count << " pending migration(s)\n";
    for (const auto& skipped : report.skipped) {
        std::cout << "  = " << skipped << " already applied\n";
    }
    for (const auto& applied : report.applied) {
        std::cout << "  + " << applied.file_name << " (v" << applied.version
                  << ") [" << applied.execution_time_ms << "ms]\n";
    }
    std::cout << "\nAll migrations completed successfully\n";
    return 0;
}

int do_down(executor::migration_executor& exec, const options& opts) {
    auto result = exec.rollback(opts.target_version);
    if (result.is_err()) {
        return report_error(result.error());
    }

    const auto& report = result.value();
    if (!report.rolled_back) {
        std::cout << "No migrations to rollback\n";
        return 0;
    }

    std::cout << "Rolled back migration: " << report.rolled_back->name << " (v"
              << report.rolled_back->version << ")\n";
    return 0;
}

int do_status(const executor::migration_executor& exec) {
    auto result = exec.status();
    if (result.is_err()) {
        return report_error(result.error());
    }

    const auto& report = result.value();
    std::cout << "\n=== Migration Status ===\n\n";

    if (report.applied.empty()) {
        std::cout << "No migrations applied yet\n";
    } else {
        std::cout << "Applied migrations:\n";
        for (const auto& entry : report.applied) {
            std::cout << "  [x] " << entry.name << " (v" << entry.version << ") - "
                      << entry.applied_at << " UTC [" << entry.execution_time_ms
                      << "ms]\n";
        }
    }

    if (report.pending.empty()) {
        std::cout << "\nNo pending migrations\n";
    } else {
        std::cout << "\nPending migrations:\n";
        for (const auto& migration : report.pending) {
            std::cout << "  [ ] " << migration.file_name << " (v"
                      << migration.version << ")\n";
        }
    }

    std::cout << "\n" << report.applied.size() << " applied, "
              << report.pending.size() << " pending\n";
    return 0;
}

int do_validate(const catalog::migration_catalog& catalog,
                const storage::version_ledger& ledger) {
    integrity::integrity_validator validator(catalog, ledger);

    std::cout << "Validating migrations...\n";
    auto result = validator.validate();
    if (result.is_err()) {
        return report_error(result.error());
    }

    const auto& report = result.value();
    for (const auto& violation : report.violations) {
        if (violation.type == integrity::violation_type::missing_file) {
            std::cerr << "  Migration file missing: " << violation.name << " (v"
                      << violation.version << ")\n";
        } else {
            std::cerr << "  Migration " << violation.name
                      << " has been modified after being applied\n"
                      << "    Expected: " << violation.expected_checksum << "\n"
                      << "    Current:  " << violation.actual_checksum.value_or("")
                      << "\n";
        }
    }

    if (!report.valid) {
        std::cerr << "\nValidation failed: " << report.violations.size()
                  << " violation(s) in " << report.checked << " applied migration(s)\n";
        return 1;
    }

    std::cout << "All " << report.checked << " applied migration(s) are valid\n";
    return 0;
}

int do_create(const catalog::migration_catalog& catalog, const options& opts) {
    if (opts.name.empty()) {
        std::cerr << "Error: Migration name is required (--name <name>)\n";
        return 1;
    }

    catalog::migration_scaffolder scaffolder(catalog);
    auto result = scaffolder.create(opts.name);
    if (result.is_err()) {
        return report_error(result.error());
    }

    std::cout << "Created migration: " << result.value().script_path.string() << "\n"
              << "Created rollback:  " << result.value().rollback_path.string()
              << "\n";
    return 0;
}

int do_reset(executor::migration_executor& exec) {
    auto result = exec.reset();
    if (result.is_err()) {
        return report_error(result.error());
    }

    const auto& report = result.value();
    for (const auto& entry : report.rolled_back) {
        std::cout << "  - " << entry.name << " (v" << entry.version << ")\n";
    }
    for (const auto& applied : report.reapplied.applied) {
        std::cout << "  + " << applied.file_name << " (v" << applied.version
                  << ") [" << applied.execution_time_ms << "ms]\n";
    }
    std::cout << "Reset complete: " << report.rolled_back.size()
              << " rolled back, " << report.reapplied.applied.size()
              << " applied\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    if (opts.command == command_type::help) {
        print_usage(argv[0]);
        return 0;
    }

    config::migrator_config cfg;
    if (!build_config(opts, cfg)) {
        return 1;
    }

    logging_scope logging(cfg.logging);

    catalog::migration_catalog catalog(cfg.migrations.directory,
                                       cfg.migrations.rollback_subdirectory);

    // Scaffolding only touches the migrations directory
    if (opts.command == command_type::create) {
        return do_create(catalog, opts);
    }

    const bool read_only = opts.command == command_type::status ||
                           opts.command == command_type::validate;
    auto db_result = open_database(cfg.database, read_only);
    if (db_result.is_err()) {
        return report_error(db_result.error());
    }

    auto& db = *db_result.value();
    storage::version_ledger ledger(db, cfg.migrations.ledger_table);

    executor::executor_options exec_options;
    exec_options.use_lock = cfg.lock.enabled;
    exec_options.lease = cfg.lock.lease;
    executor::migration_executor exec(db, catalog, ledger, exec_options);

    switch (opts.command) {
        case command_type::up:
            return do_up(exec);
        case command_type::down:
            return do_down(exec, opts);
        case command_type::status:
            return do_status(exec);
        case command_type::validate:
            return do_validate(catalog, ledger);
        case command_type::reset:
            return do_reset(exec);
        case command_type::create:
        case command_type::help:
            break;
    }

    return 0;
}
