/**
 * @file logger_adapter.hpp
 * @brief Adapter for migration logging and audit trail using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the migration engine. It supports standard logging plus an audit
 * trail of every schema mutation (applied, rolled back, failed) and every
 * integrity violation found by the validator.
 */

#pragma once

#include <migrator/compat/format.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace migrator::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace" ... "off")
 * @param name Level name, case-sensitive
 * @return The level, or std::nullopt if the name is unknown
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;

/**
 * @brief Convert a log level to its name
 */
[[nodiscard]] auto to_string(log_level level) -> std::string;

/**
 * @enum integrity_violation_kind
 * @brief Kind of integrity violation recorded in the audit trail
 */
enum class integrity_violation_kind {
    checksum_mismatch,
    missing_file
};

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable separate audit trail file (audit.json)
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Use asynchronous logging
    bool async_mode{false};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Static logging facade over logger_system
 *
 * Logging calls are no-ops until initialize() is called, so the engine can
 * be embedded and unit-tested without any logging setup.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/migrator";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Applying migration {}", "001_init.sql");
 * logger_adapter::log_migration_applied(1, "001_init.sql", checksum, 12);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Creates the log directory when file or audit output is enabled and
     * starts the underlying logger.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the underlying logger
     */
    static void shutdown();

    /**
     * @brief Check if the logger is initialized
     */
    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(migrator::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, migrator::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /**
     * @brief Flush all pending log messages
     */
    static void flush();

    // ─────────────────────────────────────────────────────
    // Migration Audit Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record a committed forward migration
     *
     * @param version Migration version
     * @param name Script file name as stored in the ledger
     * @param checksum SHA-256 of the script content
     * @param execution_time_ms Time spent executing the script
     */
    static void log_migration_applied(std::int64_t version,
                                      const std::string& name,
                                      const std::string& checksum,
                                      std::int64_t execution_time_ms);

    /**
     * @brief Record a committed rollback
     *
     * @param version Migration version that was reverted
     * @param name Script file name as stored in the ledger
     */
    static void log_migration_rolled_back(std::int64_t version,
                                          const std::string& name);

    /**
     * @brief Record a migration or rollback whose transaction was aborted
     *
     * @param version Migration version
     * @param name Script file name
     * @param operation "apply" or "rollback"
     * @param reason Error message
     */
    static void log_migration_failed(std::int64_t version,
                                     const std::string& name,
                                     const std::string& operation,
                                     const std::string& reason);

    /**
     * @brief Record an integrity violation found by the validator
     *
     * @param version Migration version
     * @param name Script file name
     * @param kind Kind of violation
     * @param expected_checksum Checksum stored in the ledger
     * @param actual_checksum Recomputed checksum, empty for a missing file
     */
    static void log_integrity_violation(std::int64_t version,
                                        const std::string& name,
                                        integrity_violation_kind kind,
                                        const std::string& expected_checksum,
                                        const std::string& actual_checksum);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace migrator::integration
