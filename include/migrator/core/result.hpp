/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the migration engine
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for migrator, integrating with common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace migrator {

/**
 * @brief Result type alias for migrator operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Migration engine error codes
 *
 * Error code range: -600 to -699
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int migrator_base = -600;

    // Catalog errors (-600 to -619)
    constexpr int malformed_version = migrator_base - 0;
    constexpr int duplicate_version = migrator_base - 1;
    constexpr int migrations_directory_error = migrator_base - 2;
    constexpr int migration_exists = migrator_base - 3;

    // Integrity errors (-620 to -639)
    constexpr int checksum_mismatch = migrator_base - 20;
    constexpr int missing_migration_file = migrator_base - 21;
    constexpr int checksum_error = migrator_base - 22;

    // Execution errors (-640 to -659)
    constexpr int execution_failed = migrator_base - 40;
    constexpr int missing_rollback_script = migrator_base - 41;
    constexpr int version_not_found = migrator_base - 42;
    constexpr int lock_held = migrator_base - 43;

    // Database errors (-660 to -679)
    constexpr int database_open_error = migrator_base - 60;
    constexpr int database_query_error = migrator_base - 61;
    constexpr int database_transaction_error = migrator_base - 62;
    constexpr int ledger_error = migrator_base - 63;

    // File and configuration errors (-680 to -699)
    constexpr int file_read_error = migrator_base - 80;
    constexpr int file_write_error = migrator_base - 81;
    constexpr int invalid_configuration = migrator_base - 82;
    constexpr int invalid_argument = migrator_base - 83;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Get a short symbolic name for a migrator error code
 *
 * Used by the command-line tool to print the error class alongside the
 * message, e.g. "MissingRollbackScriptError".
 *
 * @param code Error code from migrator::error_codes
 * @return Symbolic name, or "Error" for codes outside the migrator range
 */
[[nodiscard]] inline auto error_name(int code) -> std::string {
    switch (code) {
        case error_codes::malformed_version: return "MalformedVersionError";
        case error_codes::duplicate_version: return "DuplicateVersionError";
        case error_codes::migrations_directory_error: return "MigrationsDirectoryError";
        case error_codes::migration_exists: return "MigrationExistsError";
        case error_codes::checksum_mismatch: return "ChecksumMismatchError";
        case error_codes::missing_migration_file: return "MissingFileError";
        case error_codes::checksum_error: return "ChecksumError";
        case error_codes::execution_failed: return "ExecutionError";
        case error_codes::missing_rollback_script: return "MissingRollbackScriptError";
        case error_codes::version_not_found: return "NotFoundError";
        case error_codes::lock_held: return "LockHeldError";
        case error_codes::database_open_error: return "DatabaseOpenError";
        case error_codes::database_query_error: return "DatabaseQueryError";
        case error_codes::database_transaction_error: return "TransactionError";
        case error_codes::ledger_error: return "LedgerError";
        case error_codes::file_read_error: return "FileReadError";
        case error_codes::file_write_error: return "FileWriteError";
        case error_codes::invalid_configuration: return "ConfigurationError";
        case error_codes::invalid_argument: return "InvalidArgumentError";
        default: return "Error";
    }
}

/**
 * @brief Create a migrator error result with module context
 * @tparam T The result value type
 * @param code Error code from migrator::error_codes
 * @param message Error message
 * @param module Component that raised the error
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> migrator_error(int code, const std::string& message,
                                const std::string& module) {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create a migrator void error result
 * @param code Error code from migrator::error_codes
 * @param message Error message
 * @param module Component that raised the error
 * @return VoidResult containing the error
 */
inline VoidResult migrator_void_error(int code, const std::string& message,
                                      const std::string& module) {
    return VoidResult(error_info{code, message, module});
}

} // namespace migrator

