/**
 * @file scoped_transaction.cpp
 * @brief Implementation of the RAII transaction boundary
 */

#include <migrator/storage/scoped_transaction.hpp>

#include <migrator/compat/format.hpp>
#include <migrator/storage/database_connection.hpp>

namespace migrator::storage {

namespace {
constexpr const char* module_name = "storage";
}  // namespace

scoped_transaction::scoped_transaction(database_connection& db) noexcept
    : db_(db) {}

scoped_transaction::~scoped_transaction() {
    if (active_) {
        (void)rollback();
    }
}

auto scoped_transaction::begin() -> VoidResult {
    if (active_) {
        return migrator_void_error(error_codes::database_transaction_error,
                                   "Transaction already active", module_name);
    }

    auto result = db_.execute("BEGIN IMMEDIATE;");
    if (result.is_err()) {
        return migrator_void_error(
            error_codes::database_transaction_error,
            compat::format("Failed to begin transaction: {}",
                           result.error().message),
            module_name);
    }

    active_ = true;
    return ok();
}

auto scoped_transaction::commit() -> VoidResult {
    if (!active_) {
        return migrator_void_error(error_codes::database_transaction_error,
                                   "No active transaction to commit",
                                   module_name);
    }

    auto result = db_.execute("COMMIT;");
    if (result.is_err()) {
        (void)rollback();
        return migrator_void_error(
            error_codes::database_transaction_error,
            compat::format("Failed to commit transaction: {}",
                           result.error().message),
            module_name);
    }

    active_ = false;
    return ok();
}

auto scoped_transaction::rollback() -> VoidResult {
    if (!active_) {
        return ok();
    }
    active_ = false;

    // SQLite may already have aborted the transaction on certain errors
    // (SQLITE_FULL, SQLITE_IOERR, ...); ROLLBACK would then fail spuriously.
    if (!db_.in_transaction()) {
        return ok();
    }

    auto result = db_.execute("ROLLBACK;");
    if (result.is_err()) {
        return migrator_void_error(
            error_codes::database_transaction_error,
            compat::format("Failed to roll back transaction: {}",
                           result.error().message),
            module_name);
    }

    return ok();
}

}  // namespace migrator::storage
