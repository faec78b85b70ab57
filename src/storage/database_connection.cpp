/**
 * @file database_connection.cpp
 * @brief Implementation of the owning SQLite connection
 */

#include <migrator/storage/database_connection.hpp>

#include <migrator/compat/format.hpp>
#include <migrator/integration/logger_adapter.hpp>

#include <sqlite3.h>

#include <system_error>

namespace migrator::storage {

namespace {

constexpr const char* module_name = "storage";

auto is_memory_path(std::string_view path) -> bool {
    return path == ":memory:" || path.empty();
}

/// Set by the authorizer when a script statement was refused
struct script_authorizer_state {
    bool transaction_control_denied{false};
};

auto deny_transaction_control(void* user_data, int action, const char*,
                              const char*, const char*, const char*) -> int {
    if (action == SQLITE_TRANSACTION || action == SQLITE_SAVEPOINT) {
        static_cast<script_authorizer_state*>(user_data)
            ->transaction_control_denied = true;
        return SQLITE_DENY;
    }
    return SQLITE_OK;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

auto database_connection::open(std::string_view db_path)
    -> Result<std::unique_ptr<database_connection>> {
    config::database_config config;
    config.path = std::string(db_path);
    return open(config);
}

auto database_connection::open(const config::database_config& config)
    -> Result<std::unique_ptr<database_connection>> {
    const auto path_str = config.path.string();

    if (!config.read_only && !is_memory_path(path_str) &&
        config.path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(config.path.parent_path(), ec);
        if (ec) {
            return make_error<std::unique_ptr<database_connection>>(
                error_codes::database_open_error,
                compat::format("Failed to create directory {}: {}",
                               config.path.parent_path().string(), ec.message()),
                module_name);
        }
    }

    sqlite3* db = nullptr;
    const int flags = config.read_only
                          ? SQLITE_OPEN_READONLY
                          : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    auto rc = sqlite3_open_v2(path_str.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<std::unique_ptr<database_connection>>(
            error_codes::database_open_error,
            compat::format("Failed to open database {}: {}", path_str, error_msg),
            module_name);
    }

    if (config.foreign_keys) {
        rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<database_connection>>(
                error_codes::database_open_error,
                "Failed to enable foreign keys", module_name);
        }
    }

    // WAL is meaningless for in-memory databases and persists on disk
    if (config.wal_mode && !config.read_only && !is_memory_path(path_str)) {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<database_connection>>(
                error_codes::database_open_error, "Failed to enable WAL mode",
                module_name);
        }
    }

    if (config.busy_timeout_ms > 0) {
        sqlite3_busy_timeout(db, config.busy_timeout_ms);
    }

    integration::logger_adapter::debug("Database connected: {}", path_str);

    auto instance = std::unique_ptr<database_connection>(
        new database_connection(db, path_str));
    return instance;
}

database_connection::database_connection(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

database_connection::~database_connection() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        integration::logger_adapter::debug("Database connection closed: {}", path_);
    }
}

// ============================================================================
// Statement Execution
// ============================================================================

auto database_connection::execute(std::string_view sql) -> VoidResult {
    // sqlite3_exec needs a NUL-terminated buffer
    const std::string statement(sql);

    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, statement.c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : last_error_message();
        sqlite3_free(errmsg);

        return make_error<std::monostate>(
            error_codes::database_query_error,
            compat::format("SQL execution failed: {}", error_str), module_name);
    }

    return ok();
}

auto database_connection::execute_script(std::string_view sql) -> VoidResult {
    script_authorizer_state state;
    sqlite3_set_authorizer(db_, deny_transaction_control, &state);
    auto result = execute(sql);
    sqlite3_set_authorizer(db_, nullptr, nullptr);

    if (result.is_err() && state.transaction_control_denied) {
        return make_error<std::monostate>(
            error_codes::database_query_error,
            "Transaction control statements are not allowed in migration "
            "scripts; each script already runs in its own transaction",
            module_name);
    }

    return result;
}

auto database_connection::table_exists(std::string_view table_name) const
    -> bool {
    const char* sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name=?;";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, table_name.data(),
                      static_cast<int>(table_name.size()), SQLITE_TRANSIENT);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_ROW;
}

auto database_connection::in_transaction() const noexcept -> bool {
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

auto database_connection::last_error_message() const -> std::string {
    if (!db_) {
        return "Database not open";
    }
    const char* msg = sqlite3_errmsg(db_);
    return msg ? std::string(msg) : std::string("Unknown error");
}

}  // namespace migrator::storage
