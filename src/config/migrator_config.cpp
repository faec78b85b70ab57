/**
 * @file migrator_config.cpp
 * @brief Implementation of layered configuration loading
 */

#include <migrator/config/migrator_config.hpp>

#include <migrator/compat/format.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <optional>

using json = nlohmann::json;

namespace migrator::config {

namespace {

constexpr const char* module_name = "config";

auto get_env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

auto parse_bool(const std::string& value) -> std::optional<bool> {
    if (value == "1" || value == "true" || value == "TRUE" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "FALSE" || value == "off") {
        return false;
    }
    return std::nullopt;
}

}  // namespace

auto default_config() -> migrator_config {
    migrator_config config;
    config.logging.min_level = integration::log_level::info;
    config.logging.enable_console = false;
    config.logging.enable_file = true;
    config.logging.enable_audit_log = true;
    return config;
}

auto apply_environment(migrator_config& config) -> VoidResult {
    if (auto value = get_env("MIGRATOR_DATABASE_PATH")) {
        config.database.path = *value;
    } else if (auto legacy = get_env("DATABASE_PATH")) {
        config.database.path = *legacy;
    }

    if (auto value = get_env("MIGRATOR_MIGRATIONS_DIR")) {
        config.migrations.directory = *value;
    }

    if (auto value = get_env("MIGRATOR_LEDGER_TABLE")) {
        config.migrations.ledger_table = *value;
    }

    if (auto value = get_env("MIGRATOR_LOG_DIRECTORY")) {
        config.logging.log_directory = *value;
    }

    if (auto value = get_env("MIGRATOR_LOG_LEVEL")) {
        auto level = integration::parse_log_level(*value);
        if (!level) {
            return migrator_void_error(
                error_codes::invalid_configuration,
                compat::format("Invalid MIGRATOR_LOG_LEVEL '{}'", *value),
                module_name);
        }
        config.logging.min_level = *level;
    }

    if (auto value = get_env("MIGRATOR_USE_LOCK")) {
        auto enabled = parse_bool(*value);
        if (!enabled) {
            return migrator_void_error(
                error_codes::invalid_configuration,
                compat::format("Invalid MIGRATOR_USE_LOCK '{}'", *value),
                module_name);
        }
        config.lock.enabled = *enabled;
    }

    return ok();
}

auto load_config_file(migrator_config& config,
                      const std::filesystem::path& file_path) -> VoidResult {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return migrator_void_error(
            error_codes::file_read_error,
            compat::format("Failed to open configuration file: {}",
                           file_path.string()),
            module_name);
    }

    try {
        json root;
        file >> root;

        if (root.contains("database")) {
            const auto& db = root["database"];
            if (db.contains("path")) {
                config.database.path = db["path"].get<std::string>();
            }
            if (db.contains("foreign_keys")) {
                config.database.foreign_keys = db["foreign_keys"].get<bool>();
            }
            if (db.contains("wal_mode")) {
                config.database.wal_mode = db["wal_mode"].get<bool>();
            }
            if (db.contains("busy_timeout_ms")) {
                config.database.busy_timeout_ms = db["busy_timeout_ms"].get<int>();
            }
        }

        if (root.contains("migrations")) {
            const auto& migrations = root["migrations"];
            if (migrations.contains("directory")) {
                config.migrations.directory =
                    migrations["directory"].get<std::string>();
            }
            if (migrations.contains("rollback_subdirectory")) {
                config.migrations.rollback_subdirectory =
                    migrations["rollback_subdirectory"].get<std::string>();
            }
            if (migrations.contains("ledger_table")) {
                config.migrations.ledger_table =
                    migrations["ledger_table"].get<std::string>();
            }
        }

        if (root.contains("lock")) {
            const auto& lock = root["lock"];
            if (lock.contains("enabled")) {
                config.lock.enabled = lock["enabled"].get<bool>();
            }
            if (lock.contains("lease_seconds")) {
                config.lock.lease =
                    std::chrono::seconds(lock["lease_seconds"].get<std::int64_t>());
            }
        }

        if (root.contains("logging")) {
            const auto& logging = root["logging"];
            if (logging.contains("directory")) {
                config.logging.log_directory =
                    logging["directory"].get<std::string>();
            }
            if (logging.contains("level")) {
                auto name = logging["level"].get<std::string>();
                auto level = integration::parse_log_level(name);
                if (!level) {
                    return migrator_void_error(
                        error_codes::invalid_configuration,
                        compat::format("Invalid log level '{}' in {}", name,
                                       file_path.string()),
                        module_name);
                }
                config.logging.min_level = *level;
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                config.logging.enable_file = logging["file"].get<bool>();
            }
            if (logging.contains("audit")) {
                config.logging.enable_audit_log = logging["audit"].get<bool>();
            }
        }
    } catch (const json::exception& ex) {
        return migrator_void_error(
            error_codes::invalid_configuration,
            compat::format("JSON parsing error in {}: {}", file_path.string(),
                           ex.what()),
            module_name);
    }

    return ok();
}

auto validate_config(const migrator_config& config) -> VoidResult {
    if (config.database.path.empty()) {
        return migrator_void_error(error_codes::invalid_configuration,
                                   "Database path must not be empty",
                                   module_name);
    }

    if (config.migrations.directory.empty()) {
        return migrator_void_error(error_codes::invalid_configuration,
                                   "Migrations directory must not be empty",
                                   module_name);
    }

    if (config.migrations.rollback_subdirectory.empty()) {
        return migrator_void_error(error_codes::invalid_configuration,
                                   "Rollback subdirectory must not be empty",
                                   module_name);
    }

    if (!is_valid_identifier(config.migrations.ledger_table)) {
        return migrator_void_error(
            error_codes::invalid_configuration,
            compat::format("Ledger table name '{}' is not a valid identifier",
                           config.migrations.ledger_table),
            module_name);
    }

    if (config.lock.enabled && config.lock.lease.count() <= 0) {
        return migrator_void_error(error_codes::invalid_configuration,
                                   "Lock lease must be positive", module_name);
    }

    return ok();
}

auto is_valid_identifier(std::string_view name) noexcept -> bool {
    if (name.empty()) {
        return false;
    }
    auto is_alpha = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    };
    if (!is_alpha(name.front())) {
        return false;
    }
    for (char c : name) {
        if (!is_alpha(c) && !(c >= '0' && c <= '9')) {
            return false;
        }
    }
    return true;
}

}  // namespace migrator::config
