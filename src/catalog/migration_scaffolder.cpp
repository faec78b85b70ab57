/**
 * @file migration_scaffolder.cpp
 * @brief Implementation of migration script scaffolding
 */

#include <migrator/catalog/migration_scaffolder.hpp>

#include <migrator/compat/format.hpp>
#include <migrator/compat/time.hpp>
#include <migrator/integration/logger_adapter.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <system_error>

namespace migrator::catalog {

namespace {

constexpr const char* module_name = "scaffolder";

auto is_name_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

auto current_author() -> std::string {
    const char* user = std::getenv("USER");
    if (user == nullptr || *user == '\0') {
        user = std::getenv("USERNAME");
    }
    return (user != nullptr && *user != '\0') ? std::string(user) : "Unknown";
}

auto write_new_file(const std::filesystem::path& path, const std::string& content)
    -> VoidResult {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return migrator_void_error(
            error_codes::file_write_error,
            compat::format("Failed to create {}", path.string()), module_name);
    }
    file << content;
    file.close();
    if (!file) {
        return migrator_void_error(
            error_codes::file_write_error,
            compat::format("Failed to write {}", path.string()), module_name);
    }
    return ok();
}

}  // namespace

migration_scaffolder::migration_scaffolder(const migration_catalog& catalog)
    : catalog_(catalog) {}

// ============================================================================
// Naming and Templates
// ============================================================================

auto migration_scaffolder::sanitize_name(std::string_view name) -> std::string {
    std::string result;
    result.reserve(name.size());

    bool in_run = false;
    for (char c : name) {
        const auto lower = static_cast<char>(
            std::tolower(static_cast<unsigned char>(c)));
        if (is_name_char(lower)) {
            result.push_back(lower);
            in_run = false;
        } else if (!in_run) {
            result.push_back('_');
            in_run = true;
        }
    }
    return result;
}

auto migration_scaffolder::format_version(std::int64_t version) -> std::string {
    return compat::format("{:03}", version);
}

auto migration_scaffolder::forward_template(std::string_view file_name,
                                            std::string_view safe_name,
                                            std::string_view author,
                                            std::string_view date) -> std::string {
    std::string description(safe_name);
    std::replace(description.begin(), description.end(), '_', ' ');

    return compat::format(
        "-- Migration: {}\n"
        "-- Description: {}\n"
        "-- Author: {}\n"
        "-- Date: {}\n"
        "\n"
        "-- Your migration SQL here\n",
        file_name, description, author, date);
}

auto migration_scaffolder::rollback_template(std::string_view file_name,
                                             std::string_view safe_name)
    -> std::string {
    return compat::format(
        "-- Rollback for: {}\n"
        "-- Description: Rollback {}\n"
        "\n"
        "-- Your rollback SQL here\n",
        file_name, safe_name);
}

// ============================================================================
// Creation
// ============================================================================

auto migration_scaffolder::create(std::string_view name) const
    -> Result<scaffold_result> {
    const auto safe_name = sanitize_name(name);
    if (safe_name.empty() ||
        std::all_of(safe_name.begin(), safe_name.end(),
                    [](char c) { return c == '_'; })) {
        return make_error<scaffold_result>(
            error_codes::invalid_argument,
            compat::format("Migration name '{}' has no usable characters", name),
            module_name);
    }

    auto next = catalog_.next_version();
    if (next.is_err()) {
        return make_error<scaffold_result>(next.error().code,
                                           next.error().message, module_name);
    }

    scaffold_result result;
    result.version = next.value();
    result.file_name =
        compat::format("{}_{}.sql", format_version(result.version), safe_name);
    result.script_path = catalog_.script_path_for(result.file_name);
    result.rollback_path = catalog_.rollback_path_for(result.file_name);

    std::error_code ec;
    std::filesystem::create_directories(catalog_.rollback_directory(), ec);
    if (ec) {
        return make_error<scaffold_result>(
            error_codes::migrations_directory_error,
            compat::format("Failed to create {}: {}",
                           catalog_.rollback_directory().string(), ec.message()),
            module_name);
    }

    for (const auto& target : {result.script_path, result.rollback_path}) {
        if (std::filesystem::exists(target, ec)) {
            return make_error<scaffold_result>(
                error_codes::migration_exists,
                compat::format("Refusing to overwrite existing file {}",
                               target.string()),
                module_name);
        }
    }

    const auto date =
        compat::format_utc(std::chrono::system_clock::now(), "%Y-%m-%d");

    auto written = write_new_file(
        result.script_path,
        forward_template(result.file_name, safe_name, current_author(), date));
    if (written.is_err()) {
        return make_error<scaffold_result>(written.error().code,
                                           written.error().message, module_name);
    }

    auto stub_written = write_new_file(
        result.rollback_path, rollback_template(result.file_name, safe_name));
    if (stub_written.is_err()) {
        // A lone forward script would shift the next version number
        std::error_code remove_ec;
        std::filesystem::remove(result.script_path, remove_ec);
        if (remove_ec) {
            integration::logger_adapter::warn("Failed to remove {}: {}",
                                              result.script_path.string(),
                                              remove_ec.message());
        }
        return make_error<scaffold_result>(stub_written.error().code,
                                           stub_written.error().message,
                                           module_name);
    }

    integration::logger_adapter::info("Created migration {} (version {})",
                                      result.file_name, result.version);
    return result;
}

}  // namespace migrator::catalog
