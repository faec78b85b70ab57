/**
 * @file migration_descriptor.hpp
 * @brief Forward migration discovered in the migrations directory
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace migrator::catalog {

/**
 * @brief One forward migration script and its optional rollback script
 *
 * Descriptors are rebuilt from the directory on every invocation and are
 * never persisted.
 */
struct migration_descriptor {
    /// Version parsed from the leading integer of the file name
    std::int64_t version{0};

    /// Name part of the file name ("add_users" for "002_add_users.sql")
    std::string name;

    /// Full file name ("002_add_users.sql"); this is what the ledger stores
    std::string file_name;

    /// Location of the forward script
    std::filesystem::path script_path;

    /// Location of the rollback script, if one exists
    std::optional<std::filesystem::path> rollback_path;
};

}  // namespace migrator::catalog
