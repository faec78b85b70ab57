/**
 * @file migration_scaffolder.hpp
 * @brief Creation of new migration script pairs from templates
 */

#pragma once

#include "migration_catalog.hpp"

#include <migrator/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace migrator::catalog {

/**
 * @brief Files written by migration_scaffolder::create
 */
struct scaffold_result {
    std::int64_t version{0};
    std::string file_name;
    std::filesystem::path script_path;
    std::filesystem::path rollback_path;
};

/**
 * @brief Writes the next-version forward script and its rollback stub
 *
 * The version is the highest version in the catalog plus one, zero-padded
 * to three digits. Existing files are never overwritten.
 */
class migration_scaffolder {
public:
    explicit migration_scaffolder(const migration_catalog& catalog);

    /**
     * @brief Scaffold a new migration
     *
     * @param name Human-readable name; sanitized with sanitize_name()
     * @return The written files, or invalid_argument / migration_exists /
     *         file_write_error
     */
    [[nodiscard]] auto create(std::string_view name) const -> Result<scaffold_result>;

    /**
     * @brief Lower-case a name and collapse each run of characters outside
     *        [a-z0-9_] into a single underscore
     */
    [[nodiscard]] static auto sanitize_name(std::string_view name) -> std::string;

    /**
     * @brief Zero-pad a version to at least three digits
     */
    [[nodiscard]] static auto format_version(std::int64_t version) -> std::string;

    /**
     * @brief Content of a new forward script
     */
    [[nodiscard]] static auto forward_template(std::string_view file_name,
                                               std::string_view safe_name,
                                               std::string_view author,
                                               std::string_view date) -> std::string;

    /**
     * @brief Content of a new rollback stub
     */
    [[nodiscard]] static auto rollback_template(std::string_view file_name,
                                                std::string_view safe_name)
        -> std::string;

private:
    const migration_catalog& catalog_;
};

}  // namespace migrator::catalog
