/**
 * @file migration_catalog.hpp
 * @brief Discovery of migration scripts on disk
 *
 * Forward scripts are named "<version>_<name>.sql" and live directly in
 * the migrations directory. Rollback scripts are named
 * "<version>_<name>.rollback.sql" and live in a subdirectory
 * ("rollback" by default).
 */

#pragma once

#include "migration_descriptor.hpp"

#include <migrator/core/result.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace migrator::catalog {

/**
 * @brief Read-only view of the migrations directory
 *
 * @example
 * @code
 * migration_catalog catalog("migrations");
 * auto all = catalog.list_all();
 * if (all.is_ok()) {
 *     for (const auto& m : all.value()) {
 *         std::cout << m.version << " " << m.file_name << "\n";
 *     }
 * }
 * @endcode
 */
class migration_catalog {
public:
    /**
     * @brief Construct a catalog over a directory
     *
     * @param directory Migrations directory
     * @param rollback_subdirectory Subdirectory holding rollback scripts
     */
    explicit migration_catalog(std::filesystem::path directory,
                               std::string rollback_subdirectory = "rollback");

    /**
     * @brief Discover all forward migrations, ordered by ascending version
     *
     * A missing migrations directory is created and yields an empty list.
     * Ordering is numeric, so "9_x.sql" comes before "10_y.sql".
     *
     * @return Descriptors, or malformed_version / duplicate_version /
     *         migrations_directory_error
     */
    [[nodiscard]] auto list_all() const -> Result<std::vector<migration_descriptor>>;

    /**
     * @brief Highest discovered version plus one (1 for an empty catalog)
     */
    [[nodiscard]] auto next_version() const -> Result<std::int64_t>;

    /**
     * @brief Parse the version from a script file name
     *
     * Accepts "<digits>_<name>.sql" and, more loosely, any identifier that
     * starts with digits. The version must be positive and fit in 64 bits.
     *
     * @param identifier File name or other identifier
     * @return The version, or malformed_version
     */
    [[nodiscard]] static auto parse_version(std::string_view identifier)
        -> Result<std::int64_t>;

    /**
     * @brief Read a script's exact bytes
     *
     * The file is read in binary mode so the checksum covers every byte,
     * including line endings.
     */
    [[nodiscard]] static auto read_script(const std::filesystem::path& path)
        -> Result<std::string>;

    /**
     * @brief Location of the forward script with the given file name
     */
    [[nodiscard]] auto script_path_for(std::string_view file_name) const
        -> std::filesystem::path;

    /**
     * @brief Location of the rollback script paired with a forward script
     *
     * "002_add_users.sql" maps to "<rollback dir>/002_add_users.rollback.sql".
     * The file is not required to exist.
     */
    [[nodiscard]] auto rollback_path_for(std::string_view file_name) const
        -> std::filesystem::path;

    [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& {
        return directory_;
    }

    [[nodiscard]] auto rollback_directory() const -> std::filesystem::path;

private:
    std::filesystem::path directory_;
    std::string rollback_subdirectory_;
};

}  // namespace migrator::catalog
