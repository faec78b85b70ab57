/**
 * @file migration_catalog.cpp
 * @brief Implementation of migration script discovery
 */

#include <migrator/catalog/migration_catalog.hpp>

#include <migrator/compat/format.hpp>
#include <migrator/integration/logger_adapter.hpp>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>

namespace migrator::catalog {

namespace {

constexpr const char* module_name = "catalog";
constexpr std::string_view script_suffix = ".sql";
constexpr std::string_view rollback_suffix = ".rollback.sql";

auto ends_with(std::string_view text, std::string_view suffix) -> bool {
    return text.size() >= suffix.size() &&
           text.substr(text.size() - suffix.size()) == suffix;
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

}  // namespace

migration_catalog::migration_catalog(std::filesystem::path directory,
                                     std::string rollback_subdirectory)
    : directory_(std::move(directory)),
      rollback_subdirectory_(std::move(rollback_subdirectory)) {}

// ============================================================================
// Naming
// ============================================================================

auto migration_catalog::parse_version(std::string_view identifier)
    -> Result<std::int64_t> {
    std::size_t digits = 0;
    while (digits < identifier.size() && is_digit(identifier[digits])) {
        ++digits;
    }

    if (digits == 0) {
        return make_error<std::int64_t>(
            error_codes::malformed_version,
            compat::format("Invalid migration filename: {} (no leading version number)",
                           identifier),
            module_name);
    }

    std::int64_t version = 0;
    const auto* first = identifier.data();
    auto [ptr, ec] = std::from_chars(first, first + digits, version);
    if (ec != std::errc{} || ptr != first + digits) {
        return make_error<std::int64_t>(
            error_codes::malformed_version,
            compat::format("Invalid migration filename: {} (version out of range)",
                           identifier),
            module_name);
    }

    if (version <= 0) {
        return make_error<std::int64_t>(
            error_codes::malformed_version,
            compat::format("Invalid migration filename: {} (version must be positive)",
                           identifier),
            module_name);
    }

    return version;
}

auto migration_catalog::script_path_for(std::string_view file_name) const
    -> std::filesystem::path {
    return directory_ / std::string(file_name);
}

auto migration_catalog::rollback_directory() const -> std::filesystem::path {
    return directory_ / rollback_subdirectory_;
}

auto migration_catalog::rollback_path_for(std::string_view file_name) const
    -> std::filesystem::path {
    std::string stem(file_name);
    if (ends_with(stem, script_suffix)) {
        stem.resize(stem.size() - script_suffix.size());
    }
    return rollback_directory() / (stem + std::string(rollback_suffix));
}

// ============================================================================
// Discovery
// ============================================================================

auto migration_catalog::list_all() const
    -> Result<std::vector<migration_descriptor>> {
    std::vector<migration_descriptor> descriptors;
    std::error_code ec;

    if (!std::filesystem::exists(directory_, ec)) {
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            return make_error<std::vector<migration_descriptor>>(
                error_codes::migrations_directory_error,
                compat::format("Failed to create migrations directory {}: {}",
                               directory_.string(), ec.message()),
                module_name);
        }
        integration::logger_adapter::info("Created migrations directory {}",
                                          directory_.string());
        return descriptors;
    }

    if (!std::filesystem::is_directory(directory_, ec)) {
        return make_error<std::vector<migration_descriptor>>(
            error_codes::migrations_directory_error,
            compat::format("Migrations path {} is not a directory",
                           directory_.string()),
            module_name);
    }

    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        return make_error<std::vector<migration_descriptor>>(
            error_codes::migrations_directory_error,
            compat::format("Failed to read migrations directory {}: {}",
                           directory_.string(), ec.message()),
            module_name);
    }

    try {
        for (const auto& entry : it) {
            // The rollback subdirectory and any other directory are skipped here
            if (!entry.is_regular_file(ec)) {
                continue;
            }

            const auto file_name = entry.path().filename().string();
            if (!ends_with(file_name, script_suffix) ||
                ends_with(file_name, rollback_suffix)) {
                continue;
            }

            auto version = parse_version(file_name);
            if (version.is_err()) {
                return make_error<std::vector<migration_descriptor>>(
                    version.error().code, version.error().message, module_name);
            }

            const auto stem = std::string_view(file_name).substr(
                0, file_name.size() - script_suffix.size());
            const auto separator = stem.find('_');
            if (separator == std::string_view::npos || separator + 1 >= stem.size() ||
                !std::all_of(stem.begin(), stem.begin() + separator, is_digit)) {
                return make_error<std::vector<migration_descriptor>>(
                    error_codes::malformed_version,
                    compat::format("Invalid migration filename: {} "
                                   "(expected <version>_<name>.sql)",
                                   file_name),
                    module_name);
            }

            migration_descriptor descriptor;
            descriptor.version = version.value();
            descriptor.name = std::string(stem.substr(separator + 1));
            descriptor.file_name = file_name;
            descriptor.script_path = entry.path();

            auto rollback = rollback_path_for(file_name);
            if (std::filesystem::is_regular_file(rollback, ec)) {
                descriptor.rollback_path = std::move(rollback);
            }

            descriptors.push_back(std::move(descriptor));
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        return make_error<std::vector<migration_descriptor>>(
            error_codes::migrations_directory_error,
            compat::format("Failed to read migrations directory {}: {}",
                           directory_.string(), ex.what()),
            module_name);
    }

    std::sort(descriptors.begin(), descriptors.end(),
              [](const migration_descriptor& a, const migration_descriptor& b) {
                  return a.version < b.version;
              });

    auto duplicate = std::adjacent_find(
        descriptors.begin(), descriptors.end(),
        [](const migration_descriptor& a, const migration_descriptor& b) {
            return a.version == b.version;
        });
    if (duplicate != descriptors.end()) {
        return make_error<std::vector<migration_descriptor>>(
            error_codes::duplicate_version,
            compat::format("Duplicate migration version {}: {} and {}",
                           duplicate->version, duplicate->file_name,
                           std::next(duplicate)->file_name),
            module_name);
    }

    return descriptors;
}

auto migration_catalog::next_version() const -> Result<std::int64_t> {
    auto all = list_all();
    if (all.is_err()) {
        return make_error<std::int64_t>(all.error().code, all.error().message,
                                        module_name);
    }

    const auto& descriptors = all.value();
    if (descriptors.empty()) {
        return std::int64_t{1};
    }

    const auto last = descriptors.back().version;
    if (last == std::numeric_limits<std::int64_t>::max()) {
        return make_error<std::int64_t>(
            error_codes::invalid_argument,
            compat::format("No version left after {}", descriptors.back().file_name),
            module_name);
    }
    return last + 1;
}

// ============================================================================
// Script Access
// ============================================================================

auto migration_catalog::read_script(const std::filesystem::path& path)
    -> Result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error<std::string>(
            error_codes::file_read_error,
            compat::format("Failed to open script {}", path.string()),
            module_name);
    }

    std::string content{std::istreambuf_iterator<char>(file),
                        std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return make_error<std::string>(
            error_codes::file_read_error,
            compat::format("Failed to read script {}", path.string()),
            module_name);
    }

    return content;
}

}  // namespace migrator::catalog
