/**
 * @file checksum.hpp
 * @brief SHA-256 digests of migration scripts
 */

#pragma once

#include <migrator/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace migrator::integrity {

/// Length of a hex-encoded SHA-256 digest
inline constexpr std::size_t checksum_length = 64;

/**
 * @brief Compute the lowercase hex SHA-256 digest of a byte sequence
 *
 * @param content Exact script bytes
 * @return 64-character hex digest, or checksum_error if OpenSSL fails
 */
[[nodiscard]] auto sha256_hex(std::string_view content) -> Result<std::string>;

/**
 * @brief Read a file in binary mode and compute its digest
 *
 * @return Digest, file_read_error, or checksum_error
 */
[[nodiscard]] auto file_checksum(const std::filesystem::path& path)
    -> Result<std::string>;

}  // namespace migrator::integrity
