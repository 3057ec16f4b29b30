#pragma once

#include "core/error.hpp"
#include <string>

namespace litesync::checksum {

/**
 * @brief Hex SHA-256 of a file's contents (OpenSSL EVP, streamed)
 */
[[nodiscard]] Result<std::string> sha256_file(const std::string& path);

/**
 * @brief Sidecar path holding an artifact's digest: "<artifact>.sha256"
 */
[[nodiscard]] std::string sidecar_path(const std::string& artifact_path);

/**
 * @brief Write "<hex>  <file name>\n" (sha256sum format)
 */
[[nodiscard]] Result<void> write_sidecar(const std::string& artifact_path, const std::string& hex);

/**
 * @brief Digest recorded in an artifact's sidecar
 */
[[nodiscard]] Result<std::string> read_sidecar(const std::string& artifact_path);

} // namespace litesync::checksum
