#pragma once
#ifndef BACKUPFORGE_ENGINE_CONFIG_HPP
#define BACKUPFORGE_ENGINE_CONFIG_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "core/chunker.hpp"
#include "core/cipher.hpp"
#include "core/compressor.hpp"
#include "storage/storage.hpp"
#include "utilities/digest.hpp"
#include "utilities/key_manager.hpp"
#include "utilities/logger.h"

namespace backupforge {

/**
 * @brief Everything the engine and CLI read from backupforge.yaml.
 *
 * Example:
 * @code
 * chunking: {strategy: content-defined, min_size: 262144,
 *            avg_size: 1048576, max_size: 4194304}
 * compression: {algorithm: zstd, level: 3}
 * encryption:
 *   enabled: true
 *   cipher: ChaCha20-Poly1305
 *   kdf: {ops_limit: 2, mem_limit: 67108864}
 * hash_algorithm: blake3
 * workers: 4
 * max_in_flight: 16
 * storage_retry: {attempts: 5, base_backoff_ms: 50, max_backoff_ms: 2000}
 * log: {file: backupforge.log, level: info}
 * exclude: [.cache/, node_modules]
 * @endcode
 */
struct EngineConfig {
  ChunkerConfig chunking;
  CompressionAlgorithm compression = CompressionAlgorithm::Zstd;
  int compressionLevel = Compressor::DEFAULT_ZSTD_LEVEL;
  bool encryptionEnabled = false;
  CipherAlgorithm cipher = CipherAlgorithm::ChaCha20Poly1305;
  KdfParams kdf;
  utils::HashAlgorithm hashAlgorithm = utils::HashAlgorithm::BLAKE3;
  /// Chunk pipeline threads.
  size_t workers = 4;
  /// Chunks queued or in progress across all files.
  size_t maxInFlight = 16;
  /// Files processed concurrently.
  size_t fileParallelism = 2;
  StorageRetryPolicy storageRetry;
  std::string logFile;
  LogLevel logLevel = LogLevel::INFO;
  /// Substrings of source-relative paths left out of a directory backup.
  std::vector<std::string> excludes;

  /**
   * @brief Reject unusable settings before any I/O happens.
   * @throw ConfigurationError
   */
  void validate() const;
};

std::string hashAlgorithmToString(utils::HashAlgorithm algo);
/** @throw ConfigurationError on an unknown name. */
utils::HashAlgorithm hashAlgorithmFromString(const std::string &name);

/**
 * @brief Parse a YAML document. Absent keys keep their defaults.
 * @throw ConfigurationError On malformed YAML or values of the wrong type.
 */
EngineConfig engineConfigFromYaml(const std::string &yaml);

/**
 * @brief Apply BACKUPFORGE_COMPRESSION_LEVEL, BACKUPFORGE_CIPHER_ALGO and
 *        BACKUPFORGE_WORKERS.
 * @throw ConfigurationError If a variable does not parse.
 */
void applyEnvironmentOverrides(EngineConfig &config);

/**
 * @brief Load @p path (or $BACKUPFORGE_CONFIG, or backupforge.yaml), apply
 *        environment overrides and validate.
 *
 * A missing default file is not an error; a missing explicit one is.
 * @throw ConfigurationError
 */
EngineConfig loadEngineConfig(const std::string &path = "");

} // namespace backupforge

#endif // BACKUPFORGE_ENGINE_CONFIG_HPP
