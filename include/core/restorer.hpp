#pragma once
#ifndef BACKUPFORGE_RESTORER_HPP
#define BACKUPFORGE_RESTORER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "core/chunk_record.hpp"
#include "core/engine_config.hpp"
#include "core/snapshot.hpp"
#include "core/worker_pool.hpp"
#include "storage/storage.hpp"

namespace backupforge {

struct RestoreOptions {
  /// Snapshot paths to restore. Empty selects every file.
  std::vector<std::string> paths;
  /// Reapply permission bits and timestamps after writing.
  bool applyMetadata = true;
};

struct RestoreReport {
  std::vector<std::string> restored;
  std::vector<FileFailure> failures;
  uint64_t bytesWritten = 0;

  bool ok() const { return failures.empty(); }
};

/**
 * @brief Reads a Snapshot back out of Storage.
 *
 * Each chunk is fetched, opened with ChunkRecordCodec and checked against
 * its id before a single byte reaches the target. A file with a missing or
 * corrupt chunk is reported in RestoreReport::failures and the remaining
 * files are still restored. Files are written to "<name>.partial" and
 * renamed into place once complete.
 */
class Restorer {
public:
  /**
   * @param key Session key for encrypted records; must outlive the restorer.
   * @throw ConfigurationError If @p config is invalid.
   */
  Restorer(EngineConfig config, Storage &storage,
           const SessionKey *key = nullptr);
  ~Restorer();

  Restorer(const Restorer &) = delete;
  Restorer &operator=(const Restorer &) = delete;

  /**
   * @brief Restore the selected files of @p snapshot under @p targetDir.
   * @throw IoError If @p targetDir cannot be created.
   */
  RestoreReport restore(const Snapshot &snapshot,
                        const std::filesystem::path &targetDir,
                        const RestoreOptions &options = {});

  /**
   * @brief Write the plaintext of @p file to @p out.
   * @return Bytes written.
   * @throw StorageError, CorruptionError, IoError
   */
  uint64_t restoreFile(const FileMetadata &file, std::ostream &out);

  /**
   * @brief Fetch, open and verify one chunk.
   * @throw StorageError (NotFound for a missing chunk) or CorruptionError,
   *        both naming @p path and the chunk id.
   */
  std::vector<std::byte> fetchChunk(const ChunkId &id, const std::string &path,
                                    std::optional<uint64_t> offset = {}) const;

private:
  void restoreOne(const FileMetadata &file,
                  const std::filesystem::path &targetDir, bool applyMetadata);

  EngineConfig config_;
  Storage &storage_;
  ChunkRecordCodec codec_;
  std::unique_ptr<WorkerPool> pool_;
};

/**
 * @brief Resolve a snapshot path under @p root.
 * @throw IoError If @p relative is absolute or climbs out with "..".
 */
std::filesystem::path safeJoin(const std::filesystem::path &root,
                               const std::string &relative);

} // namespace backupforge

#endif // BACKUPFORGE_RESTORER_HPP
