#pragma once
#ifndef BACKUPFORGE_SNAPSHOT_HPP
#define BACKUPFORGE_SNAPSHOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/chunk_id.hpp"
#include "core/errors.hpp"

namespace backupforge {

/**
 * @brief One backed-up file.
 *
 * Concatenating the plaintext of chunks in order reproduces the file.
 * chunkSizes and storedSizes run parallel to chunks.
 */
struct FileMetadata {
  std::string path; ///< Relative to the snapshot source.
  uint64_t size = 0;
  uint32_t mode = 0644; ///< Permission bits only.
  int64_t mtimeNs = 0;  ///< Nanoseconds since the Unix epoch.
  int64_t atimeNs = 0;
  std::vector<ChunkId> chunks;
  std::vector<uint64_t> chunkSizes;
  std::vector<uint64_t> storedSizes;
};

/** A file the engine could not back up, and why. */
struct FileFailure {
  std::string path;
  ErrorKind kind = ErrorKind::Io;
  std::string message;
  std::string chunkId;
  std::optional<uint64_t> offset;
};

/**
 * @brief Result of one backup run. Immutable once returned by the engine.
 */
struct Snapshot {
  std::string id; ///< RFC 4122 version 4 UUID.
  int64_t createdAtNs = 0;
  std::string source;
  std::string description;
  std::vector<std::string> tags;
  std::optional<std::string> parentId;

  std::vector<FileMetadata> files;
  std::vector<FileFailure> failures;

  uint64_t fileCount = 0;
  uint64_t logicalBytes = 0;
  /// Record bytes this snapshot wrote (new chunks only).
  uint64_t storedBytes = 0;
  /// Record bytes of every chunk occurrence, new or reused.
  uint64_t referencedStoredBytes = 0;
  uint64_t newChunks = 0;
  uint64_t reusedChunks = 0;
  double durationSeconds = 0.0;
  /// False when the run was cancelled before every file finished.
  bool complete = true;

  /** referencedStoredBytes / logicalBytes, 1.0 for an empty snapshot. */
  double compressionRatio() const;
  /** Files whose path matches @p path exactly. */
  const FileMetadata *findFile(const std::string &path) const;
};

/** Random version 4 UUID string. */
std::string generateSnapshotId();

/** Serialize every field to a YAML document. */
std::string snapshotToYaml(const Snapshot &snapshot);

/**
 * @brief Parse snapshotToYaml() output.
 * @throw CorruptionError If the document is malformed.
 */
Snapshot snapshotFromYaml(const std::string &yaml);

} // namespace backupforge

#endif // BACKUPFORGE_SNAPSHOT_HPP
