#pragma once
#ifndef BACKUPFORGE_REPOSITORY_HPP
#define BACKUPFORGE_REPOSITORY_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "core/snapshot.hpp"
#include "utilities/digest.hpp"
#include "utilities/key_manager.hpp"

namespace backupforge {

inline constexpr int REPOSITORY_FORMAT_VERSION = 1;

/**
 * @brief Contents of repository.yaml.
 *
 * The salt is generated once at init and must never change, otherwise the
 * passphrase no longer derives the key existing chunks were sealed with.
 */
struct RepositoryInfo {
  int formatVersion = REPOSITORY_FORMAT_VERSION;
  KeySalt salt{};
  bool encrypted = false;
  utils::HashAlgorithm hashAlgorithm = utils::HashAlgorithm::BLAKE3;
  int64_t createdAtNs = 0;
};

/**
 * @brief Create the repository directories and write a fresh
 *        repository.yaml with a random salt.
 * @throw ConfigurationError If @p infoPath already exists.
 * @throw IoError If a directory or the file cannot be written.
 */
RepositoryInfo initRepository(const std::string &root, bool encrypted,
                              utils::HashAlgorithm hashAlgorithm);

/**
 * @throw ConfigurationError If the file is missing, malformed or of a newer
 *        format.
 */
RepositoryInfo loadRepositoryInfo(const std::string &infoPath);

/**
 * @brief Persisted snapshots, one YAML file per snapshot id.
 *
 * Writes are atomic (temporary file plus rename).
 */
class SnapshotCatalog {
public:
  /** Creates @p dir if needed. @throw IoError */
  explicit SnapshotCatalog(std::filesystem::path dir);

  /** @throw IoError */
  void save(const Snapshot &snapshot);

  /**
   * @throw StorageError (NotFound) for an unknown id.
   * @throw CorruptionError If the file does not parse.
   */
  Snapshot load(const std::string &id) const;

  /** Ids in creation order. */
  std::vector<std::string> ids() const;
  /** Every snapshot, oldest first. */
  std::vector<Snapshot> loadAll() const;

  /** @return false if @p id was not in the catalog. */
  bool remove(const std::string &id);

private:
  std::filesystem::path pathFor(const std::string &id) const;

  std::filesystem::path dir_;
};

} // namespace backupforge

#endif // BACKUPFORGE_REPOSITORY_HPP
