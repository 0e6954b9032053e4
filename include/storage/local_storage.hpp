#pragma once
#ifndef BACKUPFORGE_LOCAL_STORAGE_HPP
#define BACKUPFORGE_LOCAL_STORAGE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace backupforge {

/**
 * @brief Object store on a local directory.
 *
 * Objects live at <root>/<fan-out>/<key>, where the fan-out directory is two
 * characters of the key taken past the fixed CID prefix. Writes go to a
 * temporary file in the same directory which is then renamed over the
 * target, so readers never observe a partial object.
 */
class LocalStorage {
public:
  /// Suffix of in-progress writes; list() skips these.
  static constexpr const char *TEMP_SUFFIX = ".partial";

  /** Creates @p root if needed. @throw StorageError (Permanent) on failure. */
  explicit LocalStorage(std::filesystem::path root);

  void put(const std::string &key, std::span<const std::byte> data);
  /** @throw StorageError (NotFound) if @p key is absent. */
  std::vector<std::byte> get(const std::string &key) const;
  bool exists(const std::string &key) const;
  bool remove(const std::string &key);
  std::vector<std::string> list() const;
  uint64_t size(const std::string &key) const;

  const std::filesystem::path &root() const { return root_; }
  /** Where @p key is (or would be) stored. */
  std::filesystem::path objectPath(const std::string &key) const;

private:
  std::filesystem::path root_;
  std::atomic<uint64_t> tempCounter_{0};
};

} // namespace backupforge

#endif // BACKUPFORGE_LOCAL_STORAGE_HPP
