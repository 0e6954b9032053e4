#pragma once
#ifndef BACKUPFORGE_MEMORY_STORAGE_HPP
#define BACKUPFORGE_MEMORY_STORAGE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace backupforge {

enum class StorageOperation { Put, Get, Exists, Remove, List };

/**
 * @brief Volatile object store keyed by string.
 *
 * Used by tests and dry runs. A fault hook can be installed to make any
 * operation throw, which is how retry and rollback paths are exercised.
 */
class MemoryStorage {
public:
  /// Called before every operation; may throw StorageError.
  using FaultHook =
      std::function<void(StorageOperation op, const std::string &key)>;

  void put(const std::string &key, std::span<const std::byte> data);

  /** @throw StorageError (NotFound) if @p key is absent. */
  std::vector<std::byte> get(const std::string &key) const;

  bool exists(const std::string &key) const;
  /** @return false if @p key was absent. */
  bool remove(const std::string &key);
  std::vector<std::string> list() const;
  /** @throw StorageError (NotFound) if @p key is absent. */
  uint64_t size(const std::string &key) const;

  void setFaultHook(FaultHook hook);

  /** Successful put() calls since construction or resetCounters(). */
  size_t putCount() const { return putCount_.load(); }
  size_t getCount() const { return getCount_.load(); }
  void resetCounters();

  /** Overwrite a stored object in place. Test helper for corruption cases. */
  void replace(const std::string &key, std::vector<std::byte> data);

  size_t objectCount() const;
  uint64_t totalBytes() const;

private:
  void checkFault(StorageOperation op, const std::string &key) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::byte>> objects_;
  FaultHook faultHook_;
  std::atomic<size_t> putCount_{0};
  mutable std::atomic<size_t> getCount_{0};
};

} // namespace backupforge

#endif // BACKUPFORGE_MEMORY_STORAGE_HPP
