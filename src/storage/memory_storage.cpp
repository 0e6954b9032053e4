#include "storage/memory_storage.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <utility>

namespace backupforge {

void MemoryStorage::checkFault(StorageOperation op,
                               const std::string &key) const {
  FaultHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hook = faultHook_;
  }
  if (hook) {
    hook(op, key);
  }
}

void MemoryStorage::setFaultHook(FaultHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  faultHook_ = std::move(hook);
}

void MemoryStorage::put(const std::string &key,
                        std::span<const std::byte> data) {
  checkFault(StorageOperation::Put, key);
  std::lock_guard<std::mutex> lock(mutex_);
  objects_[key].assign(data.begin(), data.end());
  ++putCount_;
}

std::vector<std::byte> MemoryStorage::get(const std::string &key) const {
  checkFault(StorageOperation::Get, key);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(key);
  if (it == objects_.end()) {
    ErrorContext ctx;
    ctx.chunkId = key;
    throw StorageError(StorageError::Code::NotFound, "object not found", ctx);
  }
  ++getCount_;
  return it->second;
}

bool MemoryStorage::exists(const std::string &key) const {
  checkFault(StorageOperation::Exists, key);
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.count(key) > 0;
}

bool MemoryStorage::remove(const std::string &key) {
  checkFault(StorageOperation::Remove, key);
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.erase(key) > 0;
}

std::vector<std::string> MemoryStorage::list() const {
  checkFault(StorageOperation::List, "");
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(objects_.size());
  for (const auto &kv : objects_) {
    keys.push_back(kv.first);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

uint64_t MemoryStorage::size(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(key);
  if (it == objects_.end()) {
    ErrorContext ctx;
    ctx.chunkId = key;
    throw StorageError(StorageError::Code::NotFound, "object not found", ctx);
  }
  return it->second.size();
}

void MemoryStorage::resetCounters() {
  putCount_ = 0;
  getCount_ = 0;
}

void MemoryStorage::replace(const std::string &key,
                            std::vector<std::byte> data) {
  std::lock_guard<std::mutex> lock(mutex_);
  objects_[key] = std::move(data);
}

size_t MemoryStorage::objectCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.size();
}

uint64_t MemoryStorage::totalBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t total = 0;
  for (const auto &kv : objects_) {
    total += kv.second.size();
  }
  return total;
}

} // namespace backupforge
