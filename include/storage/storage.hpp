#pragma once
#ifndef BACKUPFORGE_STORAGE_HPP
#define BACKUPFORGE_STORAGE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "storage/local_storage.hpp"
#include "storage/memory_storage.hpp"

namespace backupforge {

/**
 * @brief The storage capability consumed by the engine.
 *
 * A closed set of backends behind one interface. Every operation may throw
 * StorageError; get() reports a missing object with Code::NotFound.
 */
class Storage {
public:
  template <typename Backend, typename... Args>
  explicit Storage(std::in_place_type_t<Backend> tag, Args &&...args)
      : backend_(tag, std::forward<Args>(args)...) {}

  Storage(const Storage &) = delete;
  Storage &operator=(const Storage &) = delete;

  void put(const std::string &key, std::span<const std::byte> data) {
    std::visit([&](auto &b) { b.put(key, data); }, backend_);
  }
  std::vector<std::byte> get(const std::string &key) const {
    return std::visit([&](const auto &b) { return b.get(key); }, backend_);
  }
  bool exists(const std::string &key) const {
    return std::visit([&](const auto &b) { return b.exists(key); }, backend_);
  }
  bool remove(const std::string &key) {
    return std::visit([&](auto &b) { return b.remove(key); }, backend_);
  }
  std::vector<std::string> list() const {
    return std::visit([](const auto &b) { return b.list(); }, backend_);
  }
  uint64_t size(const std::string &key) const {
    return std::visit([&](const auto &b) { return b.size(key); }, backend_);
  }

  /** "memory" or "local". */
  std::string kind() const;

  /** The concrete backend, or nullptr if another one is active. */
  template <typename Backend> Backend *as() {
    return std::get_if<Backend>(&backend_);
  }

private:
  std::variant<MemoryStorage, LocalStorage> backend_;
};

/**
 * @brief Bounded exponential backoff for transient storage failures.
 */
struct StorageRetryPolicy {
  unsigned maxAttempts = 5;
  std::chrono::milliseconds baseBackoff{50};
  std::chrono::milliseconds maxBackoff{2000};

  /** Delay before attempt @p attempt (1-based) is retried. */
  std::chrono::milliseconds backoffFor(unsigned attempt) const;
  /** @throw ConfigurationError on zero attempts or inverted bounds. */
  void validate() const;
};

/**
 * @brief Run @p op, retrying while it throws a transient StorageError.
 *
 * NotFound and permanent errors propagate at once; the last transient error
 * propagates once @p policy is exhausted. @p onRetry is told about every
 * retry before the backoff sleep.
 */
void retryTransient(
    const StorageRetryPolicy &policy, const std::function<void()> &op,
    const std::function<void(unsigned attempt, const std::string &reason)>
        &onRetry = {});

} // namespace backupforge

#endif // BACKUPFORGE_STORAGE_HPP
