#include "storage/storage.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <thread>

namespace backupforge {

std::string Storage::kind() const {
  return std::holds_alternative<MemoryStorage>(backend_) ? "memory" : "local";
}

std::chrono::milliseconds StorageRetryPolicy::backoffFor(unsigned attempt) const {
  auto delay = baseBackoff;
  for (unsigned i = 1; i < attempt && delay < maxBackoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, maxBackoff);
}

void StorageRetryPolicy::validate() const {
  if (maxAttempts == 0) {
    throw ConfigurationError("storage_retry.attempts must be at least 1");
  }
  if (baseBackoff.count() < 0 || maxBackoff < baseBackoff) {
    throw ConfigurationError(
        "storage_retry backoff bounds must satisfy 0 <= base <= max");
  }
}

void retryTransient(
    const StorageRetryPolicy &policy, const std::function<void()> &op,
    const std::function<void(unsigned, const std::string &)> &onRetry) {
  for (unsigned attempt = 1;; ++attempt) {
    try {
      op();
      return;
    } catch (const StorageError &e) {
      if (!e.isTransient() || attempt >= policy.maxAttempts) {
        throw;
      }
      if (onRetry) {
        onRetry(attempt, e.what());
      }
      std::this_thread::sleep_for(policy.backoffFor(attempt));
    }
  }
}

} // namespace backupforge
