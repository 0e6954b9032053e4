#include "core/dedup_index.hpp"
#include "core/errors.hpp"

namespace backupforge {

namespace {

ErrorContext chunkContext(const ChunkId &id) {
  ErrorContext ctx;
  ctx.chunkId = id.toString();
  return ctx;
}

} // namespace

CheckResult DedupIndex::checkAndRegister(const ChunkId &id,
                                         uint64_t *storedSize) {
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
      entries_.emplace(id, Entry{1, EntryState::Pending, 0});
      return CheckResult::New;
    }
    if (it->second.state == EntryState::Committed) {
      ++it->second.refCount;
      if (storedSize) {
        *storedSize = it->second.storedSize;
      }
      return CheckResult::Duplicate;
    }
    // Another caller is storing this chunk. Iterators do not survive the
    // wait, so look the entry up again afterwards.
    settled_.wait(lock);
  }
}

void DedupIndex::commit(const ChunkId &id, uint64_t storedSize) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.state != EntryState::Pending) {
      throw IndexConsistencyError("commit of a chunk that is not pending",
                                  chunkContext(id));
    }
    it->second.state = EntryState::Committed;
    it->second.storedSize = storedSize;
  }
  settled_.notify_all();
}

void DedupIndex::rollback(const ChunkId &id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.state != EntryState::Pending) {
      throw IndexConsistencyError("rollback of a chunk that is not pending",
                                  chunkContext(id));
    }
    entries_.erase(it);
  }
  settled_.notify_all();
}

uint64_t DedupIndex::release(const ChunkId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw IndexConsistencyError("release of an unknown chunk",
                                chunkContext(id));
  }
  if (it->second.state != EntryState::Committed) {
    throw IndexConsistencyError("release of a pending chunk", chunkContext(id));
  }
  if (it->second.refCount == 0) {
    throw IndexConsistencyError("release of a chunk with no references",
                                chunkContext(id));
  }
  return --it->second.refCount;
}

void DedupIndex::addReference(const ChunkId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end() || it->second.state != EntryState::Committed) {
    throw IndexConsistencyError("reference to a chunk missing from storage",
                                chunkContext(id));
  }
  ++it->second.refCount;
}

uint64_t DedupIndex::referenceCount(const ChunkId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  return it == entries_.end() ? 0 : it->second.refCount;
}

bool DedupIndex::contains(const ChunkId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) > 0;
}

bool DedupIndex::isCommitted(const ChunkId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  return it != entries_.end() && it->second.state == EntryState::Committed;
}

uint64_t DedupIndex::storedSize(const ChunkId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  return it == entries_.end() ? 0 : it->second.storedSize;
}

void DedupIndex::rebuildFrom(const std::vector<StoredChunk> &stored) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &kv : entries_) {
    if (kv.second.state == EntryState::Pending) {
      throw IndexConsistencyError("rebuild while a chunk store is in flight",
                                  chunkContext(kv.first));
    }
  }
  entries_.clear();
  entries_.reserve(stored.size());
  for (const auto &chunk : stored) {
    entries_[chunk.id] = Entry{0, EntryState::Committed, chunk.storedSize};
  }
}

std::vector<ChunkId> DedupIndex::unreferenced() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ChunkId> result;
  for (const auto &kv : entries_) {
    if (kv.second.state == EntryState::Committed && kv.second.refCount == 0) {
      result.push_back(kv.first);
    }
  }
  return result;
}

bool DedupIndex::erase(const ChunkId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end() || it->second.state != EntryState::Committed ||
      it->second.refCount != 0) {
    return false;
  }
  entries_.erase(it);
  return true;
}

size_t DedupIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

DedupIndex::Stats DedupIndex::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Stats stats{};
  for (const auto &kv : entries_) {
    if (kv.second.state == EntryState::Pending) {
      stats.pendingChunks++;
      continue;
    }
    stats.uniqueChunks++;
    stats.totalReferences += kv.second.refCount;
    if (kv.second.refCount == 0) {
      stats.unreferencedChunks++;
    }
  }
  return stats;
}

} // namespace backupforge
