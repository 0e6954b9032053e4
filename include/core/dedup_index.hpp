#pragma once
#ifndef BACKUPFORGE_DEDUP_INDEX_HPP
#define BACKUPFORGE_DEDUP_INDEX_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "core/chunk_id.hpp"

namespace backupforge {

enum class CheckResult { New, Duplicate };

/** A chunk found in storage, with the size of its stored record. */
struct StoredChunk {
  ChunkId id;
  uint64_t storedSize{0};
};

/**
 * @brief Reference-counted set of chunk ids known to be in storage.
 *
 * checkAndRegister() makes the write/skip decision and takes a reference in
 * one step. A New entry stays pending until commit() or rollback(); other
 * callers asking about a pending id block until the outcome is known, then
 * either take a reference on the committed chunk or, after a rollback, one
 * of them is handed New in its place.
 *
 * Committed entries whose count falls to zero stay in the index until
 * erase() is called by a prune pass, so their stored record is still reused.
 *
 * The index is volatile. rebuildFrom() repopulates it from a storage listing.
 */
class DedupIndex {
public:
  struct Stats {
    size_t uniqueChunks{0};
    uint64_t totalReferences{0};
    size_t pendingChunks{0};
    size_t unreferencedChunks{0};
  };

  /**
   * @brief Decide whether @p id must be written, and take a reference.
   * @param storedSize Receives the record size on Duplicate. May be null.
   * @return New if the caller must store the chunk and then commit() or
   *         rollback(); Duplicate if the chunk is already stored.
   */
  CheckResult checkAndRegister(const ChunkId &id,
                               uint64_t *storedSize = nullptr);

  /** @throw IndexConsistencyError If @p id is not pending. */
  void commit(const ChunkId &id, uint64_t storedSize);

  /**
   * @brief Abandon a pending entry after a failed store.
   * @throw IndexConsistencyError If @p id is not pending.
   */
  void rollback(const ChunkId &id);

  /**
   * @brief Drop one reference.
   * @return References remaining.
   * @throw IndexConsistencyError If @p id is unknown, pending or already at
   *        zero.
   */
  uint64_t release(const ChunkId &id);

  /**
   * @brief Count one more reference on a committed chunk (catalog recount).
   * @throw IndexConsistencyError If @p id is not committed.
   */
  void addReference(const ChunkId &id);

  /** 0 for unknown ids. */
  uint64_t referenceCount(const ChunkId &id) const;
  bool contains(const ChunkId &id) const;
  bool isCommitted(const ChunkId &id) const;

  /** Record size given at commit, 0 for unknown ids. */
  uint64_t storedSize(const ChunkId &id) const;

  /**
   * @brief Replace the contents with @p stored, all committed at zero
   *        references.
   * @throw IndexConsistencyError If any entry is still pending.
   */
  void rebuildFrom(const std::vector<StoredChunk> &stored);

  /** Committed entries with no references left. */
  std::vector<ChunkId> unreferenced() const;

  /**
   * @brief Forget a committed, unreferenced chunk.
   * @return false if the entry is absent, pending or still referenced.
   */
  bool erase(const ChunkId &id);

  size_t size() const;
  Stats stats() const;

private:
  enum class EntryState { Pending, Committed };

  struct Entry {
    uint64_t refCount{0};
    EntryState state{EntryState::Pending};
    uint64_t storedSize{0};
  };

  mutable std::mutex mutex_;
  std::condition_variable settled_;
  std::unordered_map<ChunkId, Entry, ChunkIdHash> entries_;
};

} // namespace backupforge

#endif // BACKUPFORGE_DEDUP_INDEX_HPP
