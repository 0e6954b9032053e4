#include "core/backup_engine.hpp"
#include "core/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace backupforge {

namespace {

EngineConfig validated(EngineConfig config, const SessionKey *key) {
  config.validate();
  if (config.encryptionEnabled && !key) {
    throw ConfigurationError(
        "encryption is enabled but no session key was provided (set "
        "BACKUPFORGE_PASSPHRASE or BACKUPFORGE_MASTER_KEY)");
  }
  return config;
}

int64_t nowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

FileFailure toFailure(const std::string &path, const BackupError &e) {
  FileFailure failure;
  failure.path = path;
  failure.kind = e.kind();
  failure.message = e.detail();
  failure.chunkId = e.context().chunkId;
  failure.offset = e.context().offset;
  return failure;
}

} // namespace

BackupEngine::BackupEngine(EngineConfig config, Storage &storage,
                           DedupIndex &index, const SessionKey *key)
    : config_(validated(std::move(config), key)), storage_(storage),
      index_(index), chunker_(config_.chunking),
      codec_(Compressor(config_.compression, config_.compressionLevel),
             config_.cipher, config_.encryptionEnabled ? key : nullptr) {
  pool_ = std::make_unique<WorkerPool>(
      config_.workers, config_.maxInFlight - config_.workers + 1);
}

BackupEngine::~BackupEngine() { pool_->shutdown(); }

Snapshot BackupEngine::backup(const std::vector<SourceEntry> &entries,
                              const BackupOptions &options) {
  std::shared_lock<std::shared_mutex> guard(maintenanceMutex_);
  const auto started = std::chrono::steady_clock::now();

  Snapshot snapshot;
  snapshot.id = generateSnapshotId();
  snapshot.createdAtNs = nowNs();
  snapshot.source = options.source;
  snapshot.description = options.description;
  snapshot.tags = options.tags;
  snapshot.parentId = options.parentId;

  Logger::getInstance().log(LogLevel::INFO, "Snapshot started",
                            {{"snapshot", snapshot.id},
                             {"source", options.source},
                             {"files", std::to_string(entries.size())}});

  std::vector<std::optional<FileResult>> results(entries.size());
  std::vector<std::optional<FileFailure>> failures(entries.size());
  std::atomic<size_t> next{0};
  std::mutex fatalMutex;
  std::exception_ptr fatal;

  auto fileWorker = [&]() {
    for (;;) {
      const size_t i = next.fetch_add(1);
      if (i >= entries.size()) {
        return;
      }
      {
        std::lock_guard<std::mutex> lock(fatalMutex);
        if (fatal) {
          return;
        }
      }
      const std::string &path = entries[i].relativePath;
      try {
        results[i] = backupOne(entries[i]);
      } catch (const IndexConsistencyError &e) {
        Logger::getInstance().log(LogLevel::FATAL, e.what(), {{"path", path}});
        std::lock_guard<std::mutex> lock(fatalMutex);
        if (!fatal) {
          fatal = std::current_exception();
        }
        return;
      } catch (const BackupError &e) {
        failures[i] = toFailure(path, e);
        Logger::getInstance().log(e.kind() == ErrorKind::Cancelled
                                      ? LogLevel::WARN
                                      : LogLevel::ERROR,
                                  "File not backed up: " + e.detail(),
                                  {{"path", path},
                                   {"chunk", e.context().chunkId},
                                   {"kind", errorKindToString(e.kind())}});
      } catch (const std::exception &e) {
        FileFailure failure;
        failure.path = path;
        failure.kind = ErrorKind::Io;
        failure.message = e.what();
        failures[i] = std::move(failure);
        Logger::getInstance().log(LogLevel::ERROR,
                                  std::string("File not backed up: ") +
                                      e.what(),
                                  {{"path", path}});
      }
    }
  };

  const size_t threads =
      std::min(config_.fileParallelism, std::max<size_t>(entries.size(), 1));
  std::vector<std::thread> fileThreads;
  fileThreads.reserve(threads);
  for (size_t t = 0; t < threads; ++t) {
    fileThreads.emplace_back(fileWorker);
  }
  for (auto &t : fileThreads) {
    t.join();
  }
  cancelled_ = false;
  if (fatal) {
    std::rethrow_exception(fatal);
  }

  for (size_t i = 0; i < entries.size(); ++i) {
    if (results[i]) {
      FileResult &r = *results[i];
      snapshot.logicalBytes += r.metadata.size;
      snapshot.storedBytes += r.storedBytes;
      snapshot.referencedStoredBytes += r.referencedStoredBytes;
      snapshot.newChunks += r.newChunks;
      snapshot.reusedChunks += r.reusedChunks;
      snapshot.files.push_back(std::move(r.metadata));
    } else if (failures[i]) {
      if (failures[i]->kind == ErrorKind::Cancelled) {
        snapshot.complete = false;
      }
      snapshot.failures.push_back(std::move(*failures[i]));
    }
  }
  snapshot.fileCount = snapshot.files.size();
  snapshot.durationSeconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - started)
          .count();

  auto &registry = MetricsRegistry::instance();
  registry.incrementCounter(metrics::LOGICAL_BYTES,
                           static_cast<double>(snapshot.logicalBytes));
  registry.incrementCounter(metrics::STORED_BYTES,
                           static_cast<double>(snapshot.storedBytes));
  if (!snapshot.failures.empty()) {
    registry.incrementCounter(metrics::FILE_FAILURES,
                             static_cast<double>(snapshot.failures.size()));
  }
  registry.observe(metrics::SNAPSHOT_SECONDS, snapshot.durationSeconds);
  registry.setGauge(metrics::INDEX_ENTRIES, static_cast<double>(index_.size()));

  Logger::getInstance().log(
      snapshot.failures.empty() ? LogLevel::INFO : LogLevel::WARN,
      snapshot.complete ? "Snapshot finished" : "Snapshot cancelled",
      {{"snapshot", snapshot.id},
       {"files", std::to_string(snapshot.fileCount)},
       {"failures", std::to_string(snapshot.failures.size())},
       {"new_chunks", std::to_string(snapshot.newChunks)},
       {"reused_chunks", std::to_string(snapshot.reusedChunks)},
       {"logical_bytes", std::to_string(snapshot.logicalBytes)},
       {"stored_bytes", std::to_string(snapshot.storedBytes)}});
  return snapshot;
}

FileMetadata BackupEngine::backupFile(const SourceEntry &entry) {
  std::shared_lock<std::shared_mutex> guard(maintenanceMutex_);
  return backupOne(entry).metadata;
}

BackupEngine::FileResult BackupEngine::backupOne(const SourceEntry &entry) {
  const std::string path = entry.relativePath;
  const ErrorContext fileCtx{path, "", std::nullopt};
  if (!entry.open) {
    throw IoError("source entry has no reader", fileCtx);
  }
  if (cancelled_) {
    throw OperationCancelled("backup cancelled before file started", fileCtx);
  }
  std::unique_ptr<std::istream> in = entry.open();
  if (!in || !*in) {
    throw IoError("cannot open source file", fileCtx);
  }

  FileResult result;
  result.metadata.path = path;
  result.metadata.mode = entry.attributes.mode;
  result.metadata.mtimeNs = entry.attributes.mtimeNs;
  result.metadata.atimeNs = entry.attributes.atimeNs;

  ChunkStream chunks = chunker_.stream(*in);
  std::vector<std::future<ChunkOutcome>> pending;
  auto fileFailed = std::make_shared<std::atomic<bool>>(false);
  std::exception_ptr firstError;
  try {
    while (!fileFailed->load()) {
      if (cancelled_) {
        throw OperationCancelled(
            "backup cancelled",
            ErrorContext{path, "", std::optional<uint64_t>(chunks.bytesRead())});
      }
      std::optional<RawChunk> chunk = chunks.next();
      if (!chunk) {
        break;
      }
      pending.push_back(pool_->submit(
          [this, fileFailed, path, c = std::move(*chunk)]() {
            try {
              return processChunk(c, path);
            } catch (const std::exception &) {
              fileFailed->store(true);
              throw;
            }
          }));
    }
  } catch (const IoError &e) {
    firstError = std::make_exception_ptr(
        IoError(e.detail(), mergeContext(e.context(), fileCtx)));
  } catch (const std::exception &) {
    firstError = std::current_exception();
  }

  // Every submitted task must finish before this frame goes away.
  std::vector<ChunkOutcome> outcomes;
  outcomes.reserve(pending.size());
  for (auto &f : pending) {
    try {
      outcomes.push_back(f.get());
    } catch (const std::exception &) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }
  if (firstError) {
    releaseOutcomes(outcomes);
    std::rethrow_exception(firstError);
  }

  FileMetadata &md = result.metadata;
  md.chunks.reserve(outcomes.size());
  md.chunkSizes.reserve(outcomes.size());
  md.storedSizes.reserve(outcomes.size());
  for (const auto &o : outcomes) {
    md.chunks.push_back(o.id);
    md.chunkSizes.push_back(o.plainSize);
    md.storedSizes.push_back(o.storedSize);
    md.size += o.plainSize;
    result.referencedStoredBytes += o.storedSize;
    if (o.isNew) {
      ++result.newChunks;
      result.storedBytes += o.storedSize;
    } else {
      ++result.reusedChunks;
    }
  }
  Logger::getInstance().log(LogLevel::DEBUG, "File backed up",
                            {{"path", path},
                             {"size", std::to_string(md.size)},
                             {"chunks", std::to_string(md.chunks.size())}});
  return result;
}

BackupEngine::ChunkOutcome BackupEngine::processChunk(const RawChunk &chunk,
                                                      const std::string &path) {
  ChunkOutcome outcome;
  outcome.id = ChunkId::compute(chunk.data, config_.hashAlgorithm);
  outcome.plainSize = chunk.data.size();
  const std::string key = outcome.id.toString();
  const ErrorContext ctx{path, key, std::optional<uint64_t>(chunk.offset)};
  auto &registry = MetricsRegistry::instance();

  uint64_t knownSize = 0;
  if (index_.checkAndRegister(outcome.id, &knownSize) ==
      CheckResult::Duplicate) {
    outcome.storedSize = knownSize;
    registry.incrementCounter(metrics::CHUNKS_TOTAL, 1,
                             {{"result", "duplicate"}});
    Logger::getInstance().log(LogLevel::TRACE, "Duplicate chunk",
                              {{"path", path}, {"chunk", key}});
    return outcome;
  }

  try {
    const std::vector<std::byte> record = codec_.seal(chunk.data);
    storeWithRetry(key, record, ctx);
    outcome.storedSize = record.size();
  } catch (const std::exception &) {
    index_.rollback(outcome.id);
    throw;
  }
  index_.commit(outcome.id, outcome.storedSize);
  outcome.isNew = true;
  registry.incrementCounter(metrics::CHUNKS_TOTAL, 1, {{"result", "new"}});
  Logger::getInstance().log(LogLevel::TRACE, "Stored new chunk",
                            {{"path", path},
                             {"chunk", key},
                             {"stored_size", std::to_string(outcome.storedSize)}});
  return outcome;
}

void BackupEngine::storeWithRetry(const std::string &key,
                                  const std::vector<std::byte> &record,
                                  const ErrorContext &ctx) {
  try {
    retryTransient(
        config_.storageRetry, [&] { storage_.put(key, record); },
        [&](unsigned attempt, const std::string &reason) {
          MetricsRegistry::instance().incrementCounter(
              metrics::STORAGE_RETRIES);
          Logger::getInstance().log(LogLevel::WARN,
                                    "Retrying chunk store after transient error",
                                    {{"path", ctx.path},
                                     {"chunk", key},
                                     {"attempt", std::to_string(attempt)},
                                     {"reason", reason}});
        });
  } catch (const StorageError &e) {
    throw StorageError(e.code(), e.detail(), mergeContext(ctx, e.context()));
  }
}

void BackupEngine::releaseOutcomes(const std::vector<ChunkOutcome> &outcomes) {
  for (const auto &o : outcomes) {
    index_.release(o.id);
  }
}

size_t BackupEngine::releaseSnapshot(const Snapshot &snapshot) {
  std::shared_lock<std::shared_mutex> guard(maintenanceMutex_);
  size_t orphaned = 0;
  for (const auto &file : snapshot.files) {
    for (const auto &id : file.chunks) {
      if (index_.release(id) == 0) {
        ++orphaned;
      }
    }
  }
  Logger::getInstance().log(LogLevel::INFO, "Snapshot released",
                            {{"snapshot", snapshot.id},
                             {"unreferenced_chunks", std::to_string(orphaned)}});
  return orphaned;
}

BackupEngine::RebuildReport
BackupEngine::rebuildIndex(const std::vector<Snapshot> &liveSnapshots) {
  std::unique_lock<std::shared_mutex> guard(maintenanceMutex_);
  RebuildReport report;

  std::vector<std::string> keys;
  retryTransient(config_.storageRetry, [&] { keys = storage_.list(); });

  std::vector<StoredChunk> stored;
  stored.reserve(keys.size());
  for (const auto &key : keys) {
    StoredChunk chunk;
    try {
      chunk.id = ChunkId::fromString(key);
    } catch (const std::runtime_error &) {
      report.foreignKeys.push_back(key);
      continue;
    }
    retryTransient(config_.storageRetry,
                   [&] { chunk.storedSize = storage_.size(key); });
    stored.push_back(chunk);
  }
  index_.rebuildFrom(stored);
  report.storedChunks = stored.size();

  std::set<std::string> missing;
  for (const auto &snapshot : liveSnapshots) {
    for (const auto &file : snapshot.files) {
      for (const auto &id : file.chunks) {
        if (!index_.isCommitted(id)) {
          missing.insert(id.toString());
          continue;
        }
        index_.addReference(id);
        ++report.references;
      }
    }
  }
  report.missingChunks.assign(missing.begin(), missing.end());

  for (const auto &key : report.foreignKeys) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Ignoring storage object that is not a chunk",
                              {{"key", key}});
  }
  for (const auto &key : report.missingChunks) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Snapshot references a chunk missing from storage",
                              {{"chunk", key}});
  }
  MetricsRegistry::instance().setGauge(metrics::INDEX_ENTRIES,
                                       static_cast<double>(index_.size()));
  Logger::getInstance().log(
      LogLevel::INFO, "Index rebuilt",
      {{"stored_chunks", std::to_string(report.storedChunks)},
       {"references", std::to_string(report.references)},
       {"snapshots", std::to_string(liveSnapshots.size())}});
  return report;
}

BackupEngine::PruneStats BackupEngine::prune(bool dryRun) {
  std::unique_lock<std::shared_mutex> guard(maintenanceMutex_);
  PruneStats stats{};
  stats.totalChunks = index_.stats().uniqueChunks;

  for (const auto &id : index_.unreferenced()) {
    const uint64_t bytes = index_.storedSize(id);
    stats.reclaimableChunks++;
    stats.reclaimableBytes += bytes;
    if (dryRun) {
      continue;
    }
    const std::string key = id.toString();
    // Storage first: if the delete fails the index still lists the chunk
    // and a later prune tries again.
    retryTransient(config_.storageRetry, [&] { storage_.remove(key); });
    index_.erase(id);
    stats.freedChunks++;
    stats.freedBytes += bytes;
    Logger::getInstance().log(LogLevel::TRACE, "Pruned chunk", {{"chunk", key}});
  }
  Logger::getInstance().log(
      LogLevel::INFO, dryRun ? "Prune dry run" : "Prune finished",
      {{"total_chunks", std::to_string(stats.totalChunks)},
       {"reclaimable_chunks", std::to_string(stats.reclaimableChunks)},
       {"reclaimable_bytes", std::to_string(stats.reclaimableBytes)},
       {"freed_chunks", std::to_string(stats.freedChunks)}});
  return stats;
}

} // namespace backupforge
