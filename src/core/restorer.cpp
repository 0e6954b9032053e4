#include "core/restorer.hpp"
#include "core/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <cerrno>
#include <cstring>
#include <deque>
#include <exception>
#include <fcntl.h>
#include <fstream>
#include <future>
#include <set>
#include <sys/stat.h>
#include <system_error>
#include <utility>

namespace backupforge {

namespace fs = std::filesystem;

namespace {

EngineConfig validated(EngineConfig config) {
  config.validate();
  return config;
}

timespec toTimespec(int64_t ns) {
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
  ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
  if (ts.tv_nsec < 0) {
    ts.tv_sec -= 1;
    ts.tv_nsec += 1000000000L;
  }
  return ts;
}

void applyAttributes(const fs::path &target, const FileMetadata &file) {
  const ErrorContext ctx{file.path, "", std::nullopt};
  std::error_code ec;
  fs::permissions(target, static_cast<fs::perms>(file.mode & 07777),
                  fs::perm_options::replace, ec);
  if (ec) {
    throw IoError("cannot set permissions: " + ec.message(), ctx);
  }
  const timespec times[2] = {toTimespec(file.atimeNs),
                             toTimespec(file.mtimeNs)};
  if (::utimensat(AT_FDCWD, target.c_str(), times, 0) != 0) {
    throw IoError(std::string("cannot set timestamps: ") + std::strerror(errno),
                  ctx);
  }
}

} // namespace

fs::path safeJoin(const fs::path &root, const std::string &relative) {
  const fs::path rel(relative);
  if (relative.empty() || rel.is_absolute() || rel.has_root_name()) {
    throw IoError("refusing to restore to an absolute or empty path",
                  ErrorContext{relative, "", std::nullopt});
  }
  for (const auto &part : rel) {
    if (part == "..") {
      throw IoError("refusing to restore outside the target directory",
                    ErrorContext{relative, "", std::nullopt});
    }
  }
  return root / rel;
}

Restorer::Restorer(EngineConfig config, Storage &storage,
                   const SessionKey *key)
    : config_(validated(std::move(config))), storage_(storage),
      // open() takes the cipher from each record's flag, so the configured
      // one only matters for sealing.
      codec_(Compressor(config_.compression, config_.compressionLevel),
             CipherAlgorithm::ChaCha20Poly1305, key) {
  pool_ = std::make_unique<WorkerPool>(
      config_.workers, config_.maxInFlight - config_.workers + 1);
}

Restorer::~Restorer() { pool_->shutdown(); }

std::vector<std::byte> Restorer::fetchChunk(const ChunkId &id,
                                            const std::string &path,
                                            std::optional<uint64_t> offset) const {
  const std::string key = id.toString();
  const ErrorContext ctx{path, key, offset};

  std::vector<std::byte> record;
  try {
    retryTransient(
        config_.storageRetry, [&] { record = storage_.get(key); },
        [&](unsigned attempt, const std::string &reason) {
          MetricsRegistry::instance().incrementCounter(
              metrics::STORAGE_RETRIES);
          Logger::getInstance().log(LogLevel::WARN,
                                    "Retrying chunk fetch after transient error",
                                    {{"path", path},
                                     {"chunk", key},
                                     {"attempt", std::to_string(attempt)},
                                     {"reason", reason}});
        });
  } catch (const StorageError &e) {
    throw StorageError(e.code(),
                       e.isNotFound() ? "chunk missing from storage"
                                      : e.detail(),
                       mergeContext(ctx, e.context()));
  }

  std::vector<std::byte> plain;
  try {
    plain = codec_.open(record);
  } catch (const AuthenticationError &e) {
    throw AuthenticationError(e.detail(), mergeContext(ctx, e.context()));
  } catch (const CorruptionError &e) {
    throw CorruptionError(e.detail(), mergeContext(ctx, e.context()));
  }
  if (ChunkId::compute(plain, id.algorithm) != id) {
    throw CorruptionError("chunk content does not match its id", ctx);
  }
  return plain;
}

uint64_t Restorer::restoreFile(const FileMetadata &file, std::ostream &out) {
  const bool sized = file.chunkSizes.size() == file.chunks.size();
  std::deque<std::future<std::vector<std::byte>>> window;
  std::exception_ptr firstError;
  uint64_t written = 0;
  uint64_t offset = 0;
  size_t drained = 0;

  auto writeNext = [&]() {
    std::vector<std::byte> plain = window.front().get();
    window.pop_front();
    const size_t i = drained++;
    if (sized && plain.size() != file.chunkSizes[i]) {
      throw CorruptionError(
          "chunk size " + std::to_string(plain.size()) + " differs from " +
              std::to_string(file.chunkSizes[i]) + " recorded in the snapshot",
          ErrorContext{file.path, file.chunks[i].toString(),
                       std::optional<uint64_t>(written)});
    }
    out.write(reinterpret_cast<const char *>(plain.data()),
              static_cast<std::streamsize>(plain.size()));
    if (!out) {
      throw IoError("write failed",
                    ErrorContext{file.path, file.chunks[i].toString(),
                                 std::optional<uint64_t>(written)});
    }
    written += plain.size();
  };

  try {
    for (size_t i = 0; i < file.chunks.size(); ++i) {
      window.push_back(pool_->submit(
          [this, id = file.chunks[i], path = file.path, at = offset]() {
            return fetchChunk(id, path, at);
          }));
      if (sized) {
        offset += file.chunkSizes[i];
      }
      if (window.size() >= config_.maxInFlight) {
        writeNext();
      }
    }
    while (!window.empty()) {
      writeNext();
    }
  } catch (const std::exception &) {
    firstError = std::current_exception();
  }

  if (firstError) {
    // Outstanding fetches capture this object; wait for them.
    for (auto &f : window) {
      f.wait();
    }
    std::rethrow_exception(firstError);
  }
  if (written != file.size) {
    throw CorruptionError("restored " + std::to_string(written) +
                              " bytes, snapshot records " +
                              std::to_string(file.size),
                          ErrorContext{file.path, "", std::nullopt});
  }
  return written;
}

void Restorer::restoreOne(const FileMetadata &file, const fs::path &targetDir,
                          bool applyMetadata) {
  const fs::path target = safeJoin(targetDir, file.path);
  const ErrorContext ctx{file.path, "", std::nullopt};
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    throw IoError("cannot create directory: " + ec.message(), ctx);
  }

  fs::path partial = target;
  partial += ".partial";
  try {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IoError("cannot open restore target for writing", ctx);
    }
    restoreFile(file, out);
    out.close();
    if (!out) {
      throw IoError("cannot flush restore target", ctx);
    }
    fs::rename(partial, target, ec);
    if (ec) {
      throw IoError("cannot move restored file into place: " + ec.message(),
                    ctx);
    }
  } catch (const std::exception &) {
    std::error_code removeEc;
    fs::remove(partial, removeEc);
    throw;
  }
  if (applyMetadata) {
    applyAttributes(target, file);
  }
}

RestoreReport Restorer::restore(const Snapshot &snapshot,
                                const fs::path &targetDir,
                                const RestoreOptions &options) {
  std::error_code ec;
  fs::create_directories(targetDir, ec);
  if (ec) {
    throw IoError("cannot create restore directory: " + ec.message(),
                  ErrorContext{targetDir.string(), "", std::nullopt});
  }

  const std::set<std::string> selected(options.paths.begin(),
                                       options.paths.end());
  RestoreReport report;
  Logger::getInstance().log(LogLevel::INFO, "Restore started",
                            {{"snapshot", snapshot.id},
                             {"target", targetDir.string()}});

  std::set<std::string> seen;
  for (const auto &file : snapshot.files) {
    if (!selected.empty() && !selected.count(file.path)) {
      continue;
    }
    seen.insert(file.path);
    try {
      restoreOne(file, targetDir, options.applyMetadata);
      report.restored.push_back(file.path);
      report.bytesWritten += file.size;
      Logger::getInstance().log(LogLevel::DEBUG, "File restored",
                                {{"path", file.path},
                                 {"size", std::to_string(file.size)}});
    } catch (const BackupError &e) {
      FileFailure failure;
      failure.path = file.path;
      failure.kind = e.kind();
      failure.message = e.detail();
      failure.chunkId = e.context().chunkId;
      failure.offset = e.context().offset;
      report.failures.push_back(std::move(failure));
      MetricsRegistry::instance().incrementCounter(metrics::RESTORE_FAILURES);
      Logger::getInstance().log(LogLevel::ERROR,
                                "File not restored: " + e.detail(),
                                {{"path", file.path},
                                 {"chunk", e.context().chunkId},
                                 {"kind", errorKindToString(e.kind())}});
    } catch (const std::exception &e) {
      FileFailure failure;
      failure.path = file.path;
      failure.kind = ErrorKind::Io;
      failure.message = e.what();
      report.failures.push_back(std::move(failure));
      MetricsRegistry::instance().incrementCounter(metrics::RESTORE_FAILURES);
      Logger::getInstance().log(LogLevel::ERROR,
                                std::string("File not restored: ") + e.what(),
                                {{"path", file.path}});
    }
  }

  for (const auto &path : selected) {
    if (!seen.count(path)) {
      FileFailure failure;
      failure.path = path;
      failure.kind = ErrorKind::Io;
      failure.message = "path is not in the snapshot";
      report.failures.push_back(std::move(failure));
      Logger::getInstance().log(LogLevel::WARN,
                                "Requested path is not in the snapshot",
                                {{"path", path}, {"snapshot", snapshot.id}});
    }
  }

  Logger::getInstance().log(
      report.ok() ? LogLevel::INFO : LogLevel::WARN, "Restore finished",
      {{"snapshot", snapshot.id},
       {"restored", std::to_string(report.restored.size())},
       {"failures", std::to_string(report.failures.size())},
       {"bytes", std::to_string(report.bytesWritten)}});
  return report;
}

} // namespace backupforge
