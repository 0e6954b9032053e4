#include "core/backup_engine.hpp"
#include "core/dedup_index.hpp"
#include "core/engine_config.hpp"
#include "core/errors.hpp"
#include "core/repository.hpp"
#include "core/restorer.hpp"
#include "core/source.hpp"
#include "storage/storage.hpp"
#include "utilities/key_manager.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/self_test.hpp"
#include "utilities/var_dir.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace backupforge;

namespace {

std::atomic<BackupEngine *> g_runningEngine{nullptr};
static_assert(std::atomic<BackupEngine *>::is_always_lock_free);

extern "C" void onInterrupt(int) {
  if (BackupEngine *engine = g_runningEngine.load()) {
    engine->cancel();
  }
}

void usage(const char *prog) {
  std::cerr
      << "Usage: " << prog << " [--repo DIR] [--config FILE] <command>\n"
      << "  init [--encrypt] [--hash blake3|sha256]\n"
      << "  backup <source_dir> [--description TEXT] [--tag TAG]... "
         "[--parent ID] [--exclude PATTERN]...\n"
      << "  restore <snapshot_id> <target_dir> [--path PATH]... "
         "[--no-metadata]\n"
      << "  snapshots\n"
      << "  release <snapshot_id>\n"
      << "  prune [--dry-run]\n"
      << "  stats [--metrics]\n";
}

/// Everything a command needs once the repository is open.
struct Session {
  EngineConfig config;
  RepositoryInfo info;
  std::optional<SessionKey> key;
  std::optional<Storage> storage;
  std::optional<SnapshotCatalog> catalog;
  DedupIndex index;

  const SessionKey *keyPtr() const { return key ? &*key : nullptr; }
};

void openSession(Session &session) {
  session.info = loadRepositoryInfo(repositoryInfoPath());
  session.config.hashAlgorithm = session.info.hashAlgorithm;
  session.config.encryptionEnabled = session.info.encrypted;
  if (session.info.encrypted) {
    session.key =
        SessionKey::fromEnvironment(session.info.salt, session.config.kdf);
    if (!session.key) {
      throw ConfigurationError(
          "repository is encrypted: set BACKUPFORGE_PASSPHRASE or "
          "BACKUPFORGE_MASTER_KEY");
    }
  }
  session.storage.emplace(std::in_place_type<LocalStorage>, chunksDir());
  session.catalog.emplace(snapshotsDir());
}

void printSnapshotSummary(const Snapshot &s) {
  std::cout << "snapshot " << s.id << (s.complete ? "" : " (partial)") << "\n"
            << "  files:          " << s.fileCount << "\n"
            << "  failures:       " << s.failures.size() << "\n"
            << "  logical bytes:  " << s.logicalBytes << "\n"
            << "  stored bytes:   " << s.storedBytes << "\n"
            << "  new chunks:     " << s.newChunks << "\n"
            << "  reused chunks:  " << s.reusedChunks << "\n"
            << "  ratio:          " << std::fixed << std::setprecision(3)
            << s.compressionRatio() << "\n";
  for (const auto &f : s.failures) {
    std::cout << "  FAILED " << f.path << " [" << errorKindToString(f.kind)
              << "] " << f.message;
    if (!f.chunkId.empty()) {
      std::cout << " (chunk " << f.chunkId << ")";
    }
    std::cout << "\n";
  }
}

int cmdInit(const EngineConfig &config, const std::vector<std::string> &args) {
  bool encrypted = config.encryptionEnabled;
  utils::HashAlgorithm hash = config.hashAlgorithm;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--encrypt") {
      encrypted = true;
    } else if (args[i] == "--hash" && i + 1 < args.size()) {
      hash = hashAlgorithmFromString(args[++i]);
    } else {
      std::cerr << "Unknown init option: " << args[i] << std::endl;
      return 2;
    }
  }
  RepositoryInfo info = initRepository(getRepositoryRoot(), encrypted, hash);
  Logger::getInstance().log(LogLevel::INFO, "Repository initialised",
                            {{"root", getRepositoryRoot()},
                             {"encrypted", encrypted ? "true" : "false"},
                             {"hash", hashAlgorithmToString(hash)}});
  std::cout << "Initialised repository at " << getRepositoryRoot()
            << (info.encrypted ? " (encrypted)" : "") << std::endl;
  return 0;
}

int cmdBackup(Session &session, const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "backup: missing source directory" << std::endl;
    return 2;
  }
  BackupOptions options;
  options.source = std::filesystem::absolute(args[0]).string();
  std::vector<std::string> excludes = session.config.excludes;
  for (size_t i = 1; i < args.size(); ++i) {
    if (args[i] == "--description" && i + 1 < args.size()) {
      options.description = args[++i];
    } else if (args[i] == "--tag" && i + 1 < args.size()) {
      options.tags.push_back(args[++i]);
    } else if (args[i] == "--parent" && i + 1 < args.size()) {
      options.parentId = args[++i];
    } else if (args[i] == "--exclude" && i + 1 < args.size()) {
      excludes.push_back(args[++i]);
    } else {
      std::cerr << "Unknown backup option: " << args[i] << std::endl;
      return 2;
    }
  }

  BackupEngine engine(session.config, *session.storage, session.index,
                      session.keyPtr());
  engine.rebuildIndex(session.catalog->loadAll());
  std::vector<SourceEntry> entries = collectDirectory(args[0], excludes);

  g_runningEngine = &engine;
  std::signal(SIGINT, onInterrupt);
  Snapshot snapshot;
  try {
    snapshot = engine.backup(entries, options);
  } catch (const std::exception &) {
    std::signal(SIGINT, SIG_DFL);
    g_runningEngine = nullptr;
    throw;
  }
  std::signal(SIGINT, SIG_DFL);
  g_runningEngine = nullptr;

  session.catalog->save(snapshot);
  printSnapshotSummary(snapshot);
  return snapshot.failures.empty() ? 0 : 1;
}

int cmdRestore(Session &session, const std::vector<std::string> &args) {
  if (args.size() < 2) {
    std::cerr << "restore: need <snapshot_id> <target_dir>" << std::endl;
    return 2;
  }
  RestoreOptions options;
  for (size_t i = 2; i < args.size(); ++i) {
    if (args[i] == "--path" && i + 1 < args.size()) {
      options.paths.push_back(args[++i]);
    } else if (args[i] == "--no-metadata") {
      options.applyMetadata = false;
    } else {
      std::cerr << "Unknown restore option: " << args[i] << std::endl;
      return 2;
    }
  }
  Snapshot snapshot = session.catalog->load(args[0]);
  Restorer restorer(session.config, *session.storage, session.keyPtr());
  RestoreReport report = restorer.restore(snapshot, args[1], options);
  std::cout << "Restored " << report.restored.size() << " files ("
            << report.bytesWritten << " bytes)" << std::endl;
  for (const auto &f : report.failures) {
    std::cout << "  FAILED " << f.path << " [" << errorKindToString(f.kind)
              << "] " << f.message;
    if (!f.chunkId.empty()) {
      std::cout << " (chunk " << f.chunkId << ")";
    }
    std::cout << std::endl;
  }
  return report.ok() ? 0 : 1;
}

int cmdSnapshots(Session &session) {
  std::cout << "ID\tCreated(ns)\tFiles\tLogicalBytes\tStoredBytes\tSource"
            << std::endl;
  for (const auto &s : session.catalog->loadAll()) {
    std::cout << s.id << '\t' << s.createdAtNs << '\t' << s.fileCount << '\t'
              << s.logicalBytes << '\t' << s.storedBytes << '\t' << s.source
              << (s.complete ? "" : " (partial)") << std::endl;
  }
  return 0;
}

int cmdRelease(Session &session, const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "release: missing snapshot id" << std::endl;
    return 2;
  }
  Snapshot snapshot = session.catalog->load(args[0]);
  BackupEngine engine(session.config, *session.storage, session.index,
                      session.keyPtr());
  engine.rebuildIndex(session.catalog->loadAll());
  const size_t orphaned = engine.releaseSnapshot(snapshot);
  session.catalog->remove(snapshot.id);
  std::cout << "Released snapshot " << snapshot.id << "; " << orphaned
            << " chunks are now unreferenced (run prune to reclaim them)"
            << std::endl;
  return 0;
}

int cmdPrune(Session &session, const std::vector<std::string> &args) {
  bool dryRun = false;
  for (const auto &a : args) {
    if (a == "--dry-run") {
      dryRun = true;
    } else {
      std::cerr << "Unknown prune option: " << a << std::endl;
      return 2;
    }
  }
  BackupEngine engine(session.config, *session.storage, session.index,
                      session.keyPtr());
  BackupEngine::RebuildReport rebuilt =
      engine.rebuildIndex(session.catalog->loadAll());
  if (!rebuilt.missingChunks.empty()) {
    std::cerr << "Warning: " << rebuilt.missingChunks.size()
              << " referenced chunks are missing from storage" << std::endl;
  }
  BackupEngine::PruneStats stats = engine.prune(dryRun);
  std::cout << (dryRun ? "Would free " : "Freed ")
            << (dryRun ? stats.reclaimableChunks : stats.freedChunks)
            << " of " << stats.totalChunks << " chunks ("
            << (dryRun ? stats.reclaimableBytes : stats.freedBytes)
            << " bytes)" << std::endl;
  return 0;
}

int cmdStats(Session &session, const std::vector<std::string> &args) {
  BackupEngine engine(session.config, *session.storage, session.index,
                      session.keyPtr());
  std::vector<Snapshot> snapshots = session.catalog->loadAll();
  BackupEngine::RebuildReport rebuilt = engine.rebuildIndex(snapshots);
  DedupIndex::Stats stats = session.index.stats();

  uint64_t logical = 0;
  uint64_t referenced = 0;
  for (const auto &s : snapshots) {
    logical += s.logicalBytes;
    referenced += s.referencedStoredBytes;
  }
  uint64_t stored = 0;
  for (const auto &key : session.storage->list()) {
    stored += session.storage->size(key);
  }

  std::cout << "repository:         " << getRepositoryRoot() << "\n"
            << "snapshots:          " << snapshots.size() << "\n"
            << "unique chunks:      " << stats.uniqueChunks << "\n"
            << "references:         " << stats.totalReferences << "\n"
            << "unreferenced:       " << stats.unreferencedChunks << "\n"
            << "missing chunks:     " << rebuilt.missingChunks.size() << "\n"
            << "logical bytes:      " << logical << "\n"
            << "stored bytes:       " << stored << "\n"
            << "compression ratio:  " << std::fixed << std::setprecision(3)
            << Compressor::ratio(logical, referenced) << "\n"
            << "dedup ratio:        "
            << Compressor::ratio(referenced, stored) << std::endl;
  if (!args.empty() && args[0] == "--metrics") {
    std::cout << MetricsRegistry::instance().toPrometheus();
  }
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string configPath;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--repo" && i + 1 < argc) {
      setRepositoryRoot(argv[++i]);
    } else if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    usage(argv[0]);
    return 2;
  }
  const std::string command = args.front();
  args.erase(args.begin());

  Session session;
  try {
    session.config = loadEngineConfig(configPath);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  try {
    std::string logFile = session.config.logFile;
    if (logFile.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(logsDir(), ec);
      logFile = ec ? Logger::CONSOLE_ONLY_OUTPUT
                   : logsDir() + "/backupforge.log";
    }
    Logger::init(logFile, session.config.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  std::string failedCheck;
  if (!crypto_self_test(&failedCheck)) {
    std::cerr << "FATAL: crypto self test failed: " << failedCheck
              << std::endl;
    return 1;
  }

  try {
    if (command == "init") {
      return cmdInit(session.config, args);
    }
    if (command != "backup" && command != "restore" &&
        command != "snapshots" && command != "release" &&
        command != "prune" && command != "stats") {
      usage(argv[0]);
      return 2;
    }
    openSession(session);
    if (command == "backup")
      return cmdBackup(session, args);
    if (command == "restore")
      return cmdRestore(session, args);
    if (command == "snapshots")
      return cmdSnapshots(session);
    if (command == "release")
      return cmdRelease(session, args);
    if (command == "prune")
      return cmdPrune(session, args);
    return cmdStats(session, args);
  } catch (const BackupError &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what(),
                              {{"command", command},
                               {"kind", errorKindToString(e.kind())}});
    std::cerr << "Error [" << errorKindToString(e.kind()) << "]: " << e.what()
              << std::endl;
    return 1;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what(),
                              {{"command", command}});
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
