#include "core/repository.hpp"
#include "core/engine_config.hpp"
#include "core/errors.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace backupforge {

namespace fs = std::filesystem;

namespace {

void writeFileAtomically(const fs::path &target, const std::string &content) {
  const fs::path temp = target.string() + ".tmp";
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IoError("cannot open for writing",
                    ErrorContext{temp.string(), "", std::nullopt});
    }
    out << content;
    out.flush();
    if (!out) {
      throw IoError("short write", ErrorContext{temp.string(), "", std::nullopt});
    }
  }
  std::error_code ec;
  fs::rename(temp, target, ec);
  if (ec) {
    throw IoError("cannot rename into place: " + ec.message(),
                  ErrorContext{target.string(), "", std::nullopt});
  }
}

std::string readFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IoError("cannot open for reading",
                  ErrorContext{path.string(), "", std::nullopt});
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

int64_t nowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

RepositoryInfo initRepository(const std::string &root, bool encrypted,
                              utils::HashAlgorithm hashAlgorithm) {
  setRepositoryRoot(root);
  if (fs::exists(repositoryInfoPath())) {
    throw ConfigurationError("repository already initialised at " + root);
  }
  for (const auto &dir : {chunksDir(), snapshotsDir(), logsDir()}) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      throw IoError("cannot create directory: " + ec.message(),
                    ErrorContext{dir, "", std::nullopt});
    }
  }

  RepositoryInfo info;
  info.salt = generateSalt();
  info.encrypted = encrypted;
  info.hashAlgorithm = hashAlgorithm;
  info.createdAtNs = nowNs();

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "format_version" << YAML::Value << info.formatVersion;
  out << YAML::Key << "salt" << YAML::Value << saltToHex(info.salt);
  out << YAML::Key << "encrypted" << YAML::Value << info.encrypted;
  out << YAML::Key << "hash_algorithm" << YAML::Value
      << hashAlgorithmToString(hashAlgorithm);
  out << YAML::Key << "created_at_ns" << YAML::Value << info.createdAtNs;
  out << YAML::EndMap;
  writeFileAtomically(repositoryInfoPath(), out.c_str());

  Logger::getInstance().log(LogLevel::INFO, "Initialised repository",
                            {{"path", root}});
  return info;
}

RepositoryInfo loadRepositoryInfo(const std::string &infoPath) {
  if (!fs::exists(infoPath)) {
    throw ConfigurationError("no repository at " + infoPath +
                             " (run 'backupforge init')");
  }
  RepositoryInfo info;
  try {
    YAML::Node node = YAML::LoadFile(infoPath);
    info.formatVersion = node["format_version"].as<int>();
    if (info.formatVersion > REPOSITORY_FORMAT_VERSION) {
      throw ConfigurationError("repository format " +
                               std::to_string(info.formatVersion) +
                               " is newer than this build supports");
    }
    info.salt = saltFromHex(node["salt"].as<std::string>());
    info.encrypted = node["encrypted"].as<bool>(false);
    info.hashAlgorithm = hashAlgorithmFromString(
        node["hash_algorithm"].as<std::string>("blake3"));
    info.createdAtNs = node["created_at_ns"].as<int64_t>(0);
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(std::string("malformed repository.yaml: ") +
                             e.what());
  }
  return info;
}

SnapshotCatalog::SnapshotCatalog(fs::path dir) : dir_(std::move(dir)) {
  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    throw IoError("cannot create snapshot catalog: " + ec.message(),
                  ErrorContext{dir_.string(), "", std::nullopt});
  }
}

fs::path SnapshotCatalog::pathFor(const std::string &id) const {
  if (id.empty() || id.find('/') != std::string::npos || id[0] == '.') {
    throw ConfigurationError("invalid snapshot id '" + id + "'");
  }
  return dir_ / (id + ".yaml");
}

void SnapshotCatalog::save(const Snapshot &snapshot) {
  writeFileAtomically(pathFor(snapshot.id), snapshotToYaml(snapshot));
}

Snapshot SnapshotCatalog::load(const std::string &id) const {
  const fs::path path = pathFor(id);
  if (!fs::exists(path)) {
    throw StorageError(StorageError::Code::NotFound,
                       "no snapshot with id " + id,
                       ErrorContext{path.string(), "", std::nullopt});
  }
  try {
    return snapshotFromYaml(readFile(path));
  } catch (const CorruptionError &e) {
    throw CorruptionError(e.detail(),
                          ErrorContext{path.string(), "", std::nullopt});
  }
}

std::vector<Snapshot> SnapshotCatalog::loadAll() const {
  std::vector<Snapshot> snapshots;
  std::error_code ec;
  for (fs::directory_iterator it(dir_, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().extension() != ".yaml") {
      continue;
    }
    snapshots.push_back(load(it->path().stem().string()));
  }
  if (ec) {
    throw IoError("cannot list snapshot catalog: " + ec.message(),
                  ErrorContext{dir_.string(), "", std::nullopt});
  }
  std::sort(snapshots.begin(), snapshots.end(),
            [](const Snapshot &a, const Snapshot &b) {
              return a.createdAtNs < b.createdAtNs;
            });
  return snapshots;
}

std::vector<std::string> SnapshotCatalog::ids() const {
  std::vector<std::string> result;
  for (const auto &snapshot : loadAll()) {
    result.push_back(snapshot.id);
  }
  return result;
}

bool SnapshotCatalog::remove(const std::string &id) {
  std::error_code ec;
  const bool removed = fs::remove(pathFor(id), ec);
  if (ec) {
    throw IoError("cannot remove snapshot: " + ec.message(),
                  ErrorContext{pathFor(id).string(), "", std::nullopt});
  }
  return removed;
}

} // namespace backupforge
