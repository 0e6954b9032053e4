#include "core/engine_config.hpp"
#include "core/errors.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace backupforge {

namespace {

const char *const DEFAULT_CONFIG_FILE = "backupforge.yaml";

size_t parseSize(const char *name, const char *value) {
  char *end = nullptr;
  errno = 0;
  const long long parsed = std::strtoll(value, &end, 10);
  if (errno != 0 || end == value || *end != '\0' || parsed < 0) {
    throw ConfigurationError(std::string(name) + " is not a non-negative "
                                                 "integer: '" +
                             value + "'");
  }
  return static_cast<size_t>(parsed);
}

} // namespace

std::string hashAlgorithmToString(utils::HashAlgorithm algo) {
  return algo == utils::HashAlgorithm::SHA256 ? "sha256" : "blake3";
}

utils::HashAlgorithm hashAlgorithmFromString(const std::string &name) {
  if (name == "blake3" || name == "BLAKE3")
    return utils::HashAlgorithm::BLAKE3;
  if (name == "sha256" || name == "SHA256" || name == "sha2-256")
    return utils::HashAlgorithm::SHA256;
  throw ConfigurationError("Unknown hash algorithm: " + name);
}

void EngineConfig::validate() const {
  chunking.validate();
  Compressor::validateLevel(compression, compressionLevel);
  if (encryptionEnabled) {
    if (cipher == CipherAlgorithm::None) {
      throw ConfigurationError(
          "encryption.enabled requires a cipher other than none");
    }
    if (!Cipher::isAvailable(cipher)) {
      throw ConfigurationError(cipherAlgorithmToString(cipher) +
                               " is not supported on this CPU");
    }
    kdf.validate();
  }
  if (workers == 0) {
    throw ConfigurationError("workers must be at least 1");
  }
  if (maxInFlight < workers) {
    throw ConfigurationError("max_in_flight must be at least workers");
  }
  if (fileParallelism == 0) {
    throw ConfigurationError("file_parallelism must be at least 1");
  }
  storageRetry.validate();
}

EngineConfig engineConfigFromYaml(const std::string &yaml) {
  EngineConfig config;
  try {
    YAML::Node node = YAML::Load(yaml);
    if (node.IsNull()) {
      return config;
    }
    if (!node.IsMap()) {
      throw ConfigurationError("configuration root must be a mapping");
    }
    if (const YAML::Node c = node["chunking"]) {
      if (c["strategy"])
        config.chunking.strategy =
            chunkingStrategyFromString(c["strategy"].as<std::string>());
      if (c["min_size"])
        config.chunking.minSize = c["min_size"].as<size_t>();
      if (c["avg_size"])
        config.chunking.avgSize = c["avg_size"].as<size_t>();
      if (c["max_size"])
        config.chunking.maxSize = c["max_size"].as<size_t>();
    }
    if (const YAML::Node c = node["compression"]) {
      if (c["algorithm"])
        config.compression =
            compressionAlgorithmFromString(c["algorithm"].as<std::string>());
      if (c["level"])
        config.compressionLevel = c["level"].as<int>();
    }
    if (const YAML::Node e = node["encryption"]) {
      if (e["enabled"])
        config.encryptionEnabled = e["enabled"].as<bool>();
      if (e["cipher"])
        config.cipher = cipherAlgorithmFromString(e["cipher"].as<std::string>());
      if (const YAML::Node k = e["kdf"]) {
        if (k["ops_limit"])
          config.kdf.opsLimit = k["ops_limit"].as<unsigned long long>();
        if (k["mem_limit"])
          config.kdf.memLimit = k["mem_limit"].as<size_t>();
      }
    }
    if (node["hash_algorithm"])
      config.hashAlgorithm =
          hashAlgorithmFromString(node["hash_algorithm"].as<std::string>());
    if (node["workers"])
      config.workers = node["workers"].as<size_t>();
    if (node["max_in_flight"])
      config.maxInFlight = node["max_in_flight"].as<size_t>();
    if (node["file_parallelism"])
      config.fileParallelism = node["file_parallelism"].as<size_t>();
    if (const YAML::Node r = node["storage_retry"]) {
      if (r["attempts"])
        config.storageRetry.maxAttempts = r["attempts"].as<unsigned>();
      if (r["base_backoff_ms"])
        config.storageRetry.baseBackoff =
            std::chrono::milliseconds(r["base_backoff_ms"].as<long>());
      if (r["max_backoff_ms"])
        config.storageRetry.maxBackoff =
            std::chrono::milliseconds(r["max_backoff_ms"].as<long>());
    }
    if (const YAML::Node x = node["exclude"]) {
      if (!x.IsSequence()) {
        throw ConfigurationError("exclude must be a list of patterns");
      }
      config.excludes = x.as<std::vector<std::string>>();
    }
    if (const YAML::Node l = node["log"]) {
      if (l["file"])
        config.logFile = l["file"].as<std::string>();
      if (l["level"]) {
        try {
          config.logLevel = logLevelFromString(l["level"].as<std::string>());
        } catch (const std::invalid_argument &e) {
          throw ConfigurationError(e.what());
        }
      }
    }
  } catch (const YAML::Exception &e) {
    throw ConfigurationError(std::string("invalid configuration: ") +
                             e.what());
  }
  return config;
}

void applyEnvironmentOverrides(EngineConfig &config) {
  if (const char *env = std::getenv("BACKUPFORGE_COMPRESSION_LEVEL"))
    config.compressionLevel =
        static_cast<int>(parseSize("BACKUPFORGE_COMPRESSION_LEVEL", env));
  if (const char *env = std::getenv("BACKUPFORGE_CIPHER_ALGO"))
    config.cipher = cipherAlgorithmFromString(env);
  if (const char *env = std::getenv("BACKUPFORGE_WORKERS")) {
    config.workers = parseSize("BACKUPFORGE_WORKERS", env);
    if (config.maxInFlight < config.workers)
      config.maxInFlight = config.workers * 4;
  }
}

EngineConfig loadEngineConfig(const std::string &path) {
  std::string cfg = path;
  bool explicitPath = !cfg.empty();
  if (cfg.empty()) {
    if (const char *env = std::getenv("BACKUPFORGE_CONFIG")) {
      cfg = env;
      explicitPath = true;
    } else {
      cfg = DEFAULT_CONFIG_FILE;
    }
  }

  EngineConfig config;
  std::ifstream in(cfg);
  if (in) {
    std::stringstream buffer;
    buffer << in.rdbuf();
    config = engineConfigFromYaml(buffer.str());
  } else if (explicitPath) {
    throw ConfigurationError("cannot read configuration file " + cfg);
  }
  applyEnvironmentOverrides(config);
  config.validate();
  return config;
}

} // namespace backupforge
