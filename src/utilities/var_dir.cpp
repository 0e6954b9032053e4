#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace backupforge {

static std::string repositoryRoot = [] {
  const char *env = std::getenv("BACKUPFORGE_REPOSITORY");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/lib/backupforge"))
    return std::string("/var/lib/backupforge");
  return std::string("backupforge-repo");
}();

void setRepositoryRoot(const std::string &dir) { repositoryRoot = dir; }

const std::string &getRepositoryRoot() { return repositoryRoot; }

std::string chunksDir() { return getRepositoryRoot() + "/chunks"; }

std::string snapshotsDir() { return getRepositoryRoot() + "/snapshots"; }

std::string logsDir() { return getRepositoryRoot() + "/logs"; }

std::string repositoryInfoPath() {
  return getRepositoryRoot() + "/repository.yaml";
}

} // namespace backupforge
