#pragma once

#include <string>

namespace backupforge {

/**
 * Repository root. Defaults to $BACKUPFORGE_REPOSITORY, then
 * /var/lib/backupforge if it exists, then ./backupforge-repo.
 */
void setRepositoryRoot(const std::string &dir);
const std::string &getRepositoryRoot();

std::string chunksDir();
std::string snapshotsDir();
std::string logsDir();
std::string repositoryInfoPath();

} // namespace backupforge
