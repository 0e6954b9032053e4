#pragma once
#ifndef BACKUPFORGE_SOURCE_HPP
#define BACKUPFORGE_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "core/errors.hpp"

namespace backupforge {

struct SourceAttributes {
  uint32_t mode = 0644; ///< Permission bits.
  int64_t mtimeNs = 0;
  int64_t atimeNs = 0;
  uint64_t size = 0;
};

/**
 * @brief One file offered to the engine: a path, a way to read its bytes and
 *        its attributes.
 *
 * open() is called at most once, from the thread that backs the file up.
 * Returning nullptr or a stream in a failed state reports an IoError for
 * that file only.
 */
struct SourceEntry {
  std::string relativePath;
  std::function<std::unique_ptr<std::istream>()> open;
  SourceAttributes attributes;
};

/**
 * @brief Regular files under @p root, recursively, sorted by path.
 *
 * Symlinks and special files are skipped, as is every path whose
 * root-relative form contains one of @p excludes (an excluded directory is
 * not descended into). A directory that cannot be read or a file that cannot
 * be stat'ed does not stop the walk: it becomes an entry whose open() throws
 * the IoError, so the engine reports it as a per-file failure.
 * @throw IoError If @p root itself is not a directory.
 */
std::vector<SourceEntry>
collectDirectory(const std::filesystem::path &root,
                 const std::vector<std::string> &excludes = {});

/** True if @p relativePath contains any of @p excludes. */
bool isExcluded(const std::string &relativePath,
                const std::vector<std::string> &excludes);

/** Entry that reports @p error when the engine opens it. */
SourceEntry failedSource(std::string relativePath, const IoError &error);

/** Attributes of @p path from stat(2). @throw IoError */
SourceAttributes statAttributes(const std::filesystem::path &path);

/** Entry backed by an in-memory copy of @p content. */
SourceEntry memorySource(std::string relativePath, std::string content,
                         SourceAttributes attributes = {});

} // namespace backupforge

#endif // BACKUPFORGE_SOURCE_HPP
