#include "core/source.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <utility>

namespace backupforge {

namespace fs = std::filesystem;

SourceAttributes statAttributes(const fs::path &path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    throw IoError(std::string("stat failed: ") + std::strerror(errno),
                  ErrorContext{path.string(), "", std::nullopt});
  }
  SourceAttributes attrs;
  attrs.mode = static_cast<uint32_t>(st.st_mode & 07777);
  attrs.size = static_cast<uint64_t>(st.st_size);
  attrs.mtimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                  st.st_mtim.tv_nsec;
  attrs.atimeNs = static_cast<int64_t>(st.st_atim.tv_sec) * 1000000000LL +
                  st.st_atim.tv_nsec;
  return attrs;
}

bool isExcluded(const std::string &relativePath,
                const std::vector<std::string> &excludes) {
  for (const auto &pattern : excludes) {
    if (!pattern.empty() && relativePath.find(pattern) != std::string::npos) {
      return true;
    }
  }
  return false;
}

SourceEntry failedSource(std::string relativePath, const IoError &error) {
  SourceEntry entry;
  entry.relativePath = std::move(relativePath);
  entry.open = [error]() -> std::unique_ptr<std::istream> { throw error; };
  return entry;
}

std::vector<SourceEntry>
collectDirectory(const fs::path &root,
                 const std::vector<std::string> &excludes) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw IoError("source is not a directory",
                  ErrorContext{root.string(), "", std::nullopt});
  }
  std::vector<SourceEntry> entries;
  std::vector<fs::path> pendingDirs{root};
  while (!pendingDirs.empty()) {
    const fs::path dir = pendingDirs.back();
    pendingDirs.pop_back();
    const std::string dirRel =
        dir == root ? std::string(".")
                    : dir.lexically_relative(root).generic_string();

    fs::directory_iterator it(dir, ec);
    for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
      const fs::path full = it->path();
      const std::string rel = full.lexically_relative(root).generic_string();
      if (isExcluded(rel, excludes)) {
        continue;
      }
      std::error_code typeEc;
      const fs::file_status st = it->symlink_status(typeEc);
      if (typeEc) {
        entries.push_back(failedSource(
            rel, IoError("cannot read file type: " + typeEc.message(),
                         ErrorContext{rel, "", std::nullopt})));
        continue;
      }
      if (fs::is_directory(st)) {
        pendingDirs.push_back(full);
        continue;
      }
      if (!fs::is_regular_file(st)) {
        continue;
      }
      SourceEntry entry;
      entry.relativePath = rel;
      try {
        entry.attributes = statAttributes(full);
      } catch (const IoError &e) {
        entries.push_back(failedSource(
            rel, IoError(e.detail(), ErrorContext{rel, "", std::nullopt})));
        continue;
      }
      entry.open = [full]() -> std::unique_ptr<std::istream> {
        return std::make_unique<std::ifstream>(full, std::ios::binary);
      };
      entries.push_back(std::move(entry));
    }
    if (ec) {
      entries.push_back(failedSource(
          dirRel, IoError("cannot read directory: " + ec.message(),
                          ErrorContext{dirRel, "", std::nullopt})));
      ec.clear();
    }
  }
  std::sort(entries.begin(), entries.end(),
            [](const SourceEntry &a, const SourceEntry &b) {
              return a.relativePath < b.relativePath;
            });
  return entries;
}

SourceEntry memorySource(std::string relativePath, std::string content,
                         SourceAttributes attributes) {
  SourceEntry entry;
  entry.relativePath = std::move(relativePath);
  attributes.size = content.size();
  entry.attributes = attributes;
  auto shared = std::make_shared<const std::string>(std::move(content));
  entry.open = [shared]() -> std::unique_ptr<std::istream> {
    return std::make_unique<std::istringstream>(*shared);
  };
  return entry;
}

} // namespace backupforge
