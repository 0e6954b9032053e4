#include "storage/local_storage.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace backupforge {

namespace fs = std::filesystem;

namespace {

// Keys are unprefixed base32 of a 4-byte CIDv1 header plus the digest.
// Characters 0-6 cover bits 0-34 and touch the header; 7 onward are digest.
constexpr size_t FANOUT_OFFSET = 7;

bool isTransientErrno(int err) {
  return err == EINTR || err == EAGAIN || err == EBUSY || err == ETIMEDOUT ||
         err == EMFILE || err == ENFILE;
}

StorageError fromErrno(int err, const std::string &what,
                       const std::string &key) {
  ErrorContext ctx;
  ctx.chunkId = key;
  if (err == ENOENT) {
    return StorageError(StorageError::Code::NotFound, what, ctx);
  }
  return StorageError(isTransientErrno(err) ? StorageError::Code::Transient
                                            : StorageError::Code::Permanent,
                      what + ": " + std::strerror(err), ctx);
}

StorageError fromErrorCode(const std::error_code &ec, const std::string &what,
                           const std::string &key) {
  return fromErrno(ec.value(), what, key);
}

void checkKey(const std::string &key) {
  if (key.empty() || key.find('/') != std::string::npos || key == "." ||
      key == "..") {
    throw StorageError(StorageError::Code::Permanent,
                       "invalid object key '" + key + "'");
  }
}

} // namespace

LocalStorage::LocalStorage(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw StorageError(StorageError::Code::Permanent,
                       "cannot create storage root " + root_.string() + ": " +
                           ec.message());
  }
}

fs::path LocalStorage::objectPath(const std::string &key) const {
  std::string shard = key.size() >= FANOUT_OFFSET + 2
                          ? key.substr(FANOUT_OFFSET, 2)
                          : std::string("00");
  return root_ / shard / key;
}

void LocalStorage::put(const std::string &key,
                       std::span<const std::byte> data) {
  checkKey(key);
  const fs::path target = objectPath(key);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    throw fromErrorCode(ec, "cannot create " + target.parent_path().string(),
                        key);
  }

  const fs::path temp =
      target.string() + "." + std::to_string(::getpid()) + "." +
      std::to_string(tempCounter_.fetch_add(1)) + TEMP_SUFFIX;
  {
    errno = 0;
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw fromErrno(errno ? errno : EIO, "cannot open " + temp.string(),
                      key);
    }
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      const int err = errno ? errno : EIO;
      out.close();
      fs::remove(temp, ec);
      throw fromErrno(err, "short write to " + temp.string(), key);
    }
  }
  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp, ignored);
    throw fromErrorCode(ec, "cannot rename into " + target.string(), key);
  }
}

std::vector<std::byte> LocalStorage::get(const std::string &key) const {
  checkKey(key);
  const fs::path path = objectPath(key);
  errno = 0;
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    throw fromErrno(errno ? errno : ENOENT, "cannot open " + path.string(),
                    key);
  }
  const std::streamsize size = in.tellg();
  in.seekg(0);
  std::vector<std::byte> data(static_cast<size_t>(size));
  if (!in.read(reinterpret_cast<char *>(data.data()), size)) {
    throw fromErrno(errno ? errno : EIO, "short read from " + path.string(),
                    key);
  }
  return data;
}

bool LocalStorage::exists(const std::string &key) const {
  checkKey(key);
  std::error_code ec;
  const bool found = fs::is_regular_file(objectPath(key), ec);
  if (ec && ec.value() != ENOENT) {
    throw fromErrorCode(ec, "cannot stat object", key);
  }
  return found;
}

bool LocalStorage::remove(const std::string &key) {
  checkKey(key);
  std::error_code ec;
  const bool removed = fs::remove(objectPath(key), ec);
  if (ec) {
    throw fromErrorCode(ec, "cannot remove object", key);
  }
  return removed;
}

std::vector<std::string> LocalStorage::list() const {
  std::vector<std::string> keys;
  std::error_code ec;
  for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code entryEc;
    if (!it->is_regular_file(entryEc)) {
      continue;
    }
    const std::string name = it->path().filename().string();
    if (name.size() >= std::strlen(TEMP_SUFFIX) &&
        name.compare(name.size() - std::strlen(TEMP_SUFFIX),
                     std::string::npos, TEMP_SUFFIX) == 0) {
      continue;
    }
    keys.push_back(name);
  }
  if (ec) {
    throw fromErrorCode(ec, "cannot list " + root_.string(), "");
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

uint64_t LocalStorage::size(const std::string &key) const {
  checkKey(key);
  std::error_code ec;
  const auto bytes = fs::file_size(objectPath(key), ec);
  if (ec) {
    throw fromErrorCode(ec, "cannot stat object", key);
  }
  return bytes;
}

} // namespace backupforge
