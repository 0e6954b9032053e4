#include "core/snapshot.hpp"

#include <cstdint>
#include <cstdio>
#include <sodium.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace backupforge {

double Snapshot::compressionRatio() const {
  if (logicalBytes == 0) {
    return 1.0;
  }
  return static_cast<double>(referencedStoredBytes) /
         static_cast<double>(logicalBytes);
}

const FileMetadata *Snapshot::findFile(const std::string &path) const {
  for (const auto &file : files) {
    if (file.path == path) {
      return &file;
    }
  }
  return nullptr;
}

std::string generateSnapshotId() {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  unsigned char bytes[16];
  randombytes_buf(bytes, sizeof(bytes));
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40); // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80); // RFC 4122
  char out[37];
  std::snprintf(out, sizeof(out),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                "%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  return std::string(out);
}

namespace {

const char *const BINARY_TAG = "tag:yaml.org,2002:binary";

bool isValidUtf8(const std::string &text) {
  const auto *p = reinterpret_cast<const unsigned char *>(text.data());
  const auto *end = p + text.size();
  while (p < end) {
    const unsigned char lead = *p++;
    if (lead < 0x80) {
      continue;
    }
    int extra;
    uint32_t cp;
    if ((lead & 0xe0) == 0xc0) {
      extra = 1;
      cp = lead & 0x1f;
    } else if ((lead & 0xf0) == 0xe0) {
      extra = 2;
      cp = lead & 0x0f;
    } else if ((lead & 0xf8) == 0xf0) {
      extra = 3;
      cp = lead & 0x07;
    } else {
      return false;
    }
    if (end - p < extra) {
      return false;
    }
    for (int i = 0; i < extra; ++i, ++p) {
      if ((*p & 0xc0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (*p & 0x3f);
    }
    static constexpr uint32_t MIN_FOR_LENGTH[] = {0, 0x80, 0x800, 0x10000};
    if (cp < MIN_FOR_LENGTH[extra] || cp > 0x10ffff ||
        (cp >= 0xd800 && cp <= 0xdfff)) {
      return false;
    }
  }
  return true;
}

// POSIX names are arbitrary bytes; the emitter would replace invalid UTF-8,
// so those go out as !!binary instead.
void emitPath(YAML::Emitter &out, const char *key, const std::string &path) {
  out << YAML::Key << key << YAML::Value;
  if (isValidUtf8(path)) {
    out << path;
  } else {
    out << YAML::Binary(reinterpret_cast<const unsigned char *>(path.data()),
                        path.size());
  }
}

std::string readPath(const YAML::Node &node) {
  if (!node) {
    throw CorruptionError("snapshot entry has no path");
  }
  if (node.Tag() == BINARY_TAG) {
    const YAML::Binary bytes = node.as<YAML::Binary>();
    return std::string(reinterpret_cast<const char *>(bytes.data()),
                       bytes.size());
  }
  return node.as<std::string>();
}

template <typename T>
void emitFlowSeq(YAML::Emitter &out, const char *key,
                 const std::vector<T> &values) {
  out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
  for (const auto &v : values) {
    out << v;
  }
  out << YAML::EndSeq;
}

void emitFile(YAML::Emitter &out, const FileMetadata &file) {
  out << YAML::BeginMap;
  emitPath(out, "path", file.path);
  out << YAML::Key << "size" << YAML::Value << file.size;
  out << YAML::Key << "mode" << YAML::Value << file.mode;
  out << YAML::Key << "mtime_ns" << YAML::Value << file.mtimeNs;
  out << YAML::Key << "atime_ns" << YAML::Value << file.atimeNs;
  std::vector<std::string> ids;
  ids.reserve(file.chunks.size());
  for (const auto &id : file.chunks) {
    ids.push_back(id.toString());
  }
  out << YAML::Key << "chunks" << YAML::Value << YAML::BeginSeq;
  for (const auto &id : ids) {
    out << id;
  }
  out << YAML::EndSeq;
  emitFlowSeq(out, "chunk_sizes", file.chunkSizes);
  emitFlowSeq(out, "stored_sizes", file.storedSizes);
  out << YAML::EndMap;
}

void emitFailure(YAML::Emitter &out, const FileFailure &failure) {
  out << YAML::BeginMap;
  emitPath(out, "path", failure.path);
  out << YAML::Key << "kind" << YAML::Value << errorKindToString(failure.kind);
  out << YAML::Key << "message" << YAML::Value << failure.message;
  if (!failure.chunkId.empty()) {
    out << YAML::Key << "chunk" << YAML::Value << failure.chunkId;
  }
  if (failure.offset) {
    out << YAML::Key << "offset" << YAML::Value << *failure.offset;
  }
  out << YAML::EndMap;
}

template <typename T> std::vector<T> readSeq(const YAML::Node &node) {
  std::vector<T> values;
  if (!node) {
    return values;
  }
  if (!node.IsSequence()) {
    throw CorruptionError("snapshot field is not a sequence");
  }
  values.reserve(node.size());
  for (const auto &item : node) {
    values.push_back(item.as<T>());
  }
  return values;
}

FileMetadata parseFile(const YAML::Node &node) {
  FileMetadata file;
  file.path = readPath(node["path"]);
  file.size = node["size"].as<uint64_t>();
  file.mode = node["mode"].as<uint32_t>();
  file.mtimeNs = node["mtime_ns"].as<int64_t>();
  file.atimeNs = node["atime_ns"].as<int64_t>();
  for (const auto &cid : readSeq<std::string>(node["chunks"])) {
    file.chunks.push_back(ChunkId::fromString(cid));
  }
  file.chunkSizes = readSeq<uint64_t>(node["chunk_sizes"]);
  file.storedSizes = readSeq<uint64_t>(node["stored_sizes"]);
  if (file.chunkSizes.size() != file.chunks.size() ||
      file.storedSizes.size() != file.chunks.size()) {
    throw CorruptionError("chunk size lists do not match chunk list",
                          ErrorContext{file.path, "", std::nullopt});
  }
  return file;
}

FileFailure parseFailure(const YAML::Node &node) {
  FileFailure failure;
  failure.path = readPath(node["path"]);
  failure.kind = errorKindFromString(node["kind"].as<std::string>());
  failure.message = node["message"].as<std::string>("");
  failure.chunkId = node["chunk"].as<std::string>("");
  if (node["offset"]) {
    failure.offset = node["offset"].as<uint64_t>();
  }
  return failure;
}

} // namespace

std::string snapshotToYaml(const Snapshot &snapshot) {
  YAML::Emitter out;
  out.SetDoublePrecision(17);
  out << YAML::BeginMap;
  out << YAML::Key << "id" << YAML::Value << snapshot.id;
  out << YAML::Key << "created_at_ns" << YAML::Value << snapshot.createdAtNs;
  emitPath(out, "source", snapshot.source);
  out << YAML::Key << "description" << YAML::Value << snapshot.description;
  emitFlowSeq(out, "tags", snapshot.tags);
  if (snapshot.parentId) {
    out << YAML::Key << "parent" << YAML::Value << *snapshot.parentId;
  }
  out << YAML::Key << "complete" << YAML::Value << snapshot.complete;
  out << YAML::Key << "stats" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "file_count" << YAML::Value << snapshot.fileCount;
  out << YAML::Key << "logical_bytes" << YAML::Value << snapshot.logicalBytes;
  out << YAML::Key << "stored_bytes" << YAML::Value << snapshot.storedBytes;
  out << YAML::Key << "referenced_stored_bytes" << YAML::Value
      << snapshot.referencedStoredBytes;
  out << YAML::Key << "new_chunks" << YAML::Value << snapshot.newChunks;
  out << YAML::Key << "reused_chunks" << YAML::Value << snapshot.reusedChunks;
  out << YAML::Key << "duration_seconds" << YAML::Value
      << snapshot.durationSeconds;
  out << YAML::EndMap;

  out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
  for (const auto &file : snapshot.files) {
    emitFile(out, file);
  }
  out << YAML::EndSeq;
  out << YAML::Key << "failures" << YAML::Value << YAML::BeginSeq;
  for (const auto &failure : snapshot.failures) {
    emitFailure(out, failure);
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
  if (!out.good()) {
    throw std::runtime_error("YAML emitter error: " + out.GetLastError());
  }
  return std::string(out.c_str());
}

Snapshot snapshotFromYaml(const std::string &yaml) {
  try {
    YAML::Node root = YAML::Load(yaml);
    if (!root.IsMap()) {
      throw CorruptionError("snapshot document is not a mapping");
    }
    Snapshot snapshot;
    snapshot.id = root["id"].as<std::string>();
    snapshot.createdAtNs = root["created_at_ns"].as<int64_t>();
    if (root["source"]) {
      snapshot.source = readPath(root["source"]);
    }
    snapshot.description = root["description"].as<std::string>("");
    snapshot.tags = readSeq<std::string>(root["tags"]);
    if (root["parent"]) {
      snapshot.parentId = root["parent"].as<std::string>();
    }
    snapshot.complete = root["complete"].as<bool>(true);

    const YAML::Node stats = root["stats"];
    if (!stats || !stats.IsMap()) {
      throw CorruptionError("snapshot has no stats section");
    }
    snapshot.fileCount = stats["file_count"].as<uint64_t>();
    snapshot.logicalBytes = stats["logical_bytes"].as<uint64_t>();
    snapshot.storedBytes = stats["stored_bytes"].as<uint64_t>();
    snapshot.referencedStoredBytes =
        stats["referenced_stored_bytes"].as<uint64_t>(0);
    snapshot.newChunks = stats["new_chunks"].as<uint64_t>();
    snapshot.reusedChunks = stats["reused_chunks"].as<uint64_t>();
    snapshot.durationSeconds = stats["duration_seconds"].as<double>(0.0);

    if (const YAML::Node files = root["files"]) {
      for (const auto &node : files) {
        snapshot.files.push_back(parseFile(node));
      }
    }
    if (const YAML::Node failures = root["failures"]) {
      for (const auto &node : failures) {
        snapshot.failures.push_back(parseFailure(node));
      }
    }
    return snapshot;
  } catch (const BackupError &) {
    throw;
  } catch (const YAML::Exception &e) {
    throw CorruptionError(std::string("malformed snapshot YAML: ") + e.what());
  } catch (const std::exception &e) {
    // Bad CID strings and unknown failure kinds.
    throw CorruptionError(std::string("invalid snapshot field: ") + e.what());
  }
}

} // namespace backupforge
