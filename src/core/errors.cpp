#include "core/errors.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace backupforge {

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Io:
    return "IoError";
  case ErrorKind::Storage:
    return "StorageError";
  case ErrorKind::Corruption:
    return "CorruptionError";
  case ErrorKind::Configuration:
    return "ConfigurationError";
  case ErrorKind::IndexConsistency:
    return "IndexConsistencyError";
  case ErrorKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

ErrorKind errorKindFromString(const std::string &name) {
  for (ErrorKind kind :
       {ErrorKind::Io, ErrorKind::Storage, ErrorKind::Corruption,
        ErrorKind::Configuration, ErrorKind::IndexConsistency,
        ErrorKind::Cancelled}) {
    if (errorKindToString(kind) == name)
      return kind;
  }
  throw std::invalid_argument("Unknown error kind: " + name);
}

static std::string formatMessage(ErrorKind kind, const std::string &message,
                                 const ErrorContext &context) {
  std::ostringstream oss;
  oss << errorKindToString(kind) << ": " << message;
  if (!context.path.empty())
    oss << " (path: " << context.path << ")";
  if (!context.chunkId.empty())
    oss << " (chunk: " << context.chunkId << ")";
  if (context.offset)
    oss << " (offset: " << *context.offset << ")";
  return oss.str();
}

BackupError::BackupError(ErrorKind kind, const std::string &message,
                         ErrorContext context)
    : std::runtime_error(formatMessage(kind, message, context)), kind_(kind),
      context_(std::move(context)), detail_(message) {}

ErrorContext mergeContext(const ErrorContext &base, const ErrorContext &extra) {
  ErrorContext merged = base;
  if (merged.path.empty())
    merged.path = extra.path;
  if (merged.chunkId.empty())
    merged.chunkId = extra.chunkId;
  if (!merged.offset)
    merged.offset = extra.offset;
  return merged;
}

} // namespace backupforge
