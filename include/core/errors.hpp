#pragma once
#ifndef BACKUPFORGE_ERRORS_HPP
#define BACKUPFORGE_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace backupforge {

/**
 * @brief Classification of every failure the backup pipeline can report.
 */
enum class ErrorKind {
  Io,               ///< Reading a source or writing a restore target.
  Storage,          ///< Backend put/get/exists/remove/list failure.
  Corruption,       ///< Tag mismatch, bad compressed frame, hash mismatch.
  Configuration,    ///< Invalid settings or missing key material.
  IndexConsistency, ///< Dedup index invariant broken. Fatal for the run.
  Cancelled         ///< Operation aborted by the caller.
};

std::string errorKindToString(ErrorKind kind);
/** Inverse of errorKindToString(). @throw std::invalid_argument */
ErrorKind errorKindFromString(const std::string &name);

/**
 * @brief Where an error happened: file path, chunk id and byte offset.
 *
 * Any field may be empty; what() includes whichever are present.
 */
struct ErrorContext {
  std::string path;
  std::string chunkId;
  std::optional<uint64_t> offset;
};

/**
 * @brief Root of the exception hierarchy.
 */
class BackupError : public std::runtime_error {
public:
  BackupError(ErrorKind kind, const std::string &message,
              ErrorContext context = {});

  ErrorKind kind() const noexcept { return kind_; }
  const ErrorContext &context() const noexcept { return context_; }
  /** Message without the context suffix. */
  const std::string &detail() const noexcept { return detail_; }

private:
  ErrorKind kind_;
  ErrorContext context_;
  std::string detail_;
};

class IoError : public BackupError {
public:
  explicit IoError(const std::string &message, ErrorContext context = {})
      : BackupError(ErrorKind::Io, message, std::move(context)) {}
};

/**
 * @brief Backend failure. Only Transient failures are retried.
 */
class StorageError : public BackupError {
public:
  enum class Code { NotFound, Transient, Permanent };

  StorageError(Code code, const std::string &message,
               ErrorContext context = {})
      : BackupError(ErrorKind::Storage, message, std::move(context)),
        code_(code) {}

  Code code() const noexcept { return code_; }
  bool isNotFound() const noexcept { return code_ == Code::NotFound; }
  bool isTransient() const noexcept { return code_ == Code::Transient; }

private:
  Code code_;
};

class CorruptionError : public BackupError {
public:
  explicit CorruptionError(const std::string &message,
                           ErrorContext context = {})
      : BackupError(ErrorKind::Corruption, message, std::move(context)) {}
};

/** Authentication tag mismatch during decryption. */
class AuthenticationError : public CorruptionError {
public:
  explicit AuthenticationError(const std::string &message,
                               ErrorContext context = {})
      : CorruptionError(message, std::move(context)) {}
};

class ConfigurationError : public BackupError {
public:
  explicit ConfigurationError(const std::string &message)
      : BackupError(ErrorKind::Configuration, message) {}
};

class IndexConsistencyError : public BackupError {
public:
  explicit IndexConsistencyError(const std::string &message,
                                 ErrorContext context = {})
      : BackupError(ErrorKind::IndexConsistency, message, std::move(context)) {}
};

class OperationCancelled : public BackupError {
public:
  explicit OperationCancelled(const std::string &message,
                              ErrorContext context = {})
      : BackupError(ErrorKind::Cancelled, message, std::move(context)) {}
};

/** @p base with any empty fields filled in from @p extra. */
ErrorContext mergeContext(const ErrorContext &base, const ErrorContext &extra);

} // namespace backupforge

#endif // BACKUPFORGE_ERRORS_HPP
