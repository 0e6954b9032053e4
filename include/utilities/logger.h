#pragma once
#ifndef BACKUPFORGE_LOGGER_H
#define BACKUPFORGE_LOGGER_H
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/** @throw std::invalid_argument on an unknown level name. */
LogLevel logLevelFromString(const std::string &name);

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Each line is an object with "timestamp", "level", "message" and any
 * extra string fields passed to log().
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  /// Pass to init() to write lines to stdout instead of a file.
  static const std::string CONSOLE_ONLY_OUTPUT;

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  void log(LogLevel level, const std::string &message);
  /** Log with extra fields such as "path" or "chunk". */
  void log(LogLevel level, const std::string &message,
           const std::map<std::string, std::string> &fields);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  static void initLocked(const std::string &logFile, LogLevel level,
                         long long maxFileSize, int maxBackupFiles);
  std::string formatLine(LogLevel level, const std::string &message,
                         const std::map<std::string, std::string> &fields);
  void rotateIfNeeded();
  std::string getTimestamp();
  std::string levelToString(LogLevel level);

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif // BACKUPFORGE_LOGGER_H
