#include "utilities/logger.h"
#include "utilities/json.hpp"
#include <cstdio>
#include <ctime>
#include <new>
#include <string>
#include <vector>

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

LogLevel logLevelFromString(const std::string &name) {
  if (name == "trace" || name == "TRACE")
    return LogLevel::TRACE;
  if (name == "debug" || name == "DEBUG")
    return LogLevel::DEBUG;
  if (name == "info" || name == "INFO")
    return LogLevel::INFO;
  if (name == "warn" || name == "WARN")
    return LogLevel::WARN;
  if (name == "error" || name == "ERROR")
    return LogLevel::ERROR;
  if (name == "fatal" || name == "FATAL")
    return LogLevel::FATAL;
  throw std::invalid_argument("Unknown log level: " + name);
}

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  initLocked(logFile, level, maxFileSizeVal, maxBackupFilesVal);
}

// Caller holds s_mutex.
void Logger::initLocked(const std::string &logFile, LogLevel level,
                        long long maxFileSizeVal, int maxBackupFilesVal) {
  delete s_instance;
  s_instance = nullptr;
  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr
        << "[Logger::init] CRITICAL: new Logger FAILED due to std::bad_alloc: "
        << bae.what() << ". s_instance REMAINS nullptr." << std::endl;
  }
}

Logger &Logger::getInstance() {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
                 "Logger::init(). Falling back to console output."
              << std::endl;
    initLocked(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN, 0, 0);
    if (!s_instance) {
      throw std::runtime_error("Logger not initialized. Call Logger::init() "
                               "first. Emergency init also failed.");
    }
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::logLevel() const {
  std::lock_guard<std::mutex> lock(s_mutex);
  return currentLogLevel;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

std::string
Logger::formatLine(LogLevel level, const std::string &message,
                   const std::map<std::string, std::string> &fields) {
  JsonValue obj(JsonValueType::Object);
  JsonValue ts(JsonValueType::String);
  ts.string_value = getTimestamp();
  JsonValue lvl(JsonValueType::String);
  lvl.string_value = levelToString(level);
  JsonValue msg(JsonValueType::String);
  msg.string_value = message;
  obj.InsertIntoObject("timestamp", &ts);
  obj.InsertIntoObject("level", &lvl);
  obj.InsertIntoObject("message", &msg);

  // InsertIntoObject takes pointers; keep the values alive until ToString().
  std::vector<JsonValue> extras;
  extras.reserve(fields.size());
  for (const auto &kv : fields) {
    extras.emplace_back(JsonValueType::String);
    extras.back().string_value = kv.second;
    obj.InsertIntoObject(kv.first, &extras.back());
  }
  return obj.ToString();
}

void Logger::log(LogLevel level, const std::string &message) {
  log(level, message, {});
}

void Logger::log(LogLevel level, const std::string &message,
                 const std::map<std::string, std::string> &fields) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }
  const std::string jsonLine = formatLine(level, message, fields);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  }
}

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0) {
    return;
  }
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize) {
    return;
  }
  logFileStream.close();

  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    // The oldest backup falls off; the rest shift up by one.
    std::string oldestPath = logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(oldestPath.c_str());

    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        std::remove(newPath.c_str());
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm utcTime{};
  gmtime_r(&currentTime, &utcTime);
  char timestamp[24];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%SZ", &utcTime);
  return std::string(timestamp);
}
