#pragma once
#ifndef ARLOADER_LOGGER_H
#define ARLOADER_LOGGER_H
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace arloader {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Each record is written as {"timestamp","level","message"}. When the log
 * path is CONSOLE_ONLY_OUTPUT records go to stderr so that stdout stays
 * reserved for command output.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT;

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  /// Parses "trace".."fatal" (case-insensitive); unknown names map to WARN.
  static LogLevel levelFromString(const std::string &name);

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  static std::string levelToString(LogLevel level);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace arloader

#endif
