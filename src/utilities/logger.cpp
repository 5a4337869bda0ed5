#include "utilities/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <nlohmann/json.hpp>
#include <new>

namespace arloader {

Logger *Logger::s_instance = nullptr;
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr << "[Logger::init] CRITICAL: allocation failed: " << bae.what()
              << std::endl;
  }
}

Logger &Logger::getInstance() {
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_instance)
      return *s_instance;
  }
  // Nobody called init(); fall back to stderr at WARN.
  init(CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    throw std::runtime_error("Logger not initialized. Call Logger::init() "
                             "first. Emergency init also failed.");
  }
  return *s_instance;
}

LogLevel Logger::levelFromString(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "trace")
    return LogLevel::TRACE;
  if (lower == "debug")
    return LogLevel::DEBUG;
  if (lower == "info")
    return LogLevel::INFO;
  if (lower == "error")
    return LogLevel::ERROR;
  if (lower == "fatal")
    return LogLevel::FATAL;
  return LogLevel::WARN;
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

void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0)
    return;
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize)
    return;

  logFileStream.close();
  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOld = logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(tooOld.c_str());
    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::rename(oldPath.c_str(), newPath.c_str());
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  nlohmann::json line = {{"timestamp", getTimestamp()},
                         {"level", levelToString(level)},
                         {"message", message}};
  // Messages may carry file names that are not valid UTF-8.
  const std::string jsonLine =
      line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cerr << jsonLine << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << jsonLine << std::endl;
  }
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}

} // namespace arloader
