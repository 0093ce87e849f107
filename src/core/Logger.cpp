/* @file Logger.cpp
 * @brief timestamped, levelled log lines to stderr and FileLogger
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

// Hearo headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

using namespace hearo::core;

namespace {
  std::string timestampNow() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    localtime_r(&secs, &tm);
    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
    return buf;
  }
} // namespace

const char* hearo::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::None:
    return "NONE";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> hearo::core::parseLevel(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "none")
    return LogLevel::None;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "debug")
    return LogLevel::Debug;
  return std::nullopt;
}

Logger::Logger(std::string tag, LogLevel level)
    : tag_(std::move(tag)), level_(level), console_(&std::cerr) {}

Logger::~Logger() { flush(); }

bool Logger::openFile(const std::string& path, std::size_t maxBytes, unsigned int backups) {
  auto file = std::make_unique<io::FileLogger>();
  if (!file->open(path, maxBytes, backups)) {
    error("cannot open log file: " + file->lastError());
    return false;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  file_ = std::move(file);
  return true;
}

void Logger::setConsole(std::ostream* os) {
  std::lock_guard<std::mutex> lock(mtx_);
  console_ = os;
}

void Logger::log(LogLevel level, std::string_view message) {
  if (!enabled(level))
    return;

  std::string line = timestampNow();
  line += " [";
  line += toString(level);
  line += "] ";
  line += tag_;
  line += ": ";
  line += message;
  line += '\n';

  std::lock_guard<std::mutex> lock(mtx_);
  if (console_) {
    *console_ << line;
    console_->flush();
  }
  if (file_) {
    file_->write(line);
    if (level >= LogLevel::Warn)
      file_->flush();
  }
}

void Logger::flush() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (file_ && !file_->flush() && console_)
    *console_ << "log file flush failed: " << file_->lastError() << '\n';
}
