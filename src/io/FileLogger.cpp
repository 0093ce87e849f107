/* @file FileLogger.cpp
 * @brief buffered append + rotation
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

// Hearo headers
#include "io/FileLogger.hpp"

using namespace hearo::io;

FileLogger::~FileLogger() { close(); }

bool FileLogger::open(const std::string& path, std::size_t maxBytes, unsigned int backups) {
  close();

  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);

  fp_ = std::fopen(path.c_str(), "a");
  if (!fp_) {
    lastError_ = "open " + path + ": " + std::strerror(errno);
    return false;
  }
  path_ = path;
  maxBytes_ = maxBytes;
  backups_ = backups;

  auto size = std::filesystem::file_size(path, ec);
  written_ = ec ? 0 : static_cast<std::size_t>(size);
  buffer_.reserve(kBufferSize);
  return true;
}

void FileLogger::write(const std::string& line) {
  if (!fp_)
    return;
  if (maxBytes_ > 0 && written_ > 0 && written_ + line.size() > maxBytes_) {
    if (!rotate())
      return;
  }
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  written_ += line.size();
  if (buffer_.size() >= kBufferSize)
    flush();
}

bool FileLogger::flush() {
  if (!fp_)
    return false;
  if (!buffer_.empty()) {
    std::size_t n = std::fwrite(buffer_.data(), 1, buffer_.size(), fp_);
    buffer_.clear();
    if (n == 0) {
      lastError_ = std::string("fwrite: ") + std::strerror(errno);
      return false;
    }
  }
  if (std::fflush(fp_) != 0) {
    lastError_ = std::string("fflush: ") + std::strerror(errno);
    return false;
  }
  return true;
}

// path.(N-1) -> path.N ... path -> path.1, then reopen a fresh path
bool FileLogger::rotate() {
  flush();
  std::fclose(fp_);
  fp_ = nullptr;

  std::error_code ec;
  if (backups_ == 0) {
    std::filesystem::remove(path_, ec);
  } else {
    std::filesystem::remove(path_ + "." + std::to_string(backups_), ec);
    for (unsigned int i = backups_; i > 1; --i) {
      std::string from = path_ + "." + std::to_string(i - 1);
      if (std::filesystem::exists(from, ec))
        std::filesystem::rename(from, path_ + "." + std::to_string(i), ec);
    }
    std::filesystem::rename(path_, path_ + ".1", ec);
  }
  if (ec)
    lastError_ = "rotate " + path_ + ": " + ec.message();

  fp_ = std::fopen(path_.c_str(), "w");
  if (!fp_) {
    lastError_ = "reopen " + path_ + ": " + std::strerror(errno);
    return false;
  }
  written_ = 0;
  return true;
}

void FileLogger::close() {
  if (fp_) {
    flush();
    std::fclose(fp_);
  }
  fp_ = nullptr;
  buffer_.clear();
}
