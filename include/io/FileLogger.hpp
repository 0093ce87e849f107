#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered line writer with size-based rotation.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace hearo {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file, buffers writes, and flushes on demand.
 *
 *  * Appends; an existing file keeps its content.
 *  * When the file would exceed `maxBytes` it is rotated to `path.1`,
 *    `path.1` to `path.2` ... up to `backups` generations (oldest dropped).
 *  * `maxBytes == 0` disables rotation.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kBufferSize = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path, std::size_t maxBytes = 0, unsigned int backups = 0);

      /** Queues one line (caller includes trailing '\n'). */
      void write(const std::string& line);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }
      const std::string& path() const { return path_; }
      const std::string& lastError() const { return lastError_; }

      //---non-copyable-----------------------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;

    private:
      bool rotate();

      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
      std::string path_{};
      std::string lastError_{};
      std::size_t maxBytes_{ 0 };
      unsigned int backups_{ 0 };
      std::size_t written_{ 0 }; ///< bytes in the current file, buffer included
    };

  } // namespace io
} // namespace hearo
