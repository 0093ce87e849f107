#pragma once
/** @file  Logger.hpp
 *  @brief Levelled line logger: console (stderr) plus optional rotating file.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace hearo {
  namespace io {
    class FileLogger;
  }

  namespace core {

    enum class LogLevel { Debug, Info, Warn, Error, None };

    const char* toString(LogLevel level);

    /// Accepts none|error|warn|warning|info|debug (case-insensitive).
    std::optional<LogLevel> parseLevel(std::string_view name);

    /**
     * @class Logger
     * @brief One per daemon; every line is `YYYY-MM-DD HH:MM:SS.mmm [LEVEL] tag: message`.
     *
     *  * Level is adjustable at runtime (`*_CMD_SET_DEBUG`).
     *  * Console sink defaults to std::cerr and can be redirected (tests).
     *  * The file sink is flushed after every Warn/Error line and on destruction.
     */
    class Logger {

    public:
      explicit Logger(std::string tag, LogLevel level = LogLevel::Info);
      ~Logger();

      // --- public API ---
      /// Attach the rotating file sink. @returns false if the file cannot be opened.
      bool openFile(const std::string& path, std::size_t maxBytes, unsigned int backups);
      void setConsole(std::ostream* os); ///< nullptr silences the console
      void setLevel(LogLevel level) { level_ = level; }
      LogLevel level() const { return level_; }
      const std::string& tag() const { return tag_; }

      bool enabled(LogLevel level) const {
        return level != LogLevel::None && level >= level_;
      }

      void log(LogLevel level, std::string_view message);

      void debug(std::string_view m) { log(LogLevel::Debug, m); }
      void info(std::string_view m) { log(LogLevel::Info, m); }
      void warn(std::string_view m) { log(LogLevel::Warn, m); }
      void error(std::string_view m) { log(LogLevel::Error, m); }

      void flush();

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      std::string tag_;
      LogLevel level_;
      std::ostream* console_;
      std::unique_ptr<io::FileLogger> file_;
      std::mutex mtx_;
    };

  } // namespace core
} // namespace hearo
