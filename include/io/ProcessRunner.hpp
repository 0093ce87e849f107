#pragma once
/** @file  ProcessRunner.hpp
 *  @brief Runs an external helper (wpa_cli, iw, playback helper ...) with a deadline.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hearo {
  namespace io {

    struct ProcessResult {
      int exitCode{ -1 };    ///< exit status, 128+N when killed by signal N
      bool timedOut{ false }; ///< child was killed after the deadline
      std::string output;    ///< captured stdout (stderr is discarded)
    };

    /**
 * @class ProcessRunner
 * @brief fork/exec + pipe capture; the caller's loop is blocked at most `timeout`.
 *
 *  * No shell: argv[0] is looked up in PATH, arguments are passed verbatim.
 *  * A child that cannot exec exits with 127.
 *  * Virtual so collaborators can be tested with a scripted fake.
 */
    class ProcessRunner {
    public:
      static constexpr std::size_t kMaxOutput = 64 * 1024;

      virtual ~ProcessRunner() = default;

      /// @returns std::nullopt only when the child could not be started at all.
      virtual std::optional<ProcessResult> run(const std::vector<std::string>& argv,
                                               std::chrono::milliseconds timeout);

      const std::string& lastError() const { return lastError_; }

    protected:
      std::string lastError_{};
    };

  } // namespace io
} // namespace hearo
