#pragma once
/** @file  GPIOInput.hpp
 *  @brief One Linux GPIO input line read through the gpiochip character device.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <optional>
#include <string>

namespace hearo {
  namespace io {

    /**
 * @class GPIOInput
 * @brief Owns one requested GPIO line handle and samples its level.
 *
 *  * Non-blocking: `readLevel()` is called periodically by the owner loop.
 *  * Levels are reported as *asserted* (true) / *released* (false); for a
 *    pull-up button wired to ground that means activeLow = true.
 *  * No copy, move-enabled (sole owner of the line handle).
 */
    class GPIOInput {
    public:
      GPIOInput() = default;
      virtual ~GPIOInput(); ///< auto-release line

      /** @returns false if the GPIO chip/line cannot be opened. */
      virtual bool open(const std::string& chip, ///< e.g. "/dev/gpiochip0"
                        unsigned int line,       ///< BCM line offset
                        bool activeLow = true,   ///< pressed == electrical low
                        const std::string& consumer = "hearo");

      /** Current asserted state, std::nullopt when the ioctl fails. */
      virtual std::optional<bool> readLevel();

      void close();

      bool isOpen() const { return fd_ >= 0; }
      const std::string& lastError() const { return lastError_; }

      // ─── non-copyable, move-enabled ───────────────────────────────────────────
      GPIOInput(const GPIOInput&) = delete;
      GPIOInput& operator=(const GPIOInput&) = delete;
      GPIOInput(GPIOInput&& other) noexcept;
      GPIOInput& operator=(GPIOInput&& other) noexcept;

    protected:
      int fd_{ -1 }; ///< line handle FD (-1 = closed)
      std::string lastError_{};
    };

  } // namespace io
} // namespace hearo
