#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Per-daemon fault aggregator & escalation helper.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hearo::core {

  /// What the escalation callback receives for each new fault.
  struct FailureReport {
    std::string code;    ///< short machine code, e.g. "I2C_TIMEOUT"
    std::string message; ///< human readable detail
    bool recovering{ true };
  };

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error code.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the bus doesn't get spammed; `clear()`
 *   re-arms every code once the fault condition is gone.
 * * `lastErrorCode()` survives `clear()` and is reported by PING.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const FailureReport&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that turns a fault into `<PREFIX>_EVENT_ERROR`.
    void registerEscalation(Escalation cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& code, const std::string& message,
                               bool recovering = true);

    /// Forget one code (it will escalate again next time).
    void clear(const std::string& code);
    void clear();

    std::string lastErrorCode() const;

  private:
    bool rememberIfNew(const std::string& code);

    Escalation escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::string lastCode_{};
    mutable std::mutex mtx_;
  };

} // namespace hearo::core
