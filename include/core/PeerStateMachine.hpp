#pragma once
/** @file  PeerStateMachine.hpp
 *  @brief Abstract base class for the polled peer state-machines (Wi-Fi, player, NFC).
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>

#include <nlohmann/json.hpp>

#include "core/Backoff.hpp"
#include "core/PeerError.hpp"

namespace hearo::core { // forward decls only, keeps dependency light
  class EventPublisher;
  class ErrorMonitor;
} // namespace hearo::core

namespace hearo::core {

  /**
 * @class PeerStateMachine
 * @brief Common shape of every peer FSM.
 *
 *  * Runs synchronously on the daemon loop thread; `tick()` is called once
 *    per period with the current steady time.
 *  * Collaborator failures never escape `tick()`: a PeerError is reported
 *    to the ErrorMonitor and handed to `onFailure()`; any other exception is
 *    treated as a transient failure.
 *  * `status()` is a side-effect-free snapshot for the `*_STATUS` command.
 */
  class PeerStateMachine {
  public:
    PeerStateMachine(EventPublisher& events, ErrorMonitor& errors, Backoff backoff);
    virtual ~PeerStateMachine() = default;

    void tick(std::int64_t nowMs);

    virtual nlohmann::json status(std::int64_t nowMs) const = 0;
    virtual const char* stateName() const = 0;

  protected:
    virtual void step(std::int64_t nowMs) = 0;
    virtual void onFailure(const PeerError& err, std::int64_t nowMs) = 0;

    /// Run \p fn; a failure takes the same path as one thrown from step().
    template <typename Fn> bool guarded(std::int64_t nowMs, Fn&& fn);

    bool retryDue(std::int64_t nowMs) const { return nowMs >= retryAt_; }
    void scheduleRetry(std::int64_t nowMs) { retryAt_ = nowMs + backoff_.next(); }
    void resetBackoff() {
      backoff_.reset();
      retryAt_ = 0;
    }
    std::int64_t retryAt() const { return retryAt_; }

    void report(const PeerError& err, std::int64_t nowMs);

    EventPublisher& events_;
    ErrorMonitor& errors_;
    Backoff backoff_;

  private:
    std::int64_t retryAt_{ 0 };
  };

  template <typename Fn> bool PeerStateMachine::guarded(std::int64_t nowMs, Fn&& fn) {
    try {
      fn();
      return true;
    } catch (const PeerError& e) {
      report(e, nowMs);
    } catch (const std::exception& e) {
      report(PeerError(FailureClass::Transient, "INTERNAL_ERROR", e.what()), nowMs);
    }
    return false;
  }

} // namespace hearo::core
