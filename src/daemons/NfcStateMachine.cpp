/* @file NfcStateMachine.cpp
 * @brief NFC reader FSM
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <chrono>

#include "core/ErrorMonitor.hpp"
#include "core/EventPublisher.hpp"
#include "daemons/NfcStateMachine.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
using std::chrono::milliseconds;
namespace names = hearo::protocols::names;

NfcStateMachine::NfcStateMachine(core::EventPublisher& events, core::ErrorMonitor& errors,
                                 TagReader& reader, const core::NfcConfig& cfg)
    : core::PeerStateMachine(events, errors, core::Backoff(cfg.retryInitialMs, cfg.retryMaxMs)),
      reader_(reader), tracker_(events, cfg) {}

const char* NfcStateMachine::stateName() const {
  switch (state_) {
  case State::Init:
    return "INIT";
  case State::Ready:
    return "READY";
  case State::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

void NfcStateMachine::initReader() {
  reader_.init();
  state_ = State::Ready;
  resetBackoff();
  errors_.clear("HW_NOT_FOUND");
  events_.publish(names::kNfcEventReady);
}

void NfcStateMachine::step(std::int64_t nowMs) {
  const milliseconds now{ nowMs };

  if (restart_) {
    restart_ = false;
    reader_.close();
    state_ = State::Init;
    resetBackoff();
  }

  switch (state_) {
  case State::Init:
    initReader();
    break;
  case State::Error:
    if (retryDue(nowMs))
      initReader();
    break;
  case State::Ready:
    if (auto uid = reader_.readUid())
      tracker_.seen(*uid, now);
    if (readFailing_) {
      readFailing_ = false;
      errors_.clear("I2C_TIMEOUT");
    }
    tracker_.update(now);
    break;
  }
}

void NfcStateMachine::onFailure(const core::PeerError& err, std::int64_t nowMs) {
  if (state_ == State::Ready && err.cls() == core::FailureClass::Transient) {
    readFailing_ = true;
    tracker_.update(milliseconds{ nowMs }); // no tag this cycle
    return;
  }
  state_ = State::Error;
  scheduleRetry(nowMs);
}

nlohmann::json NfcStateMachine::status(std::int64_t) const {
  return {
    { "state", stateName() },
    { "tag", tracker_.uid() && tracker_.present() ? nlohmann::json(*tracker_.uid())
                                                  : nlohmann::json(nullptr) },
    { "present", tracker_.present() },
  };
}
