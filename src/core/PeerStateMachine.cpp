/* @file PeerStateMachine.cpp
 * @brief tick wrapper that keeps collaborator failures inside the FSM
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "core/PeerStateMachine.hpp"
#include "core/ErrorMonitor.hpp"

using namespace hearo::core;

PeerStateMachine::PeerStateMachine(EventPublisher& events, ErrorMonitor& errors, Backoff backoff)
    : events_(events), errors_(errors), backoff_(backoff) {}

void PeerStateMachine::tick(std::int64_t nowMs) {
  guarded(nowMs, [&] { step(nowMs); });
}

void PeerStateMachine::report(const PeerError& err, std::int64_t nowMs) {
  errors_.notifyFailure(err.code(), err.what(), true);
  onFailure(err, nowMs);
}
