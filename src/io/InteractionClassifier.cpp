/* @file InteractionClassifier.cpp
 * @brief debounce / classification state machine
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "io/InteractionClassifier.hpp"

using namespace hearo::io;
using std::chrono::milliseconds;

const char* hearo::io::toString(Interaction i) {
  switch (i) {
  case Interaction::ShortPress:
    return "SHORT_PRESS";
  case Interaction::LongPress:
    return "LONG_PRESS";
  case Interaction::HoldTick:
    return "HOLD_TICK";
  }
  return "UNKNOWN";
}

void InteractionClassifier::emit(Interaction kind, milliseconds duration) {
  ++sequence_;
  if (cb_)
    cb_(InteractionEvent{ kind, duration, sequence_ });
}

// release confirmed: classify the whole press by its raw length
void InteractionClassifier::finishPress(milliseconds now) {
  const milliseconds duration = lastChange_ - pressStart_;
  if (duration >= cfg_.longThreshold) {
    emit(Interaction::LongPress, duration);
  } else if (duration >= cfg_.shortMin) {
    emit(Interaction::ShortPress, duration);
  }
  state_ = State::Idle;
  emitEdge(Edge::Released, now);
}

void InteractionClassifier::update(bool pressed, milliseconds now) {
  if (pressed != lastLevel_) {
    lastLevel_ = pressed;
    lastChange_ = now;
  }
  const bool stable = (now - lastChange_) >= cfg_.debounce;

  if (state_ == State::Idle) {
    if (!(pressed && stable))
      return;
    state_ = State::Pressed;
    pressStart_ = lastChange_;
    emitEdge(Edge::Engaged, now);
    // fall through: a zero long threshold goes straight on to LongHeld
  }

  if (state_ == State::Pressed) {
    if (!pressed) {
      if (stable)
        finishPress(now);
      return;
    }
    if (now - pressStart_ < cfg_.longThreshold)
      return;
    state_ = State::LongHeld;
    lastHoldTick_ = pressStart_ + cfg_.longThreshold;
    return;
  }

  // State::LongHeld
  if (pressed) {
    if (cfg_.holdTickInterval.count() > 0 && now - lastHoldTick_ >= cfg_.holdTickInterval) {
      lastHoldTick_ += cfg_.holdTickInterval;
      emit(Interaction::HoldTick, now - pressStart_);
    }
    return;
  }
  // ticks falling due up to the release edge still belong to the press
  if (cfg_.holdTickInterval.count() > 0) {
    while (lastHoldTick_ + cfg_.holdTickInterval <= lastChange_) {
      lastHoldTick_ += cfg_.holdTickInterval;
      emit(Interaction::HoldTick, lastHoldTick_ - pressStart_);
    }
  }
  if (stable)
    finishPress(now);
}

void InteractionClassifier::reset(milliseconds now) {
  state_ = State::Idle;
  lastLevel_ = false;
  lastChange_ = now;
}
