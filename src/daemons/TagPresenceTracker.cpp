/* @file TagPresenceTracker.cpp
 * @brief read results -> debounced tag lifecycle events
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <algorithm>

#include "core/EventPublisher.hpp"
#include "daemons/TagPresenceTracker.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
using std::chrono::milliseconds;
namespace names = hearo::protocols::names;

hearo::io::ClassifierConfig TagPresenceTracker::classifierConfig(const core::NfcConfig& cfg) {
  io::ClassifierConfig c;
  c.debounce = milliseconds{ cfg.debounceMs };
  c.shortMin = milliseconds{ 0 };
  c.longThreshold = milliseconds{ 0 }; // engaged == held: heartbeats start at once
  c.holdTickInterval = milliseconds{ cfg.heartbeatMs };
  return c;
}

TagPresenceTracker::TagPresenceTracker(core::EventPublisher& events, const core::NfcConfig& cfg)
    : events_(events), classifier_(classifierConfig(cfg)),
      window_(milliseconds{ std::max(1, cfg.missReleaseMs - cfg.debounceMs) }) {
  classifier_.registerEdgeCallback(
      [this](io::InteractionClassifier::Edge edge, milliseconds) { onEdge(edge); });
  classifier_.registerCallback([this](const io::InteractionEvent& ev) {
    if (ev.kind == io::Interaction::HoldTick)
      onTick(ev);
  });
}

void TagPresenceTracker::seen(const std::string& uid, milliseconds now) {
  if (uid_ && *uid_ != uid) {
    if (announced_)
      events_.publish(names::kNfcEventTagRemoved, { { "uid", *uid_ }, { "reason", "replaced" } });
    announced_ = false;
    classifier_.reset(now);
  }
  uid_ = uid;
  lastSeen_ = now;
}

void TagPresenceTracker::update(milliseconds now) {
  const bool level = uid_.has_value() && (now - lastSeen_) < window_;
  classifier_.update(level, now);

  // a candidate that never made it through the debounce is forgotten
  if (!level && !announced_ && classifier_.state() == io::InteractionClassifier::State::Idle)
    uid_.reset();
}

void TagPresenceTracker::onEdge(io::InteractionClassifier::Edge edge) {
  if (!uid_)
    return;
  if (edge == io::InteractionClassifier::Edge::Engaged) {
    announced_ = true;
    events_.publish(names::kNfcEventTagAdded, { { "uid", *uid_ }, { "tech", "ISO14443" } });
  } else if (announced_) {
    announced_ = false;
    events_.publish(names::kNfcEventTagRemoved, { { "uid", *uid_ }, { "reason", "timeout" } });
  }
}

void TagPresenceTracker::onTick(const io::InteractionEvent& ev) {
  if (announced_ && uid_)
    events_.publish(names::kNfcEventTagPresent,
                    { { "uid", *uid_ }, { "present_ms", ev.duration.count() } });
}
