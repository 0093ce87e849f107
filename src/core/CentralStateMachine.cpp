/* @file CentralStateMachine.cpp
 * @brief global state fold: events in, state changes + peer commands out
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <initializer_list>

// Hearo headers
#include "core/CentralStateMachine.hpp"
#include "core/CommandClient.hpp"
#include "core/EventPublisher.hpp"
#include "core/Logger.hpp"
#include "protocols/Names.hpp"

using namespace hearo::core;
namespace names = hearo::protocols::names;
using hearo::protocols::Peer;

namespace {
  constexpr std::int64_t kStatusTimeoutMs = 2000;

  bool isOneOf(const std::string& name, std::initializer_list<std::string_view> list) {
    return std::find(list.begin(), list.end(), name) != list.end();
  }

  hearo::protocols::Event synthetic(std::string_view name) {
    return hearo::protocols::Event{ {}, std::string(name), nlohmann::json::object() };
  }
} // namespace

const char* hearo::core::toString(SystemState s) {
  switch (s) {
  case SystemState::Initializing:
    return "INITIALIZING";
  case SystemState::NoNetwork:
    return "NO_NETWORK";
  case SystemState::Offline:
    return "OFFLINE";
  case SystemState::ReadyPaused:
    return "READY_PAUSED";
  case SystemState::Playing:
    return "PLAYING";
  case SystemState::ShuttingDown:
    return "SHUTTING_DOWN";
  case SystemState::Faulted:
    return "FAULTED";
  }
  return "UNKNOWN";
}

CentralStateMachine::CentralStateMachine(EventPublisher& events, CommandClient& commands,
                                         HcsmConfig config, std::string replyPath, Logger& log)
    : events_(events), commands_(commands), config_(std::move(config)),
      replyPath_(std::move(replyPath)), log_(log) {}

void CentralStateMachine::begin() {
  log_.info(std::string("start in ") + toString(state_));
  events_.publish(names::kHcsmEventStateChanged, { { "old", nullptr }, { "new", toString(state_) } });
  queryNetwork();
}

void CentralStateMachine::shutdown() { transitionTo(SystemState::ShuttingDown); }

//---helpers-------------------------------------------------------------

bool CentralStateMachine::isRequired(Peer p) const {
  return std::find(config_.requiredPeers.begin(), config_.requiredPeers.end(), p) !=
         config_.requiredPeers.end();
}

bool CentralStateMachine::allRequiredStarted() const {
  return std::all_of(config_.requiredPeers.begin(), config_.requiredPeers.end(),
                     [this](Peer p) { return started_.count(p) != 0; });
}

void CentralStateMachine::transitionTo(SystemState next) {
  if (next == state_)
    return;

  const SystemState old = state_;
  state_ = next;
  log_.info(std::string("state ") + toString(old) + " -> " + toString(next));
  events_.publish(names::kHcsmEventStateChanged,
                  { { "old", toString(old) }, { "new", toString(next) } });

  switch (next) {
  case SystemState::ShuttingDown:
    events_.publish(names::kHcsmEventShutdown);
    break;
  case SystemState::Offline:
    queryPlayer();
    break;
  default:
    break;
  }
}

void CentralStateMachine::sendPlayback(std::string_view cmd, nlohmann::json payload) {
  if (commands_.send(Peer::PLSM, cmd, std::move(payload)).empty())
    log_.warn(std::string(cmd) + " not delivered to plsm");
}

void CentralStateMachine::queryNetwork() {
  if (commands_.send(Peer::WSM, names::kWsmCommandStatus, nlohmann::json::object(), replyPath_,
                     kStatusTimeoutMs)
          .empty())
    log_.warn("wifi status query not delivered");
}

void CentralStateMachine::queryPlayer() {
  if (commands_.send(Peer::PLSM, names::kPlsmCommandStatus, nlohmann::json::object(), replyPath_,
                     kStatusTimeoutMs)
          .empty())
    log_.warn("player status query not delivered");
}

void CentralStateMachine::batteryCritical() {
  log_.warn("battery critical, shutting down");
  sendPlayback(names::kPlsmCommandStop);
  transitionTo(SystemState::ShuttingDown);
}

void CentralStateMachine::checkInitDone() {
  if (state_ != SystemState::Initializing || !allRequiredStarted() || !networkSeen_)
    return;

  transitionTo(SystemState::NoNetwork);
  if (!initiated_) {
    initiated_ = true;
    events_.publish(names::kHcsmEventInitiated);
  }
  // connectivity reported while still initialising
  if (connected_)
    transitionTo(SystemState::Offline);
}

//---event fold----------------------------------------------------------

void CentralStateMachine::handleEvent(const protocols::Event& ev) {
  if (state_ == SystemState::ShuttingDown)
    return;

  const std::string& name = ev.name;

  if (auto p = protocols::peerFromLifecycleEvent(name, names::kDaemonStarted)) {
    if (started_.insert(*p).second)
      log_.info(std::string("daemon started: ") + protocols::toString(*p));
  } else if (auto p = protocols::peerFromLifecycleEvent(name, names::kDaemonStopped)) {
    started_.erase(*p);
    if (isRequired(*p) && state_ != SystemState::Initializing && state_ != SystemState::Faulted) {
      log_.warn(std::string("required daemon stopped: ") + protocols::toString(*p));
      transitionTo(SystemState::Faulted);
      return;
    }
  }

  if (name == names::kWsmEventWifiConnected) {
    networkSeen_ = true;
    connected_ = true;
  } else if (name == names::kWsmEventWifiLost) {
    networkSeen_ = true;
    connected_ = false;
  }

  switch (state_) {
  case SystemState::Initializing:
    onInitializing(name);
    break;
  case SystemState::NoNetwork:
    onNoNetwork(name);
    break;
  case SystemState::Offline:
    onOffline(name);
    break;
  case SystemState::ReadyPaused:
    onReadyPaused(name, ev.payload);
    break;
  case SystemState::Playing:
    onPlaying(name, ev.payload);
    break;
  case SystemState::Faulted:
    if (allRequiredStarted()) {
      networkSeen_ = false;
      transitionTo(SystemState::Initializing);
      queryNetwork();
    }
    break;
  case SystemState::ShuttingDown:
    break;
  }
}

void CentralStateMachine::handleNetworkStatus(const nlohmann::json& status) {
  if (!status.is_object()) {
    log_.warn("ignoring malformed wifi status");
    return;
  }
  const auto it = status.find("state");
  const bool connected = it != status.end() && it->is_string() && *it == "CONNECTED";
  handleEvent(synthetic(connected ? names::kWsmEventWifiConnected : names::kWsmEventWifiLost));
}

void CentralStateMachine::handlePlayerStatus(const nlohmann::json& status) {
  if (!status.is_object()) {
    log_.warn("ignoring malformed player status");
    return;
  }
  const auto it = status.find("auth");
  if (it != status.end() && it->is_string() && *it == "AUTH_OK")
    handleEvent(synthetic(names::kPlsmEventAuthenticated));
}

//---per-state handlers--------------------------------------------------

void CentralStateMachine::onInitializing(const std::string& name) {
  if (isOneOf(name, { names::kNfcEventTagAdded, names::kNfcEventTagPresent,
                      names::kNfcEventTagRemoved, names::kBdEventButton }))
    return;
  checkInitDone();
}

void CentralStateMachine::onNoNetwork(const std::string& name) {
  if (name == names::kWsmEventWifiConnected)
    transitionTo(SystemState::Offline);
  else if (name == names::kPowdEventBatteryCritical)
    batteryCritical();
}

void CentralStateMachine::onOffline(const std::string& name) {
  if (name == names::kPlsmEventAuthenticated)
    transitionTo(SystemState::ReadyPaused);
  else if (name == names::kWsmEventWifiLost)
    transitionTo(SystemState::NoNetwork);
  else if (name == names::kPowdEventBatteryCritical)
    batteryCritical();
}

void CentralStateMachine::onReadyPaused(const std::string& name, const nlohmann::json& payload) {
  if (name == names::kNfcEventTagAdded) {
    onTagAdded(payload);
  } else if (name == names::kNfcEventTagRemoved) {
    currentTag_.reset();
  } else if (name == names::kPlsmEventTagResolved) {
    transitionTo(SystemState::Playing);
  } else if (name == names::kWsmEventWifiLost) {
    transitionTo(SystemState::NoNetwork);
  } else if (isOneOf(name, { names::kPlsmEventDisconnected, names::kPlsmEventAuthLost,
                             names::kPlsmEventAuthFailed })) {
    transitionTo(SystemState::Offline);
  } else if (name == names::kPowdEventBatteryCritical) {
    batteryCritical();
  }
}

void CentralStateMachine::onPlaying(const std::string& name, const nlohmann::json& payload) {
  if (name == names::kNfcEventTagAdded) {
    onTagAdded(payload);
  } else if (name == names::kPlsmEventPlayStopped) {
    transitionTo(SystemState::ReadyPaused);
  } else if (name == names::kNfcEventTagRemoved) {
    currentTag_.reset();
    sendPlayback(names::kPlsmCommandStop);
    transitionTo(SystemState::ReadyPaused);
  } else if (name == names::kBdEventButton) {
    onButton(payload);
  } else if (name == names::kWsmEventWifiLost) {
    sendPlayback(names::kPlsmCommandStop);
    transitionTo(SystemState::NoNetwork);
  } else if (isOneOf(name, { names::kPlsmEventDisconnected, names::kPlsmEventAuthLost,
                             names::kPlsmEventAuthFailed })) {
    transitionTo(SystemState::Offline);
  } else if (name == names::kPowdEventBatteryCritical) {
    batteryCritical();
  }
}

void CentralStateMachine::onTagAdded(const nlohmann::json& payload) {
  const auto it = payload.find("uid");
  if (it == payload.end() || !it->is_string() || it->get<std::string>().empty()) {
    log_.warn("tag event without uid ignored");
    return;
  }
  currentTag_ = it->get<std::string>();
  sendPlayback(names::kPlsmCommandPlayTag, { { "uid", *currentTag_ } });
}

void CentralStateMachine::onButton(const nlohmann::json& payload) {
  const auto b = payload.find("button");
  const auto i = payload.find("interaction");
  if (b == payload.end() || i == payload.end() || !b->is_string() || !i->is_string())
    return;

  const auto button = b->get<std::string>();
  const auto interaction = i->get<std::string>();
  if (button != "NEXT" && button != "PREV")
    return;

  if (interaction == "SHORT_PRESS") {
    sendPlayback(button == "NEXT" ? names::kPlsmCommandNext : names::kPlsmCommandPrevious);
  } else if (interaction == "LONG_PRESS" || interaction == "HOLD_TICK") {
    const std::int64_t delta = button == "NEXT" ? config_.seekDeltaMs : -config_.seekDeltaMs;
    sendPlayback(names::kPlsmCommandSeek, { { "delta_ms", delta } });
  }
}

nlohmann::json CentralStateMachine::snapshot() const {
  nlohmann::json peers = nlohmann::json::array();
  for (auto p : started_)
    peers.push_back(protocols::toString(p));
  return {
    { "state", toString(state_) },
    { "initiated", initiated_ },
    { "network_seen", networkSeen_ },
    { "network_connected", connected_ },
    { "current_tag", currentTag_ ? nlohmann::json(*currentTag_) : nlohmann::json(nullptr) },
    { "started", std::move(peers) },
  };
}
