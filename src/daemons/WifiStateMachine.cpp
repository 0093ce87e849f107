/* @file WifiStateMachine.cpp
 * @brief Wi-Fi station / AP FSM
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include "core/ErrorMonitor.hpp"
#include "core/EventPublisher.hpp"
#include "daemons/WifiStateMachine.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
using hearo::core::FailureClass;
using hearo::core::PeerError;
namespace names = hearo::protocols::names;

namespace {
  constexpr const char* kStackUnavailable = "WIFI_STACK_UNAVAILABLE";

  nlohmann::json orNull(const std::string& s) {
    return s.empty() ? nlohmann::json(nullptr) : nlohmann::json(s);
  }
} // namespace

WifiStateMachine::WifiStateMachine(core::EventPublisher& events, core::ErrorMonitor& errors,
                                   WifiControl& control, core::WifiConfig cfg)
    : core::PeerStateMachine(events, errors,
                             core::Backoff(cfg.backoffInitialMs, cfg.backoffMaxMs)),
      control_(control), cfg_(std::move(cfg)) {}

const char* WifiStateMachine::stateName() const {
  switch (state_) {
  case State::Init:
    return "INIT";
  case State::ApMode:
    return "AP_MODE";
  case State::Connected:
    return "CONNECTED";
  case State::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

void WifiStateMachine::transitionTo(State next) { state_ = next; }

void WifiStateMachine::announceOffline(const std::string& reason) {
  if (announced_)
    return;
  announced_ = true;
  events_.publish(names::kWsmEventWifiLost, { { "reason", reason },
                                              { "ssid", orNull(station_.ssid) },
                                              { "ip", orNull(station_.ip) },
                                              { "fail_streak", failStreak_ } });
}

void WifiStateMachine::enterApMode() {
  transitionTo(State::ApMode);
  resetBackoff();
  nextStationCheck_ = 0;
}

void WifiStateMachine::step(std::int64_t nowMs) {
  if (!startedAt_)
    startedAt_ = nowMs;

  switch (state_) {
  case State::Init:
  case State::Error:
    if (state_ == State::Error && !retryDue(nowMs))
      break;
    if (!control_.stackAvailable())
      throw PeerError(FailureClass::ResourceUnavailable, kStackUnavailable, "wpa_cli not found");
    errors_.clear(kStackUnavailable);
    enterApMode();
    handleApMode(nowMs);
    break;
  case State::ApMode:
    handleApMode(nowMs);
    break;
  case State::Connected:
    handleConnected(nowMs);
    break;
  }
}

void WifiStateMachine::probe(std::int64_t nowMs) {
  lastCheck_ = nowMs;
  reachable_ = control_.internetReachable();
  failStreak_ = reachable_ ? 0 : failStreak_ + 1;
}

void WifiStateMachine::startAp() {
  control_.startAp();
  apActive_ = true;
  events_.publish(names::kWsmEventApStarted, { { "ssid", cfg_.apSsid },
                                               { "channel", cfg_.apChannel },
                                               { "security", cfg_.apSecurity } });
}

void WifiStateMachine::stopAp(std::int64_t nowMs, const std::string& reason) {
  const bool clean = guarded(nowMs, [&] { control_.stopAp(); });
  apActive_ = false;
  events_.publish(names::kWsmEventApStopped, { { "reason", reason }, { "clean", clean } });
}

void WifiStateMachine::handleApMode(std::int64_t nowMs) {
  if (nowMs >= nextStationCheck_) {
    nextStationCheck_ = nowMs + backoff_.next();
    station_ = control_.station();
    if (station_.connected)
      probe(nowMs);
    else
      control_.reconnect();

    if (!(station_.connected && reachable_)) {
      announceOffline("not_connected");
      if (!apActive_)
        startAp();
    }
  }

  if (!(station_.connected && reachable_))
    return;

  announced_ = true;
  events_.publish(names::kWsmEventWifiConnected,
                  { { "ssid", station_.ssid },
                    { "ip", station_.ip },
                    { "rssi", station_.rssi ? nlohmann::json(*station_.rssi)
                                            : nlohmann::json(nullptr) } });
  if (apActive_)
    stopAp(nowMs, "station_connected");

  transitionTo(State::Connected);
  resetBackoff();
  nextStationCheck_ = nowMs + cfg_.stationRefreshMs;
  nextConnectivityCheck_ = nowMs + cfg_.connectivityCheckMs;
}

void WifiStateMachine::handleConnected(std::int64_t nowMs) {
  if (nowMs >= nextStationCheck_) {
    nextStationCheck_ = nowMs + cfg_.stationRefreshMs;
    station_ = control_.station();
  }
  if (nowMs >= nextConnectivityCheck_) {
    nextConnectivityCheck_ = nowMs + cfg_.connectivityCheckMs;
    probe(nowMs);
  }

  const char* reason = nullptr;
  if (!station_.connected)
    reason = "link_down";
  else if (station_.ip.empty())
    reason = "no_ip";
  else if (!reachable_)
    reason = "no_internet";

  if (!reason)
    return;

  events_.publish(names::kWsmEventWifiLost, { { "reason", reason },
                                              { "ssid", orNull(station_.ssid) },
                                              { "ip", orNull(station_.ip) },
                                              { "fail_streak", failStreak_ } });
  enterApMode();
}

void WifiStateMachine::onFailure(const PeerError& err, std::int64_t nowMs) {
  switch (state_) {
  case State::Init:
  case State::Error:
    transitionTo(State::Error);
    scheduleRetry(nowMs);
    announceOffline("wifi_unavailable");
    break;
  case State::ApMode:
    announceOffline("not_connected");
    break;
  case State::Connected:
    // a failed tool run counts as a failed probe; the next tick reports the loss
    if (err.cls() != FailureClass::AuthIssue) {
      reachable_ = false;
      ++failStreak_;
    }
    break;
  }
}

nlohmann::json WifiStateMachine::status(std::int64_t nowMs) const {
  const auto code = errors_.lastErrorCode();
  return {
    { "state", stateName() },
    { "ap_mode",
      { { "active", apActive_ },
        { "ssid", apActive_ ? nlohmann::json(cfg_.apSsid) : nlohmann::json(nullptr) },
        { "channel", cfg_.apChannel } } },
    { "station",
      { { "connected", station_.connected },
        { "ssid", orNull(station_.ssid) },
        { "ip", orNull(station_.ip) },
        { "rssi", station_.rssi ? nlohmann::json(*station_.rssi) : nlohmann::json(nullptr) } } },
    { "internet",
      { { "reachable", reachable_ },
        { "fail_streak", failStreak_ },
        { "last_check_ms_ago",
          lastCheck_ ? nlohmann::json(nowMs - *lastCheck_) : nlohmann::json(nullptr) } } },
    { "uptime_ms", startedAt_ ? nowMs - *startedAt_ : 0 },
    { "last_error_code", orNull(code) },
  };
}
