/* @file PlayerStateMachine.cpp
 * @brief Player FSM
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Hearo headers
#include "core/ErrorMonitor.hpp"
#include "core/EventPublisher.hpp"
#include "daemons/PlayerStateMachine.hpp"
#include "protocols/Names.hpp"

using namespace hearo::daemons;
using hearo::core::CommandOutcome;
using hearo::core::FailureClass;
using hearo::core::PeerError;
namespace names = hearo::protocols::names;

namespace {
  nlohmann::json optionalString(const std::optional<std::string>& s) {
    return s ? nlohmann::json(*s) : nlohmann::json(nullptr);
  }
} // namespace

PlayerStateMachine::PlayerStateMachine(core::EventPublisher& events, core::ErrorMonitor& errors,
                                       PlaybackBackend& backend, TagStore& tags,
                                       const core::PlayerConfig& cfg)
    : core::PeerStateMachine(events, errors,
                             core::Backoff(cfg.backoffInitialMs, cfg.backoffMaxMs)),
      backend_(backend), tags_(tags), progressIntervalMs_(cfg.progressIntervalMs) {}

const char* PlayerStateMachine::stateName() const {
  switch (state_) {
  case State::Init:
    return "PL_INIT";
  case State::Authenticating:
    return "PL_AUTHENTICATING";
  case State::Ready:
    return "PL_READY";
  case State::Playing:
    return "PL_PLAYING";
  case State::Error:
    return "PL_ERROR";
  }
  return "UNKNOWN";
}

const char* PlayerStateMachine::authName(Auth a) {
  switch (a) {
  case Auth::None:
    return "AUTH_NONE";
  case Auth::Pending:
    return "AUTH_PENDING";
  case Auth::Ok:
    return "AUTH_OK";
  case Auth::Failed:
    return "AUTH_FAILED";
  case Auth::Lost:
    return "AUTH_LOST";
  }
  return "UNKNOWN";
}

//---transitions---------------------------------------------------------

void PlayerStateMachine::setState(State next) {
  if (next == state_)
    return;
  const char* old = stateName();
  state_ = next;
  events_.publish(names::kPlsmEventStateChanged, { { "old", old }, { "new", stateName() } });
}

void PlayerStateMachine::setAuth(Auth next, std::string_view event, nlohmann::json payload) {
  if (next == auth_)
    return;
  auth_ = next;
  events_.publish(event, std::move(payload));
}

void PlayerStateMachine::surface(const PeerError& err, bool startup) {
  switch (err.cls()) {
  case FailureClass::AuthIssue:
    if (startup)
      setAuth(Auth::Failed, names::kPlsmEventAuthFailed,
              { { "reason", err.code() }, { "message", err.what() } });
    else
      setAuth(Auth::Lost, names::kPlsmEventAuthLost, { { "reason", err.code() } });
    break;
  case FailureClass::ResourceUnavailable:
    if (auth_ != Auth::Lost)
      events_.publish(names::kPlsmEventDisconnected,
                      { { "reason", err.code() }, { "message", err.what() } });
    setAuth(Auth::Lost, names::kPlsmEventAuthLost, { { "reason", err.code() } });
    break;
  case FailureClass::Transient:
    events_.publish(names::kPlsmEventPlaybackError,
                    { { "code", err.code() }, { "message", err.what() } });
    break;
  }
}

void PlayerStateMachine::authenticate() {
  setState(State::Authenticating);
  if (auth_ == Auth::None)
    auth_ = Auth::Pending;
  backend_.ensureReady();

  setAuth(Auth::Ok, names::kPlsmEventAuthenticated, nlohmann::json::object());
  errors_.clear();
  startup_ = false;
  resetBackoff();
  setState(State::Ready);
}

//---loop------------------------------------------------------------------

void PlayerStateMachine::step(std::int64_t nowMs) {
  switch (state_) {
  case State::Init:
    authenticate();
    break;
  case State::Error:
    if (retryDue(nowMs))
      authenticate();
    break;
  case State::Playing:
    if (nowMs >= nextProgressAt_)
      refreshProgress(nowMs);
    break;
  case State::Authenticating:
  case State::Ready:
    break;
  }
}

void PlayerStateMachine::onFailure(const PeerError& err, std::int64_t nowMs) {
  const bool authenticating = state_ == State::Authenticating;
  surface(err, authenticating && startup_);

  if (!authenticating && err.cls() == FailureClass::Transient)
    return;

  if (state_ == State::Playing)
    persistProgress();
  setState(State::Error);
  scheduleRetry(nowMs);
}

void PlayerStateMachine::refreshProgress(std::int64_t nowMs) {
  nextProgressAt_ = nowMs + progressIntervalMs_;

  const auto st = backend_.status();
  if (!st.uri.empty())
    uri_ = st.uri;
  positionMs_ = std::max<std::int64_t>(0, st.positionMs);
  persistProgress();

  if (!st.isPlaying) {
    events_.publish(names::kPlsmEventPlayStopped,
                    { { "uid", optionalString(uid_) },
                      { "uri", uri_ },
                      { "position_ms", positionMs_ },
                      { "reason", "ended" } });
    setState(State::Ready);
  }
}

void PlayerStateMachine::persistProgress() {
  if (!uid_ || uri_.empty())
    return;
  try {
    tags_.saveProgress(*uid_, uri_, positionMs_);
  } catch (const PeerError& e) {
    errors_.notifyFailure(e.code(), e.what(), true);
  }
}

void PlayerStateMachine::startPlayback(const std::optional<std::string>& uid,
                                       const std::string& uri, std::int64_t posMs,
                                       std::int64_t nowMs) {
  backend_.play(uri, posMs);

  uid_ = uid;
  uri_ = uri;
  positionMs_ = posMs;
  nextProgressAt_ = nowMs + progressIntervalMs_;
  events_.publish(names::kPlsmEventPlayStarted, { { "uid", optionalString(uid_) }, { "uri", uri_ } });
  setState(State::Playing);
}

//---commands--------------------------------------------------------------

CommandOutcome PlayerStateMachine::fail(const PeerError& err, std::int64_t nowMs) {
  report(err, nowMs);
  return CommandOutcome::failed(err.code(), err.what());
}

CommandOutcome PlayerStateMachine::requireAuth(std::string_view what) {
  events_.publish(names::kPlsmEventAuthFailed,
                  { { "reason", "auth_not_ok" }, { "auth", authName(auth_) } });
  return CommandOutcome::rejected("AUTH_REQUIRED",
                                  std::string(what) + " needs an authenticated player");
}

CommandOutcome PlayerStateMachine::playTag(const nlohmann::json& payload, std::int64_t nowMs) {
  const auto it = payload.find("uid");
  if (it == payload.end() || !it->is_string() || it->get<std::string>().empty())
    return CommandOutcome::rejected(std::string(names::kErrBadPayload), "\"uid\" must be a non-empty string");
  const auto uid = it->get<std::string>();

  if (auth_ != Auth::Ok)
    return requireAuth("play-tag");

  std::optional<TagEntry> entry;
  try {
    entry = tags_.lookup(uid);
  } catch (const PeerError& e) {
    errors_.notifyFailure(e.code(), e.what(), true);
    return CommandOutcome::rejected(e.code(), e.what());
  }

  if (!entry) {
    events_.publish(names::kPlsmEventTagUnknown, { { "uid", uid } });
    return CommandOutcome::rejected("TAG_UNMAPPED", "no media mapped to tag " + uid);
  }

  std::string uri = entry->playlistUri;
  std::int64_t pos = 0;
  if (!entry->lastTrackUri.empty() && entry->lastPosMs > 0) {
    uri = entry->lastTrackUri;
    pos = entry->lastPosMs;
  } else if (uri.empty()) {
    uri = entry->lastTrackUri;
  }

  events_.publish(names::kPlsmEventTagResolved,
                  { { "uid", uid }, { "uri", uri }, { "position_ms", pos } });

  // hot swap: keep the outgoing tag's position
  if (state_ == State::Playing)
    persistProgress();

  try {
    startPlayback(uid, uri, pos, nowMs);
  } catch (const PeerError& e) {
    return fail(e, nowMs);
  }
  return CommandOutcome::done({ { "uid", uid }, { "uri", uri }, { "position_ms", pos } });
}

CommandOutcome PlayerStateMachine::play(const nlohmann::json& payload, std::int64_t nowMs) {
  const auto u = payload.find("uri");
  if (u == payload.end() || !u->is_string() || u->get<std::string>().empty())
    return CommandOutcome::rejected(std::string(names::kErrBadPayload), "\"uri\" must be a non-empty string");

  std::int64_t pos = 0;
  if (const auto p = payload.find("position_ms"); p != payload.end()) {
    if (!p->is_number_integer())
      return CommandOutcome::rejected(std::string(names::kErrBadPayload), "\"position_ms\" must be an integer");
    pos = std::max<std::int64_t>(0, p->get<std::int64_t>());
  }

  if (auth_ != Auth::Ok)
    return requireAuth("play");

  if (state_ == State::Playing)
    persistProgress();

  const auto uri = u->get<std::string>();
  try {
    startPlayback(std::nullopt, uri, pos, nowMs);
  } catch (const PeerError& e) {
    return fail(e, nowMs);
  }
  return CommandOutcome::done({ { "uri", uri }, { "position_ms", pos } });
}

CommandOutcome PlayerStateMachine::stop(std::int64_t nowMs) {
  if (state_ != State::Playing)
    return CommandOutcome::done({ { "stopped", false } });

  persistProgress();
  try {
    backend_.pause();
  } catch (const PeerError& e) {
    return fail(e, nowMs);
  }

  events_.publish(names::kPlsmEventPlayStopped,
                  { { "uid", optionalString(uid_) },
                    { "uri", uri_ },
                    { "position_ms", positionMs_ },
                    { "reason", "stopped" } });
  setState(State::Ready);
  return CommandOutcome::done({ { "stopped", true }, { "position_ms", positionMs_ } });
}

CommandOutcome PlayerStateMachine::requirePlaying() const {
  return CommandOutcome::rejected("NO_ACTIVE_PLAYBACK", std::string("player is ") + stateName());
}

CommandOutcome PlayerStateMachine::next(std::int64_t nowMs) {
  if (state_ != State::Playing)
    return requirePlaying();
  try {
    backend_.next();
  } catch (const PeerError& e) {
    return fail(e, nowMs);
  }
  nextProgressAt_ = nowMs; // pick up the new track on the next tick
  return CommandOutcome::done();
}

CommandOutcome PlayerStateMachine::previous(std::int64_t nowMs) {
  if (state_ != State::Playing)
    return requirePlaying();
  try {
    backend_.previous();
  } catch (const PeerError& e) {
    return fail(e, nowMs);
  }
  nextProgressAt_ = nowMs;
  return CommandOutcome::done();
}

CommandOutcome PlayerStateMachine::seek(const nlohmann::json& payload, std::int64_t nowMs) {
  const auto d = payload.find("delta_ms");
  if (d == payload.end() || !d->is_number_integer())
    return CommandOutcome::rejected(std::string(names::kErrBadPayload), "\"delta_ms\" must be an integer");
  if (state_ != State::Playing)
    return requirePlaying();

  const std::int64_t target = std::max<std::int64_t>(0, positionMs_ + d->get<std::int64_t>());
  try {
    backend_.seek(target);
  } catch (const PeerError& e) {
    return fail(e, nowMs);
  }
  positionMs_ = target;
  return CommandOutcome::done({ { "position_ms", target } });
}

CommandOutcome PlayerStateMachine::shutdown(std::int64_t) {
  if (state_ == State::Playing)
    persistProgress();
  return CommandOutcome::done({ { "position_ms", positionMs_ } });
}

nlohmann::json PlayerStateMachine::status(std::int64_t) const {
  const auto code = errors_.lastErrorCode();
  return {
    { "state", stateName() },
    { "auth", authName(auth_) },
    { "uid", optionalString(uid_) },
    { "uri", uri_.empty() ? nlohmann::json(nullptr) : nlohmann::json(uri_) },
    { "position_ms", positionMs_ },
    { "last_error_code", code.empty() ? nlohmann::json(nullptr) : nlohmann::json(code) },
  };
}
