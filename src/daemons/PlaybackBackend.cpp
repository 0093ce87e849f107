/* @file PlaybackBackend.cpp
 * @brief playback helper invocation + exit status classification
 *
 * © 2025 Hearo — MIT-licensed.
 */

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/PeerError.hpp"
#include "daemons/PlaybackBackend.hpp"

using namespace hearo::daemons;
using hearo::core::FailureClass;
using hearo::core::PeerError;

ShellPlaybackBackend::ShellPlaybackBackend(io::ProcessRunner& runner,
                                           std::vector<std::string> helper,
                                           std::chrono::milliseconds timeout)
    : runner_(runner), helper_(std::move(helper)), timeout_(timeout) {
  if (helper_.empty())
    throw std::invalid_argument("[ShellPlaybackBackend] empty helper command");
}

std::string ShellPlaybackBackend::run(const std::vector<std::string>& args) {
  std::vector<std::string> argv = helper_;
  argv.insert(argv.end(), args.begin(), args.end());
  const std::string what = helper_.front() + " " + args.front();

  const auto res = runner_.run(argv, timeout_);
  if (!res)
    throw PeerError(FailureClass::ResourceUnavailable, "BACKEND_UNAVAILABLE",
                    what + ": " + runner_.lastError());
  if (res->timedOut)
    throw PeerError(FailureClass::Transient, "BACKEND_TIMEOUT", what + " timed out");

  switch (res->exitCode) {
  case 0:
    return res->output;
  case kExitAuth:
    throw PeerError(FailureClass::AuthIssue, "AUTH_FAILED", what + ": not authorised");
  case kExitDevice:
    throw PeerError(FailureClass::ResourceUnavailable, "DEVICE_UNAVAILABLE",
                    what + ": playback device unavailable");
  case 127:
    throw PeerError(FailureClass::ResourceUnavailable, "BACKEND_UNAVAILABLE",
                    what + ": helper not executable");
  default:
    throw PeerError(FailureClass::Transient, "BACKEND_ERROR",
                    what + ": exit status " + std::to_string(res->exitCode));
  }
}

void ShellPlaybackBackend::play(const std::string& uri, std::int64_t positionMs) {
  run({ "play", uri, std::to_string(positionMs) });
}

void ShellPlaybackBackend::seek(std::int64_t positionMs) {
  run({ "seek", std::to_string(positionMs) });
}

PlaybackStatus ShellPlaybackBackend::status() {
  const auto out = run({ "status" });
  const auto j = nlohmann::json::parse(out, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    throw PeerError(FailureClass::Transient, "BACKEND_BAD_OUTPUT", "status output is not JSON");

  PlaybackStatus st;
  st.isPlaying = j.value("is_playing", false);
  if (const auto it = j.find("uri"); it != j.end() && it->is_string())
    st.uri = it->get<std::string>();
  if (const auto it = j.find("position_ms"); it != j.end() && it->is_number_integer())
    st.positionMs = it->get<std::int64_t>();
  return st;
}
