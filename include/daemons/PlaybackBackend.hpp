#pragma once
/** @file  PlaybackBackend.hpp
 *  @brief Playback control seam and the helper-executable implementation.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "io/ProcessRunner.hpp"

namespace hearo::daemons {

  struct PlaybackStatus {
    bool isPlaying{ false };
    std::string uri{};
    std::int64_t positionMs{ 0 };
  };

  /**
 * @class PlaybackBackend
 * @brief Every call is synchronous and bounded; failures throw core::PeerError
 *        classified as AuthIssue (session), ResourceUnavailable (device) or Transient.
 */
  class PlaybackBackend {
  public:
    virtual ~PlaybackBackend() = default;

    virtual void ensureReady() = 0;
    virtual void play(const std::string& uri, std::int64_t positionMs) = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;
    virtual void seek(std::int64_t positionMs) = 0;
    virtual void next() = 0;
    virtual void previous() = 0;
    virtual PlaybackStatus status() = 0;
  };

  /**
 * @class ShellPlaybackBackend
 * @brief Runs `<helper...> <subcommand> [args]` for every call.
 *
 * Subcommands: ensure-ready, play <uri> <pos_ms>, pause, resume, seek <pos_ms>,
 * next, previous, status (prints `{"is_playing", "uri", "position_ms"}`).
 * Exit 0 ok, 2 auth failure, 3 device unavailable, anything else transient.
 */
  class ShellPlaybackBackend : public PlaybackBackend {
  public:
    ShellPlaybackBackend(io::ProcessRunner& runner, std::vector<std::string> helper,
                         std::chrono::milliseconds timeout);

    void ensureReady() override { run({ "ensure-ready" }); }
    void play(const std::string& uri, std::int64_t positionMs) override;
    void pause() override { run({ "pause" }); }
    void resume() override { run({ "resume" }); }
    void seek(std::int64_t positionMs) override;
    void next() override { run({ "next" }); }
    void previous() override { run({ "previous" }); }
    PlaybackStatus status() override;

    static constexpr int kExitAuth = 2;
    static constexpr int kExitDevice = 3;

  private:
    std::string run(const std::vector<std::string>& args);

    io::ProcessRunner& runner_;
    std::vector<std::string> helper_;
    std::chrono::milliseconds timeout_;
  };

} // namespace hearo::daemons
