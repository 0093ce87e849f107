#pragma once
/** @file  PlayerStateMachine.hpp
 *  @brief Playback session FSM: backend readiness, tag resolution, progress persistence.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/CommandRegistry.hpp"
#include "core/Config.hpp"
#include "core/PeerStateMachine.hpp"
#include "daemons/PlaybackBackend.hpp"
#include "daemons/TagStore.hpp"

namespace hearo::daemons {

  /**
 * @class PlayerStateMachine
 * @brief Init -> Authenticating -> Ready <-> Playing, Error retried with backoff.
 *
 *  * Failure classes surface as distinct events: AuthIssue -> AUTH_FAILED
 *    (startup) or AUTH_LOST, ResourceUnavailable -> DISCONNECTED + AUTH_LOST,
 *    Transient -> PLAYBACK_ERROR.
 *  * Command handlers return a CommandOutcome; they never throw.
 *  * While Playing the backend position is saved to the tag store every
 *    `progressIntervalMs`.
 */
  class PlayerStateMachine : public core::PeerStateMachine {
  public:
    enum class State { Init, Authenticating, Ready, Playing, Error };
    enum class Auth { None, Pending, Ok, Failed, Lost };

    PlayerStateMachine(core::EventPublisher& events, core::ErrorMonitor& errors,
                       PlaybackBackend& backend, TagStore& tags, const core::PlayerConfig& cfg);

    //---commands--------------------------------------------------------
    core::CommandOutcome playTag(const nlohmann::json& payload, std::int64_t nowMs);
    core::CommandOutcome stop(std::int64_t nowMs);
    core::CommandOutcome next(std::int64_t nowMs);
    core::CommandOutcome previous(std::int64_t nowMs);
    core::CommandOutcome seek(const nlohmann::json& payload, std::int64_t nowMs);
    core::CommandOutcome play(const nlohmann::json& payload, std::int64_t nowMs);
    /// Save progress; the daemon stops its loop afterwards.
    core::CommandOutcome shutdown(std::int64_t nowMs);

    State state() const { return state_; }
    Auth auth() const { return auth_; }
    const std::optional<std::string>& uid() const { return uid_; }
    const std::string& uri() const { return uri_; }
    std::int64_t positionMs() const { return positionMs_; }

    const char* stateName() const override;
    static const char* authName(Auth a);
    nlohmann::json status(std::int64_t nowMs) const override;

  protected:
    void step(std::int64_t nowMs) override;
    void onFailure(const core::PeerError& err, std::int64_t nowMs) override;

  private:
    void authenticate();
    void setState(State next);
    void setAuth(Auth next, std::string_view event, nlohmann::json payload);
    void surface(const core::PeerError& err, bool startup);
    void startPlayback(const std::optional<std::string>& uid, const std::string& uri,
                       std::int64_t posMs, std::int64_t nowMs);
    void persistProgress();
    void refreshProgress(std::int64_t nowMs);
    core::CommandOutcome fail(const core::PeerError& err, std::int64_t nowMs);
    core::CommandOutcome requireAuth(std::string_view what);
    core::CommandOutcome requirePlaying() const;

    PlaybackBackend& backend_;
    TagStore& tags_;
    const std::int64_t progressIntervalMs_;

    State state_{ State::Init };
    Auth auth_{ Auth::None };
    bool startup_{ true };
    std::optional<std::string> uid_{};
    std::string uri_{};
    std::int64_t positionMs_{ 0 };
    std::int64_t nextProgressAt_{ 0 };
  };

} // namespace hearo::daemons
