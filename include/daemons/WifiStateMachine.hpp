#pragma once
/** @file  WifiStateMachine.hpp
 *  @brief Station/AP supervision: Init -> ApMode <-> Connected, Error with backoff.
 *
 *  © 2025 Hearo — MIT-licensed.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "core/Config.hpp"
#include "core/PeerStateMachine.hpp"
#include "daemons/WifiControl.hpp"

namespace hearo::daemons {

  /**
 * @class WifiStateMachine
 * @brief Keeps the box either on a working station link or in setup AP mode.
 *
 *  * ApMode    : station refresh on a doubling interval, reconnect nudges,
 *                reachability probe; connected + reachable -> CONNECTED event,
 *                AP stopped, Connected.
 *  * Connected : station refresh every stationRefresh, probe every
 *                connectivityCheck; link down / no ip / unreachable -> LOST.
 *  * The first evaluation always publishes the current connectivity.
 */
  class WifiStateMachine : public core::PeerStateMachine {
  public:
    enum class State { Init, ApMode, Connected, Error };

    WifiStateMachine(core::EventPublisher& events, core::ErrorMonitor& errors, WifiControl& control,
                     core::WifiConfig cfg);

    State state() const { return state_; }
    const char* stateName() const override;
    nlohmann::json status(std::int64_t nowMs) const override;

    bool apActive() const { return apActive_; }
    const StationStatus& station() const { return station_; }

  protected:
    void step(std::int64_t nowMs) override;
    void onFailure(const core::PeerError& err, std::int64_t nowMs) override;

  private:
    void enterApMode();
    void announceOffline(const std::string& reason); ///< first LOST only
    void handleApMode(std::int64_t nowMs);
    void handleConnected(std::int64_t nowMs);
    void probe(std::int64_t nowMs);
    void startAp();
    void stopAp(std::int64_t nowMs, const std::string& reason);
    void transitionTo(State next);

    WifiControl& control_;
    const core::WifiConfig cfg_;

    State state_{ State::Init };
    bool announced_{ false };
    bool apActive_{ false };
    StationStatus station_{};
    bool reachable_{ false };
    int failStreak_{ 0 };
    std::optional<std::int64_t> lastCheck_{};
    std::int64_t nextStationCheck_{ 0 };
    std::int64_t nextConnectivityCheck_{ 0 };
    std::optional<std::int64_t> startedAt_{};
  };

} // namespace hearo::daemons
